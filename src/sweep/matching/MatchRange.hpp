#pragma once

#include <cstddef>
#include <string_view>

namespace sweep
{

// Byte offsets into the scanned input. [begin, end) covers the identifier,
// the content and the terminator; [content_begin, content_end) the content.
struct MatchRange
{
    std::size_t begin = 0;
    std::size_t end = 0;
    std::size_t content_begin = 0;
    std::size_t content_end = 0;

    std::size_t Size() const noexcept { return end - begin; }

    std::string_view Slice(std::string_view input) const { return input.substr(begin, end - begin); }

    bool operator==(const MatchRange& other) const = default;
};

struct Match
{
    std::string_view content;
    MatchRange range;

    bool operator==(const Match& other) const = default;
};

} // namespace sweep
