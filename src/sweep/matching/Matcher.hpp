#pragma once

#include "MatchRange.hpp"
#include "../pattern/Identifier.hpp"
#include "../pattern/Terminator.hpp"

#include <cstddef>
#include <functional>
#include <string_view>
#include <vector>

namespace sweep
{

// Position of a matcher in the list handed to Scan(). Sessions refer to
// their matcher through this index only.
using MatcherId = std::size_t;

/**
 * @brief Scan description: which patterns open and close a session, and
 *        what to do with each match
 *
 * Any identifier opens a session; any terminator closes it. With
 * allow_multiple_matches = false the matcher retires after its first match.
 * A matcher must stay alive and unmodified while a scan is using it.
 */
struct Matcher
{
    using ContentHandler = std::function<void(std::string_view content)>;
    using RangeHandler = std::function<void(std::string_view content, const MatchRange& range)>;

    std::vector<Identifier> identifiers;
    std::vector<Terminator> terminators;
    bool allow_multiple_matches = true;
    RangeHandler handler;

    Matcher(std::vector<Identifier> identifiers, std::vector<Terminator> terminators, RangeHandler handler,
            bool allow_multiple_matches = true);

    Matcher(std::vector<Identifier> identifiers, std::vector<Terminator> terminators, ContentHandler handler,
            bool allow_multiple_matches = true);

    Matcher(Identifier identifier, Terminator terminator, RangeHandler handler, bool allow_multiple_matches = true);

    Matcher(Identifier identifier, Terminator terminator, ContentHandler handler, bool allow_multiple_matches = true);
};

} // namespace sweep
