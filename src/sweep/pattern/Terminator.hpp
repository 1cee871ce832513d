#pragma once

#include <string>

namespace sweep
{

/**
 * @brief Literal pattern that closes a matching session
 *
 * A plain string converts to a terminator that may appear anywhere in the
 * scanned input. Use End() or Suffix() to require the terminator at the very
 * end of the input.
 */
class Terminator
{
public:
    Terminator(const char* text);
    Terminator(std::string text);

    /// Zero-width terminator matching the end of the input; the content
    /// runs through the last character.
    static Terminator End();

    /// Terminator that only matches at the end of the input.
    static Terminator Suffix(std::string text);

    /// Terminator that matches anywhere in the input.
    static Terminator AnyString(std::string text);

    const std::string& Text() const noexcept { return text_; }
    std::size_t Size() const noexcept { return text_.size(); }
    bool IsSuffix() const noexcept { return is_suffix_; }
    bool IsZeroWidth() const noexcept { return is_suffix_ && text_.empty(); }

    // Unanchored empty terminators are ignored by the scanner.
    bool CanMatch() const noexcept { return !text_.empty() || is_suffix_; }

    bool operator==(const Terminator& other) const = default;

private:
    std::string text_;
    bool is_suffix_ = false;
};

} // namespace sweep
