#pragma once

#include <string>

namespace sweep
{

/**
 * @brief Literal pattern that opens a matching session
 *
 * A plain string converts to an identifier that may appear anywhere in the
 * scanned input. Use Start() or Prefix() to require the identifier at the
 * very beginning of the input.
 */
class Identifier
{
public:
    Identifier(const char* text);
    Identifier(std::string text);

    /// Zero-width identifier matching position 0; the session's content
    /// starts with the first character of the input.
    static Identifier Start();

    /// Identifier that only matches at the start of the input.
    static Identifier Prefix(std::string text);

    /// Identifier that matches anywhere in the input.
    static Identifier AnyString(std::string text);

    const std::string& Text() const noexcept { return text_; }
    std::size_t Size() const noexcept { return text_.size(); }
    bool IsPrefix() const noexcept { return is_prefix_; }
    bool IsZeroWidth() const noexcept { return is_prefix_ && text_.empty(); }

    // An empty identifier without the start anchor has no first character
    // and can never open a session.
    bool CanMatch() const noexcept { return !text_.empty() || is_prefix_; }

    bool operator==(const Identifier& other) const = default;

private:
    std::string text_;
    bool is_prefix_ = false;
};

} // namespace sweep
