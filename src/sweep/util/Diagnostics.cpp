#include "Diagnostics.hpp"

#include "../pattern/Identifier.hpp"
#include "../pattern/Terminator.hpp"

#include <algorithm>

namespace sweep
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(std::max<std::size_t>(bytes, 1), std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    const std::string_view shown = text.substr(0, limit);

    std::string out;
    out.reserve(shown.size() + 24);
    for (char ch : shown)
        appendEscaped(out, ch);

    if (text.size() > limit)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

std::string Diagnostics::Describe(const Identifier& identifier)
{
    if (identifier.IsZeroWidth())
        return "start";

    std::string out = identifier.IsPrefix() ? "prefix \"" : "\"";
    for (char ch : identifier.Text())
        appendEscaped(out, ch);
    out += '"';
    return out;
}

std::string Diagnostics::Describe(const Terminator& terminator)
{
    if (terminator.IsZeroWidth())
        return "end";

    std::string out = terminator.IsSuffix() ? "suffix \"" : "\"";
    for (char ch : terminator.Text())
        appendEscaped(out, ch);
    out += '"';
    return out;
}

void Diagnostics::appendEscaped(std::string& out, char ch)
{
    static constexpr char kHex[] = "0123456789ABCDEF";

    switch (ch)
    {
    case '\n':
        out += "\\n";
        return;
    case '\r':
        out += "\\r";
        return;
    case '\t':
        out += "\\t";
        return;
    case '"':
        out += "\\\"";
        return;
    default:
        break;
    }

    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x20 || byte == 0x7F)
    {
        out += "\\x";
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
        return;
    }
    out.push_back(ch);
}

} // namespace sweep
