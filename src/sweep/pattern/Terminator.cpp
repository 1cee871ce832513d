#include "Terminator.hpp"

#include <utility>

namespace sweep
{

Terminator::Terminator(const char* text)
    : text_(text ? text : "")
{
}

Terminator::Terminator(std::string text)
    : text_(std::move(text))
{
}

Terminator Terminator::End() { return Suffix(std::string()); }

Terminator Terminator::Suffix(std::string text)
{
    Terminator terminator(std::move(text));
    terminator.is_suffix_ = true;
    return terminator;
}

Terminator Terminator::AnyString(std::string text) { return Terminator(std::move(text)); }

} // namespace sweep
