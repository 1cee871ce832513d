#include "Identifier.hpp"

#include <utility>

namespace sweep
{

Identifier::Identifier(const char* text)
    : text_(text ? text : "")
{
}

Identifier::Identifier(std::string text)
    : text_(std::move(text))
{
}

Identifier Identifier::Start() { return Prefix(std::string()); }

Identifier Identifier::Prefix(std::string text)
{
    Identifier identifier(std::move(text));
    identifier.is_prefix_ = true;
    return identifier;
}

Identifier Identifier::AnyString(std::string text) { return Identifier(std::move(text)); }

} // namespace sweep
