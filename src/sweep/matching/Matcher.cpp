#include "Matcher.hpp"

#include <utility>

namespace sweep
{

namespace
{

Matcher::RangeHandler WrapContentHandler(Matcher::ContentHandler handler)
{
    if (!handler)
        return {};

    return [handler = std::move(handler)](std::string_view content, const MatchRange&)
    {
        handler(content);
    };
}

} // namespace

Matcher::Matcher(std::vector<Identifier> identifiers, std::vector<Terminator> terminators, RangeHandler handler,
                 bool allow_multiple_matches)
    : identifiers(std::move(identifiers))
    , terminators(std::move(terminators))
    , allow_multiple_matches(allow_multiple_matches)
    , handler(std::move(handler))
{
}

Matcher::Matcher(std::vector<Identifier> identifiers, std::vector<Terminator> terminators, ContentHandler handler,
                 bool allow_multiple_matches)
    : Matcher(std::move(identifiers), std::move(terminators), WrapContentHandler(std::move(handler)),
              allow_multiple_matches)
{
}

Matcher::Matcher(Identifier identifier, Terminator terminator, RangeHandler handler, bool allow_multiple_matches)
    : Matcher(std::vector<Identifier>{ std::move(identifier) }, std::vector<Terminator>{ std::move(terminator) },
              std::move(handler), allow_multiple_matches)
{
}

Matcher::Matcher(Identifier identifier, Terminator terminator, ContentHandler handler, bool allow_multiple_matches)
    : Matcher(std::vector<Identifier>{ std::move(identifier) }, std::vector<Terminator>{ std::move(terminator) },
              WrapContentHandler(std::move(handler)), allow_multiple_matches)
{
}

} // namespace sweep
