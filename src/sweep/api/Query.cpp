#include "Query.hpp"

#include "../scanning/ScanEngine.hpp"

#include <utility>

namespace sweep
{

namespace
{

std::vector<Match> CollectMatches(std::string_view input, std::vector<Identifier> identifiers,
                                  std::vector<Terminator> terminators, bool allow_multiple_matches)
{
    std::vector<Match> matches;

    std::vector<Matcher> matchers;
    matchers.emplace_back(
        std::move(identifiers), std::move(terminators),
        Matcher::RangeHandler([&matches](std::string_view content, const MatchRange& range)
                              { matches.push_back(Match{ content, range }); }),
        allow_multiple_matches);

    Scan(input, matchers);
    return matches;
}

std::vector<std::string_view> ContentsOf(const std::vector<Match>& matches)
{
    std::vector<std::string_view> contents;
    contents.reserve(matches.size());
    for (const auto& match : matches)
        contents.push_back(match.content);
    return contents;
}

std::optional<Match> FirstOf(std::vector<Match>&& matches)
{
    if (matches.empty())
        return std::nullopt;
    return matches.front();
}

} // namespace

std::vector<std::string_view> SubstringsBetween(std::string_view input, Identifier identifier, Terminator terminator)
{
    return SubstringsBetween(input, std::vector<Identifier>{ std::move(identifier) },
                             std::vector<Terminator>{ std::move(terminator) });
}

std::vector<std::string_view> SubstringsBetween(std::string_view input, std::vector<Identifier> identifiers,
                                                std::vector<Terminator> terminators)
{
    return ContentsOf(CollectMatches(input, std::move(identifiers), std::move(terminators), true));
}

std::optional<std::string_view> FirstSubstringBetween(std::string_view input, Identifier identifier,
                                                      Terminator terminator)
{
    return FirstSubstringBetween(input, std::vector<Identifier>{ std::move(identifier) },
                                 std::vector<Terminator>{ std::move(terminator) });
}

std::optional<std::string_view> FirstSubstringBetween(std::string_view input, std::vector<Identifier> identifiers,
                                                      std::vector<Terminator> terminators)
{
    auto first = FirstMatchBetween(input, std::move(identifiers), std::move(terminators));
    if (!first)
        return std::nullopt;
    return first->content;
}

std::vector<Match> MatchesBetween(std::string_view input, Identifier identifier, Terminator terminator)
{
    return MatchesBetween(input, std::vector<Identifier>{ std::move(identifier) },
                          std::vector<Terminator>{ std::move(terminator) });
}

std::vector<Match> MatchesBetween(std::string_view input, std::vector<Identifier> identifiers,
                                  std::vector<Terminator> terminators)
{
    return CollectMatches(input, std::move(identifiers), std::move(terminators), true);
}

std::optional<Match> FirstMatchBetween(std::string_view input, Identifier identifier, Terminator terminator)
{
    return FirstMatchBetween(input, std::vector<Identifier>{ std::move(identifier) },
                             std::vector<Terminator>{ std::move(terminator) });
}

std::optional<Match> FirstMatchBetween(std::string_view input, std::vector<Identifier> identifiers,
                                       std::vector<Terminator> terminators)
{
    return FirstOf(CollectMatches(input, std::move(identifiers), std::move(terminators), false));
}

} // namespace sweep
