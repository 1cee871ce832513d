#pragma once

#include "../matching/Matcher.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace sweep
{

// Pull-style helpers over Scan(). Every result views into `input`; keep the
// input alive while the results are in use.

/// All substrings between `identifier` and `terminator`, left to right.
std::vector<std::string_view> SubstringsBetween(std::string_view input, Identifier identifier, Terminator terminator);

/// All substrings between any of `identifiers` and any of `terminators`.
std::vector<std::string_view> SubstringsBetween(std::string_view input, std::vector<Identifier> identifiers,
                                                std::vector<Terminator> terminators);

/// The first substring found, scanning no further than needed.
std::optional<std::string_view> FirstSubstringBetween(std::string_view input, Identifier identifier,
                                                      Terminator terminator);

std::optional<std::string_view> FirstSubstringBetween(std::string_view input, std::vector<Identifier> identifiers,
                                                      std::vector<Terminator> terminators);

/// Like SubstringsBetween, with the enclosing range of every match.
std::vector<Match> MatchesBetween(std::string_view input, Identifier identifier, Terminator terminator);

std::vector<Match> MatchesBetween(std::string_view input, std::vector<Identifier> identifiers,
                                  std::vector<Terminator> terminators);

std::optional<Match> FirstMatchBetween(std::string_view input, Identifier identifier, Terminator terminator);

std::optional<Match> FirstMatchBetween(std::string_view input, std::vector<Identifier> identifiers,
                                       std::vector<Terminator> terminators);

} // namespace sweep
