#pragma once

// Public entry point of the sweep library.
//
//   auto tags = sweep::SubstringsBetween("Some <b>bold</b> text", "<", ">");
//   // tags == { "b", "/b" }
//
//   std::vector<sweep::Matcher> matchers;
//   matchers.emplace_back("[", "]", [](std::string_view link) { ... });
//   matchers.emplace_back(sweep::Identifier::Start(), ":", [](std::string_view key) { ... },
//                         false);
//   sweep::Scan(text, matchers);

#include "../pattern/Identifier.hpp"
#include "../pattern/Terminator.hpp"
#include "../matching/MatchRange.hpp"
#include "../matching/Matcher.hpp"
#include "../scanning/ScanEngine.hpp"
#include "Query.hpp"
