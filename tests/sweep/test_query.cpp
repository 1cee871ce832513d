#include <catch2/catch_test_macros.hpp>
#include "sweep/api/Query.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace sweep;

namespace
{
using Views = std::vector<std::string_view>;
}

TEST_CASE("SubstringsBetween - basic scanning", "[query]")
{
    REQUIRE(SubstringsBetween("Some text <Scanned> some other text.", "<", ">") == Views{ "Scanned" });
}

TEST_CASE("SubstringsBetween - multiple segments in order", "[query]")
{
    const std::string input = "Some text <First> some other text <Second>.";
    REQUIRE(SubstringsBetween(input, "<", ">") == Views{ "First", "Second" });
}

TEST_CASE("SubstringsBetween - back to back segments", "[query]")
{
    const std::string input = "Some text |First|Second| some other text.";
    REQUIRE(SubstringsBetween(input, "|", "|") == Views{ "First", "Second" });
}

TEST_CASE("SubstringsBetween - multiple identifiers and terminators", "[query]")
{
    const std::string input = "Some text <First> some other text -[Second]-";
    REQUIRE(SubstringsBetween(input, { "<", "-[" }, { ">", "]-" }) == Views{ "First", "Second" });
}

TEST_CASE("SubstringsBetween - nested identifier is content", "[query][nesting]")
{
    const std::string input = "Some text <Par<Nested>sed> some other text.";
    REQUIRE(SubstringsBetween(input, "<", ">") == Views{ "Par<Nested" });
}

TEST_CASE("SubstringsBetween - multiple nested identifiers", "[query][nesting]")
{
    const std::string input = "Some text <Par{First}<Second>sed> some other text.";
    REQUIRE(SubstringsBetween(input, { "<", "{" }, { ">", "}" }) == Views{ "Par{First", "Second" });
}

TEST_CASE("SubstringsBetween - unterminated and empty matches are dropped", "[query][edge]")
{
    SECTION("Unterminated match")
    {
        REQUIRE(SubstringsBetween("Some text [(Match", "[(", ")]").empty());
    }

    SECTION("Empty match")
    {
        REQUIRE(SubstringsBetween("Some text [()]", "[(", ")]").empty());
    }

    SECTION("Identifier that never occurs")
    {
        const std::string long_input(4096, 'x');
        REQUIRE(SubstringsBetween(long_input, "<", ">").empty());
        REQUIRE(SubstringsBetween("", "<", ">").empty());
    }

    SECTION("Terminator that never occurs")
    {
        REQUIRE(SubstringsBetween("<a <b <c", "<", ">").empty());
    }
}

TEST_CASE("SubstringsBetween - anchored identifiers", "[query][anchor]")
{
    const std::string input = "<Scanned> text";
    REQUIRE(SubstringsBetween(input, Identifier::Start(), ">") == Views{ "<Scanned" });
    REQUIRE(SubstringsBetween(input, Identifier::Prefix("<"), ">") == Views{ "Scanned" });
    REQUIRE(SubstringsBetween(input, "<", ">") == Views{ "Scanned" });
    REQUIRE(SubstringsBetween(input, ">", Terminator::End()) == Views{ " text" });
}

TEST_CASE("SubstringsBetween - results view into the input", "[query]")
{
    const std::string input = "a <b> c";
    auto matches = SubstringsBetween(input, "<", ">");
    REQUIRE(matches.size() == 1);
    REQUIRE(matches.front().data() == input.data() + 3);
}

TEST_CASE("FirstSubstringBetween - only the first occurrence", "[query][single_shot]")
{
    const std::string input = "<First> <Second> <Third>";

    auto first = FirstSubstringBetween(input, "<", ">");
    REQUIRE(first.has_value());
    REQUIRE(*first == "First");

    auto either = FirstSubstringBetween(input, { "[", "<" }, { "]", ">" });
    REQUIRE(either.has_value());
    REQUIRE(*either == "First");

    REQUIRE_FALSE(FirstSubstringBetween(input, "[", "]").has_value());
    REQUIRE_FALSE(FirstSubstringBetween("Some text [(Match", "[(", ")]").has_value());
}

TEST_CASE("FirstSubstringBetween - an empty first occurrence ends the search", "[query][single_shot]")
{
    REQUIRE_FALSE(FirstSubstringBetween("[()] [(x)]", "[(", ")]").has_value());
    REQUIRE_FALSE(FirstMatchBetween("<> <x>", "<", ">").has_value());
    REQUIRE(SubstringsBetween("[()] [(x)]", "[(", ")]") == Views{ "x" });
}

TEST_CASE("MatchesBetween - ranges slice back to identifier, content and terminator", "[query][range]")
{
    const std::string input = "Some text <First> some other text -[Second]-";
    auto matches = MatchesBetween(input, { "<", "-[" }, { ">", "]-" });

    REQUIRE(matches.size() == 2);

    REQUIRE(matches[0].content == "First");
    REQUIRE(matches[0].range.Slice(input) == "<First>");
    REQUIRE(matches[0].range.begin == 10);
    REQUIRE(matches[0].range.end == 17);

    REQUIRE(matches[1].content == "Second");
    REQUIRE(matches[1].range.Slice(input) == "-[Second]-");
    REQUIRE(matches[1].range.Size() == 10);

    for (const auto& match : matches)
    {
        REQUIRE(match.range.content_begin > match.range.begin);
        REQUIRE(match.range.content_end < match.range.end);
        REQUIRE(input.substr(match.range.content_begin, match.range.content_end - match.range.content_begin) ==
                match.content);
    }
}

TEST_CASE("MatchesBetween - terminator positions increase", "[query][range]")
{
    const std::string input = "[a] [bb] [] [ccc] [d";
    auto matches = MatchesBetween(input, "[", "]");

    REQUIRE(matches.size() == 3);
    for (std::size_t i = 1; i < matches.size(); ++i)
        REQUIRE(matches[i - 1].range.end < matches[i].range.end);
}

TEST_CASE("FirstMatchBetween - zero-width anchors report zero-width ranges", "[query][range][anchor]")
{
    const std::string input = "title: Sweep";

    auto key = FirstMatchBetween(input, Identifier::Start(), ":");
    REQUIRE(key.has_value());
    REQUIRE(key->content == "title");
    REQUIRE(key->range.begin == 0);
    REQUIRE(key->range.Slice(input) == "title:");

    auto value = FirstMatchBetween(input, ": ", Terminator::End());
    REQUIRE(value.has_value());
    REQUIRE(value->content == "Sweep");
    REQUIRE(value->range.end == input.size());
    REQUIRE(value->range.Slice(input) == ": Sweep");

    REQUIRE_FALSE(FirstMatchBetween(input, "<", ">").has_value());
}
