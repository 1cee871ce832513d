#include <catch2/catch_test_macros.hpp>
#include "sweep/config/MatcherConfig.hpp"
#include "sweep/scanning/ScanEngine.hpp"
#include "sweep/util/Diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace sweep;

namespace
{
struct CollectedIssues
{
    std::vector<ConfigIssue> issues;

    IssueReporter Reporter()
    {
        return IssueReporter([this](const ConfigIssue& issue) { issues.push_back(issue); });
    }
};

constexpr const char* kFullConfig = R"(
[diagnostics]
verbose = true
max_preview = 32

[logging]
level = 5
file = "logs/sweep.log"
console = true
append = false
max_file_size = 2048
backup_count = 1

[[matcher]]
name = "tags"
identifiers = ["<", { prefix = "<<" }]
terminators = [">", { suffix = "!" }]

[[matcher]]
name = "heading"
identifiers = [{ start = true }]
terminators = [":"]
allow_multiple_matches = false

[[matcher]]
name = "tail"
identifiers = [{ any = "=" }]
terminators = [{ end = true }]
)";
} // namespace

TEST_CASE("MatcherConfig - loads matcher definitions", "[config]")
{
    CollectedIssues collected;
    MatcherConfig config(collected.Reporter());

    REQUIRE(config.LoadString(kFullConfig));
    REQUIRE(config.LastError().empty());
    REQUIRE(collected.issues.empty());
    REQUIRE(config.Definitions().size() == 3);

    SECTION("Pattern forms")
    {
        const auto* tags = config.Find("tags");
        REQUIRE(tags != nullptr);
        REQUIRE(tags->identifiers.size() == 2);
        REQUIRE(tags->identifiers[0] == Identifier("<"));
        REQUIRE(tags->identifiers[1] == Identifier::Prefix("<<"));
        REQUIRE(tags->terminators[0] == Terminator(">"));
        REQUIRE(tags->terminators[1] == Terminator::Suffix("!"));
        REQUIRE(tags->allow_multiple_matches);

        const auto* heading = config.Find("heading");
        REQUIRE(heading != nullptr);
        REQUIRE(heading->identifiers[0].IsZeroWidth());
        REQUIRE_FALSE(heading->allow_multiple_matches);

        const auto* tail = config.Find("tail");
        REQUIRE(tail != nullptr);
        REQUIRE(tail->identifiers[0] == Identifier::AnyString("="));
        REQUIRE(tail->terminators[0].IsZeroWidth());

        REQUIRE(config.Find("missing") == nullptr);
    }

    SECTION("Settings")
    {
        REQUIRE(config.GetDiagnostics().verbose);
        REQUIRE(config.GetDiagnostics().max_preview == 32);

        const auto& logging = config.GetLogging();
        REQUIRE(logging.level == plog::debug);
        REQUIRE(logging.file == "logs/sweep.log");
        REQUIRE(logging.console);
        REQUIRE_FALSE(logging.append);
        REQUIRE(logging.max_file_size == 2048);
        REQUIRE(logging.backup_count == 1);
    }

    SECTION("Bound definitions scan like hand-built matchers")
    {
        std::vector<std::string> tags;
        std::vector<std::string> headings;
        std::vector<std::string> tails;

        std::vector<Matcher> matchers;
        matchers.push_back(config.Find("tags")->Bind([&](std::string_view c) { tags.emplace_back(c); }));
        matchers.push_back(config.Find("heading")->Bind([&](std::string_view c) { headings.emplace_back(c); }));
        matchers.push_back(config.Find("tail")->Bind([&](std::string_view c) { tails.emplace_back(c); }));

        Scan("<<Intro: <a> and <b> x=1", matchers);

        REQUIRE(tags == std::vector<std::string>{ "Intro: <a", "b" });
        REQUIRE(headings == std::vector<std::string>{ "<<Intro" });
        REQUIRE(tails == std::vector<std::string>{ "1" });
    }
}

TEST_CASE("MatcherConfig - Apply pushes diagnostics settings", "[config][diagnostics]")
{
    const bool verbose = Diagnostics::IsVerbose();
    const auto preview = Diagnostics::MaxPreview();

    MatcherConfig config;
    REQUIRE(config.LoadString("[diagnostics]\nverbose = true\nmax_preview = 12\n"));
    config.Apply();

    REQUIRE(Diagnostics::IsVerbose());
    REQUIRE(Diagnostics::MaxPreview() == 12);

    Diagnostics::SetVerbose(verbose);
    Diagnostics::SetMaxPreview(preview);
}

TEST_CASE("MatcherConfig - invalid matcher entries are skipped", "[config][error]")
{
    CollectedIssues collected;
    MatcherConfig config(collected.Reporter());

    REQUIRE(config.LoadString(R"(
[[matcher]]
identifiers = ["<"]
terminators = [">"]

[[matcher]]
name = "no_terminators"
identifiers = ["<"]
terminators = []

[[matcher]]
name = "empty_identifier"
identifiers = [""]
terminators = [">"]

[[matcher]]
name = "bad_form"
identifiers = [{ prefix = "<", any = "[" }]
terminators = [">"]

[[matcher]]
name = "bad_flag"
identifiers = ["<"]
terminators = [">"]
allow_multiple_matches = "yes"

[[matcher]]
name = "ok"
identifiers = ["<"]
terminators = [">"]

[[matcher]]
name = "ok"
identifiers = ["["]
terminators = ["]"]
)"));

    REQUIRE(config.Definitions().size() == 1);
    REQUIRE(config.Definitions().front().name == "ok");
    REQUIRE(config.Definitions().front().identifiers[0] == Identifier("<"));

    REQUIRE(collected.issues.size() == 6);
    for (const auto& issue : collected.issues)
    {
        REQUIRE(issue.severity == IssueSeverity::Warning);
        REQUIRE(issue.message == "Skipping matcher definition");
        REQUIRE(issue.source == "<string>");
        REQUIRE(issue.line > 0);
    }
    REQUIRE(collected.issues[0].details.find("missing 'name'") != std::string::npos);
    REQUIRE(collected.issues[5].details.find("duplicate name 'ok'") != std::string::npos);
    REQUIRE(collected.issues[0].line < collected.issues[5].line);
}

TEST_CASE("MatcherConfig - parse errors keep the previous state", "[config][error]")
{
    CollectedIssues collected;
    MatcherConfig config(collected.Reporter());

    REQUIRE(config.LoadString("[[matcher]]\nname = \"keep\"\nidentifiers = [\"<\"]\nterminators = [\">\"]\n"));
    REQUIRE(config.Definitions().size() == 1);

    REQUIRE_FALSE(config.LoadString("[[matcher]\nname = ", "broken.toml"));
    REQUIRE_FALSE(config.LastError().empty());
    REQUIRE(config.Definitions().size() == 1);
    REQUIRE(config.Find("keep") != nullptr);

    REQUIRE(collected.issues.size() == 1);
    REQUIRE(collected.issues[0].severity == IssueSeverity::Error);
    REQUIRE(collected.issues[0].source == "broken.toml");
    REQUIRE(collected.issues[0].details == config.LastError());
}

TEST_CASE("MatcherConfig - matcher key must be an array of tables", "[config][error]")
{
    MatcherConfig config;
    REQUIRE_FALSE(config.LoadString("matcher = 3\n"));
    REQUIRE(config.LastError().find("array of tables") != std::string::npos);
}

TEST_CASE("MatcherConfig - loads from file", "[config][file]")
{
    const auto path = std::filesystem::temp_directory_path() / "sweep_test_matchers.toml";
    {
        std::ofstream out(path);
        out << kFullConfig;
    }

    MatcherConfig config;
    REQUIRE(config.LoadFile(path.string()));
    REQUIRE(config.Definitions().size() == 3);

    std::filesystem::remove(path);

    MatcherConfig missing;
    REQUIRE_FALSE(missing.LoadFile(path.string()));
    REQUIRE(missing.LastError().find("cannot open") != std::string::npos);
}
