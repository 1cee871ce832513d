#pragma once

#include "ConfigIssue.hpp"
#include "../matching/Matcher.hpp"
#include "../util/LogManager.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

namespace sweep
{

// Named matcher without a handler, as declared in a configuration file.
struct MatcherDefinition
{
    std::string name;
    std::vector<Identifier> identifiers;
    std::vector<Terminator> terminators;
    bool allow_multiple_matches = true;

    Matcher Bind(Matcher::RangeHandler handler) const;
    Matcher Bind(Matcher::ContentHandler handler) const;
};

struct DiagnosticsSettings
{
    bool verbose = false;
    std::size_t max_preview = 160;
};

/**
 * @brief Loads matcher definitions and library settings from TOML
 *
 * Recognised layout:
 *
 *   [diagnostics]
 *   verbose = false
 *   max_preview = 160
 *
 *   [logging]
 *   level = 4
 *   file = "logs/sweep.log"
 *   console = false
 *
 *   [[matcher]]
 *   name = "tags"
 *   identifiers = ["<", { prefix = "<<" }, { start = true }]
 *   terminators = [">", { suffix = "!" }, { end = true }]
 *   allow_multiple_matches = true
 *
 * A document that fails to parse leaves the previous state untouched and
 * returns false. Individual matcher entries that are malformed are skipped
 * and reported as warnings carrying the line of the [[matcher]] header.
 */
class MatcherConfig
{
public:
    MatcherConfig() = default;
    explicit MatcherConfig(IssueReporter issues);

    bool LoadFile(const std::string& path);
    bool LoadString(std::string_view text, std::string_view source_name = "<string>");

    const std::string& LastError() const { return last_error_; }

    const std::vector<MatcherDefinition>& Definitions() const { return definitions_; }
    const MatcherDefinition* Find(std::string_view name) const;

    const DiagnosticsSettings& GetDiagnostics() const { return diagnostics_; }
    const LoggingSettings& GetLogging() const { return logging_; }

    // Pushes [diagnostics] into the process-wide Diagnostics switches.
    void Apply() const;

private:
    bool Parse(const toml::table& root);
    void Warn(std::uint32_t line, const std::string& message, const std::string& details);
    void Fail(std::uint32_t line, const std::string& details);
    void ParseDiagnostics(const toml::table& root, DiagnosticsSettings& out);
    void ParseLogging(const toml::table& root, LoggingSettings& out);
    bool ParseMatcher(const toml::table& entry, std::size_t index, MatcherDefinition& out);
    bool ParseIdentifier(const toml::node& node, Identifier& out, std::string& problem) const;
    bool ParseTerminator(const toml::node& node, Terminator& out, std::string& problem) const;

    IssueReporter issues_;
    std::string source_;
    std::string last_error_;
    std::vector<MatcherDefinition> definitions_;
    DiagnosticsSettings diagnostics_;
    LoggingSettings logging_;
};

} // namespace sweep
