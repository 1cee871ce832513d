#include "MatcherConfig.hpp"
#include "../util/Diagnostics.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <utility>

#include <plog/Log.h>

namespace sweep
{

namespace
{

std::string DescribeParseError(const toml::parse_error& pe)
{
    if (pe.source().begin.line > 0)
    {
        return "line " + std::to_string(pe.source().begin.line) + ", column " +
               std::to_string(pe.source().begin.column) + ": " + std::string(pe.description());
    }
    return std::string(pe.description());
}

std::uint32_t LineOf(const toml::node& node) { return node.source().begin.line; }

} // namespace

Matcher MatcherDefinition::Bind(Matcher::RangeHandler handler) const
{
    return Matcher(identifiers, terminators, std::move(handler), allow_multiple_matches);
}

Matcher MatcherDefinition::Bind(Matcher::ContentHandler handler) const
{
    return Matcher(identifiers, terminators, std::move(handler), allow_multiple_matches);
}

MatcherConfig::MatcherConfig(IssueReporter issues)
    : issues_(std::move(issues))
{
}

bool MatcherConfig::LoadFile(const std::string& path)
{
    last_error_.clear();
    source_ = path;

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        last_error_ = "cannot open matcher configuration: " + path;
        PLOG_WARNING_(Diagnostics::kLogInstance) << last_error_;
        issues_.ReportError(source_, 0, "Matcher configuration not found", last_error_);
        return false;
    }

    try
    {
        auto root = toml::parse(ifs, path);
        return Parse(root);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error: " + DescribeParseError(pe);
        Fail(pe.source().begin.line, last_error_);
        return false;
    }
}

bool MatcherConfig::LoadString(std::string_view text, std::string_view source_name)
{
    last_error_.clear();
    source_ = std::string(source_name);

    try
    {
        auto root = toml::parse(text, source_name);
        return Parse(root);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error: " + DescribeParseError(pe);
        Fail(pe.source().begin.line, last_error_);
        return false;
    }
}

const MatcherDefinition* MatcherConfig::Find(std::string_view name) const
{
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [name](const MatcherDefinition& definition) { return definition.name == name; });
    return it != definitions_.end() ? &*it : nullptr;
}

void MatcherConfig::Apply() const
{
    Diagnostics::SetVerbose(diagnostics_.verbose);
    Diagnostics::SetMaxPreview(diagnostics_.max_preview);
}

void MatcherConfig::Warn(std::uint32_t line, const std::string& message, const std::string& details)
{
    PLOG_WARNING_(Diagnostics::kLogInstance) << source_ << ":" << line << ": " << message << " (" << details << ")";
    issues_.ReportWarning(source_, line, message, details);
}

void MatcherConfig::Fail(std::uint32_t line, const std::string& details)
{
    PLOG_WARNING_(Diagnostics::kLogInstance) << source_ << ": " << details;
    issues_.ReportError(source_, line, "Matcher configuration has errors", details);
}

bool MatcherConfig::Parse(const toml::table& root)
{
    DiagnosticsSettings diagnostics;
    LoggingSettings logging;
    std::vector<MatcherDefinition> definitions;

    ParseDiagnostics(root, diagnostics);
    ParseLogging(root, logging);

    if (const toml::node* matchers = root.get("matcher"))
    {
        const toml::array* entries = matchers->as_array();
        if (!entries)
        {
            last_error_ = "'matcher' must be an array of tables ([[matcher]])";
            Fail(LineOf(*matchers), last_error_);
            return false;
        }

        for (std::size_t index = 0; index < entries->size(); ++index)
        {
            const toml::node* node = entries->get(index);
            const toml::table* entry = node->as_table();
            if (!entry)
            {
                Warn(LineOf(*node), "Skipping matcher definition",
                     "matcher[" + std::to_string(index) + "]: expected a table");
                continue;
            }

            MatcherDefinition definition;
            if (!ParseMatcher(*entry, index, definition))
                continue;

            const bool duplicate = std::any_of(definitions.begin(), definitions.end(),
                                               [&](const MatcherDefinition& d) { return d.name == definition.name; });
            if (duplicate)
            {
                Warn(LineOf(*entry), "Skipping matcher definition",
                     "matcher[" + std::to_string(index) + "]: duplicate name '" + definition.name + "'");
                continue;
            }

            definitions.push_back(std::move(definition));
        }
    }

    diagnostics_ = diagnostics;
    logging_ = std::move(logging);
    definitions_ = std::move(definitions);

    PLOG_DEBUG_(Diagnostics::kLogInstance) << "Loaded " << definitions_.size() << " matcher definition(s)";
    return true;
}

void MatcherConfig::ParseDiagnostics(const toml::table& root, DiagnosticsSettings& out)
{
    const toml::table* section = root["diagnostics"].as_table();
    if (!section)
        return;

    if (auto verbose = (*section)["verbose"].value<bool>())
        out.verbose = *verbose;

    if (auto preview = (*section)["max_preview"].value<int64_t>())
    {
        if (*preview > 0)
            out.max_preview = static_cast<std::size_t>(*preview);
        else
            Warn(LineOf(*section), "Ignoring diagnostics.max_preview", "value must be positive");
    }
}

void MatcherConfig::ParseLogging(const toml::table& root, LoggingSettings& out)
{
    const toml::table* section = root["logging"].as_table();
    if (!section)
        return;

    if (auto level = (*section)["level"].value<int64_t>())
    {
        if (!LogManager::SeverityFromInt(*level, out.level))
            Warn(LineOf(*section), "Ignoring logging.level", "expected 0..6, got " + std::to_string(*level));
    }
    if (auto file = (*section)["file"].value<std::string>())
        out.file = *file;
    if (auto console = (*section)["console"].value<bool>())
        out.console = *console;
    if (auto append = (*section)["append"].value<bool>())
        out.append = *append;
    if (auto size = (*section)["max_file_size"].value<int64_t>(); size && *size > 0)
        out.max_file_size = static_cast<std::size_t>(*size);
    if (auto count = (*section)["backup_count"].value<int64_t>(); count && *count >= 0)
        out.backup_count = static_cast<std::size_t>(*count);
}

bool MatcherConfig::ParseMatcher(const toml::table& entry, std::size_t index, MatcherDefinition& out)
{
    const std::string where = "matcher[" + std::to_string(index) + "]";
    auto reject = [&](const std::string& problem)
    {
        Warn(LineOf(entry), "Skipping matcher definition", where + ": " + problem);
        return false;
    };

    auto name = entry["name"].value<std::string>();
    if (!name || name->empty())
        return reject("missing 'name'");
    out.name = *name;

    const toml::array* identifiers = entry["identifiers"].as_array();
    if (!identifiers || identifiers->empty())
        return reject("'" + out.name + "' needs a non-empty 'identifiers' array");

    const toml::array* terminators = entry["terminators"].as_array();
    if (!terminators || terminators->empty())
        return reject("'" + out.name + "' needs a non-empty 'terminators' array");

    std::string problem;
    for (std::size_t i = 0; i < identifiers->size(); ++i)
    {
        Identifier identifier("");
        if (!ParseIdentifier(*identifiers->get(i), identifier, problem))
            return reject("'" + out.name + "' identifiers[" + std::to_string(i) + "]: " + problem);
        out.identifiers.push_back(std::move(identifier));
    }

    for (std::size_t i = 0; i < terminators->size(); ++i)
    {
        Terminator terminator("");
        if (!ParseTerminator(*terminators->get(i), terminator, problem))
            return reject("'" + out.name + "' terminators[" + std::to_string(i) + "]: " + problem);
        out.terminators.push_back(std::move(terminator));
    }

    if (const toml::node* multiple = entry.get("allow_multiple_matches"))
    {
        auto value = multiple->value<bool>();
        if (!value)
            return reject("'" + out.name + "' allow_multiple_matches must be a boolean");
        out.allow_multiple_matches = *value;
    }

    return true;
}

bool MatcherConfig::ParseIdentifier(const toml::node& node, Identifier& out, std::string& problem) const
{
    if (auto text = node.value<std::string>())
    {
        if (text->empty())
        {
            problem = "empty identifier never matches; use { start = true }";
            return false;
        }
        out = Identifier(std::move(*text));
        return true;
    }

    const toml::table* form = node.as_table();
    if (!form || form->size() != 1)
    {
        problem = "expected a string or a table with one of 'prefix', 'start', 'any'";
        return false;
    }

    if (auto prefix = (*form)["prefix"].value<std::string>())
    {
        out = Identifier::Prefix(std::move(*prefix));
        return true;
    }
    if (auto start = (*form)["start"].value<bool>())
    {
        if (!*start)
        {
            problem = "'start' can only be true";
            return false;
        }
        out = Identifier::Start();
        return true;
    }
    if (auto any = (*form)["any"].value<std::string>(); any && !any->empty())
    {
        out = Identifier::AnyString(std::move(*any));
        return true;
    }

    problem = "unrecognised identifier form";
    return false;
}

bool MatcherConfig::ParseTerminator(const toml::node& node, Terminator& out, std::string& problem) const
{
    if (auto text = node.value<std::string>())
    {
        if (text->empty())
        {
            problem = "empty terminator never matches; use { end = true }";
            return false;
        }
        out = Terminator(std::move(*text));
        return true;
    }

    const toml::table* form = node.as_table();
    if (!form || form->size() != 1)
    {
        problem = "expected a string or a table with one of 'suffix', 'end', 'any'";
        return false;
    }

    if (auto suffix = (*form)["suffix"].value<std::string>())
    {
        out = Terminator::Suffix(std::move(*suffix));
        return true;
    }
    if (auto end = (*form)["end"].value<bool>())
    {
        if (!*end)
        {
            problem = "'end' can only be true";
            return false;
        }
        out = Terminator::End();
        return true;
    }
    if (auto any = (*form)["any"].value<std::string>(); any && !any->empty())
    {
        out = Terminator::AnyString(std::move(*any));
        return true;
    }

    problem = "unrecognised terminator form";
    return false;
}

} // namespace sweep
