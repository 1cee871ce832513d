#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace sweep
{

enum class IssueSeverity
{
    Warning, // entry skipped, the rest of the document was loaded
    Error    // document rejected, previous state kept
};

// One problem found while loading matcher configuration.
struct ConfigIssue
{
    IssueSeverity severity = IssueSeverity::Error;
    std::string source;     // file path, or the name given to LoadString()
    std::uint32_t line = 0; // 0 when the position is unknown
    std::string message;
    std::string details;
};

using IssueCallback = std::function<void(const ConfigIssue&)>;

/**
 * @brief Forwards configuration problems to the host application
 *
 * MatcherConfig never throws for bad input; it reports here and lets the
 * caller decide whether a skipped entry matters. Without a callback the
 * issues are dropped (they are still logged by MatcherConfig).
 *
 * Usage:
 *   MatcherConfig config(IssueReporter([](const ConfigIssue& issue) {
 *       std::cerr << issue.source << ":" << issue.line << ": " << issue.details;
 *   }));
 */
class IssueReporter
{
public:
    IssueReporter() = default;
    explicit IssueReporter(IssueCallback callback)
        : callback_(std::move(callback))
    {
    }

    void ReportError(std::string source, std::uint32_t line, std::string message, std::string details = {})
    {
        Report(IssueSeverity::Error, std::move(source), line, std::move(message), std::move(details));
    }

    void ReportWarning(std::string source, std::uint32_t line, std::string message, std::string details = {})
    {
        Report(IssueSeverity::Warning, std::move(source), line, std::move(message), std::move(details));
    }

private:
    void Report(IssueSeverity severity, std::string source, std::uint32_t line, std::string message,
                std::string details)
    {
        if (!callback_)
            return;
        callback_(ConfigIssue{ severity, std::move(source), line, std::move(message), std::move(details) });
    }

    IssueCallback callback_;
};

} // namespace sweep
