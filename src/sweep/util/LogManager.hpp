#pragma once

#include <cstddef>
#include <string>

#include <plog/Severity.h>

namespace sweep
{

struct LoggingSettings
{
    plog::Severity level = plog::info;
    std::string file;                 // rolling file appender; empty disables it
    bool console = false;
    bool append = true;               // false truncates `file` on initialisation
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
};

// Owns the appenders attached to the library's plog instance
// (Diagnostics::kLogInstance).
class LogManager
{
public:
    // Attaches the appenders described by `settings`, replacing those of an
    // earlier call. On failure the previous appenders stay in place.
    static bool Initialize(const LoggingSettings& settings);

    // Mutes the library logger and closes its appenders.
    static void Shutdown();

    static bool IsInitialized();

    // Maps the 0..6 integer scale used in configuration files onto plog.
    static bool SeverityFromInt(long long value, plog::Severity& out);

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
};

} // namespace sweep
