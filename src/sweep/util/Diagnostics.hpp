#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace sweep
{

class Identifier;
class Terminator;

// Process-wide switches for the library's log output. The library logs to
// plog instance kLogInstance; nothing is written until the host initialises
// that instance (see LogManager).
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    // When set, every emitted match is logged at verbose severity.
    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Single-line, length-limited rendering of scanned text for log messages.
    [[nodiscard]] static std::string Preview(std::string_view text);

    [[nodiscard]] static std::string Describe(const Identifier& identifier);
    [[nodiscard]] static std::string Describe(const Terminator& terminator);

private:
    static void appendEscaped(std::string& out, char ch);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace sweep
