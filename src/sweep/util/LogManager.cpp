#include "LogManager.hpp"
#include "Diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace sweep
{

namespace
{

// plog loggers can only gain appenders. The library registers this one once
// and swaps the real appenders behind it.
class AppenderSet : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& appender : appenders_)
            appender->write(record);
    }

    void Replace(std::vector<std::unique_ptr<plog::IAppender>> appenders)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        appenders_.swap(appenders);
    }

    std::size_t Size()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return appenders_.size();
    }

private:
    std::mutex mutex_;
    std::vector<std::unique_ptr<plog::IAppender>> appenders_;
};

AppenderSet& Appenders()
{
    static AppenderSet appenders;
    return appenders;
}

} // namespace

bool LogManager::s_initialized = false;

bool LogManager::Initialize(const LoggingSettings& settings)
{
    std::vector<std::unique_ptr<plog::IAppender>> appenders;
    try
    {
        if (!settings.file.empty())
        {
            if (!PrepareLogDirectory(settings.file))
                return false;

            if (!settings.append)
                std::ofstream(settings.file, std::ios::trunc).close();

            appenders.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                settings.file.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count)));
        }

        if (settings.console)
            appenders.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>());
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << "Failed to initialise sweep logger: " << ex.what();
        return false;
    }

    static bool attached = []
    {
        plog::init<Diagnostics::kLogInstance>(plog::none, &Appenders());
        return true;
    }();
    (void)attached;

    Appenders().Replace(std::move(appenders));
    plog::get<Diagnostics::kLogInstance>()->setMaxSeverity(settings.level);
    s_initialized = true;

    PLOG_INFO_(Diagnostics::kLogInstance) << "sweep logging initialised (" << Appenders().Size()
                                          << " appender(s))";
    return true;
}

void LogManager::Shutdown()
{
    if (auto logger = plog::get<Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);
    Appenders().Replace({});
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::SeverityFromInt(long long value, plog::Severity& out)
{
    if (value < plog::none || value > plog::verbose)
        return false;
    out = static_cast<plog::Severity>(value);
    return true;
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        PLOG_WARNING << "Unable to prepare log directory " << parent.string() << ": " << ec.message();
        return false;
    }
    return true;
}

} // namespace sweep
