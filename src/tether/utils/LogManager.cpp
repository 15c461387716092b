#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <algorithm>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace tether::utils
{

bool LogManager::s_initialized = false;
plog::Severity LogManager::s_default_level = plog::info;
std::filesystem::path LogManager::s_log_directory;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<int> LogManager::s_registered;

bool LogManager::Initialize(const std::filesystem::path& log_directory, plog::Severity default_level)
{
    s_default_level = default_level;
    if (s_initialized)
        return true;

    std::error_code ec;
    std::filesystem::create_directories(log_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Startup, "Unable to prepare log directory", ec.message());
        return false;
    }

    s_log_directory = log_directory;
    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Startup, "LogManager not initialized before registering logger",
                                   config.name);
        return false;
    }

    plog::Severity level = config.level_override.value_or(s_default_level);

    // A second runtime start in the same process reuses the existing appenders.
    if (std::find(s_registered.begin(), s_registered.end(), InstanceId) != s_registered.end())
    {
        if (auto logger = plog::get<InstanceId>())
            logger->setMaxSeverity(level);
        return true;
    }

    try
    {
        const std::string path = (s_log_directory / config.filename).string();
        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        s_registered.push_back(InstanceId);
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Startup, "Failed to register logger: " + config.name, ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<kPluginLogInstance>(const LoggerConfig&);

void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto logger = plog::get<kPluginLogInstance>())
        logger->setMaxSeverity(plog::none);
}

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::filesystem::path& LogManager::LogDirectory() { return s_log_directory; }

} // namespace tether::utils
