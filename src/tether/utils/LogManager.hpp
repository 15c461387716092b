#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace tether::utils
{

/// plog instance receiving lines that plugins send through the host API.
inline constexpr int kPluginLogInstance = 1;

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filename;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    /// Creates the log directory. Safe to call more than once.
    static bool Initialize(const std::filesystem::path& log_directory, plog::Severity default_level);

    template <int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    /// Silences every registered logger. Appenders stay owned until process exit
    /// because plog keeps raw pointers to them.
    static void Shutdown();

    static plog::Severity GetDefaultLogLevel();
    static const std::filesystem::path& LogDirectory();

private:
    LogManager() = default;

    static bool s_initialized;
    static plog::Severity s_default_level;
    static std::filesystem::path s_log_directory;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<int> s_registered;
};

} // namespace tether::utils
