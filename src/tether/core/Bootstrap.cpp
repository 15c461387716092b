#include "Bootstrap.hpp"
#include "DefaultSubsystemFactory.hpp"
#include "SubsystemError.hpp"
#include "Supervisor.hpp"
#include "tether/utils/CrashHandler.hpp"
#include "tether/utils/LogLevelSwitch.hpp"
#include "tether/utils/LogManager.hpp"

#include <mutex>

#include <plog/Log.h>

namespace tether
{

namespace
{

// Guards the supervisor's lifetime against RequestUnload from host threads.
std::mutex g_active_mutex;
Supervisor* g_active = nullptr;

/// Publishes a supervisor to RequestUnload for the lifetime of the scope.
class ActiveRegistration
{
public:
    explicit ActiveRegistration(Supervisor& supervisor)
    {
        std::lock_guard<std::mutex> lock(g_active_mutex);
        g_active = &supervisor;
    }

    ~ActiveRegistration()
    {
        std::lock_guard<std::mutex> lock(g_active_mutex);
        g_active = nullptr;
    }

    ActiveRegistration(const ActiveRegistration&) = delete;
    ActiveRegistration& operator=(const ActiveRegistration&) = delete;
};

#ifdef TETHER_DEBUG
constexpr plog::Severity kInitialLevel = plog::verbose;
#else
constexpr plog::Severity kInitialLevel = plog::info;
#endif

} // namespace

void Bootstrap::InitializeLogging(const StartInfo& info)
{
    auto base = info.working_directory.empty() ? std::filesystem::current_path() : info.working_directory;
    utils::LogManager::Initialize(base / "logs", kInitialLevel);

    utils::LogManager::LoggerConfig runtime_log;
    runtime_log.name = "tether";
    runtime_log.filename = "tether.log";
    runtime_log.add_console_appender = true;
    utils::LogManager::RegisterLogger<0>(runtime_log);

    utils::LogManager::LoggerConfig plugin_log;
    plugin_log.name = "plugins";
    plugin_log.filename = "plugins.log";
    utils::LogManager::RegisterLogger<utils::kPluginLogInstance>(plugin_log);
}

void Bootstrap::Run(const StartInfo& info, OneShotSignal& finished, std::unique_ptr<ISubsystemFactory> factory,
                    std::optional<LaunchOptions> options)
{
    try
    {
        InitializeLogging(info);
        utils::CrashHandler::Initialize();

        utils::LogLevelSwitch log_level(kInitialLevel);
        if (!factory)
            factory = std::make_unique<DefaultSubsystemFactory>();

        Supervisor supervisor(info, log_level, finished, std::move(factory));
        {
            ActiveRegistration registration(supervisor);
            if (options)
                supervisor.Start(*options);
            else
                supervisor.Start();

            supervisor.WaitForUnload();
        }
        supervisor.Dispose();
    }
    catch (...)
    {
        PLOG_FATAL << "Runtime thread failed: " << CurrentExceptionMessage();
    }

    PLOG_INFO << "Runtime thread finished";

    // The injector may free this module once `finished` is set.
    utils::CrashHandler::Uninstall();
    utils::LogManager::Shutdown();
    finished.Set();
}

bool Bootstrap::RequestUnload()
{
    std::lock_guard<std::mutex> lock(g_active_mutex);
    if (g_active == nullptr)
        return false;
    g_active->Unload();
    return true;
}

} // namespace tether
