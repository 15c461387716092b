#include "Supervisor.hpp"
#include "SubsystemError.hpp"
#include "tether/Version.hpp"
#include "tether/diag/Troubleshooting.hpp"
#include "tether/overlay/SeasonalFeature.hpp"
#include "tether/utils/CrashHandler.hpp"
#include "tether/utils/ErrorReporter.hpp"
#include "tether/utils/LogLevelSwitch.hpp"

#include <plog/Log.h>

namespace tether
{

namespace
{

constexpr size_t kChatLogLimit = 200;

} // namespace

const char* LifecycleStateName(LifecycleState state)
{
    switch (state)
    {
    case LifecycleState::NotStarted: return "NotStarted";
    case LifecycleState::Starting: return "Starting";
    case LifecycleState::Ready: return "Ready";
    case LifecycleState::FailedDuringStart: return "FailedDuringStart";
    case LifecycleState::Unloading: return "Unloading";
    case LifecycleState::Disposed: return "Disposed";
    }
    return "Unknown";
}

Supervisor::Supervisor(StartInfo info, utils::LogLevelSwitch& log_level, OneShotSignal& unload_finished,
                       std::unique_ptr<ISubsystemFactory> factory)
    : info_(std::move(info))
    , log_level_(log_level)
    , unload_finished_(unload_finished)
    , factory_(std::move(factory))
{
}

Supervisor::~Supervisor() { ReleaseHandles(); }

void Supervisor::Start() { Start(LaunchOptions::FromEnvironment()); }

void Supervisor::Start(const LaunchOptions& options)
{
    LifecycleState expected = LifecycleState::NotStarted;
    if (!state_.compare_exchange_strong(expected, LifecycleState::Starting))
    {
        PLOG_WARNING << "Start ignored in state " << LifecycleStateName(expected);
        return;
    }

    PLOG_INFO << "Starting tether " << TETHER_VERSION_STRING << " for game " << info_.game_version;

    try
    {
        RunStep(StartupStep::LoadConfiguration, [&] {
            configuration_ = factory_->LoadConfiguration(info_.configuration_path);
            if (!configuration_.logging_level)
                return;
            auto level = static_cast<plog::Severity>(*configuration_.logging_level);
            if (level != log_level_.Get())
                log_level_.Set(level);
        });

        RunStep(StartupStep::ProcessContext, [&] { scanner_ = factory_->CreateSigScanner(info_); });

        RunStep(StartupStep::HookGuard, [&] {
            hook_guard_ = factory_->CreateHookGuard(*scanner_);
            if (options.hook_guard_enabled)
                hook_guard_->Enable();
        });

        RunStep(StartupStep::GameSubsystems, [&] {
            framework_ = factory_->CreateFramework(*scanner_);
            network_optimizer_ = factory_->CreateNetworkOptimizer();
            network_handlers_ = factory_->CreateNetworkHandlers(*framework_, info_.opt_out_telemetry);
            client_state_ = factory_->CreateClientState(*scanner_, info_.language);
        });

        RunStep(StartupStep::Localization, [&] {
            localization_ = factory_->CreateLocalization(info_.asset_directory);
            if (configuration_.language_override)
                localization_->SetupWithLangCode(*configuration_.language_override);
            else
                localization_->SetupWithUiCulture();
        });

        RunStep(StartupStep::PluginCatalog, [&] {
            plugin_catalog_ = factory_->CreatePluginCatalog(info_.plugin_directory, info_.game_version);
            if (!info_.default_plugin_directory.empty())
                default_plugin_catalog_ =
                    factory_->CreatePluginCatalog(info_.default_plugin_directory, info_.game_version);
        });

        RunStep(StartupStep::RuntimeInterface, [&] {
            runtime_interface_ = factory_->CreateRuntimeInterface(RuntimeInterfaceCreateInfo{
                TETHER_VERSION_STRING,
                log_level_,
                *localization_,
                [this]() { return plugins_ ? plugins_->LoadedPlugins() : std::vector<LoadedPluginInfo>{}; },
                [this]() { Unload(); },
            });
        });

        RunStep(
            StartupStep::Overlay,
            [&] {
                if (!options.overlay_enabled)
                {
                    PLOG_INFO << "Overlay suppressed by " << LaunchOptions::kNoInterfaceVariable;
                    return;
                }
                overlay_ = factory_->CreateOverlayRuntime(*scanner_, configuration_);
                overlay_->Enable();
                IRuntimeInterface* shell = runtime_interface_.get();
                overlay_->SubscribeDraw([shell]() { shell->Draw(); });
                overlay_->WaitForFontRebuild();
            },
            [&] {
                if (!overlay_)
                    return;
                // Released even when Dispose throws.
                auto overlay = std::move(overlay_);
                overlay->Dispose();
            });

        RunStep(StartupStep::SeasonalFeature, [&] {
            if (!overlay_)
            {
                PLOG_INFO << "Seasonal feature not attached: overlay unavailable";
                return;
            }
            if (!SeasonalFeature::IsActiveOn(options.today))
                return;
            seasonal_ = factory_->CreateSeasonalFeature(*overlay_);
        });

        if (!RunStep(StartupStep::DataAssets, [&] {
                data_ = factory_->CreateDataAssets(info_.language);
                data_->Initialize(info_.asset_directory);
            }))
        {
            return;
        }

        RunStep(StartupStep::StringDecoder, [&] { decoder_ = factory_->CreateStringDecoder(*data_); });

        RunStep(StartupStep::Commands, [&] {
            command_router_ = factory_->CreateCommandRouter(info_.language);
            builtin_commands_ = factory_->CreateBuiltinCommands(*command_router_, MakeBuiltinHooks());
            builtin_commands_->Setup();
        });

        RunStep(StartupStep::ChatFeatures, [&] {
            chat_ = factory_->CreateChatFeatures(ChatFeaturesCreateInfo{
                *command_router_,
                *localization_,
                *client_state_,
                *network_handlers_,
                *data_,
                *decoder_,
                [this](const std::string& line) { PrintChat(line); },
                [this]() { return plugins_ ? plugins_->LoadedPlugins().size() : size_t{ 0 }; },
            });
        });

        RunStep(StartupStep::Plugins, [&] {
            if (!options.plugins_enabled)
            {
                PLOG_INFO << "Plugins suppressed by " << LaunchOptions::kNoPluginsVariable;
                return;
            }
            plugin_catalog_->CleanupStalePlugins();
            plugins_ = factory_->CreatePluginRuntime(PluginRuntimeCreateInfo{
                *plugin_catalog_,
                default_plugin_catalog_.get(),
                *command_router_,
                overlay_.get(),
                configuration_,
                info_.game_version,
                LanguageCode(info_.language),
            });
            plugins_->LoadPlugins();
        });

        RunStep(StartupStep::EnableHostHooks, [&] {
            framework_->Enable();
            client_state_->Enable();
        });

        RunStep(StartupStep::Ready, [&] { troubleshooting_ = Troubleshooting::LogSnapshot(*this, overlay_ != nullptr); });

        expected = LifecycleState::Starting;
        state_.compare_exchange_strong(expected, LifecycleState::Ready);
        PLOG_INFO << "tether is ready";

        // An unload requested while starting still wins.
        if (unload_requested_.IsSet())
        {
            expected = LifecycleState::Ready;
            state_.compare_exchange_strong(expected, LifecycleState::Unloading);
        }
    }
    catch (...)
    {
        const std::string what = CurrentExceptionMessage();
        utils::CrashHandler::SetContext(nullptr);
        PLOG_FATAL << "Startup failed: " << what;
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Startup, "tether could not start and will unload",
                                          what);
        state_.store(LifecycleState::FailedDuringStart, std::memory_order_release);
        Unload();
    }
}

bool Supervisor::RunStep(StartupStep step, const std::function<void()>& body,
                         const std::function<void()>& on_soft_failure)
{
    const char* name = StartupPolicy::StepName(step);
    PLOG_VERBOSE << "[START] " << name;

    FailurePolicy policy = StartupPolicy::For(step);
    if (policy == FailurePolicy::Fatal)
    {
        utils::CrashHandler::SetContext(name);
        body();
        utils::CrashHandler::SetContext(nullptr);
        return true;
    }

    try
    {
        body();
        return true;
    }
    catch (...)
    {
        const std::string what = CurrentExceptionMessage();
        if (policy == FailurePolicy::Soft)
        {
            PLOG_ERROR << "[START] " << name << " failed, continuing without it: " << what;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Startup,
                                              std::string(name) + " is unavailable for this session", what);
            if (on_soft_failure)
            {
                try
                {
                    on_soft_failure();
                }
                catch (...)
                {
                    PLOG_ERROR << "[START] " << name << " cleanup failed: " << CurrentExceptionMessage();
                }
            }
            return true;
        }

        PLOG_FATAL << "[START] " << name << " failed, unloading: " << what;
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Startup, "Game data could not be loaded", what);
        state_.store(LifecycleState::FailedDuringStart, std::memory_order_release);
        Unload();
        return false;
    }
}

void Supervisor::Unload()
{
    unload_requested_.Set();

    LifecycleState expected = LifecycleState::Ready;
    if (state_.compare_exchange_strong(expected, LifecycleState::Unloading))
        PLOG_INFO << "Unload requested";
}

void Supervisor::WaitForUnload() const { unload_requested_.Wait(); }

void Supervisor::WaitForUnloadFinish() const { unload_finished_.Wait(); }

void Supervisor::Dispose()
{
    if (dispose_entered_.exchange(true))
    {
        PLOG_WARNING << "Dispose called more than once, ignoring";
        return;
    }

    state_.store(LifecycleState::Unloading, std::memory_order_release);
    PLOG_INFO << "Disposing tether";

    try
    {
        DisposeStep("SeasonalFeature", [&] {
            if (seasonal_)
                seasonal_->Dispose();
        });

        // The render thread must stop calling draw subscribers before plugins go away.
        DisposeStep("Overlay", [&] {
            if (overlay_)
                overlay_->Dispose();
        });

        DisposeStep("Plugins", [&] {
            if (plugins_)
                plugins_->UnloadPlugins();
        });

        DisposeStep("Framework", [&] {
            if (framework_)
                framework_->Dispose();
        });

        DisposeStep("ClientState", [&] {
            if (client_state_)
                client_state_->Dispose();
        });

        DisposeStep("UnloadSignal", [&] { unload_requested_.Set(); });

        DisposeStep("NetworkOptimizer", [&] {
            if (network_optimizer_)
                network_optimizer_->Dispose();
        });

        DisposeStep("SigScanner", [&] {
            if (scanner_)
                scanner_->Dispose();
        });

        DisposeStep("DataAssets", [&] {
            if (data_)
                data_->Dispose();
        });

        DisposeStep("HookGuard", [&] {
            if (hook_guard_)
                hook_guard_->Dispose();
        });
    }
    catch (...)
    {
        const std::string what = CurrentExceptionMessage();
        PLOG_ERROR << "Teardown failed: " << what;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Teardown, "tether did not unload cleanly", what);
    }

    state_.store(LifecycleState::Disposed, std::memory_order_release);
    PLOG_INFO << "tether disposed";
}

void Supervisor::DisposeStep(const char* name, const std::function<void()>& body)
{
    PLOG_VERBOSE << "[DISPOSE] " << name;
    try
    {
        body();
    }
    catch (...)
    {
        const std::string what = CurrentExceptionMessage();
        PLOG_ERROR << "[DISPOSE] " << name << " failed: " << what;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Teardown, std::string(name) + " failed to dispose",
                                          what);
    }
}

// Dependents go before what they depend on.
void Supervisor::ReleaseHandles()
{
    chat_.reset();
    plugins_.reset();
    builtin_commands_.reset();
    command_router_.reset();
    decoder_.reset();
    data_.reset();
    seasonal_.reset();
    overlay_.reset();
    runtime_interface_.reset();
    default_plugin_catalog_.reset();
    plugin_catalog_.reset();
    localization_.reset();
    client_state_.reset();
    network_handlers_.reset();
    network_optimizer_.reset();
    framework_.reset();
    hook_guard_.reset();
    filter_installer_.reset();
    scanner_.reset();
}

std::optional<uintptr_t> Supervisor::ReplaceExceptionHandler()
{
    if (!scanner_)
    {
        PLOG_WARNING << "Exception filter replacement needs the scanner";
        return std::nullopt;
    }

    try
    {
        if (!filter_installer_)
            filter_installer_ = factory_->CreateExceptionFilterInstaller();
        return ExceptionFilter::Replace(*scanner_, *filter_installer_);
    }
    catch (...)
    {
        PLOG_ERROR << "Exception filter replacement failed: " << CurrentExceptionMessage();
        return std::nullopt;
    }
}

bool Supervisor::RestoreExceptionHandler(uintptr_t previous)
{
    if (!filter_installer_)
    {
        PLOG_WARNING << "No exception filter was replaced";
        return false;
    }
    return ExceptionFilter::Restore(*filter_installer_, previous);
}

BuiltinCommandHooks Supervisor::MakeBuiltinHooks()
{
    BuiltinCommandHooks hooks;
    hooks.print = [this](const std::string& line) { PrintChat(line); };
    hooks.version = []() { return std::string(TETHER_VERSION_STRING); };
    hooks.plugin_summaries = [this]() {
        std::vector<std::string> lines;
        if (!plugins_)
            return lines;
        for (const auto& plugin : plugins_->LoadedPlugins())
            lines.push_back(plugin.name + " " + plugin.version + (plugin.is_default ? " (bundled)" : ""));
        return lines;
    };
    hooks.set_log_level = [this](const std::string& text) {
        auto level = utils::LogLevelSwitch::Parse(text);
        if (!level)
            return false;
        log_level_.Set(*level);
        return true;
    };
    hooks.toggle_main_window = [this]() {
        if (runtime_interface_)
            runtime_interface_->ToggleMainWindow();
    };
    hooks.request_unload = [this]() { Unload(); };
    hooks.replace_exception_filter = [this]() { return ReplaceExceptionHandler().has_value(); };
    return hooks;
}

void Supervisor::PrintChat(const std::string& line)
{
    PLOG_INFO << "[chat] " << line;
    std::lock_guard<std::mutex> lock(chat_mutex_);
    if (chat_log_.size() >= kChatLogLimit)
        chat_log_.erase(chat_log_.begin());
    chat_log_.push_back(line);
}

std::vector<std::string> Supervisor::ChatLog() const
{
    std::lock_guard<std::mutex> lock(chat_mutex_);
    return chat_log_;
}

} // namespace tether
