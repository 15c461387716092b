#pragma once

#include "ISubsystemFactory.hpp"
#include "OneShotSignal.hpp"
#include "StartupPlan.hpp"
#include "tether/api/LaunchOptions.hpp"
#include "tether/api/StartInfo.hpp"
#include "tether/config/RuntimeConfiguration.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether
{

namespace utils
{
class LogLevelSwitch;
}

enum class LifecycleState : uint8_t
{
    NotStarted,
    Starting,
    Ready,
    FailedDuringStart,
    Unloading,
    Disposed
};

const char* LifecycleStateName(LifecycleState state);

/**
 * @brief Brings the runtime's subsystems up in dependency order and tears them down again.
 *
 * Threading:
 * - Start and Dispose run on the host-owned bootstrap thread, once each.
 * - Unload may be called from any thread and never blocks.
 * - WaitForUnload blocks until Unload was called; WaitForUnloadFinish blocks
 *   until the caller has set the finish signal after Dispose.
 *
 * No exception escapes any public lifecycle method.
 */
class Supervisor
{
public:
    Supervisor(StartInfo info, utils::LogLevelSwitch& log_level, OneShotSignal& unload_finished,
               std::unique_ptr<ISubsystemFactory> factory);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Resolves LaunchOptions from the environment, then starts.
    void Start();
    void Start(const LaunchOptions& options);

    void Unload();
    void WaitForUnload() const;
    void WaitForUnloadFinish() const;
    void Dispose();

    bool IsReady() const { return state_.load(std::memory_order_acquire) == LifecycleState::Ready; }
    LifecycleState State() const { return state_.load(std::memory_order_acquire); }

    /// Reinstalls the host's own exception filter. Returns the filter it replaced.
    std::optional<uintptr_t> ReplaceExceptionHandler();
    bool RestoreExceptionHandler(uintptr_t previous);

    const StartInfo& Info() const { return info_; }
    const RuntimeConfiguration& Configuration() const { return configuration_; }
    const OneShotSignal& UnloadRequested() const { return unload_requested_; }

    ISigScanner* Scanner() const { return scanner_.get(); }
    IHookGuard* HookGuard() const { return hook_guard_.get(); }
    IFramework* Framework() const { return framework_.get(); }
    INetworkHandlers* Network() const { return network_handlers_.get(); }
    IClientState* ClientState() const { return client_state_.get(); }
    ILocalization* Localization() const { return localization_.get(); }
    IOverlayRuntime* Overlay() const { return overlay_.get(); }
    IRuntimeInterface* Interface() const { return runtime_interface_.get(); }
    ISeasonalFeature* Seasonal() const { return seasonal_.get(); }
    IDataAssets* Data() const { return data_.get(); }
    IStringDecoder* Decoder() const { return decoder_.get(); }
    ICommandRouter* Commands() const { return command_router_.get(); }
    IChatFeatures* Chat() const { return chat_.get(); }
    IPluginRuntime* Plugins() const { return plugins_.get(); }

    /// Lines printed to the player, oldest first.
    std::vector<std::string> ChatLog() const;

    /// Diagnostic JSON emitted on reaching Ready, empty before.
    const std::string& TroubleshootingPayload() const { return troubleshooting_; }

private:
    /// Runs one startup step under its failure policy. Returns false only when the
    /// step failed with AbortAndUnload.
    bool RunStep(StartupStep step, const std::function<void()>& body,
                 const std::function<void()>& on_soft_failure = {});

    void DisposeStep(const char* name, const std::function<void()>& body);
    void ReleaseHandles();

    BuiltinCommandHooks MakeBuiltinHooks();
    void PrintChat(const std::string& line);

    StartInfo info_;
    utils::LogLevelSwitch& log_level_;
    OneShotSignal& unload_finished_;
    OneShotSignal unload_requested_;
    std::unique_ptr<ISubsystemFactory> factory_;

    std::atomic<LifecycleState> state_{ LifecycleState::NotStarted };
    std::atomic<bool> dispose_entered_{ false };

    RuntimeConfiguration configuration_;

    std::unique_ptr<ISigScanner> scanner_;
    std::unique_ptr<IHookGuard> hook_guard_;
    std::unique_ptr<IFramework> framework_;
    std::unique_ptr<INetworkOptimizer> network_optimizer_;
    std::unique_ptr<INetworkHandlers> network_handlers_;
    std::unique_ptr<IClientState> client_state_;
    std::unique_ptr<ILocalization> localization_;
    std::unique_ptr<IPluginCatalog> plugin_catalog_;
    std::unique_ptr<IPluginCatalog> default_plugin_catalog_;
    std::unique_ptr<IRuntimeInterface> runtime_interface_;
    std::unique_ptr<IOverlayRuntime> overlay_;
    std::unique_ptr<ISeasonalFeature> seasonal_;
    std::unique_ptr<IDataAssets> data_;
    std::unique_ptr<IStringDecoder> decoder_;
    std::unique_ptr<ICommandRouter> command_router_;
    std::unique_ptr<IBuiltinCommands> builtin_commands_;
    std::unique_ptr<IChatFeatures> chat_;
    std::unique_ptr<IPluginRuntime> plugins_;
    std::unique_ptr<IExceptionFilterInstaller> filter_installer_;

    std::string troubleshooting_;

    mutable std::mutex chat_mutex_;
    std::vector<std::string> chat_log_;
};

} // namespace tether
