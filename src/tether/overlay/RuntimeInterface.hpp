#pragma once

#include "IOverlay.hpp"
#include "tether/utils/ErrorReporter.hpp"

#include <atomic>
#include <deque>

namespace tether
{

/**
 * @brief The runtime's main window: version, log level, plugins and error reports.
 */
class RuntimeInterface : public IRuntimeInterface
{
public:
    static constexpr size_t kMaxShownErrors = 20;

    explicit RuntimeInterface(const RuntimeInterfaceCreateInfo& info);

    void Draw() override;
    void ToggleMainWindow() override;
    bool IsMainWindowOpen() const override { return main_open_.load(std::memory_order_acquire); }

    /// Error reports drained from ErrorReporter, newest last.
    const std::deque<utils::ErrorReport>& ShownErrors() const { return errors_; }

    /// Moves pending reports into the shown list. Called at the start of Draw.
    void CollectErrors();

private:
    void DrawLogLevel();
    void DrawPlugins();
    void DrawErrors();

    std::string version_;
    utils::LogLevelSwitch& log_level_;
    ILocalization& localization_;
    std::function<std::vector<LoadedPluginInfo>()> loaded_plugins_;
    std::function<void()> request_unload_;

    std::atomic<bool> main_open_{ false };
    std::deque<utils::ErrorReport> errors_;
};

} // namespace tether
