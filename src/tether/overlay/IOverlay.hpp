#pragma once

#include "tether/core/SubscriberList.hpp"
#include "tether/plugin/IPluginHost.hpp"

#include <functional>
#include <string>
#include <vector>

namespace tether
{

class ILocalization;

namespace utils
{
class LogLevelSwitch;
}

/**
 * @brief In-process overlay drawn on top of the host's frames.
 *
 * Draw subscribers run on the host's render thread. After Dispose returns no
 * subscriber runs again.
 */
class IOverlayRuntime
{
public:
    virtual ~IOverlayRuntime() = default;

    /// Creates the UI context and hooks the host's present call. Throws on failure.
    virtual void Enable() = 0;

    virtual SubscriptionId SubscribeDraw(std::function<void()> callback) = 0;
    virtual void UnsubscribeDraw(SubscriptionId id) = 0;

    /// Blocks until the render thread has built the font atlas at least once.
    virtual void WaitForFontRebuild() = 0;

    virtual bool IsFontReady() const = 0;

    virtual void Dispose() = 0;
};

/// The runtime's own windows, drawn through the overlay.
class IRuntimeInterface
{
public:
    virtual ~IRuntimeInterface() = default;

    virtual void Draw() = 0;
    virtual void ToggleMainWindow() = 0;
    virtual bool IsMainWindowOpen() const = 0;
};

/// Date-gated overlay decoration.
class ISeasonalFeature
{
public:
    virtual ~ISeasonalFeature() = default;

    virtual bool IsAttached() const = 0;
    virtual void Dispose() = 0;
};

struct RuntimeInterfaceCreateInfo
{
    std::string version;
    utils::LogLevelSwitch& log_level;
    ILocalization& localization;
    std::function<std::vector<LoadedPluginInfo>()> loaded_plugins;
    std::function<void()> request_unload;
};

} // namespace tether
