#pragma once

#include "tether/api/StartInfo.hpp"
#include "tether/core/SubscriberList.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tether
{

/// A message the host's zone connection delivered, header stripped.
struct NetworkMessage
{
    uint16_t opcode = 0;
    uint32_t target_id = 0;
    std::vector<uint8_t> payload;
};

/**
 * @brief Countermeasure against the host's debugger-presence check.
 */
class IHookGuard
{
public:
    virtual ~IHookGuard() = default;

    virtual void Enable() = 0;
    virtual void Disable() = 0;
    virtual bool IsEnabled() const = 0;
    virtual void Dispose() = 0;
};

/**
 * @brief Host main-loop integration.
 *
 * Update and network subscribers run on the host's main thread, inside the
 * hooked host functions, once Enable has been called.
 */
class IFramework
{
public:
    virtual ~IFramework() = default;

    /// Installs the host hooks. Throws on failure.
    virtual void Enable() = 0;

    virtual SubscriptionId SubscribeUpdate(std::function<void()> callback) = 0;
    virtual void UnsubscribeUpdate(SubscriptionId id) = 0;

    virtual SubscriptionId SubscribeNetworkMessage(std::function<void(const NetworkMessage&)> callback) = 0;
    virtual void UnsubscribeNetworkMessage(SubscriptionId id) = 0;

    virtual uint64_t FrameCount() const = 0;

    /// Removes the hooks and drops every subscriber.
    virtual void Dispose() = 0;
};

/// Socket option tuning for the host's connections.
class INetworkOptimizer
{
public:
    virtual ~INetworkOptimizer() = default;

    virtual uint64_t TunedSocketCount() const = 0;
    virtual void Dispose() = 0;
};

/**
 * @brief Routes host network messages to registered handlers by opcode.
 */
class INetworkHandlers
{
public:
    virtual ~INetworkHandlers() = default;

    using Handler = std::function<void(const NetworkMessage&)>;

    /// Telemetry handlers are skipped when the user opted out of telemetry.
    virtual SubscriptionId RegisterHandler(uint16_t opcode, Handler handler, bool telemetry = false) = 0;
    virtual void RemoveHandler(SubscriptionId id) = 0;

    /// Returns the number of handlers that ran.
    virtual size_t Dispatch(const NetworkMessage& message) = 0;
};

/**
 * @brief Observable client-side game state.
 */
class IClientState
{
public:
    virtual ~IClientState() = default;

    /// Installs the territory-change hook. Throws on failure.
    virtual void Enable() = 0;

    virtual uint16_t TerritoryType() const = 0;
    virtual ClientLanguage Language() const = 0;

    virtual SubscriptionId SubscribeTerritoryChanged(std::function<void(uint16_t)> callback) = 0;
    virtual void UnsubscribeTerritoryChanged(SubscriptionId id) = 0;

    virtual void Dispose() = 0;
};

} // namespace tether
