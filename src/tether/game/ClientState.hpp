#pragma once

#include "IGameSubsystems.hpp"
#include "tether/memory/HostHook.hpp"

#include <atomic>

namespace tether
{

/**
 * @brief Tracks the player's territory through the host's zone-setup function.
 */
class ClientState : public IClientState
{
public:
    ClientState(uintptr_t territory_change_address, ClientLanguage language);
    ~ClientState() override;

    void Enable() override;

    uint16_t TerritoryType() const override { return territory_.load(std::memory_order_acquire); }
    ClientLanguage Language() const override { return language_; }

    SubscriptionId SubscribeTerritoryChanged(std::function<void(uint16_t)> callback) override;
    void UnsubscribeTerritoryChanged(SubscriptionId id) override;

    void Dispose() override;

    /// Records the new territory and notifies subscribers.
    void OnTerritoryChanged(uint16_t territory);

private:
    using SetupTerritoryFn = void* (*)(void*, uint16_t);

    static void* SetupTerritoryDetour(void* host_manager, uint16_t territory);

    static std::atomic<ClientState*> s_active;
    static DetourSlot<SetupTerritoryFn> s_territory_slot;

    HostHook hook_;
    ClientLanguage language_;
    std::atomic<uint16_t> territory_{ 0 };
    SubscriberList<uint16_t> territory_subscribers_;
    std::atomic<bool> disposed_{ false };
};

} // namespace tether
