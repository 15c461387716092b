#pragma once

#include "IGameSubsystems.hpp"
#include "tether/memory/HostHook.hpp"

#include <atomic>

namespace tether
{

struct FrameworkCreateInfo
{
    uintptr_t update_address = 0;
    uintptr_t network_address = 0; // Zero leaves network messages unobserved
};

/**
 * @brief Hooks the host's per-frame update and zone packet dispatch.
 *
 * Host packet layout: [u16 size][u16 opcode][payload], size counting the header.
 */
class Framework : public IFramework
{
public:
    static constexpr size_t kPacketHeaderSize = 4;

    explicit Framework(const FrameworkCreateInfo& info);
    ~Framework() override;

    void Enable() override;

    SubscriptionId SubscribeUpdate(std::function<void()> callback) override;
    void UnsubscribeUpdate(SubscriptionId id) override;

    SubscriptionId SubscribeNetworkMessage(std::function<void(const NetworkMessage&)> callback) override;
    void UnsubscribeNetworkMessage(SubscriptionId id) override;

    uint64_t FrameCount() const override { return frame_count_.load(std::memory_order_relaxed); }

    void Dispose() override;

    /// One host frame: runs update subscribers. Subscriber exceptions are logged.
    void Tick();

    /// Decodes a raw host packet and notifies network subscribers.
    void DispatchPacket(uint32_t target_id, const uint8_t* packet);

private:
    using UpdateFn = bool (*)(void*);
    using NetworkFn = void (*)(void*, uint32_t, const uint8_t*);

    static bool UpdateDetour(void* host_framework);
    static void NetworkDetour(void* host_network, uint32_t target_id, const uint8_t* packet);

    static std::atomic<Framework*> s_active;
    static DetourSlot<UpdateFn> s_update_slot;
    static DetourSlot<NetworkFn> s_network_slot;

    HostHook update_hook_;
    HostHook network_hook_;
    SubscriberList<> update_subscribers_;
    SubscriberList<const NetworkMessage&> network_subscribers_;
    std::atomic<uint64_t> frame_count_{ 0 };
    std::atomic<bool> disposed_{ false };
};

} // namespace tether
