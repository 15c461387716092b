#include "Framework.hpp"
#include "tether/core/SubsystemError.hpp"

#include <cstring>

#include <plog/Log.h>

namespace tether
{

std::atomic<Framework*> Framework::s_active{ nullptr };
DetourSlot<Framework::UpdateFn> Framework::s_update_slot;
DetourSlot<Framework::NetworkFn> Framework::s_network_slot;

Framework::Framework(const FrameworkCreateInfo& info)
    : update_hook_("Framework.Update", info.update_address, reinterpret_cast<uintptr_t>(&Framework::UpdateDetour))
    , network_hook_("Framework.Network", info.network_address,
                    reinterpret_cast<uintptr_t>(&Framework::NetworkDetour))
{
    if (info.update_address == 0)
        throw SubsystemError("Framework", "host update function not resolved");
    if (info.network_address == 0)
        PLOG_WARNING << "Host network dispatch not resolved, network messages will not be observed";
}

Framework::~Framework() { Dispose(); }

void Framework::Enable()
{
    Framework* expected = nullptr;
    if (!s_active.compare_exchange_strong(expected, this) && expected != this)
        throw SubsystemError("Framework", "another framework instance is already hooked");

    if (!update_hook_.Enable())
    {
        s_active.store(nullptr);
        throw SubsystemError("Framework", "could not hook the host update function");
    }
    s_update_slot.Arm(update_hook_.Original<UpdateFn>());

    if (network_hook_.Target() != 0)
    {
        if (network_hook_.Enable())
            s_network_slot.Arm(network_hook_.Original<NetworkFn>());
        else
            PLOG_ERROR << "Could not hook host network dispatch, continuing without network messages";
    }

    PLOG_INFO << "Framework hooks enabled";
}

SubscriptionId Framework::SubscribeUpdate(std::function<void()> callback)
{
    return update_subscribers_.Subscribe(std::move(callback));
}

void Framework::UnsubscribeUpdate(SubscriptionId id) { update_subscribers_.Unsubscribe(id); }

SubscriptionId Framework::SubscribeNetworkMessage(std::function<void(const NetworkMessage&)> callback)
{
    return network_subscribers_.Subscribe(std::move(callback));
}

void Framework::UnsubscribeNetworkMessage(SubscriptionId id) { network_subscribers_.Unsubscribe(id); }

void Framework::Dispose()
{
    if (disposed_.exchange(true))
        return;

    s_update_slot.Disarm(update_hook_);
    s_network_slot.Disarm(network_hook_);

    Framework* expected = this;
    s_active.compare_exchange_strong(expected, nullptr);

    update_subscribers_.Clear();
    network_subscribers_.Clear();
    PLOG_DEBUG << "Framework disposed after " << FrameCount() << " frame(s)";
}

void Framework::Tick()
{
    frame_count_.fetch_add(1, std::memory_order_relaxed);
    for (const auto& callback : update_subscribers_.Snapshot())
    {
        try
        {
            callback();
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Update subscriber threw: " << ex.what();
        }
    }
}

void Framework::DispatchPacket(uint32_t target_id, const uint8_t* packet)
{
    if (packet == nullptr)
        return;

    uint16_t size = 0;
    uint16_t opcode = 0;
    std::memcpy(&size, packet, sizeof(size));
    std::memcpy(&opcode, packet + 2, sizeof(opcode));
    if (size < kPacketHeaderSize)
    {
        PLOG_DEBUG << "Dropping packet with size " << size;
        return;
    }

    NetworkMessage message;
    message.opcode = opcode;
    message.target_id = target_id;
    message.payload.assign(packet + kPacketHeaderSize, packet + size);

    for (const auto& callback : network_subscribers_.Snapshot())
    {
        try
        {
            callback(message);
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Network subscriber threw on opcode 0x" << std::hex << opcode << ": " << ex.what();
        }
    }
}

bool Framework::UpdateDetour(void* host_framework)
{
    if (Framework* self = s_active.load(std::memory_order_acquire))
        self->Tick();

    auto original = s_update_slot.Original();
    return original ? original(host_framework) : false;
}

void Framework::NetworkDetour(void* host_network, uint32_t target_id, const uint8_t* packet)
{
    if (Framework* self = s_active.load(std::memory_order_acquire))
        self->DispatchPacket(target_id, packet);

    auto original = s_network_slot.Original();
    if (original)
        original(host_network, target_id, packet);
}

} // namespace tether
