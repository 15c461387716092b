#include "ClientState.hpp"
#include "tether/core/SubsystemError.hpp"

#include <plog/Log.h>

namespace tether
{

std::atomic<ClientState*> ClientState::s_active{ nullptr };
DetourSlot<ClientState::SetupTerritoryFn> ClientState::s_territory_slot;

ClientState::ClientState(uintptr_t territory_change_address, ClientLanguage language)
    : hook_("ClientState.SetupTerritory", territory_change_address,
            reinterpret_cast<uintptr_t>(&ClientState::SetupTerritoryDetour))
    , language_(language)
{
    if (territory_change_address == 0)
        throw SubsystemError("ClientState", "territory change function not resolved");
}

ClientState::~ClientState() { Dispose(); }

void ClientState::Enable()
{
    ClientState* expected = nullptr;
    if (!s_active.compare_exchange_strong(expected, this) && expected != this)
        throw SubsystemError("ClientState", "another client state instance is already hooked");

    if (!hook_.Enable())
    {
        s_active.store(nullptr);
        throw SubsystemError("ClientState", "could not hook the territory change function");
    }
    s_territory_slot.Arm(hook_.Original<SetupTerritoryFn>());
    PLOG_INFO << "Client state hooks enabled (language " << LanguageCode(language_) << ")";
}

SubscriptionId ClientState::SubscribeTerritoryChanged(std::function<void(uint16_t)> callback)
{
    return territory_subscribers_.Subscribe(std::move(callback));
}

void ClientState::UnsubscribeTerritoryChanged(SubscriptionId id) { territory_subscribers_.Unsubscribe(id); }

void ClientState::Dispose()
{
    if (disposed_.exchange(true))
        return;

    s_territory_slot.Disarm(hook_);
    ClientState* expected = this;
    s_active.compare_exchange_strong(expected, nullptr);
    territory_subscribers_.Clear();
}

void ClientState::OnTerritoryChanged(uint16_t territory)
{
    territory_.store(territory, std::memory_order_release);
    PLOG_DEBUG << "Territory changed to " << territory;

    for (const auto& callback : territory_subscribers_.Snapshot())
    {
        try
        {
            callback(territory);
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Territory subscriber threw: " << ex.what();
        }
    }
}

void* ClientState::SetupTerritoryDetour(void* host_manager, uint16_t territory)
{
    if (ClientState* self = s_active.load(std::memory_order_acquire))
        self->OnTerritoryChanged(territory);

    auto original = s_territory_slot.Original();
    return original ? original(host_manager, territory) : nullptr;
}

} // namespace tether
