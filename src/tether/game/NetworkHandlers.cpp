#include "NetworkHandlers.hpp"

#include <vector>

#include <plog/Log.h>

namespace tether
{

NetworkHandlers::NetworkHandlers(IFramework& framework, bool opt_out_telemetry)
    : framework_(framework)
    , opt_out_telemetry_(opt_out_telemetry)
{
    framework_subscription_ = framework_.SubscribeNetworkMessage([this](const NetworkMessage& message) { Dispatch(message); });
    if (opt_out_telemetry_)
        PLOG_INFO << "Telemetry opt-out: telemetry network handlers will not be registered";
}

NetworkHandlers::~NetworkHandlers() { framework_.UnsubscribeNetworkMessage(framework_subscription_); }

SubscriptionId NetworkHandlers::RegisterHandler(uint16_t opcode, Handler handler, bool telemetry)
{
    if (telemetry && opt_out_telemetry_)
    {
        PLOG_DEBUG << "Skipping telemetry handler for opcode 0x" << std::hex << opcode;
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    handlers_.emplace(id, Entry{ opcode, std::move(handler) });
    return id;
}

void NetworkHandlers::RemoveHandler(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

size_t NetworkHandlers::Dispatch(const NetworkMessage& message)
{
    std::vector<Handler> matching;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : handlers_)
        {
            if (entry.opcode == message.opcode)
                matching.push_back(entry.handler);
        }
    }

    size_t ran = 0;
    for (const auto& handler : matching)
    {
        try
        {
            handler(message);
            ++ran;
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Network handler for opcode 0x" << std::hex << message.opcode << " threw: " << ex.what();
        }
    }
    return ran;
}

size_t NetworkHandlers::HandlerCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

} // namespace tether
