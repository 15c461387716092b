#pragma once

#include "IGameSubsystems.hpp"

#include <map>
#include <mutex>

namespace tether
{

class NetworkHandlers : public INetworkHandlers
{
public:
    NetworkHandlers(IFramework& framework, bool opt_out_telemetry);
    ~NetworkHandlers() override;

    NetworkHandlers(const NetworkHandlers&) = delete;
    NetworkHandlers& operator=(const NetworkHandlers&) = delete;

    SubscriptionId RegisterHandler(uint16_t opcode, Handler handler, bool telemetry = false) override;
    void RemoveHandler(SubscriptionId id) override;
    size_t Dispatch(const NetworkMessage& message) override;

    size_t HandlerCount() const;

private:
    struct Entry
    {
        uint16_t opcode;
        Handler handler;
    };

    IFramework& framework_;
    SubscriptionId framework_subscription_;
    bool opt_out_telemetry_;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Entry> handlers_;
    SubscriptionId next_id_ = 1;
};

} // namespace tether
