#pragma once

#include "IGameSubsystems.hpp"
#include "tether/memory/HostHook.hpp"

#include <atomic>
#include <memory>

#ifdef _WIN32
#include <winsock2.h>
#endif

namespace tether
{

class IProcessMemory;

#ifdef _WIN32
using NativeSocket = SOCKET;
#else
using NativeSocket = int;
#endif

/**
 * @brief Tunes every TCP socket the host creates.
 *
 * Hooks the socket() export of the platform socket library. Streams get
 * TCP_NODELAY and SO_KEEPALIVE as soon as they exist.
 */
class NetworkOptimizer : public INetworkOptimizer
{
public:
    /// Hooks immediately. Throws SubsystemError when socket() cannot be hooked.
    explicit NetworkOptimizer(IProcessMemory& memory);
    ~NetworkOptimizer() override;

    uint64_t TunedSocketCount() const override { return tuned_.load(std::memory_order_relaxed); }
    void Dispose() override;

    /// Applies the socket options. Returns false if either setsockopt failed.
    static bool ApplySocketTuning(NativeSocket socket);

private:
    static NativeSocket
#ifdef _WIN32
        WSAAPI
#endif
        SocketDetour(int family, int type, int protocol);

    static std::atomic<NetworkOptimizer*> s_active;

    std::unique_ptr<HostHook> hook_;
    std::atomic<uint64_t> tuned_{ 0 };
    std::atomic<bool> disposed_{ false };
};

} // namespace tether
