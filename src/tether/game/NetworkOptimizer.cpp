#include "NetworkOptimizer.hpp"
#include "tether/core/SubsystemError.hpp"
#include "tether/memory/IProcessMemory.hpp"

#include <cerrno>
#include <cstring>

#include <plog/Log.h>

#ifdef _WIN32
#include <ws2tcpip.h>
#else
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#endif

namespace tether
{

namespace
{

#ifdef _WIN32
constexpr const char* kSocketModule = "ws2_32.dll";
constexpr NativeSocket kInvalidSocket = INVALID_SOCKET;
using SocketFn = SOCKET(WSAAPI*)(int, int, int);
#else
constexpr const char* kSocketModule = "libc.so.6";
constexpr NativeSocket kInvalidSocket = -1;
using SocketFn = int (*)(int, int, int);
#endif

DetourSlot<SocketFn> g_socket_slot;

} // namespace

std::atomic<NetworkOptimizer*> NetworkOptimizer::s_active{ nullptr };

NetworkOptimizer::NetworkOptimizer(IProcessMemory& memory)
{
    auto module = memory.FindModule(kSocketModule);
    if (!module)
        throw SubsystemError("NetworkOptimizer", std::string(kSocketModule) + " is not loaded");

    auto target = memory.FindSymbol(*module, "socket");
    if (!target)
        throw SubsystemError("NetworkOptimizer", std::string("socket() not exported by ") + kSocketModule);

    NetworkOptimizer* expected = nullptr;
    if (!s_active.compare_exchange_strong(expected, this))
        throw SubsystemError("NetworkOptimizer", "socket() is already hooked by another instance");

    hook_ = std::make_unique<HostHook>("NetworkOptimizer.socket", *target,
                                       reinterpret_cast<uintptr_t>(&NetworkOptimizer::SocketDetour));
    if (!hook_->Enable())
    {
        s_active.store(nullptr);
        throw SubsystemError("NetworkOptimizer", "could not hook socket()");
    }
    g_socket_slot.Arm(hook_->Original<SocketFn>());
    PLOG_INFO << "Network optimizer hooked socket() in " << kSocketModule;
}

NetworkOptimizer::~NetworkOptimizer() { Dispose(); }

void NetworkOptimizer::Dispose()
{
    if (disposed_.exchange(true))
        return;

    if (hook_)
        g_socket_slot.Disarm(*hook_);

    NetworkOptimizer* expected = this;
    s_active.compare_exchange_strong(expected, nullptr);
    PLOG_DEBUG << "Network optimizer disposed, tuned " << TunedSocketCount() << " socket(s)";
}

bool NetworkOptimizer::ApplySocketTuning(NativeSocket socket)
{
    int enable = 1;
    bool ok = true;
#ifdef _WIN32
    const char* value = reinterpret_cast<const char*>(&enable);
#else
    const void* value = &enable;
#endif

    if (setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, value, sizeof(enable)) != 0)
    {
        PLOG_WARNING << "TCP_NODELAY failed on socket " << socket;
        ok = false;
    }
    if (setsockopt(socket, SOL_SOCKET, SO_KEEPALIVE, value, sizeof(enable)) != 0)
    {
        PLOG_WARNING << "SO_KEEPALIVE failed on socket " << socket;
        ok = false;
    }
    return ok;
}

NativeSocket
#ifdef _WIN32
    WSAAPI
#endif
    NetworkOptimizer::SocketDetour(int family, int type, int protocol)
{
    auto original = g_socket_slot.Original();
    if (original == nullptr)
    {
#ifdef _WIN32
        WSASetLastError(WSAENETDOWN);
#else
        errno = ENETDOWN;
#endif
        return kInvalidSocket;
    }

    NativeSocket result = original(family, type, protocol);
    NetworkOptimizer* self = s_active.load(std::memory_order_acquire);
    if (self != nullptr && result != kInvalidSocket && (type & 0xF) == SOCK_STREAM)
    {
        if (ApplySocketTuning(result))
            self->tuned_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

} // namespace tether
