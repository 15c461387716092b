#include "HostSimulation.hpp"

#include <cstring>
#include <string>
#include <vector>

#include <plog/Log.h>

#if defined(_WIN32)
#define TETHER_HOST_EXPORT extern "C" __declspec(dllexport) __declspec(noinline)
#else
#define TETHER_HOST_EXPORT extern "C" __attribute__((visibility("default"), noinline, used))
#endif

namespace
{

// Opcode assigned to ChatMessage in assets/UIRes/serveropcode.json.
constexpr uint16_t kChatOpcode = 0x0067;
constexpr uint8_t kErrorMessageType = 60;

volatile uint64_t g_host_ticks = 0;
volatile uint16_t g_host_territory = 0;
volatile uint64_t g_host_packets = 0;
volatile uint64_t g_host_presents = 0;

std::vector<uint8_t> BuildChatPacket(uint8_t type, const std::string& sender, const std::string& text)
{
    std::vector<uint8_t> packet(4);
    packet.push_back(type);
    uint16_t sender_length = static_cast<uint16_t>(sender.size());
    packet.push_back(static_cast<uint8_t>(sender_length & 0xFF));
    packet.push_back(static_cast<uint8_t>(sender_length >> 8));
    packet.insert(packet.end(), sender.begin(), sender.end());
    packet.insert(packet.end(), text.begin(), text.end());

    uint16_t size = static_cast<uint16_t>(packet.size());
    std::memcpy(packet.data(), &size, sizeof(size));
    std::memcpy(packet.data() + 2, &kChatOpcode, sizeof(kChatOpcode));
    return packet;
}

} // namespace

// Hook targets. Bodies must stay large enough for a detour jump.

TETHER_HOST_EXPORT bool tether_host_framework_update(void* framework)
{
    g_host_ticks = g_host_ticks + 1;
    return framework != nullptr && g_host_ticks > 0;
}

TETHER_HOST_EXPORT void tether_host_network_dispatch(void* network, uint32_t target_id, const uint8_t* packet)
{
    if (network != nullptr && packet != nullptr && target_id != 0xFFFFFFFF)
        g_host_packets = g_host_packets + 1;
}

TETHER_HOST_EXPORT void* tether_host_setup_territory(void* manager, uint16_t territory)
{
    g_host_territory = territory;
    return manager != nullptr && territory != 0 ? manager : nullptr;
}

TETHER_HOST_EXPORT long tether_host_present(void* swap_chain, unsigned sync_interval, unsigned flags)
{
    if (swap_chain == nullptr)
        return -1;
    g_host_presents = g_host_presents + sync_interval + flags;
    return 0;
}

namespace tether::host
{

HostSimulation::HostSimulation(std::chrono::milliseconds frame_interval)
    : frame_interval_(frame_interval)
{
}

HostSimulation::~HostSimulation() { Stop(); }

void HostSimulation::Start()
{
    if (running_.exchange(true))
        return;
    thread_ = std::thread([this]() { Loop(); });
}

void HostSimulation::Stop()
{
    running_.store(false);
    if (thread_.joinable())
        thread_.join();
}

void HostSimulation::Loop()
{
    int framework = 0;
    int network = 0;
    int manager = 0;
    int swap_chain = 0;

    bool zoned = false;
    bool chatted = false;
    auto chat_packet = BuildChatPacket(kErrorMessageType, "", "Command not recognized: \"/thelp\"");

    PLOG_INFO << "Host simulation running";
    while (running_.load())
    {
        uint64_t frame = frames_.fetch_add(1, std::memory_order_relaxed) + 1;
        tether_host_framework_update(&framework);
        tether_host_present(&swap_chain, 1, 0);

        // Give the runtime time to hook before the one-off events.
        if (!zoned && frame == 120)
        {
            tether_host_setup_territory(&manager, 132);
            zoned = true;
        }
        if (!chatted && frame == 180)
        {
            tether_host_network_dispatch(&network, 1, chat_packet.data());
            chatted = true;
        }

        std::this_thread::sleep_for(frame_interval_);
    }
    PLOG_INFO << "Host simulation stopped after " << Frames() << " frame(s)";
}

} // namespace tether::host
