#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace tether::host
{

/**
 * @brief Stand-in game loop for running the runtime inside tether-host.
 *
 * The loop calls the exported tether_host_* functions the runtime hooks through
 * "@symbol" signatures: a frame update, a present call, one territory change, and
 * a chat packet carrying the host's unknown-command error for /thelp.
 */
class HostSimulation
{
public:
    explicit HostSimulation(std::chrono::milliseconds frame_interval = std::chrono::milliseconds(16));
    ~HostSimulation();

    HostSimulation(const HostSimulation&) = delete;
    HostSimulation& operator=(const HostSimulation&) = delete;

    void Start();
    void Stop();

    uint64_t Frames() const { return frames_.load(std::memory_order_relaxed); }

private:
    void Loop();

    std::chrono::milliseconds frame_interval_;
    std::atomic<bool> running_{ false };
    std::atomic<uint64_t> frames_{ 0 };
    std::thread thread_;
};

} // namespace tether::host
