#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <libmem/libmem.hpp>

namespace tether
{

/**
 * @brief In-process function detour on a host function.
 *
 * Lifecycle States:
 * 1. Resolved - target and detour known, host code untouched
 * 2. Enabled - jump written, the detour runs and calls Original<Fn>() to continue
 * 3. Disabled - original code restored, trampoline released
 */
class HostHook
{
public:
    HostHook(std::string name, uintptr_t target, uintptr_t detour);
    ~HostHook();

    HostHook(const HostHook&) = delete;
    HostHook& operator=(const HostHook&) = delete;

    bool Enable();
    bool Disable();

    bool IsEnabled() const { return trampoline_.load(std::memory_order_acquire) != 0; }

    const std::string& Name() const { return name_; }
    uintptr_t Target() const { return target_; }

    template <typename Fn>
    Fn Original() const
    {
        return reinterpret_cast<Fn>(trampoline_.load(std::memory_order_acquire));
    }

private:
    std::string name_;
    uintptr_t target_;
    uintptr_t detour_;
    std::optional<libmem::Trampoline> hook_;
    std::atomic<uintptr_t> trampoline_{ 0 };
};

/// Logs and files a teardown report for a hook whose jump could not be removed.
void ReportStuckHook(const std::string& name);

/**
 * @brief Static landing point a detour forwards host calls through.
 *
 * Armed with the trampoline once the hook is in and cleared only after the jump is
 * gone, so a detour reached after its owner was disposed still calls the original.
 * Hook is HostHook, or anything with IsEnabled(), Disable() and Name().
 */
template <typename Fn>
class DetourSlot
{
public:
    void Arm(Fn original) { original_.store(original, std::memory_order_release); }

    /// Disables the hook and stops forwarding. When the unhook fails the jump stays
    /// live, the slot keeps forwarding and the failure is reported.
    template <typename Hook>
    bool Disarm(Hook& hook)
    {
        if (!hook.IsEnabled())
            return true;
        if (!hook.Disable())
        {
            ReportStuckHook(hook.Name());
            return false;
        }
        original_.store(nullptr, std::memory_order_release);
        return true;
    }

    Fn Original() const { return original_.load(std::memory_order_acquire); }

private:
    std::atomic<Fn> original_{ nullptr };
};

} // namespace tether
