#pragma once

#include "IOverlay.hpp"
#include "tether/core/OneShotSignal.hpp"
#include "tether/memory/HostHook.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

struct ImGuiContext;
struct ImDrawData;

namespace tether
{

struct OverlaySettings
{
    float font_scale = 1.0f;
    float display_width = 1920.0f;
    float display_height = 1080.0f;
};

/**
 * @brief Dear ImGui overlay driven by the host's present call.
 *
 * Without a present address no hook is installed and the owner drives
 * RenderFrame itself.
 */
class OverlayRuntime : public IOverlayRuntime
{
public:
    using DrawDataSink = std::function<void(ImDrawData*)>;

    OverlayRuntime(std::optional<uintptr_t> present_address, OverlaySettings settings);
    ~OverlayRuntime() override;

    OverlayRuntime(const OverlayRuntime&) = delete;
    OverlayRuntime& operator=(const OverlayRuntime&) = delete;

    void Enable() override;

    SubscriptionId SubscribeDraw(std::function<void()> callback) override;
    void UnsubscribeDraw(SubscriptionId id) override;

    void WaitForFontRebuild() override { font_ready_.Wait(); }
    bool IsFontReady() const override { return font_ready_.IsSet(); }

    void Dispose() override;

    /**
     * @brief Render one overlay frame on the calling (render) thread
     *
     * Builds the font atlas on first use, runs every draw subscriber inside an
     * ImGui frame and hands the draw data to the sink.
     *
     * @return false when the overlay is not enabled or already disposed
     */
    bool RenderFrame(float delta_seconds);

    /// Receives the finished draw data, for the host-side renderer.
    void SetDrawDataSink(DrawDataSink sink);

    uint64_t FramesRendered() const { return frames_.load(std::memory_order_relaxed); }

private:
    using PresentFn = long (*)(void*, unsigned, unsigned);

    static long PresentDetour(void* swap_chain, unsigned sync_interval, unsigned flags);

    static std::atomic<OverlayRuntime*> s_active;
    static DetourSlot<PresentFn> s_present_slot;

    std::optional<uintptr_t> present_address_;
    OverlaySettings settings_;
    std::unique_ptr<HostHook> present_hook_;

    std::mutex frame_mutex_;
    ImGuiContext* context_ = nullptr;
    bool disposed_ = false;
    DrawDataSink sink_;
    std::chrono::steady_clock::time_point last_present_{};

    SubscriberList<> draw_subscribers_;
    OneShotSignal font_ready_;
    std::atomic<uint64_t> frames_{ 0 };
};

} // namespace tether
