#include "OverlayRuntime.hpp"
#include "tether/core/SubsystemError.hpp"

#include <imgui.h>
#include <plog/Log.h>

namespace tether
{

std::atomic<OverlayRuntime*> OverlayRuntime::s_active{ nullptr };
DetourSlot<OverlayRuntime::PresentFn> OverlayRuntime::s_present_slot;

OverlayRuntime::OverlayRuntime(std::optional<uintptr_t> present_address, OverlaySettings settings)
    : present_address_(present_address)
    , settings_(settings)
{
}

OverlayRuntime::~OverlayRuntime() { Dispose(); }

void OverlayRuntime::Enable()
{
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        if (disposed_)
            throw SubsystemError("Overlay", "enable after dispose");
        if (context_ != nullptr)
            return;

        IMGUI_CHECKVERSION();
        context_ = ImGui::CreateContext();
        ImGui::SetCurrentContext(context_);
        ImGuiIO& io = ImGui::GetIO();
        io.IniFilename = nullptr;
        io.LogFilename = nullptr;
        io.FontGlobalScale = settings_.font_scale;
        io.DisplaySize = ImVec2(settings_.display_width, settings_.display_height);
        ImGui::StyleColorsDark();
    }

    if (!present_address_)
    {
        PLOG_INFO << "Overlay enabled without a present hook";
        return;
    }

    OverlayRuntime* expected = nullptr;
    if (!s_active.compare_exchange_strong(expected, this))
        throw SubsystemError("Overlay", "another overlay already owns the present hook");

    present_hook_ = std::make_unique<HostHook>("Overlay.Present", *present_address_,
                                               reinterpret_cast<uintptr_t>(&OverlayRuntime::PresentDetour));
    if (!present_hook_->Enable())
    {
        s_active.store(nullptr);
        throw SubsystemError("Overlay", "could not hook the host present call");
    }
    s_present_slot.Arm(present_hook_->Original<PresentFn>());
    PLOG_INFO << "Overlay hooked present at 0x" << std::hex << *present_address_;
}

SubscriptionId OverlayRuntime::SubscribeDraw(std::function<void()> callback)
{
    return draw_subscribers_.Subscribe(std::move(callback));
}

void OverlayRuntime::UnsubscribeDraw(SubscriptionId id) { draw_subscribers_.Unsubscribe(id); }

void OverlayRuntime::SetDrawDataSink(DrawDataSink sink)
{
    std::lock_guard<std::mutex> lock(frame_mutex_);
    sink_ = std::move(sink);
}

bool OverlayRuntime::RenderFrame(float delta_seconds)
{
    std::lock_guard<std::mutex> lock(frame_mutex_);
    if (disposed_ || context_ == nullptr)
        return false;

    ImGui::SetCurrentContext(context_);
    ImGuiIO& io = ImGui::GetIO();

    if (!font_ready_.IsSet())
    {
        io.Fonts->AddFontDefault();
        io.Fonts->Build();
        unsigned char* pixels = nullptr;
        int width = 0;
        int height = 0;
        io.Fonts->GetTexDataAsRGBA32(&pixels, &width, &height);
        PLOG_DEBUG << "Font atlas built (" << width << "x" << height << ")";
        font_ready_.Set();
    }

    io.DisplaySize = ImVec2(settings_.display_width, settings_.display_height);
    io.DeltaTime = delta_seconds > 0.0f ? delta_seconds : 1.0f / 60.0f;

    ImGui::NewFrame();
    for (const auto& callback : draw_subscribers_.Snapshot())
    {
        try
        {
            callback();
        }
        catch (...)
        {
            PLOG_ERROR << "Draw subscriber threw: " << CurrentExceptionMessage();
        }
    }
    ImGui::Render();

    if (sink_)
        sink_(ImGui::GetDrawData());

    frames_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void OverlayRuntime::Dispose()
{
    if (present_hook_)
    {
        s_present_slot.Disarm(*present_hook_);
        OverlayRuntime* expected = this;
        s_active.compare_exchange_strong(expected, nullptr);
    }

    // Waits out a frame in flight; no subscriber runs after this.
    std::lock_guard<std::mutex> lock(frame_mutex_);
    if (disposed_)
        return;
    disposed_ = true;

    draw_subscribers_.Clear();
    if (context_ != nullptr)
    {
        ImGui::DestroyContext(context_);
        context_ = nullptr;
    }
    PLOG_INFO << "Overlay disposed after " << FramesRendered() << " frame(s)";
}

long OverlayRuntime::PresentDetour(void* swap_chain, unsigned sync_interval, unsigned flags)
{
    OverlayRuntime* self = s_active.load(std::memory_order_acquire);
    auto original = s_present_slot.Original();
    if (self == nullptr)
        return original ? original(swap_chain, sync_interval, flags) : 0;

    auto now = std::chrono::steady_clock::now();
    float delta = 0.0f;
    if (self->last_present_.time_since_epoch().count() != 0)
        delta = std::chrono::duration<float>(now - self->last_present_).count();
    self->last_present_ = now;

    self->RenderFrame(delta);
    return original ? original(swap_chain, sync_interval, flags) : 0;
}

} // namespace tether
