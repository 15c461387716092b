#include "SeasonalFeature.hpp"

#include <cmath>

#include <imgui.h>
#include <plog/Log.h>

namespace tether
{

SeasonalFeature::SeasonalFeature(IOverlayRuntime& overlay)
    : overlay_(overlay)
{
    subscription_ = overlay_.SubscribeDraw([this]() { Draw(); });
    attached_.store(true, std::memory_order_release);
    PLOG_INFO << "Seasonal feature attached";
}

SeasonalFeature::~SeasonalFeature() { Dispose(); }

void SeasonalFeature::Dispose()
{
    if (!attached_.exchange(false))
        return;
    overlay_.UnsubscribeDraw(subscription_);
    PLOG_DEBUG << "Seasonal feature detached";
}

void SeasonalFeature::Draw()
{
    elapsed_ += ImGui::GetIO().DeltaTime;

    // Banner drifting along the top edge of the screen.
    const ImVec2 display = ImGui::GetIO().DisplaySize;
    const char* text = "Happy April 1st!";
    ImVec2 size = ImGui::CalcTextSize(text);
    float travel = display.x + size.x;
    float x = std::fmod(elapsed_ * 120.0f, travel) - size.x;
    float y = 8.0f + 4.0f * std::sin(elapsed_ * 3.0f);

    ImGui::GetForegroundDrawList()->AddText(ImVec2(x, y), IM_COL32(255, 200, 64, 255), text);
}

} // namespace tether
