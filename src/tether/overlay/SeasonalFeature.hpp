#pragma once

#include "IOverlay.hpp"
#include "tether/api/LaunchOptions.hpp"

#include <atomic>

namespace tether
{

/**
 * @brief Seasonal overlay decoration, only active on one calendar day.
 */
class SeasonalFeature : public ISeasonalFeature
{
public:
    static constexpr CivilDate kActiveDate{ 2021, 4, 1 };

    static bool IsActiveOn(const CivilDate& date) { return date == kActiveDate; }

    /// Attaches to the overlay draw event immediately.
    explicit SeasonalFeature(IOverlayRuntime& overlay);
    ~SeasonalFeature() override;

    bool IsAttached() const override { return attached_.load(std::memory_order_acquire); }
    void Dispose() override;

private:
    void Draw();

    IOverlayRuntime& overlay_;
    SubscriptionId subscription_ = 0;
    std::atomic<bool> attached_{ false };
    float elapsed_ = 0.0f;
};

} // namespace tether
