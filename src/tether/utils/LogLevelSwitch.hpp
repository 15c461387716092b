#pragma once

#include <atomic>
#include <optional>
#include <string_view>

#include <plog/Severity.h>

namespace tether::utils
{

/**
 * @brief Runtime-adjustable log level shared by the runtime and plugin loggers.
 *
 * Owned by the bootstrap and passed to the supervisor by reference.
 */
class LogLevelSwitch
{
public:
    explicit LogLevelSwitch(plog::Severity initial = plog::info);

    /// Applies the level to every registered plog instance.
    void Set(plog::Severity level);

    plog::Severity Get() const { return level_.load(std::memory_order_acquire); }

    /// Accepts plog severity names ("verbose" ... "fatal", "none") or 0..6.
    static std::optional<plog::Severity> Parse(std::string_view text);

private:
    std::atomic<plog::Severity> level_;
};

} // namespace tether::utils
