#pragma once

#include <functional>
#include <optional>
#include <string_view>

namespace tether
{

struct CivilDate
{
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    bool operator==(const CivilDate&) const = default;

    static CivilDate Today();
};

/**
 * @brief Start-time toggles, resolved once by the caller and passed into Supervisor::Start.
 */
struct LaunchOptions
{
    static constexpr const char* kNoInterfaceVariable = "TETHER_NOT_HAVE_INTERFACE";
    static constexpr const char* kNoPluginsVariable = "TETHER_NOT_HAVE_PLUGINS";

#ifdef TETHER_DEBUG
    static constexpr bool kHookGuardByDefault = true;
#else
    static constexpr bool kHookGuardByDefault = false;
#endif

    bool overlay_enabled = true;
    bool plugins_enabled = true;
    bool hook_guard_enabled = kHookGuardByDefault;
    CivilDate today{};

    using VariableLookup = std::function<const char*(const char*)>;

    /// Reads the process environment and the local date.
    static LaunchOptions FromEnvironment();

    static LaunchOptions FromVariables(const VariableLookup& lookup, CivilDate today);
};

/// Parses "true"/"false"/"1"/"0" (case-insensitive). Anything else yields nullopt.
std::optional<bool> ParseBooleanFlag(std::string_view text);

} // namespace tether
