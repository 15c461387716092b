#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace tether
{

namespace sig
{
inline constexpr const char* kFrameworkUpdate = "framework_update";
inline constexpr const char* kNetworkDispatch = "network_dispatch";
inline constexpr const char* kTerritoryChange = "territory_change";
inline constexpr const char* kDebugCheck = "debug_check";
inline constexpr const char* kOverlayPresent = "overlay_present";
inline constexpr const char* kExceptionFilter = "exception_filter";
} // namespace sig

/**
 * @brief Named host signatures.
 *
 * A value is either a byte pattern ("48 8B ?? 05") or "@symbol" for a function the
 * host module exports by name.
 */
class Signatures
{
public:
    /// Built-in patterns for the supported game build.
    static Signatures Defaults();

    /// Defaults overlaid with `<asset_directory>/signatures.toml` when present.
    /// Malformed files are logged and ignored.
    static Signatures Load(const std::filesystem::path& asset_directory);

    /// Overlays entries from a TOML file. Returns the number of entries applied.
    size_t LoadOverrides(const std::filesystem::path& path);

    std::optional<std::string> Get(const std::string& name) const;
    void Set(const std::string& name, std::string value);

    size_t Size() const { return entries_.size(); }

    static bool IsSymbolReference(const std::string& value) { return !value.empty() && value[0] == '@'; }

private:
    std::map<std::string, std::string> entries_;
};

} // namespace tether
