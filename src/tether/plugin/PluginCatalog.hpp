#pragma once

#include "IPluginHost.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace tether
{

/**
 * @brief Plugin installations under `<directory>/<name>/<version>/plugin.json`.
 */
class PluginCatalog : public IPluginCatalog
{
public:
    static constexpr const char* kManifestFile = "plugin.json";
    static constexpr const char* kDeleteMarker = ".delete";

    PluginCatalog(std::filesystem::path directory, std::string game_version);

    size_t CleanupStalePlugins() override;
    std::vector<PluginManifest> Discover() const override;
    const std::filesystem::path& Directory() const override { return directory_; }

    /// Parses one plugin.json. Returns nullopt and logs when it is unreadable or incomplete.
    static std::optional<PluginManifest> ReadManifest(const std::filesystem::path& version_directory);

private:
    bool IsApplicable(const PluginManifest& manifest) const;

    std::filesystem::path directory_;
    std::string game_version_;
};

} // namespace tether
