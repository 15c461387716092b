#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tether
{

class ICommandRouter;
class IOverlayRuntime;
class RuntimeConfiguration;

struct PluginManifest
{
    std::string name;
    std::string version;
    std::filesystem::path library;   // Absolute, resolved against the version directory
    std::filesystem::path directory; // The version directory holding plugin.json
    int api_level = 0;
    std::string applicable_version = "any";
    bool disabled = false;
};

/**
 * @brief Plugins installed on disk, one directory per plugin and per version.
 */
class IPluginCatalog
{
public:
    virtual ~IPluginCatalog() = default;

    /// Removes superseded and deletion-marked versions. Returns the number removed.
    virtual size_t CleanupStalePlugins() = 0;

    /// Newest version of each plugin that applies to the game version.
    virtual std::vector<PluginManifest> Discover() const = 0;

    virtual const std::filesystem::path& Directory() const = 0;
};

struct LoadedPluginInfo
{
    std::string name;
    std::string version;
    bool is_default = false;
};

class IPluginRuntime
{
public:
    virtual ~IPluginRuntime() = default;

    /// Loads every applicable plugin. A plugin that fails is logged and skipped.
    virtual void LoadPlugins() = 0;

    /// Unloads in reverse load order. Never throws.
    virtual void UnloadPlugins() = 0;

    virtual std::vector<LoadedPluginInfo> LoadedPlugins() const = 0;
};

struct PluginRuntimeCreateInfo
{
    IPluginCatalog& catalog;
    IPluginCatalog* default_catalog = nullptr; // Bundled plugins, loaded after the user's
    ICommandRouter& commands;
    IOverlayRuntime* overlay = nullptr;        // Null when the overlay is unavailable
    const RuntimeConfiguration& configuration;
    std::string game_version;
    std::string language;
};

} // namespace tether
