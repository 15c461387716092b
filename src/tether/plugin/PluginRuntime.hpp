#pragma once

#include "IPluginHost.hpp"
#include "PluginAbi.h"
#include "tether/core/SubscriberList.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <libmem/libmem.hpp>

namespace tether
{

/**
 * @brief Loads plugin libraries into the process and brokers the host API they call.
 */
class PluginRuntime : public IPluginRuntime
{
public:
    explicit PluginRuntime(const PluginRuntimeCreateInfo& info);
    ~PluginRuntime() override;

    PluginRuntime(const PluginRuntime&) = delete;
    PluginRuntime& operator=(const PluginRuntime&) = delete;

    void LoadPlugins() override;
    void UnloadPlugins() override;
    std::vector<LoadedPluginInfo> LoadedPlugins() const override;

    /// Loads one plugin. Returns false and logs on failure.
    bool LoadPlugin(const PluginManifest& manifest, bool is_default);

    ICommandRouter& Commands() const { return commands_; }
    IOverlayRuntime* Overlay() const { return overlay_; }
    const std::string& GameVersion() const { return game_version_; }
    const std::string& Language() const { return language_; }

    /// Per-plugin state the host API callbacks operate on.
    struct LoadedPlugin
    {
        PluginRuntime* owner = nullptr;
        PluginManifest manifest;
        bool is_default = false;
        std::optional<libmem::Module> module;
        tether_plugin_unload_fn unload = nullptr;
        tether_host_api_v1 api{};

        // Host API calls may arrive from the command and render threads.
        std::mutex registrations_mutex;
        bool withdrawn = false; // Set once teardown began; new registrations are refused
        std::vector<std::string> commands;
        std::vector<SubscriptionId> draw_subscriptions;
    };

private:
    void UnloadPlugin(LoadedPlugin& plugin);

    ICommandRouter& commands_;
    IOverlayRuntime* overlay_;
    IPluginCatalog& catalog_;
    IPluginCatalog* default_catalog_;
    const RuntimeConfiguration& configuration_;
    std::string game_version_;
    std::string language_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<LoadedPlugin>> plugins_;
};

} // namespace tether
