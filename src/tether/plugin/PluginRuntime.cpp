#include "PluginRuntime.hpp"
#include "tether/command/ICommandRouter.hpp"
#include "tether/config/RuntimeConfiguration.hpp"
#include "tether/overlay/IOverlay.hpp"
#include "tether/utils/ErrorReporter.hpp"
#include "tether/utils/LogManager.hpp"

#include <algorithm>
#include <set>

#include <plog/Log.h>

namespace tether
{

namespace
{

using LoadedPlugin = PluginRuntime::LoadedPlugin;

LoadedPlugin& FromContext(void* ctx) { return *static_cast<LoadedPlugin*>(ctx); }

plog::Severity ToSeverity(int level)
{
    if (level < TETHER_LOG_FATAL)
        return plog::fatal;
    if (level > TETHER_LOG_VERBOSE)
        return plog::verbose;
    return static_cast<plog::Severity>(level);
}

void HostLog(void* ctx, int level, const char* message)
{
    auto& plugin = FromContext(ctx);
    PLOG_(utils::kPluginLogInstance, ToSeverity(level)) << "[" << plugin.manifest.name << "] " << (message ? message : "");
}

int HostAddCommand(void* ctx, const char* command, const char* help, tether_command_fn fn, void* user_data)
{
    auto& plugin = FromContext(ctx);
    if (command == nullptr || fn == nullptr)
        return 0;

    std::lock_guard<std::mutex> lock(plugin.registrations_mutex);
    if (plugin.withdrawn)
    {
        PLOG_WARNING << "Plugin " << plugin.manifest.name << " registered " << command << " while unloading, ignored";
        return 0;
    }

    CommandInfo info;
    info.help_message = help ? help : "";
    info.handler = [fn, user_data](const std::string& cmd, const std::string& args) {
        fn(user_data, cmd.c_str(), args.c_str());
    };

    if (!plugin.owner->Commands().AddHandler(command, std::move(info)))
    {
        PLOG_WARNING << "Plugin " << plugin.manifest.name << " tried to register existing command " << command;
        return 0;
    }
    plugin.commands.emplace_back(command);
    return 1;
}

int HostRemoveCommand(void* ctx, const char* command)
{
    auto& plugin = FromContext(ctx);
    if (command == nullptr)
        return 0;

    std::lock_guard<std::mutex> lock(plugin.registrations_mutex);
    auto it = std::find(plugin.commands.begin(), plugin.commands.end(), command);
    if (it == plugin.commands.end())
        return 0;

    plugin.commands.erase(it);
    return plugin.owner->Commands().RemoveHandler(command) ? 1 : 0;
}

unsigned long long HostSubscribeDraw(void* ctx, tether_draw_fn fn, void* user_data)
{
    auto& plugin = FromContext(ctx);
    IOverlayRuntime* overlay = plugin.owner->Overlay();
    if (overlay == nullptr || fn == nullptr)
        return 0;

    std::lock_guard<std::mutex> lock(plugin.registrations_mutex);
    if (plugin.withdrawn)
        return 0;

    SubscriptionId id = overlay->SubscribeDraw([fn, user_data]() { fn(user_data); });
    plugin.draw_subscriptions.push_back(id);
    return id;
}

void HostUnsubscribeDraw(void* ctx, unsigned long long id)
{
    auto& plugin = FromContext(ctx);
    IOverlayRuntime* overlay = plugin.owner->Overlay();
    std::lock_guard<std::mutex> lock(plugin.registrations_mutex);
    auto it = std::find(plugin.draw_subscriptions.begin(), plugin.draw_subscriptions.end(), id);
    if (overlay == nullptr || it == plugin.draw_subscriptions.end())
        return;

    plugin.draw_subscriptions.erase(it);
    overlay->UnsubscribeDraw(id);
}

const char* HostGameVersion(void* ctx) { return FromContext(ctx).owner->GameVersion().c_str(); }

const char* HostLanguage(void* ctx) { return FromContext(ctx).owner->Language().c_str(); }

} // namespace

PluginRuntime::PluginRuntime(const PluginRuntimeCreateInfo& info)
    : commands_(info.commands)
    , overlay_(info.overlay)
    , catalog_(info.catalog)
    , default_catalog_(info.default_catalog)
    , configuration_(info.configuration)
    , game_version_(info.game_version)
    , language_(info.language)
{
}

PluginRuntime::~PluginRuntime() { UnloadPlugins(); }

void PluginRuntime::LoadPlugins()
{
    std::set<std::string> seen;
    auto load_from = [&](IPluginCatalog& catalog, bool is_default) {
        for (const auto& manifest : catalog.Discover())
        {
            if (!seen.insert(manifest.name).second)
            {
                PLOG_INFO << "Skipping bundled " << manifest.name << ", an installed copy is already loaded";
                continue;
            }
            if (manifest.disabled || configuration_.IsPluginDisabled(manifest.name))
            {
                PLOG_INFO << "Plugin " << manifest.name << " is disabled";
                continue;
            }
            if (manifest.api_level != TETHER_PLUGIN_ABI_VERSION)
            {
                PLOG_WARNING << "Plugin " << manifest.name << " targets API level " << manifest.api_level
                             << ", runtime provides " << TETHER_PLUGIN_ABI_VERSION;
                continue;
            }
            LoadPlugin(manifest, is_default);
        }
    };

    load_from(catalog_, false);
    if (default_catalog_)
        load_from(*default_catalog_, true);

    PLOG_INFO << "Loaded " << LoadedPlugins().size() << " plugin(s)";
}

bool PluginRuntime::LoadPlugin(const PluginManifest& manifest, bool is_default)
{
    PLOG_DEBUG << "Loading plugin " << manifest.name << " " << manifest.version << " from "
               << manifest.library.string();

    auto plugin = std::make_unique<LoadedPlugin>();
    plugin->owner = this;
    plugin->manifest = manifest;
    plugin->is_default = is_default;

    auto library = manifest.library.string();
    plugin->module = libmem::LoadModule(library.c_str());
    if (!plugin->module)
    {
        PLOG_ERROR << "Could not load plugin library " << library;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Plugin, "Plugin " + manifest.name + " failed to load",
                                          "LoadModule failed for " + library);
        return false;
    }

    auto load_address = libmem::FindSymbolAddress(&plugin->module.value(), TETHER_PLUGIN_LOAD_SYMBOL);
    auto unload_address = libmem::FindSymbolAddress(&plugin->module.value(), TETHER_PLUGIN_UNLOAD_SYMBOL);
    if (!load_address || !unload_address)
    {
        PLOG_ERROR << "Plugin " << manifest.name << " does not export " << TETHER_PLUGIN_LOAD_SYMBOL << " and "
                   << TETHER_PLUGIN_UNLOAD_SYMBOL;
        libmem::UnloadModule(&plugin->module.value());
        return false;
    }

    plugin->unload = reinterpret_cast<tether_plugin_unload_fn>(*unload_address);
    plugin->api.abi_version = TETHER_PLUGIN_ABI_VERSION;
    plugin->api.ctx = plugin.get();
    plugin->api.log = HostLog;
    plugin->api.add_command = HostAddCommand;
    plugin->api.remove_command = HostRemoveCommand;
    plugin->api.subscribe_draw = HostSubscribeDraw;
    plugin->api.unsubscribe_draw = HostUnsubscribeDraw;
    plugin->api.game_version = HostGameVersion;
    plugin->api.language = HostLanguage;

    auto load = reinterpret_cast<tether_plugin_load_fn>(*load_address);
    int rc = load(&plugin->api);
    if (rc != 0)
    {
        PLOG_ERROR << "Plugin " << manifest.name << " refused to load (code " << rc << ")";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Plugin, "Plugin " + manifest.name + " failed to load",
                                          "tether_plugin_load returned " + std::to_string(rc));
        // Undo whatever it registered before failing.
        plugin->unload = nullptr;
        UnloadPlugin(*plugin);
        return false;
    }

    PLOG_INFO << "Loaded plugin " << manifest.name << " " << manifest.version << (is_default ? " (bundled)" : "");
    std::lock_guard<std::mutex> lock(mutex_);
    plugins_.push_back(std::move(plugin));
    return true;
}

void PluginRuntime::UnloadPlugins()
{
    std::vector<std::unique_ptr<LoadedPlugin>> plugins;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        plugins.swap(plugins_);
    }

    for (auto it = plugins.rbegin(); it != plugins.rend(); ++it)
        UnloadPlugin(**it);

    if (!plugins.empty())
        PLOG_INFO << "Unloaded " << plugins.size() << " plugin(s)";
}

void PluginRuntime::UnloadPlugin(LoadedPlugin& plugin)
{
    const auto& name = plugin.manifest.name;

    // Nothing routes into the plugin once its unload entry point runs.
    std::vector<std::string> commands;
    std::vector<SubscriptionId> draw_subscriptions;
    {
        std::lock_guard<std::mutex> lock(plugin.registrations_mutex);
        plugin.withdrawn = true;
        commands.swap(plugin.commands);
        draw_subscriptions.swap(plugin.draw_subscriptions);
    }

    for (const auto& command : commands)
        commands_.RemoveHandler(command);

    if (overlay_)
    {
        for (auto id : draw_subscriptions)
            overlay_->UnsubscribeDraw(id);
    }

    if (plugin.unload)
    {
        PLOG_DEBUG << "Unloading plugin " << name;
        plugin.unload();
        plugin.unload = nullptr;
    }

    if (plugin.module && !libmem::UnloadModule(&plugin.module.value()))
        PLOG_WARNING << "Could not unload library of plugin " << name;
    plugin.module.reset();
}

std::vector<LoadedPluginInfo> PluginRuntime::LoadedPlugins() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LoadedPluginInfo> infos;
    infos.reserve(plugins_.size());
    for (const auto& plugin : plugins_)
        infos.push_back({ plugin->manifest.name, plugin->manifest.version, plugin->is_default });
    return infos;
}

} // namespace tether
