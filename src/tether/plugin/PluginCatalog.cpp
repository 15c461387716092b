#include "PluginCatalog.hpp"
#include "PluginVersion.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace tether
{

namespace
{

struct VersionDirectory
{
    PluginVersion version;
    fs::path path;
};

// Version subdirectories of one plugin, oldest first. Unparseable names are skipped.
std::vector<VersionDirectory> ListVersions(const fs::path& plugin_directory)
{
    std::vector<VersionDirectory> versions;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(plugin_directory, ec))
    {
        if (!entry.is_directory())
            continue;

        auto name = entry.path().filename().string();
        auto version = PluginVersion::tryParse(name);
        if (!version)
        {
            PLOG_DEBUG << "Ignoring non-version directory " << entry.path().string();
            continue;
        }
        versions.push_back({ *version, entry.path() });
    }

    std::sort(versions.begin(), versions.end(),
              [](const VersionDirectory& a, const VersionDirectory& b) { return a.version < b.version; });
    return versions;
}

bool RemoveDirectory(const fs::path& path)
{
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
    {
        PLOG_ERROR << "Could not remove " << path.string() << ": " << ec.message();
        return false;
    }
    PLOG_INFO << "Removed stale plugin version " << path.string();
    return true;
}

} // namespace

PluginCatalog::PluginCatalog(fs::path directory, std::string game_version)
    : directory_(std::move(directory))
    , game_version_(std::move(game_version))
{
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec)
        PLOG_WARNING << "Could not create plugin directory " << directory_.string() << ": " << ec.message();
}

size_t PluginCatalog::CleanupStalePlugins()
{
    size_t removed = 0;
    std::error_code ec;
    for (const auto& plugin : fs::directory_iterator(directory_, ec))
    {
        if (!plugin.is_directory())
            continue;

        auto versions = ListVersions(plugin.path());

        // Marked versions go first, then everything but the newest survivor.
        std::vector<VersionDirectory> kept;
        for (const auto& version : versions)
        {
            if (fs::exists(version.path / kDeleteMarker))
            {
                if (RemoveDirectory(version.path))
                    ++removed;
                continue;
            }
            kept.push_back(version);
        }

        for (size_t i = 0; i + 1 < kept.size(); ++i)
        {
            if (RemoveDirectory(kept[i].path))
                ++removed;
        }
    }

    if (ec)
        PLOG_WARNING << "Plugin directory scan stopped early: " << ec.message();

    PLOG_INFO << "Plugin cleanup removed " << removed << " director" << (removed == 1 ? "y" : "ies");
    return removed;
}

std::vector<PluginManifest> PluginCatalog::Discover() const
{
    std::vector<PluginManifest> manifests;
    std::error_code ec;
    for (const auto& plugin : fs::directory_iterator(directory_, ec))
    {
        if (!plugin.is_directory())
            continue;

        auto versions = ListVersions(plugin.path());
        if (versions.empty())
            continue;

        auto manifest = ReadManifest(versions.back().path);
        if (!manifest)
            continue;

        if (!IsApplicable(*manifest))
        {
            PLOG_INFO << "Skipping " << manifest->name << ": built for " << manifest->applicable_version
                      << ", game is " << game_version_;
            continue;
        }
        manifests.push_back(std::move(*manifest));
    }

    std::sort(manifests.begin(), manifests.end(),
              [](const PluginManifest& a, const PluginManifest& b) { return a.name < b.name; });
    return manifests;
}

std::optional<PluginManifest> PluginCatalog::ReadManifest(const fs::path& version_directory)
{
    auto path = version_directory / kManifestFile;
    std::ifstream file(path);
    if (!file)
    {
        PLOG_WARNING << "Missing plugin manifest " << path.string();
        return std::nullopt;
    }

    try
    {
        json doc = json::parse(file);

        PluginManifest manifest;
        manifest.name = doc.value("name", "");
        manifest.version = doc.value("version", version_directory.filename().string());
        manifest.api_level = doc.value("api_level", 0);
        manifest.applicable_version = doc.value("applicable_version", "any");
        manifest.disabled = doc.value("disabled", false);
        manifest.directory = version_directory;

        std::string library = doc.value("library", "");
        if (manifest.name.empty() || library.empty())
        {
            PLOG_WARNING << "Plugin manifest " << path.string() << " needs 'name' and 'library'";
            return std::nullopt;
        }
        manifest.library = version_directory / library;
        return manifest;
    }
    catch (const json::exception& e)
    {
        PLOG_WARNING << "Malformed plugin manifest " << path.string() << ": " << e.what();
        return std::nullopt;
    }
}

bool PluginCatalog::IsApplicable(const PluginManifest& manifest) const
{
    return manifest.applicable_version == "any" || manifest.applicable_version == game_version_;
}

} // namespace tether
