#include "RuntimeConfiguration.hpp"
#include "tether/utils/ErrorReporter.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <plog/Log.h>
#include <toml++/toml.h>

namespace fs = std::filesystem;

namespace tether
{

RuntimeConfiguration RuntimeConfiguration::Load(const fs::path& path)
{
    RuntimeConfiguration config;
    config.path_ = path;

    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec))
    {
        PLOG_INFO << "No configuration at '" << path.string() << "', using defaults";
        return config;
    }

    toml::table root;
    try
    {
        root = toml::parse_file(path.string());
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream oss;
        oss << "Failed to parse configuration '" << path.string() << "': " << pe.description() << " (line "
            << pe.source().begin.line << ")";
        throw ConfigurationError(oss.str());
    }

    if (auto lang = root["language_override"].value<std::string>(); lang && !lang->empty())
    {
        config.language_override = *lang;
    }

    if (auto level = root["logging_level"].value<int64_t>())
    {
        if (*level >= 0 && *level <= 6)
            config.logging_level = static_cast<int>(*level);
        else
            PLOG_WARNING << "Ignoring out-of-range logging_level " << *level;
    }

    if (auto disabled = root["disabled_plugins"].as_array())
    {
        for (auto&& node : *disabled)
        {
            if (auto name = node.value<std::string>())
                config.disabled_plugins.push_back(*name);
        }
    }

    if (auto overlay = root["overlay"].as_table())
    {
        if (auto scale = (*overlay)["font_scale"].value<double>())
            config.overlay_font_scale = static_cast<float>(*scale);
        if (auto banner = (*overlay)["show_startup_banner"].value<bool>())
            config.show_startup_banner = *banner;
    }

    PLOG_INFO << "Loaded configuration from " << path.string();
    return config;
}

bool RuntimeConfiguration::Save() const { return SaveAs(path_); }

bool RuntimeConfiguration::SaveAs(const fs::path& path) const
{
    last_error_.clear();

    toml::table root;
    if (language_override)
        root.insert_or_assign("language_override", *language_override);
    if (logging_level)
        root.insert_or_assign("logging_level", static_cast<int64_t>(*logging_level));

    toml::array disabled;
    for (const auto& name : disabled_plugins)
        disabled.push_back(name);
    root.insert_or_assign("disabled_plugins", std::move(disabled));

    toml::table overlay;
    overlay.insert_or_assign("font_scale", static_cast<double>(overlay_font_scale));
    overlay.insert_or_assign("show_startup_banner", show_startup_banner);
    root.insert_or_assign("overlay", std::move(overlay));

    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);

    fs::path tmp = path;
    tmp += ".tmp";
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        last_error_ = "Failed to open temp file for writing";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not create temporary file for writing: " + tmp.string());
        return false;
    }
    ofs << root;
    ofs.flush();
    ofs.close();

    fs::rename(tmp, path, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    PLOG_INFO << "Saved configuration to " << path.string();
    return true;
}

bool RuntimeConfiguration::IsPluginDisabled(const std::string& name) const
{
    return std::find(disabled_plugins.begin(), disabled_plugins.end(), name) != disabled_plugins.end();
}

} // namespace tether
