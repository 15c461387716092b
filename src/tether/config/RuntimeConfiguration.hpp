#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tether
{

class ConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Persisted runtime settings, stored as TOML.
 *
 * Loaded once at the start of the runtime. UI-driven settings flows may change
 * values and call Save(); the supervisor itself never writes.
 */
class RuntimeConfiguration
{
public:
    std::optional<std::string> language_override;
    std::optional<int> logging_level; // plog severity; the bootstrap level stands when unset
    std::vector<std::string> disabled_plugins;
    float overlay_font_scale = 1.0f;
    bool show_startup_banner = true;

    /// Missing file yields defaults. A file that fails to parse throws ConfigurationError.
    static RuntimeConfiguration Load(const std::filesystem::path& path);

    /// Writes through a temporary file and rename. Returns false and logs on failure.
    bool Save() const;
    bool SaveAs(const std::filesystem::path& path) const;

    bool IsPluginDisabled(const std::string& name) const;

    const std::filesystem::path& Path() const { return path_; }

    /// Empty unless the last Save failed.
    const std::string& LastError() const { return last_error_; }

private:
    std::filesystem::path path_;
    mutable std::string last_error_;
};

} // namespace tether
