#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tether
{

enum class ClientLanguage
{
    Japanese,
    English,
    German,
    French
};

/// Two-letter code used for asset and localization lookups ("ja", "en", "de", "fr").
const char* LanguageCode(ClientLanguage language);

/// Accepts two-letter codes and full English names, case-insensitive.
std::optional<ClientLanguage> ParseClientLanguage(std::string_view text);

/**
 * @brief Launch parameters handed over by the injector.
 *
 * Immutable for the lifetime of the process. Paths are not validated here; a
 * missing directory surfaces as the owning subsystem's construction error.
 */
struct StartInfo
{
    std::filesystem::path working_directory;
    std::filesystem::path configuration_path;
    std::filesystem::path plugin_directory;
    std::filesystem::path default_plugin_directory;
    std::filesystem::path asset_directory;
    ClientLanguage language = ClientLanguage::English;
    std::string game_version;
    bool opt_out_telemetry = false;

    /// Parses the injector's JSON document. Throws std::runtime_error on malformed input.
    static StartInfo FromJson(const std::string& text);

    /// Reads and parses a JSON file. Throws std::runtime_error if unreadable or malformed.
    static StartInfo LoadFromFile(const std::filesystem::path& path);

    std::string ToJson() const;
};

} // namespace tether
