#include "StartInfo.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tether
{

namespace
{

std::string ToLower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::filesystem::path PathField(const json& doc, const char* key)
{
    if (auto it = doc.find(key); it != doc.end() && it->is_string())
        return std::filesystem::path(it->get<std::string>());
    return {};
}

} // namespace

const char* LanguageCode(ClientLanguage language)
{
    switch (language)
    {
    case ClientLanguage::Japanese:
        return "ja";
    case ClientLanguage::English:
        return "en";
    case ClientLanguage::German:
        return "de";
    case ClientLanguage::French:
        return "fr";
    }
    return "en";
}

std::optional<ClientLanguage> ParseClientLanguage(std::string_view text)
{
    const std::string lower = ToLower(text);
    if (lower == "ja" || lower == "japanese")
        return ClientLanguage::Japanese;
    if (lower == "en" || lower == "english")
        return ClientLanguage::English;
    if (lower == "de" || lower == "german")
        return ClientLanguage::German;
    if (lower == "fr" || lower == "french")
        return ClientLanguage::French;
    return std::nullopt;
}

StartInfo StartInfo::FromJson(const std::string& text)
{
    json doc;
    try
    {
        doc = json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        throw std::runtime_error(std::string("Malformed start info: ") + e.what());
    }

    if (!doc.is_object())
        throw std::runtime_error("Malformed start info: expected a JSON object");

    StartInfo info;
    info.working_directory = PathField(doc, "working_directory");
    info.configuration_path = PathField(doc, "configuration_path");
    info.plugin_directory = PathField(doc, "plugin_directory");
    info.default_plugin_directory = PathField(doc, "default_plugin_directory");
    info.asset_directory = PathField(doc, "asset_directory");
    info.game_version = doc.value("game_version", std::string{});
    info.opt_out_telemetry = doc.value("opt_out_telemetry", false);

    // The injector sends either the numeric enum value or a language code.
    if (auto it = doc.find("language"); it != doc.end())
    {
        if (it->is_number_integer())
        {
            int value = it->get<int>();
            if (value < 0 || value > static_cast<int>(ClientLanguage::French))
                throw std::runtime_error("Malformed start info: language out of range");
            info.language = static_cast<ClientLanguage>(value);
        }
        else if (it->is_string())
        {
            auto parsed = ParseClientLanguage(it->get<std::string>());
            if (!parsed)
                throw std::runtime_error("Malformed start info: unknown language '" + it->get<std::string>() + "'");
            info.language = *parsed;
        }
    }

    return info;
}

StartInfo StartInfo::LoadFromFile(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("Unable to open start info: " + path.string());

    std::stringstream buffer;
    buffer << in.rdbuf();
    return FromJson(buffer.str());
}

std::string StartInfo::ToJson() const
{
    json doc = {
        { "working_directory", working_directory.string() },
        { "configuration_path", configuration_path.string() },
        { "plugin_directory", plugin_directory.string() },
        { "default_plugin_directory", default_plugin_directory.string() },
        { "asset_directory", asset_directory.string() },
        { "language", LanguageCode(language) },
        { "game_version", game_version },
        { "opt_out_telemetry", opt_out_telemetry },
    };
    return doc.dump(2);
}

} // namespace tether
