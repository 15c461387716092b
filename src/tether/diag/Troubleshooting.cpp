#include "Troubleshooting.hpp"
#include "tether/Version.hpp"
#include "tether/core/Supervisor.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace tether
{

std::string Troubleshooting::LogSnapshot(const Supervisor& supervisor, bool interface_loaded)
{
    const auto& info = supervisor.Info();
    const auto& config = supervisor.Configuration();

    json payload;
    payload["runtime_version"] = TETHER_VERSION_STRING;
    payload["game_version"] = info.game_version;
    payload["language"] = LanguageCode(info.language);
    payload["interface_loaded"] = interface_loaded;
    payload["opt_out_telemetry"] = info.opt_out_telemetry;

    json plugins = json::array();
    if (auto* runtime = supervisor.Plugins())
    {
        for (const auto& plugin : runtime->LoadedPlugins())
            plugins.push_back({ { "name", plugin.name }, { "version", plugin.version }, { "bundled", plugin.is_default } });
    }
    payload["loaded_plugins"] = plugins;

    payload["configuration"] = {
        { "language_override", config.language_override ? *config.language_override : "" },
        { "logging_level", config.logging_level ? json(*config.logging_level) : json(nullptr) },
        { "disabled_plugins", config.disabled_plugins },
    };

    std::string text = payload.dump();
    PLOG_INFO << kLogPrefix << Base64Encode(text);
    return text;
}

std::string Troubleshooting::Base64Encode(const std::string& data)
{
    static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3)
    {
        uint32_t n = (static_cast<uint8_t>(data[i]) << 16) | (static_cast<uint8_t>(data[i + 1]) << 8) |
                     static_cast<uint8_t>(data[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest == 1)
    {
        uint32_t n = static_cast<uint8_t>(data[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    }
    else if (rest == 2)
    {
        uint32_t n = (static_cast<uint8_t>(data[i]) << 16) | (static_cast<uint8_t>(data[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace tether
