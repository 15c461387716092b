#include "LaunchOptions.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <string>

#include <plog/Log.h>

namespace tether
{

namespace
{

// Missing or unparseable toggles read as "not suppressed".
bool ReadSuppressFlag(const LaunchOptions::VariableLookup& lookup, const char* name)
{
    const char* raw = lookup ? lookup(name) : nullptr;
    if (raw == nullptr)
        return false;

    auto parsed = ParseBooleanFlag(raw);
    if (!parsed)
    {
        PLOG_WARNING << "Ignoring " << name << "='" << raw << "': expected true or false";
        return false;
    }
    return *parsed;
}

} // namespace

CivilDate CivilDate::Today()
{
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    return CivilDate{ tm_buf.tm_year + 1900, static_cast<unsigned>(tm_buf.tm_mon + 1),
                      static_cast<unsigned>(tm_buf.tm_mday) };
}

std::optional<bool> ParseBooleanFlag(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "1")
        return true;
    if (lower == "false" || lower == "0")
        return false;
    return std::nullopt;
}

LaunchOptions LaunchOptions::FromEnvironment()
{
    return FromVariables([](const char* name) { return std::getenv(name); }, CivilDate::Today());
}

LaunchOptions LaunchOptions::FromVariables(const VariableLookup& lookup, CivilDate today)
{
    LaunchOptions options;
    options.overlay_enabled = !ReadSuppressFlag(lookup, kNoInterfaceVariable);
    options.plugins_enabled = !ReadSuppressFlag(lookup, kNoPluginsVariable);
    options.today = today;
    return options;
}

} // namespace tether
