#include "LogLevelSwitch.hpp"
#include "LogManager.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include <plog/Log.h>

namespace tether::utils
{

LogLevelSwitch::LogLevelSwitch(plog::Severity initial)
    : level_(initial)
{
}

void LogLevelSwitch::Set(plog::Severity level)
{
    level_.store(level, std::memory_order_release);

    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(level);
    if (auto logger = plog::get<kPluginLogInstance>())
        logger->setMaxSeverity(level);

    PLOG_INFO << "Log level set to " << plog::severityToString(level);
}

std::optional<plog::Severity> LogLevelSwitch::Parse(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.size() == 1 && lower[0] >= '0' && lower[0] <= '6')
        return static_cast<plog::Severity>(lower[0] - '0');

    if (lower == "none")
        return plog::none;
    if (lower == "fatal")
        return plog::fatal;
    if (lower == "error")
        return plog::error;
    if (lower == "warning" || lower == "warn")
        return plog::warning;
    if (lower == "info")
        return plog::info;
    if (lower == "debug")
        return plog::debug;
    if (lower == "verbose")
        return plog::verbose;
    return std::nullopt;
}

} // namespace tether::utils
