#include "PluginVersion.hpp"

#include <regex>
#include <sstream>

namespace tether
{

PluginVersion::PluginVersion(int major, int minor, int patch, int revision) : parts_{ major, minor, patch, revision }
{
}

std::string PluginVersion::toString() const
{
    std::ostringstream oss;
    oss << parts_[0] << "." << parts_[1];
    if (parts_[2] != 0 || parts_[3] != 0)
        oss << "." << parts_[2];
    if (parts_[3] != 0)
        oss << "." << parts_[3];
    return oss.str();
}

std::optional<PluginVersion> PluginVersion::tryParse(const std::string& text)
{
    std::string cleaned = text;
    if (!cleaned.empty() && (cleaned[0] == 'v' || cleaned[0] == 'V'))
        cleaned = cleaned.substr(1);

    static const std::regex version_regex(R"(^(\d+)(?:\.(\d+))?(?:\.(\d+))?(?:\.(\d+))?$)");
    std::smatch match;
    if (!std::regex_match(cleaned, match, version_regex))
        return std::nullopt;

    PluginVersion version;
    try
    {
        for (size_t i = 0; i < 4; ++i)
        {
            if (match[i + 1].matched)
                version.parts_[i] = std::stoi(match[i + 1].str());
        }
    }
    catch (const std::exception&)
    {
        // out of int range
        return std::nullopt;
    }
    return version;
}

} // namespace tether
