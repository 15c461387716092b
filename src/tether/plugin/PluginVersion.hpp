#pragma once

#include <array>
#include <compare>
#include <optional>
#include <string>

namespace tether
{

// Plugin version (up to four numeric components, "1.2" == "1.2.0.0")
class PluginVersion
{
public:
    PluginVersion() = default;
    PluginVersion(int major, int minor, int patch = 0, int revision = 0);

    int major() const { return parts_[0]; }
    int minor() const { return parts_[1]; }
    int patch() const { return parts_[2]; }
    int revision() const { return parts_[3]; }

    // Shortest form without trailing zero components beyond minor, e.g. "1.2" or "1.2.0.4"
    std::string toString() const;

    auto operator<=>(const PluginVersion& other) const = default;

    // Accepts "1", "1.2", "1.2.3", "1.2.3.4" with an optional leading 'v'
    static std::optional<PluginVersion> tryParse(const std::string& text);

private:
    std::array<int, 4> parts_{ 0, 0, 0, 0 };
};

} // namespace tether
