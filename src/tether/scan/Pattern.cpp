#include "Pattern.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <sstream>

namespace tether
{

Pattern Pattern::FromString(const std::string& pattern_str)
{
    Pattern pattern;
    std::istringstream iss(pattern_str);
    std::string token;

    while (iss >> token)
    {
        if (token == "??" || token == "?" || token == "." || token == "..")
        {
            pattern.bytes.push_back(0x00);
            pattern.mask.push_back(false);
            continue;
        }

        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value, 16);
        if (ec != std::errc() || ptr != token.data() + token.size() || token.size() > 2)
        {
            return Pattern();
        }
        pattern.bytes.push_back(static_cast<uint8_t>(value));
        pattern.mask.push_back(true);
    }

    return pattern;
}

Pattern Pattern::FromBytes(const uint8_t* data, size_t size)
{
    Pattern pattern;
    pattern.bytes.assign(data, data + size);
    pattern.mask.assign(size, true);
    return pattern;
}

bool Pattern::HasWildcards() const { return std::find(mask.begin(), mask.end(), false) != mask.end(); }

std::string Pattern::ToString() const
{
    std::string out;
    char buf[4];
    for (size_t i = 0; i < bytes.size(); ++i)
    {
        if (i)
            out.push_back(' ');
        if (!mask[i])
        {
            out += "??";
            continue;
        }
        std::snprintf(buf, sizeof(buf), "%02X", bytes[i]);
        out += buf;
    }
    return out;
}

} // namespace tether
