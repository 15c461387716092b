#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tether
{

/// Byte signature with wildcard positions (mask[i] == false).
struct Pattern
{
    std::vector<uint8_t> bytes;
    std::vector<bool> mask;

    /// Parses "48 8B ?? 05". Wildcards are "??", "?" or ".". Any malformed token
    /// yields an invalid (empty) pattern.
    static Pattern FromString(const std::string& pattern_str);

    static Pattern FromBytes(const uint8_t* data, size_t size);

    size_t Size() const { return bytes.size(); }

    bool IsValid() const { return !bytes.empty() && bytes.size() == mask.size(); }

    bool HasWildcards() const;

    std::string ToString() const;
};

} // namespace tether
