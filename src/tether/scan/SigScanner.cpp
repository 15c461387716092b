#include "SigScanner.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

#include <plog/Log.h>

namespace tether
{

namespace
{
// Regions are read in windows of this size; consecutive windows overlap by the pattern length.
constexpr size_t kScanWindow = 16 * 1024 * 1024;

std::string Hex(uintptr_t value)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}
} // namespace

SigScanner::SigScanner(ProcessContext context, Signatures signatures)
    : context_(std::move(context))
    , signatures_(std::move(signatures))
{
}

std::vector<size_t> SigScanner::BuildBadCharTable(const Pattern& pattern)
{
    std::vector<size_t> table(256, pattern.Size());

    for (size_t i = 0; i < pattern.Size() - 1; ++i)
    {
        if (pattern.mask[i])
        {
            table[pattern.bytes[i]] = pattern.Size() - 1 - i;
        }
    }

    return table;
}

std::optional<size_t> SigScanner::FindPatternInBuffer(const uint8_t* buffer, size_t buffer_size,
                                                      const Pattern& pattern,
                                                      const std::vector<size_t>& bad_char_table)
{
    if (buffer_size < pattern.Size())
    {
        return std::nullopt;
    }

    size_t i = 0;
    while (i <= buffer_size - pattern.Size())
    {
        size_t j = pattern.Size();

        while (j > 0)
        {
            --j;
            if (buffer[i + j] != pattern.bytes[j])
            {
                break;
            }
            if (j == 0)
            {
                return i;
            }
        }

        uint8_t bad_char = buffer[i + pattern.Size() - 1];
        i += bad_char_table[bad_char];
    }

    return std::nullopt;
}

std::optional<size_t> SigScanner::FindMaskedPatternInBuffer(const uint8_t* buffer, size_t buffer_size,
                                                             const Pattern& pattern)
{
    if (buffer_size < pattern.Size())
    {
        return std::nullopt;
    }

    for (size_t i = 0; i <= buffer_size - pattern.Size(); ++i)
    {
        bool match = true;
        for (size_t j = 0; j < pattern.Size(); ++j)
        {
            if (pattern.mask[j] && buffer[i + j] != pattern.bytes[j])
            {
                match = false;
                break;
            }
        }
        if (match)
            return i;
    }

    return std::nullopt;
}

std::optional<uintptr_t> SigScanner::ScanRegion(const MemoryRegion& region, const Pattern& pattern)
{
    if (!pattern.IsValid() || region.Size() < pattern.Size())
    {
        return std::nullopt;
    }

    const bool has_wildcards = pattern.HasWildcards();
    std::vector<size_t> bad_char_table;
    if (!has_wildcards)
    {
        bad_char_table = BuildBadCharTable(pattern);
    }

    std::vector<uint8_t> buffer;
    uintptr_t window_start = region.start;
    while (window_start + pattern.Size() <= region.end)
    {
        const size_t window_size = (std::min)(kScanWindow, static_cast<size_t>(region.end - window_start));
        buffer.resize(window_size);
        if (!context_.Memory().ReadMemory(window_start, buffer.data(), buffer.size()))
        {
            PLOG_VERBOSE << "Unreadable window at " << Hex(window_start);
            return std::nullopt;
        }

        std::optional<size_t> offset;
        if (has_wildcards)
            offset = FindMaskedPatternInBuffer(buffer.data(), buffer.size(), pattern);
        else
            offset = FindPatternInBuffer(buffer.data(), buffer.size(), pattern, bad_char_table);

        if (offset)
        {
            return window_start + *offset;
        }

        if (window_start + window_size >= region.end)
            break;
        window_start += window_size - (pattern.Size() - 1);
    }

    return std::nullopt;
}

std::optional<uintptr_t> SigScanner::ScanModule(const Pattern& pattern)
{
    for (const auto& region : context_.ReadableRegions())
    {
        if (auto result = ScanRegion(region, pattern))
            return result;
    }
    return std::nullopt;
}

std::optional<uintptr_t> SigScanner::ResolveRelativeTarget(uintptr_t instruction)
{
    int32_t displacement = 0;
    if (!context_.Memory().ReadMemory(instruction + 1, &displacement, sizeof(displacement)))
        return std::nullopt;
    return instruction + 5 + static_cast<intptr_t>(displacement);
}

std::optional<uintptr_t> SigScanner::TryScanText(const std::string& signature)
{
    if (disposed_)
    {
        PLOG_WARNING << "Scan requested after the scanner was disposed: " << signature;
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (auto it = cache_.find(signature); it != cache_.end())
            return it->second;
    }

    Pattern pattern = Pattern::FromString(signature);
    if (!pattern.IsValid())
    {
        PLOG_WARNING << "Invalid signature: '" << signature << "'";
        return std::nullopt;
    }

    std::optional<uintptr_t> result;
    for (const auto& region : context_.TextRegions())
    {
        result = ScanRegion(region, pattern);
        if (result)
            break;
    }

    if (!result)
        return std::nullopt;

    // Signatures that start on a call or jump refer to the callee.
    if (pattern.mask[0] && (pattern.bytes[0] == 0xE8 || pattern.bytes[0] == 0xE9))
    {
        result = ResolveRelativeTarget(*result);
        if (!result)
            return std::nullopt;
    }

    PLOG_VERBOSE << "Signature '" << signature << "' -> " << Hex(*result) << " (+" << Hex(*result - BaseAddress())
                 << ")";

    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_[signature] = *result;
    return result;
}

uintptr_t SigScanner::ScanText(const std::string& signature)
{
    auto result = TryScanText(signature);
    if (!result)
        throw SignatureNotFound("Signature not found in " + ModuleName() + ": " + signature);
    return *result;
}

std::optional<uintptr_t> SigScanner::TryResolve(const std::string& name)
{
    auto value = signatures_.Get(name);
    if (!value)
    {
        PLOG_WARNING << "No signature configured for '" << name << "'";
        return std::nullopt;
    }

    if (Signatures::IsSymbolReference(*value))
    {
        auto address = context_.Memory().FindSymbol(context_.Module(), value->substr(1));
        if (address)
            PLOG_VERBOSE << "Symbol '" << *value << "' -> " << Hex(*address);
        return address;
    }

    return TryScanText(*value);
}

uintptr_t SigScanner::Resolve(const std::string& name)
{
    auto result = TryResolve(name);
    if (!result)
        throw SignatureNotFound("Could not resolve '" + name + "' in " + ModuleName());
    return *result;
}

void SigScanner::Dispose()
{
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
    disposed_ = true;
}

} // namespace tether
