#pragma once

#include "IProcessMemory.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tether
{

class MemoryPatch
{
public:
    static bool WriteWithProtect(IProcessMemory& mem, uintptr_t address, const uint8_t* data, size_t size,
                                 MemoryProtection temp = MemoryProtection::ReadWriteExecute,
                                 MemoryProtection restore = MemoryProtection::ReadExecute);

    static bool WriteWithProtect(IProcessMemory& mem, uintptr_t address, const std::vector<uint8_t>& bytes,
                                 MemoryProtection temp = MemoryProtection::ReadWriteExecute,
                                 MemoryProtection restore = MemoryProtection::ReadExecute)
    {
        return WriteWithProtect(mem, address, bytes.data(), bytes.size(), temp, restore);
    }

    static std::vector<uint8_t> ReadBack(IProcessMemory& mem, uintptr_t address, size_t size);

    static std::string HexFirstN(const std::vector<uint8_t>& bytes, size_t n = 16);
};

/**
 * @brief Reversible code patch.
 *
 * Apply saves the bytes it overwrites; Restore writes them back. The destructor
 * restores an applied patch.
 */
class BytePatch
{
public:
    BytePatch(IProcessMemory& memory, uintptr_t address, std::vector<uint8_t> replacement);
    ~BytePatch();

    BytePatch(const BytePatch&) = delete;
    BytePatch& operator=(const BytePatch&) = delete;

    bool Apply();
    bool Restore();

    bool IsApplied() const { return applied_; }
    uintptr_t Address() const { return address_; }
    const std::vector<uint8_t>& OriginalBytes() const { return original_; }

private:
    IProcessMemory& memory_;
    uintptr_t address_;
    std::vector<uint8_t> replacement_;
    std::vector<uint8_t> original_;
    bool applied_ = false;
};

} // namespace tether
