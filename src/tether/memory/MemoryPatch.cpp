#include "MemoryPatch.hpp"

#include <algorithm>
#include <cstdio>

#include <plog/Log.h>

namespace tether
{

bool MemoryPatch::WriteWithProtect(IProcessMemory& mem, uintptr_t address, const uint8_t* data, size_t size,
                                   MemoryProtection temp, MemoryProtection restore)
{
    if (!mem.SetMemoryProtection(address, size, temp))
    {
        PLOG_DEBUG << "Could not change protection at 0x" << std::hex << address << ", trying write anyway";
    }
    bool ok = mem.WriteMemory(address, data, size);
    if (!mem.SetMemoryProtection(address, size, restore))
    {
        PLOG_WARNING << "Could not restore protection at 0x" << std::hex << address;
    }
    return ok;
}

std::vector<uint8_t> MemoryPatch::ReadBack(IProcessMemory& mem, uintptr_t address, size_t size)
{
    std::vector<uint8_t> out(size);
    if (!mem.ReadMemory(address, out.data(), out.size()))
        out.clear();
    return out;
}

std::string MemoryPatch::HexFirstN(const std::vector<uint8_t>& bytes, size_t n)
{
    char buf[256];
    size_t cap = sizeof(buf);
    size_t pos = 0;
    size_t count = (std::min)(n, bytes.size());
    for (size_t i = 0; i < count && pos + 3 < cap; ++i)
    {
        pos += std::snprintf(buf + pos, cap - pos, "%02X ", bytes[i]);
    }
    return std::string(buf, buf + pos);
}

BytePatch::BytePatch(IProcessMemory& memory, uintptr_t address, std::vector<uint8_t> replacement)
    : memory_(memory)
    , address_(address)
    , replacement_(std::move(replacement))
{
}

BytePatch::~BytePatch()
{
    if (applied_)
        Restore();
}

bool BytePatch::Apply()
{
    if (applied_)
        return true;

    original_ = MemoryPatch::ReadBack(memory_, address_, replacement_.size());
    if (original_.size() != replacement_.size())
    {
        PLOG_ERROR << "Failed to read original bytes at 0x" << std::hex << address_;
        return false;
    }

    if (!MemoryPatch::WriteWithProtect(memory_, address_, replacement_))
    {
        PLOG_ERROR << "Failed to write patch at 0x" << std::hex << address_;
        return false;
    }

    PLOG_DEBUG << "Patched 0x" << std::hex << address_ << ": " << MemoryPatch::HexFirstN(original_) << "-> "
               << MemoryPatch::HexFirstN(replacement_);
    applied_ = true;
    return true;
}

bool BytePatch::Restore()
{
    if (!applied_)
        return true;

    if (!MemoryPatch::WriteWithProtect(memory_, address_, original_))
    {
        PLOG_ERROR << "Failed to restore original bytes at 0x" << std::hex << address_;
        return false;
    }

    applied_ = false;
    return true;
}

} // namespace tether
