#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tether
{

enum class MemoryProtection
{
    Read = 1,
    Write = 2,
    Execute = 4,
    ReadWrite = Read | Write,
    ReadExecute = Read | Execute,
    ReadWriteExecute = Read | Write | Execute
};

struct MemoryRegion
{
    uintptr_t start = 0;
    uintptr_t end = 0;
    int protection = 0;
    std::string pathname;

    size_t Size() const { return end - start; }

    bool IsReadable() const { return protection & static_cast<int>(MemoryProtection::Read); }

    bool IsExecutable() const { return protection & static_cast<int>(MemoryProtection::Execute); }

    bool IsWritable() const { return protection & static_cast<int>(MemoryProtection::Write); }
};

struct ModuleInfo
{
    std::string name;
    std::string path;
    uintptr_t base = 0;
    uintptr_t end = 0;

    size_t Size() const { return end - base; }
};

} // namespace tether
