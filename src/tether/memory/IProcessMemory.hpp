#pragma once

#include "MemoryRegion.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tether
{

/**
 * @brief Access to the memory of the process the runtime lives in.
 *
 * Every operation reports failure through its return value; none throw.
 */
class IProcessMemory
{
public:
    virtual ~IProcessMemory() = default;

    virtual bool ReadMemory(uintptr_t address, void* buffer, size_t size) = 0;

    virtual bool WriteMemory(uintptr_t address, const void* buffer, size_t size) = 0;

    virtual bool SetMemoryProtection(uintptr_t address, size_t size, MemoryProtection protection) = 0;

    virtual uintptr_t AllocateMemory(size_t size, bool executable = true) = 0;

    virtual bool FreeMemory(uintptr_t address, size_t size) = 0;

    /// First enumerated module when name is empty, which is the host executable.
    virtual std::optional<ModuleInfo> FindModule(const std::string& name = "") = 0;

    /// Memory segments overlapping [start, end).
    virtual std::vector<MemoryRegion> EnumerateRegions(uintptr_t start, uintptr_t end) = 0;

    /// Exported symbol of a loaded module.
    virtual std::optional<uintptr_t> FindSymbol(const ModuleInfo& module, const std::string& symbol) = 0;
};

} // namespace tether
