#pragma once

#include "IProcessMemory.hpp"

#include <string>
#include <vector>

namespace tether
{

/**
 * @brief Read-only view of the host's main executable module.
 */
class ProcessContext
{
public:
    /// Resolves the module by name, or the process's main executable when empty.
    /// Throws SubsystemError when the module cannot be found.
    static ProcessContext Acquire(IProcessMemory& memory, const std::string& module_name = "");

    /// Context over an explicit address range, treated as a single executable region.
    static ProcessContext FromRange(IProcessMemory& memory, std::string name, uintptr_t base, size_t size);

    IProcessMemory& Memory() const { return *memory_; }
    const ModuleInfo& Module() const { return module_; }
    uintptr_t BaseAddress() const { return module_.base; }

    /// Readable and executable regions of the module.
    std::vector<MemoryRegion> TextRegions() const;

    /// Every readable region of the module.
    std::vector<MemoryRegion> ReadableRegions() const;

private:
    ProcessContext(IProcessMemory& memory, ModuleInfo module, std::vector<MemoryRegion> regions);

    IProcessMemory* memory_;
    ModuleInfo module_;
    std::vector<MemoryRegion> regions_;
};

} // namespace tether
