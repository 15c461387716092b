#pragma once

#include "IProcessMemory.hpp"

#include <optional>
#include <string>
#include <vector>

#include <libmem/libmem.hpp>

namespace tether
{

/**
 * @brief IProcessMemory for the current process, backed by libmem.
 */
class ProcessMemory : public IProcessMemory
{
public:
    ProcessMemory();
    ~ProcessMemory() override = default;

    /// False when libmem could not describe the current process.
    bool IsAttached() const { return m_process.has_value(); }

    bool ReadMemory(uintptr_t address, void* buffer, size_t size) override;
    bool WriteMemory(uintptr_t address, const void* buffer, size_t size) override;
    bool SetMemoryProtection(uintptr_t address, size_t size, MemoryProtection protection) override;
    uintptr_t AllocateMemory(size_t size, bool executable = true) override;
    bool FreeMemory(uintptr_t address, size_t size) override;
    std::optional<ModuleInfo> FindModule(const std::string& name = "") override;
    std::vector<MemoryRegion> EnumerateRegions(uintptr_t start, uintptr_t end) override;
    std::optional<uintptr_t> FindSymbol(const ModuleInfo& module, const std::string& symbol) override;

private:
    std::optional<libmem::Process> m_process;
};

} // namespace tether
