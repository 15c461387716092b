#include "ProcessContext.hpp"
#include "tether/core/SubsystemError.hpp"

#include <sstream>

#include <plog/Log.h>

namespace tether
{

ProcessContext::ProcessContext(IProcessMemory& memory, ModuleInfo module, std::vector<MemoryRegion> regions)
    : memory_(&memory)
    , module_(std::move(module))
    , regions_(std::move(regions))
{
}

ProcessContext ProcessContext::Acquire(IProcessMemory& memory, const std::string& module_name)
{
    auto module = memory.FindModule(module_name);
    if (!module)
    {
        throw SubsystemError("ProcessContext", module_name.empty() ? std::string("main module not found")
                                                                   : "module '" + module_name + "' not found");
    }

    auto regions = memory.EnumerateRegions(module->base, module->end);
    if (regions.empty())
    {
        throw SubsystemError("ProcessContext", "no mapped regions for module '" + module->name + "'");
    }

    for (auto& region : regions)
        region.pathname = module->path;

    std::ostringstream oss;
    oss << "Main module " << module->name << " at 0x" << std::hex << module->base << " size 0x" << module->Size()
        << " (" << std::dec << regions.size() << " regions)";
    PLOG_INFO << oss.str();

    return ProcessContext(memory, std::move(*module), std::move(regions));
}

ProcessContext ProcessContext::FromRange(IProcessMemory& memory, std::string name, uintptr_t base, size_t size)
{
    ModuleInfo module{ name, name, base, base + size };
    MemoryRegion region{ base, base + size, static_cast<int>(MemoryProtection::ReadExecute), name };
    return ProcessContext(memory, std::move(module), { region });
}

std::vector<MemoryRegion> ProcessContext::TextRegions() const
{
    std::vector<MemoryRegion> out;
    for (const auto& region : regions_)
    {
        if (region.IsReadable() && region.IsExecutable())
            out.push_back(region);
    }
    return out;
}

std::vector<MemoryRegion> ProcessContext::ReadableRegions() const
{
    std::vector<MemoryRegion> out;
    for (const auto& region : regions_)
    {
        if (region.IsReadable())
            out.push_back(region);
    }
    return out;
}

} // namespace tether
