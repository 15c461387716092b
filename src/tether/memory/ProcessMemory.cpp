#include "ProcessMemory.hpp"

#include <type_traits>

namespace tether
{
namespace
{
template <typename E>
constexpr auto to_underlying(E e) noexcept
{
    return static_cast<std::underlying_type_t<E>>(e);
}

libmem::Prot ToLibmemProt(MemoryProtection protection)
{
    auto flags = static_cast<int>(protection);
    uint32_t result = 0;

    if (flags & static_cast<int>(MemoryProtection::Read))
        result |= to_underlying(libmem::Prot::R);
    if (flags & static_cast<int>(MemoryProtection::Write))
        result |= to_underlying(libmem::Prot::W);
    if (flags & static_cast<int>(MemoryProtection::Execute))
        result |= to_underlying(libmem::Prot::X);

    return static_cast<libmem::Prot>(result);
}

int FromLibmemProt(libmem::Prot prot)
{
    const auto flags = to_underlying(prot);
    int result = 0;
    if (flags & to_underlying(libmem::Prot::R))
        result |= static_cast<int>(MemoryProtection::Read);
    if (flags & to_underlying(libmem::Prot::W))
        result |= static_cast<int>(MemoryProtection::Write);
    if (flags & to_underlying(libmem::Prot::X))
        result |= static_cast<int>(MemoryProtection::Execute);
    return result;
}

ModuleInfo ToModuleInfo(const libmem::Module& module)
{
    return ModuleInfo{ module.name, module.path, static_cast<uintptr_t>(module.base),
                       static_cast<uintptr_t>(module.end) };
}
} // namespace

ProcessMemory::ProcessMemory()
    : m_process(libmem::GetProcess())
{
}

bool ProcessMemory::ReadMemory(uintptr_t address, void* buffer, size_t size)
{
    if (!m_process || address == 0 || buffer == nullptr || size == 0)
        return false;

    size_t bytes_read = libmem::ReadMemory(&m_process.value(), static_cast<libmem::Address>(address),
                                           reinterpret_cast<uint8_t*>(buffer), size);
    return bytes_read == size;
}

bool ProcessMemory::WriteMemory(uintptr_t address, const void* buffer, size_t size)
{
    if (!m_process || address == 0 || buffer == nullptr || size == 0)
        return false;

    // libmem::WriteMemory takes a non-const source buffer but never writes to it.
    size_t bytes_written = libmem::WriteMemory(&m_process.value(), static_cast<libmem::Address>(address),
                                               const_cast<uint8_t*>(reinterpret_cast<const uint8_t*>(buffer)), size);
    return bytes_written == size;
}

bool ProcessMemory::SetMemoryProtection(uintptr_t address, size_t size, MemoryProtection protection)
{
    if (!m_process)
        return false;

    auto result = libmem::ProtMemory(&m_process.value(), static_cast<libmem::Address>(address), size,
                                     ToLibmemProt(protection));
    return result.has_value();
}

uintptr_t ProcessMemory::AllocateMemory(size_t size, bool executable)
{
    if (!m_process)
        return 0;

    libmem::Prot protection = executable ? libmem::Prot::XRW : libmem::Prot::RW;
    auto allocated = libmem::AllocMemory(&m_process.value(), size, protection);
    return allocated.value_or(0);
}

bool ProcessMemory::FreeMemory(uintptr_t address, size_t size)
{
    if (!m_process)
        return false;

    return libmem::FreeMemory(&m_process.value(), static_cast<libmem::Address>(address), size);
}

std::optional<ModuleInfo> ProcessMemory::FindModule(const std::string& name)
{
    if (!m_process)
        return std::nullopt;

    if (name.empty())
    {
        auto modules = libmem::EnumModules(&m_process.value());
        if (!modules || modules->empty())
            return std::nullopt;
        return ToModuleInfo((*modules)[0]);
    }

    auto module = libmem::FindModule(&m_process.value(), name.c_str());
    if (!module)
        return std::nullopt;
    return ToModuleInfo(*module);
}

std::vector<MemoryRegion> ProcessMemory::EnumerateRegions(uintptr_t start, uintptr_t end)
{
    std::vector<MemoryRegion> regions;
    if (!m_process)
        return regions;

    auto segments = libmem::EnumSegments(&m_process.value());
    if (!segments)
        return regions;

    for (const auto& segment : *segments)
    {
        const auto seg_start = static_cast<uintptr_t>(segment.base);
        const auto seg_end = static_cast<uintptr_t>(segment.end);
        if (seg_end <= start || seg_start >= end)
            continue;

        MemoryRegion region;
        region.start = seg_start < start ? start : seg_start;
        region.end = seg_end > end ? end : seg_end;
        region.protection = FromLibmemProt(segment.prot);
        regions.push_back(region);
    }

    return regions;
}

std::optional<uintptr_t> ProcessMemory::FindSymbol(const ModuleInfo& module, const std::string& symbol)
{
    if (!m_process)
        return std::nullopt;

    auto lm_module = libmem::FindModule(&m_process.value(), module.name.c_str());
    if (!lm_module)
        return std::nullopt;

    auto address = libmem::FindSymbolAddress(&lm_module.value(), symbol.c_str());
    if (!address)
        return std::nullopt;
    return static_cast<uintptr_t>(*address);
}

} // namespace tether
