#pragma once

#include "ISigScanner.hpp"
#include "Pattern.hpp"
#include "Signatures.hpp"
#include "tether/memory/ProcessContext.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tether
{

class SigScanner : public ISigScanner
{
public:
    SigScanner(ProcessContext context, Signatures signatures);

    uintptr_t ScanText(const std::string& signature) override;
    std::optional<uintptr_t> TryScanText(const std::string& signature) override;
    uintptr_t Resolve(const std::string& name) override;
    std::optional<uintptr_t> TryResolve(const std::string& name) override;
    const std::string& ModuleName() const override { return context_.Module().name; }
    uintptr_t BaseAddress() const override { return context_.BaseAddress(); }
    void Dispose() override;

    /// First match across every readable region of the module, no call following.
    std::optional<uintptr_t> ScanModule(const Pattern& pattern);

    std::optional<uintptr_t> ScanRegion(const MemoryRegion& region, const Pattern& pattern);

    /// Target of the rel32 CALL/JMP at `instruction`.
    std::optional<uintptr_t> ResolveRelativeTarget(uintptr_t instruction);

    const Signatures& SignatureTable() const { return signatures_; }

private:
    std::vector<size_t> BuildBadCharTable(const Pattern& pattern);

    std::optional<size_t> FindPatternInBuffer(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern,
                                              const std::vector<size_t>& bad_char_table);

    /// Linear scan honouring wildcards.
    std::optional<size_t> FindMaskedPatternInBuffer(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern);

    ProcessContext context_;
    Signatures signatures_;
    std::mutex cache_mutex_;
    std::unordered_map<std::string, uintptr_t> cache_;
    std::atomic<bool> disposed_{ false };
};

} // namespace tether
