#pragma once

#include "IGameSubsystems.hpp"
#include "tether/memory/MemoryPatch.hpp"

#include <memory>
#include <optional>

namespace tether
{

class ISigScanner;

/**
 * @brief Neutralizes the host's debugger-presence check.
 *
 * The check is a `call [IsDebuggerPresent]` followed by a test of eax. Enable
 * replaces the call with `xor eax, eax` so the host always sees no debugger.
 */
class HookGuard : public IHookGuard
{
public:
    static constexpr uint8_t kPatchBytes[] = { 0x31, 0xC0, 0x90, 0x90, 0x90, 0x90 };

    HookGuard(ISigScanner& scanner, IProcessMemory& memory);
    ~HookGuard() override;

    /// Logs and does nothing when the check was not found.
    void Enable() override;
    void Disable() override;
    bool IsEnabled() const override { return patch_ && patch_->IsApplied(); }
    void Dispose() override;

    std::optional<uintptr_t> CheckAddress() const { return check_address_; }

private:
    std::optional<uintptr_t> check_address_;
    std::unique_ptr<BytePatch> patch_;
};

} // namespace tether
