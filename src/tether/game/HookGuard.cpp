#include "HookGuard.hpp"
#include "tether/scan/ISigScanner.hpp"
#include "tether/scan/Signatures.hpp"

#include <plog/Log.h>

namespace tether
{

HookGuard::HookGuard(ISigScanner& scanner, IProcessMemory& memory)
    : check_address_(scanner.TryResolve(sig::kDebugCheck))
{
    if (!check_address_)
    {
        PLOG_WARNING << "Debugger check not found, hook guard is inactive";
        return;
    }

    patch_ = std::make_unique<BytePatch>(
        memory, *check_address_, std::vector<uint8_t>(std::begin(kPatchBytes), std::end(kPatchBytes)));
    PLOG_DEBUG << "Debugger check at 0x" << std::hex << *check_address_;
}

HookGuard::~HookGuard() { Dispose(); }

void HookGuard::Enable()
{
    if (!patch_)
    {
        PLOG_WARNING << "Hook guard enable skipped: no debugger check to patch";
        return;
    }
    if (patch_->IsApplied())
        return;

    if (!patch_->Apply())
    {
        PLOG_ERROR << "Could not patch debugger check at 0x" << std::hex << *check_address_;
        return;
    }
    PLOG_INFO << "Hook guard enabled (was " << MemoryPatch::HexFirstN(patch_->OriginalBytes()) << ")";
}

void HookGuard::Disable()
{
    if (!IsEnabled())
        return;

    if (!patch_->Restore())
        PLOG_ERROR << "Could not restore debugger check at 0x" << std::hex << *check_address_;
    else
        PLOG_INFO << "Hook guard disabled";
}

void HookGuard::Dispose()
{
    Disable();
    patch_.reset();
}

} // namespace tether
