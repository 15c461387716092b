#include "HostHook.hpp"
#include "tether/utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace tether
{

HostHook::HostHook(std::string name, uintptr_t target, uintptr_t detour)
    : name_(std::move(name))
    , target_(target)
    , detour_(detour)
{
}

HostHook::~HostHook()
{
    if (IsEnabled())
        Disable();
}

bool HostHook::Enable()
{
    if (IsEnabled())
        return true;

    if (target_ == 0 || detour_ == 0)
    {
        PLOG_ERROR << "[" << name_ << "] cannot hook a null address";
        return false;
    }

    hook_ = libmem::HookCode(static_cast<libmem::Address>(target_), static_cast<libmem::Address>(detour_));
    if (!hook_)
    {
        PLOG_ERROR << "[" << name_ << "] HookCode failed at 0x" << std::hex << target_;
        return false;
    }

    trampoline_.store(static_cast<uintptr_t>(hook_->address), std::memory_order_release);
    PLOG_DEBUG << "[" << name_ << "] hooked 0x" << std::hex << target_ << " -> 0x" << detour_ << " (trampoline 0x"
               << hook_->address << ")";
    return true;
}

bool HostHook::Disable()
{
    if (!IsEnabled() || !hook_)
        return true;

    if (!libmem::UnhookCode(static_cast<libmem::Address>(target_), *hook_))
    {
        PLOG_ERROR << "[" << name_ << "] UnhookCode failed at 0x" << std::hex << target_;
        return false;
    }

    trampoline_.store(0, std::memory_order_release);
    hook_.reset();
    PLOG_DEBUG << "[" << name_ << "] unhooked";
    return true;
}

void ReportStuckHook(const std::string& name)
{
    PLOG_ERROR << "[" << name << "] still hooked after dispose, host calls keep going through the trampoline";
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Teardown, "A game hook could not be removed", name);
}

} // namespace tether
