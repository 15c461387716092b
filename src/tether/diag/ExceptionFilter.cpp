#include "ExceptionFilter.hpp"
#include "tether/scan/ISigScanner.hpp"
#include "tether/scan/Signatures.hpp"

#include <plog/Log.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#endif

namespace tether
{

namespace
{

#ifdef _WIN32
class NativeExceptionFilterInstaller : public IExceptionFilterInstaller
{
public:
    std::optional<uintptr_t> Install(uintptr_t filter) override
    {
        auto previous = SetUnhandledExceptionFilter(reinterpret_cast<LPTOP_LEVEL_EXCEPTION_FILTER>(filter));
        return reinterpret_cast<uintptr_t>(previous);
    }
};
#else
// On POSIX hosts the top-level filter is the SIGSEGV handler.
class NativeExceptionFilterInstaller : public IExceptionFilterInstaller
{
public:
    std::optional<uintptr_t> Install(uintptr_t filter) override
    {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_SIGINFO;
        action.sa_sigaction = reinterpret_cast<void (*)(int, siginfo_t*, void*)>(filter);
        return Swap(action);
    }

    // SIG_DFL, SIG_IGN and plain handlers come back exactly as they were.
    bool Reinstate(uintptr_t previous) override
    {
        auto it = replaced_.find(previous);
        if (it == replaced_.end())
            return Install(previous).has_value();
        return Swap(it->second).has_value();
    }

private:
    static uintptr_t HandlerAddress(const struct sigaction& action)
    {
        if (action.sa_flags & SA_SIGINFO)
            return reinterpret_cast<uintptr_t>(action.sa_sigaction);
        return reinterpret_cast<uintptr_t>(action.sa_handler);
    }

    std::optional<uintptr_t> Swap(const struct sigaction& action)
    {
        struct sigaction previous;
        std::memset(&previous, 0, sizeof(previous));
        if (sigaction(SIGSEGV, &action, &previous) != 0)
        {
            PLOG_ERROR << "sigaction(SIGSEGV) failed: " << std::strerror(errno);
            return std::nullopt;
        }

        uintptr_t address = HandlerAddress(previous);
        replaced_.insert_or_assign(address, previous);
        return address;
    }

    std::map<uintptr_t, struct sigaction> replaced_;
};
#endif

} // namespace

std::unique_ptr<IExceptionFilterInstaller> CreateNativeExceptionFilterInstaller()
{
    return std::make_unique<NativeExceptionFilterInstaller>();
}

std::optional<uintptr_t> ExceptionFilter::Replace(ISigScanner& scanner, IExceptionFilterInstaller& installer)
{
    auto release_filter = scanner.TryResolve(sig::kExceptionFilter);
    if (!release_filter)
    {
        PLOG_ERROR << "Host exception filter not found, leaving the current filter in place";
        return std::nullopt;
    }

    PLOG_DEBUG << "Host release filter at 0x" << std::hex << *release_filter;
    auto previous = installer.Install(*release_filter);
    if (!previous)
    {
        PLOG_ERROR << "Could not install the host exception filter";
        return std::nullopt;
    }
    PLOG_DEBUG << "Reset exception filter, old: 0x" << std::hex << *previous;
    return previous;
}

bool ExceptionFilter::Restore(IExceptionFilterInstaller& installer, uintptr_t previous)
{
    if (!installer.Reinstate(previous))
    {
        PLOG_ERROR << "Could not restore exception filter 0x" << std::hex << previous;
        return false;
    }
    PLOG_DEBUG << "Restored exception filter 0x" << std::hex << previous;
    return true;
}

} // namespace tether
