#pragma once

#include <cstdint>
#include <memory>
#include <optional>

namespace tether
{

class ISigScanner;

/**
 * @brief Swaps the process-wide unhandled-exception filter.
 */
class IExceptionFilterInstaller
{
public:
    virtual ~IExceptionFilterInstaller() = default;

    /// Installs filter. Returns the one it replaced (0 if none), nullopt when the
    /// platform refused the change.
    virtual std::optional<uintptr_t> Install(uintptr_t filter) = 0;

    /// Puts back a filter returned by Install, with the settings it had then.
    virtual bool Reinstate(uintptr_t previous) { return Install(previous).has_value(); }
};

/// SetUnhandledExceptionFilter on Windows, a SIGSEGV sigaction elsewhere.
std::unique_ptr<IExceptionFilterInstaller> CreateNativeExceptionFilterInstaller();

class ExceptionFilter
{
public:
    /**
     * @brief Install the host's own release exception filter
     *
     * The host ships a top-level filter compatible with attached debuggers; the
     * runtime's crash handler replaced it at startup. This puts the host's back.
     *
     * @return The previous filter, or nullopt when the host filter was not found
     *         or could not be installed
     */
    static std::optional<uintptr_t> Replace(ISigScanner& scanner, IExceptionFilterInstaller& installer);

    static bool Restore(IExceptionFilterInstaller& installer, uintptr_t previous);
};

} // namespace tether
