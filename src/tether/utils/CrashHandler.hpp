#pragma once

namespace tether::utils
{

/**
 * Crash handler for unhandled exceptions and fatal errors.
 *
 * Logs a cpptrace stack trace through plog, then chains to whatever handler was
 * installed before. Intercepts std::terminate() on every platform and, on Windows,
 * structured exceptions that reach the top-level filter.
 */
class CrashHandler
{
public:
    /// Installs the handlers once per process.
    static void Initialize();

    /// Restores the handlers that were active before Initialize.
    static void Uninstall();

    /// Sets thread-local context string to be included in crash reports
    static void SetContext(const char* operation);
};

} // namespace tether::utils
