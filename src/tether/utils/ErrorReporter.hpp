#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace tether::utils
{

enum class ErrorCategory
{
    Startup,       // Subsystem construction during Start
    Teardown,      // Dispose steps
    Hook,          // Signature scans, detours, memory patches
    Overlay,       // ImGui context, font build
    Plugin,        // Plugin discovery, load and unload
    Configuration, // TOML/JSON parsing, invalid settings
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // Feature degraded, runtime continues
    Error,   // Operation failed, runtime continues
    Fatal    // Runtime will unload
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Shown in the overlay's problems list
    std::string technical_details; // Exception text, shown on hover and logged
    std::string timestamp;         // Local wall-clock time, HH:MM:SS

    bool IsFatal() const { return severity == ErrorSeverity::Fatal; }
};

/**
 * @brief Process-wide queue of problems the player should see.
 *
 * Every report is logged through plog when it is filed. The runtime's main window
 * drains the queue on its next draw. The queue is bounded; when it overflows the
 * oldest non-fatal report is evicted, so a startup failure stays visible behind a
 * flood of plugin warnings.
 */
class ErrorReporter
{
public:
    static constexpr size_t kMaxQueuedReports = 64;

    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /// Returns every queued report, oldest first, and empties the queue.
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    /// Reports evicted because the queue was full, since the last ClearErrors.
    static size_t DroppedCount();

    static const char* CategoryName(ErrorCategory category);
    static const char* SeverityName(ErrorSeverity severity);

private:
    static std::string Timestamp();

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
    static size_t s_dropped;
};

} // namespace tether::utils
