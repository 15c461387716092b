#include "ErrorReporter.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iterator>

#include <plog/Log.h>

namespace tether::utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;
size_t ErrorReporter::s_dropped = 0;

namespace
{

plog::Severity ToPlog(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info: return plog::info;
    case ErrorSeverity::Warning: return plog::warning;
    case ErrorSeverity::Error: return plog::error;
    case ErrorSeverity::Fatal: return plog::fatal;
    }
    return plog::error;
}

} // namespace

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    PLOG(ToPlog(severity)) << "[" << CategoryName(category) << "] " << user_message
                           << (technical_details.empty() ? "" : " | ") << technical_details;

    ErrorReport report{ category, severity, user_message, technical_details, Timestamp() };

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_queue.size() >= kMaxQueuedReports)
    {
        auto victim = std::find_if(s_queue.begin(), s_queue.end(), [](const ErrorReport& r) { return !r.IsFatal(); });
        s_queue.erase(victim != s_queue.end() ? victim : s_queue.begin());
        ++s_dropped;
    }
    s_queue.push_back(std::move(report));
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports(std::make_move_iterator(s_queue.begin()), std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    return reports;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_dropped = 0;
}

size_t ErrorReporter::DroppedCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_dropped;
}

const char* ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Startup: return "Startup";
    case ErrorCategory::Teardown: return "Teardown";
    case ErrorCategory::Hook: return "Hook";
    case ErrorCategory::Overlay: return "Overlay";
    case ErrorCategory::Plugin: return "Plugin";
    case ErrorCategory::Configuration: return "Configuration";
    case ErrorCategory::Unknown: break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityName(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info: return "Info";
    case ErrorSeverity::Warning: return "Warning";
    case ErrorSeverity::Error: return "Error";
    case ErrorSeverity::Fatal: return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::Timestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &local);
    return buffer;
}

} // namespace tether::utils
