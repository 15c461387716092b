#include "CrashHandler.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>
#include <typeinfo>

#include <cpptrace/cpptrace.hpp>
#include <plog/Log.h>

#ifdef _WIN32
#include <windows.h>
#endif

namespace tether::utils
{

namespace
{

std::atomic<bool> g_installed{ false };
std::terminate_handler g_prev_terminate = nullptr;
thread_local const char* g_current_operation = nullptr;

#ifdef _WIN32
LPTOP_LEVEL_EXCEPTION_FILTER g_prev_filter = nullptr;
#endif

void LogStackTrace()
{
    PLOG_FATAL << "Stack trace (most recent call first):";
    auto trace = cpptrace::generate_trace(1);
    if (trace.empty())
    {
        PLOG_FATAL << "No stack trace available";
        return;
    }

    int index = 0;
    for (const auto& frame : trace.frames)
    {
        PLOG_FATAL << "#" << index++ << " " << frame.to_string();
    }
}

void LogCurrentException()
{
    std::exception_ptr current = std::current_exception();
    if (!current)
    {
        PLOG_FATAL << "std::terminate called without an active exception";
        return;
    }

    try
    {
        std::rethrow_exception(current);
    }
    catch (const std::exception& ex)
    {
        PLOG_FATAL << "Uncaught exception (" << typeid(ex).name() << "): " << ex.what();
    }
    catch (...)
    {
        PLOG_FATAL << "Uncaught exception of non-standard type";
    }
}

[[noreturn]] void CrashTerminateHandler()
{
    PLOG_FATAL << "=== TETHER RUNTIME TERMINATING ===";
    if (g_current_operation)
        PLOG_FATAL << "Operation: " << g_current_operation;

    LogCurrentException();
    LogStackTrace();

    if (g_prev_terminate)
        g_prev_terminate();
    std::abort();
}

#ifdef _WIN32
LONG WINAPI CrashFilter(EXCEPTION_POINTERS* ex)
{
    PLOG_FATAL << "=== TETHER RUNTIME CRASHED ===";
    DWORD code = ex->ExceptionRecord->ExceptionCode;
    PLOG_FATAL << "Exception: 0x" << std::hex << code;
    PLOG_FATAL << "Address: 0x" << std::hex << ex->ExceptionRecord->ExceptionAddress;
    if (g_current_operation)
        PLOG_FATAL << "Operation: " << g_current_operation;

    LogStackTrace();

    if (g_prev_filter)
        return g_prev_filter(ex);
    return EXCEPTION_CONTINUE_SEARCH;
}
#endif

} // namespace

void CrashHandler::Initialize()
{
    bool expected = false;
    if (!g_installed.compare_exchange_strong(expected, true))
        return;

    g_prev_terminate = std::set_terminate(CrashTerminateHandler);
#ifdef _WIN32
    g_prev_filter = SetUnhandledExceptionFilter(CrashFilter);
#endif
    PLOG_INFO << "Crash handler installed";
}

void CrashHandler::Uninstall()
{
    bool expected = true;
    if (!g_installed.compare_exchange_strong(expected, false))
        return;

    std::set_terminate(g_prev_terminate);
#ifdef _WIN32
    SetUnhandledExceptionFilter(g_prev_filter);
#endif
    PLOG_INFO << "Crash handler removed";
}

void CrashHandler::SetContext(const char* operation) { g_current_operation = operation; }

} // namespace tether::utils
