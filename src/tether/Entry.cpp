#include "tether/api/StartInfo.hpp"
#include "tether/core/Bootstrap.hpp"
#include "tether/core/OneShotSignal.hpp"

#include <atomic>
#include <thread>

#include <plog/Log.h>

#if defined(_WIN32)
#define TETHER_EXPORT extern "C" __declspec(dllexport)
#else
#define TETHER_EXPORT extern "C" __attribute__((visibility("default")))
#endif

namespace
{

// Outlives the runtime thread; the injector may wait on it after everything else is gone.
tether::OneShotSignal g_finished;
std::atomic<bool> g_started{ false };

} // namespace

/// Starts the runtime on a new thread. Returns 0 on success, -1 for bad input, 1 if already started.
TETHER_EXPORT int tether_initialize(const char* start_info_json)
{
    if (start_info_json == nullptr)
        return -1;

    tether::StartInfo info;
    try
    {
        info = tether::StartInfo::FromJson(start_info_json);
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << "Rejected start info: " << ex.what();
        return -1;
    }

    if (g_started.exchange(true))
        return 1;

    std::thread([info]() { tether::Bootstrap::Run(info, g_finished); }).detach();
    return 0;
}

TETHER_EXPORT int tether_request_unload() { return tether::Bootstrap::RequestUnload() ? 1 : 0; }

TETHER_EXPORT void tether_wait_for_unload_finish()
{
    if (g_started.load())
        g_finished.Wait();
}
