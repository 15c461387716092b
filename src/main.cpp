#include "HostSimulation.hpp"
#include "tether/core/Bootstrap.hpp"
#include "tether/core/OneShotSignal.hpp"

#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <thread>

namespace
{

volatile std::sig_atomic_t g_stop_requested = 0;

void OnSignal(int) { g_stop_requested = 1; }

tether::StartInfo DefaultStartInfo()
{
    auto cwd = std::filesystem::current_path();
    tether::StartInfo info;
    info.working_directory = cwd;
    info.asset_directory = cwd / "assets";
    info.plugin_directory = cwd / "plugins";
    info.default_plugin_directory = cwd / "plugins" / "default";
    info.configuration_path = cwd / "tether.toml";
    info.language = tether::ClientLanguage::English;
    info.game_version = "self-host";
    return info;
}

void PrintUsage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [--start-info <file>] [--no-overlay] [--no-plugins]\n";
}

} // namespace

int main(int argc, char** argv)
{
    tether::StartInfo info = DefaultStartInfo();
    tether::LaunchOptions options = tether::LaunchOptions::FromEnvironment();

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--start-info") == 0 && i + 1 < argc)
        {
            try
            {
                info = tether::StartInfo::LoadFromFile(argv[++i]);
            }
            catch (const std::exception& ex)
            {
                std::cerr << "Cannot load start info: " << ex.what() << "\n";
                return 2;
            }
        }
        else if (std::strcmp(argv[i], "--no-overlay") == 0)
        {
            options.overlay_enabled = false;
        }
        else if (std::strcmp(argv[i], "--no-plugins") == 0)
        {
            options.plugins_enabled = false;
        }
        else
        {
            PrintUsage(argv[0]);
            return std::strcmp(argv[i], "--help") == 0 ? 0 : 2;
        }
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    tether::host::HostSimulation host;
    host.Start();

    tether::OneShotSignal finished;
    std::thread runtime([&]() { tether::Bootstrap::Run(info, finished, nullptr, options); });

    // Signal handlers may only touch the flag; forward the request from here.
    while (!finished.WaitFor(std::chrono::milliseconds(100)))
    {
        if (g_stop_requested && tether::Bootstrap::RequestUnload())
            g_stop_requested = 0;
    }

    runtime.join();
    host.Stop();
    return 0;
}
