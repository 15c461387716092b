#pragma once

#include <array>
#include <cstdint>

namespace tether
{

/// Startup steps in execution order.
enum class StartupStep : uint8_t
{
    LoadConfiguration,
    ProcessContext,
    HookGuard,
    GameSubsystems,
    Localization,
    PluginCatalog,
    RuntimeInterface,
    Overlay,
    SeasonalFeature,
    DataAssets,
    StringDecoder,
    Commands,
    ChatFeatures,
    Plugins,
    EnableHostHooks,
    Ready
};

enum class FailurePolicy : uint8_t
{
    Fatal,         // Propagate to Start's outer handler, which unloads
    Soft,          // Log, report, and continue without the feature
    AbortAndUnload // Log, unload, and return from Start immediately
};

struct StartupPolicy
{
    static FailurePolicy For(StartupStep step);

    static const char* StepName(StartupStep step);
    static const char* PolicyName(FailurePolicy policy);

    static constexpr std::array<StartupStep, 16> kOrder = {
        StartupStep::LoadConfiguration, StartupStep::ProcessContext, StartupStep::HookGuard,
        StartupStep::GameSubsystems,    StartupStep::Localization,   StartupStep::PluginCatalog,
        StartupStep::RuntimeInterface,  StartupStep::Overlay,        StartupStep::SeasonalFeature,
        StartupStep::DataAssets,        StartupStep::StringDecoder,  StartupStep::Commands,
        StartupStep::ChatFeatures,      StartupStep::Plugins,        StartupStep::EnableHostHooks,
        StartupStep::Ready,
    };
};

} // namespace tether
