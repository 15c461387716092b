#include "StartupPlan.hpp"

namespace tether
{

FailurePolicy StartupPolicy::For(StartupStep step)
{
    switch (step)
    {
    case StartupStep::Overlay:
    case StartupStep::SeasonalFeature:
    case StartupStep::Plugins:
        return FailurePolicy::Soft;
    case StartupStep::DataAssets:
        return FailurePolicy::AbortAndUnload;
    default:
        return FailurePolicy::Fatal;
    }
}

const char* StartupPolicy::StepName(StartupStep step)
{
    switch (step)
    {
    case StartupStep::LoadConfiguration: return "LoadConfiguration";
    case StartupStep::ProcessContext: return "ProcessContext";
    case StartupStep::HookGuard: return "HookGuard";
    case StartupStep::GameSubsystems: return "GameSubsystems";
    case StartupStep::Localization: return "Localization";
    case StartupStep::PluginCatalog: return "PluginCatalog";
    case StartupStep::RuntimeInterface: return "RuntimeInterface";
    case StartupStep::Overlay: return "Overlay";
    case StartupStep::SeasonalFeature: return "SeasonalFeature";
    case StartupStep::DataAssets: return "DataAssets";
    case StartupStep::StringDecoder: return "StringDecoder";
    case StartupStep::Commands: return "Commands";
    case StartupStep::ChatFeatures: return "ChatFeatures";
    case StartupStep::Plugins: return "Plugins";
    case StartupStep::EnableHostHooks: return "EnableHostHooks";
    case StartupStep::Ready: return "Ready";
    }
    return "Unknown";
}

const char* StartupPolicy::PolicyName(FailurePolicy policy)
{
    switch (policy)
    {
    case FailurePolicy::Fatal: return "Fatal";
    case FailurePolicy::Soft: return "Soft";
    case FailurePolicy::AbortAndUnload: return "AbortAndUnload";
    }
    return "Unknown";
}

} // namespace tether
