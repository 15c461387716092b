#include "DefaultSubsystemFactory.hpp"
#include "SubsystemError.hpp"
#include "tether/chat/ChatFeatureSet.hpp"
#include "tether/command/BuiltinCommands.hpp"
#include "tether/command/CommandRouter.hpp"
#include "tether/data/DataAssets.hpp"
#include "tether/data/StringDecoder.hpp"
#include "tether/game/ClientState.hpp"
#include "tether/game/Framework.hpp"
#include "tether/game/HookGuard.hpp"
#include "tether/game/NetworkHandlers.hpp"
#include "tether/game/NetworkOptimizer.hpp"
#include "tether/i18n/LocalizationService.hpp"
#include "tether/memory/ProcessContext.hpp"
#include "tether/overlay/OverlayRuntime.hpp"
#include "tether/overlay/RuntimeInterface.hpp"
#include "tether/overlay/SeasonalFeature.hpp"
#include "tether/plugin/PluginCatalog.hpp"
#include "tether/plugin/PluginRuntime.hpp"
#include "tether/scan/SigScanner.hpp"
#include "tether/scan/Signatures.hpp"

#include <plog/Log.h>

namespace tether
{

RuntimeConfiguration DefaultSubsystemFactory::LoadConfiguration(const std::filesystem::path& path)
{
    return RuntimeConfiguration::Load(path);
}

std::unique_ptr<ISigScanner> DefaultSubsystemFactory::CreateSigScanner(const StartInfo& info)
{
    if (!memory_.IsAttached())
        throw SubsystemError("SigScanner", "libmem could not open the current process");

    auto context = ProcessContext::Acquire(memory_);
    PLOG_INFO << "Host module " << context.Module().name << " at 0x" << std::hex << context.BaseAddress();
    return std::make_unique<SigScanner>(std::move(context), Signatures::Load(info.asset_directory));
}

std::unique_ptr<IHookGuard> DefaultSubsystemFactory::CreateHookGuard(ISigScanner& scanner)
{
    return std::make_unique<HookGuard>(scanner, memory_);
}

std::unique_ptr<IFramework> DefaultSubsystemFactory::CreateFramework(ISigScanner& scanner)
{
    FrameworkCreateInfo info;
    info.update_address = scanner.Resolve(sig::kFrameworkUpdate);
    info.network_address = scanner.TryResolve(sig::kNetworkDispatch).value_or(0);
    return std::make_unique<Framework>(info);
}

std::unique_ptr<INetworkOptimizer> DefaultSubsystemFactory::CreateNetworkOptimizer()
{
    return std::make_unique<NetworkOptimizer>(memory_);
}

std::unique_ptr<INetworkHandlers> DefaultSubsystemFactory::CreateNetworkHandlers(IFramework& framework,
                                                                                 bool opt_out_telemetry)
{
    return std::make_unique<NetworkHandlers>(framework, opt_out_telemetry);
}

std::unique_ptr<IClientState> DefaultSubsystemFactory::CreateClientState(ISigScanner& scanner, ClientLanguage language)
{
    return std::make_unique<ClientState>(scanner.Resolve(sig::kTerritoryChange), language);
}

std::unique_ptr<ILocalization> DefaultSubsystemFactory::CreateLocalization(const std::filesystem::path& asset_directory)
{
    return std::make_unique<LocalizationService>(asset_directory);
}

std::unique_ptr<IPluginCatalog> DefaultSubsystemFactory::CreatePluginCatalog(const std::filesystem::path& directory,
                                                                             const std::string& game_version)
{
    return std::make_unique<PluginCatalog>(directory, game_version);
}

std::unique_ptr<IRuntimeInterface> DefaultSubsystemFactory::CreateRuntimeInterface(
    const RuntimeInterfaceCreateInfo& info)
{
    return std::make_unique<RuntimeInterface>(info);
}

std::unique_ptr<IOverlayRuntime> DefaultSubsystemFactory::CreateOverlayRuntime(ISigScanner& scanner,
                                                                               const RuntimeConfiguration& configuration)
{
    OverlaySettings settings;
    settings.font_scale = configuration.overlay_font_scale;

    // A missing present signature cannot be driven by anyone, so it is a failure here.
    auto present = scanner.TryResolve(sig::kOverlayPresent);
    if (!present)
        throw SubsystemError("Overlay", "present signature not configured or not found");
    return std::make_unique<OverlayRuntime>(present, settings);
}

std::unique_ptr<ISeasonalFeature> DefaultSubsystemFactory::CreateSeasonalFeature(IOverlayRuntime& overlay)
{
    return std::make_unique<SeasonalFeature>(overlay);
}

std::unique_ptr<IDataAssets> DefaultSubsystemFactory::CreateDataAssets(ClientLanguage language)
{
    return std::make_unique<DataAssets>(language);
}

std::unique_ptr<IStringDecoder> DefaultSubsystemFactory::CreateStringDecoder(IDataAssets& data)
{
    return std::make_unique<StringDecoder>(data);
}

std::unique_ptr<ICommandRouter> DefaultSubsystemFactory::CreateCommandRouter(ClientLanguage language)
{
    return std::make_unique<CommandRouter>(language);
}

std::unique_ptr<IBuiltinCommands> DefaultSubsystemFactory::CreateBuiltinCommands(ICommandRouter& router,
                                                                                 BuiltinCommandHooks hooks)
{
    return std::make_unique<BuiltinCommands>(router, std::move(hooks));
}

std::unique_ptr<IChatFeatures> DefaultSubsystemFactory::CreateChatFeatures(const ChatFeaturesCreateInfo& info)
{
    return std::make_unique<ChatFeatureSet>(info);
}

std::unique_ptr<IPluginRuntime> DefaultSubsystemFactory::CreatePluginRuntime(const PluginRuntimeCreateInfo& info)
{
    return std::make_unique<PluginRuntime>(info);
}

std::unique_ptr<IExceptionFilterInstaller> DefaultSubsystemFactory::CreateExceptionFilterInstaller()
{
    return CreateNativeExceptionFilterInstaller();
}

} // namespace tether
