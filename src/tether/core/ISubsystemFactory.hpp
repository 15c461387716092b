#pragma once

#include "tether/api/StartInfo.hpp"
#include "tether/chat/IChatFeatures.hpp"
#include "tether/command/ICommandRouter.hpp"
#include "tether/config/RuntimeConfiguration.hpp"
#include "tether/data/IDataAssets.hpp"
#include "tether/diag/ExceptionFilter.hpp"
#include "tether/game/IGameSubsystems.hpp"
#include "tether/i18n/ILocalization.hpp"
#include "tether/overlay/IOverlay.hpp"
#include "tether/plugin/IPluginHost.hpp"
#include "tether/scan/ISigScanner.hpp"

#include <filesystem>
#include <memory>

namespace tether
{

/**
 * @brief Builds every collaborator the supervisor owns.
 *
 * Each method receives only the handles its collaborator needs. Construction
 * failures are reported by throwing.
 */
class ISubsystemFactory
{
public:
    virtual ~ISubsystemFactory() = default;

    virtual RuntimeConfiguration LoadConfiguration(const std::filesystem::path& path) = 0;

    virtual std::unique_ptr<ISigScanner> CreateSigScanner(const StartInfo& info) = 0;
    virtual std::unique_ptr<IHookGuard> CreateHookGuard(ISigScanner& scanner) = 0;

    virtual std::unique_ptr<IFramework> CreateFramework(ISigScanner& scanner) = 0;
    virtual std::unique_ptr<INetworkOptimizer> CreateNetworkOptimizer() = 0;
    virtual std::unique_ptr<INetworkHandlers> CreateNetworkHandlers(IFramework& framework, bool opt_out_telemetry) = 0;
    virtual std::unique_ptr<IClientState> CreateClientState(ISigScanner& scanner, ClientLanguage language) = 0;

    virtual std::unique_ptr<ILocalization> CreateLocalization(const std::filesystem::path& asset_directory) = 0;

    virtual std::unique_ptr<IPluginCatalog> CreatePluginCatalog(const std::filesystem::path& directory,
                                                                const std::string& game_version) = 0;

    virtual std::unique_ptr<IRuntimeInterface> CreateRuntimeInterface(const RuntimeInterfaceCreateInfo& info) = 0;
    virtual std::unique_ptr<IOverlayRuntime> CreateOverlayRuntime(ISigScanner& scanner,
                                                                  const RuntimeConfiguration& configuration) = 0;
    virtual std::unique_ptr<ISeasonalFeature> CreateSeasonalFeature(IOverlayRuntime& overlay) = 0;

    virtual std::unique_ptr<IDataAssets> CreateDataAssets(ClientLanguage language) = 0;
    virtual std::unique_ptr<IStringDecoder> CreateStringDecoder(IDataAssets& data) = 0;

    virtual std::unique_ptr<ICommandRouter> CreateCommandRouter(ClientLanguage language) = 0;
    virtual std::unique_ptr<IBuiltinCommands> CreateBuiltinCommands(ICommandRouter& router,
                                                                    BuiltinCommandHooks hooks) = 0;
    virtual std::unique_ptr<IChatFeatures> CreateChatFeatures(const ChatFeaturesCreateInfo& info) = 0;

    virtual std::unique_ptr<IPluginRuntime> CreatePluginRuntime(const PluginRuntimeCreateInfo& info) = 0;

    virtual std::unique_ptr<IExceptionFilterInstaller> CreateExceptionFilterInstaller() = 0;
};

} // namespace tether
