#pragma once

#include "ISubsystemFactory.hpp"
#include "tether/memory/ProcessMemory.hpp"

namespace tether
{

/**
 * @brief Builds the production collaborators over the current process.
 */
class DefaultSubsystemFactory : public ISubsystemFactory
{
public:
    DefaultSubsystemFactory() = default;

    RuntimeConfiguration LoadConfiguration(const std::filesystem::path& path) override;

    std::unique_ptr<ISigScanner> CreateSigScanner(const StartInfo& info) override;
    std::unique_ptr<IHookGuard> CreateHookGuard(ISigScanner& scanner) override;

    std::unique_ptr<IFramework> CreateFramework(ISigScanner& scanner) override;
    std::unique_ptr<INetworkOptimizer> CreateNetworkOptimizer() override;
    std::unique_ptr<INetworkHandlers> CreateNetworkHandlers(IFramework& framework, bool opt_out_telemetry) override;
    std::unique_ptr<IClientState> CreateClientState(ISigScanner& scanner, ClientLanguage language) override;

    std::unique_ptr<ILocalization> CreateLocalization(const std::filesystem::path& asset_directory) override;

    std::unique_ptr<IPluginCatalog> CreatePluginCatalog(const std::filesystem::path& directory,
                                                        const std::string& game_version) override;

    std::unique_ptr<IRuntimeInterface> CreateRuntimeInterface(const RuntimeInterfaceCreateInfo& info) override;
    std::unique_ptr<IOverlayRuntime> CreateOverlayRuntime(ISigScanner& scanner,
                                                          const RuntimeConfiguration& configuration) override;
    std::unique_ptr<ISeasonalFeature> CreateSeasonalFeature(IOverlayRuntime& overlay) override;

    std::unique_ptr<IDataAssets> CreateDataAssets(ClientLanguage language) override;
    std::unique_ptr<IStringDecoder> CreateStringDecoder(IDataAssets& data) override;

    std::unique_ptr<ICommandRouter> CreateCommandRouter(ClientLanguage language) override;
    std::unique_ptr<IBuiltinCommands> CreateBuiltinCommands(ICommandRouter& router,
                                                            BuiltinCommandHooks hooks) override;
    std::unique_ptr<IChatFeatures> CreateChatFeatures(const ChatFeaturesCreateInfo& info) override;

    std::unique_ptr<IPluginRuntime> CreatePluginRuntime(const PluginRuntimeCreateInfo& info) override;

    std::unique_ptr<IExceptionFilterInstaller> CreateExceptionFilterInstaller() override;

private:
    ProcessMemory memory_;
};

} // namespace tether
