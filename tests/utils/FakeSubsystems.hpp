#pragma once

#include "tether/core/ISubsystemFactory.hpp"
#include "tether/core/Supervisor.hpp"
#include "tether/utils/LogLevelSwitch.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tether::test
{

/**
 * @brief Ordered record of what the fakes were asked to do.
 *
 * Entries read "<action>:<subsystem>", e.g. "construct:Framework" or "dispose:Overlay".
 */
class EventJournal
{
public:
    void Record(const std::string& event);

    std::vector<std::string> Events() const;
    bool Contains(const std::string& event) const;

    /// Position of the first matching event, -1 when absent.
    int IndexOf(const std::string& event) const;

    /// True when both events occurred and `first` came before `second`.
    bool Before(const std::string& first, const std::string& second) const;

    /// Events sharing an action prefix, in order ("dispose:" yields every dispose).
    std::vector<std::string> WithPrefix(const std::string& prefix) const;

    /// Marks an event so that recording it throws std::runtime_error afterwards.
    void FailOn(const std::string& event);

    /// Like FailOn, but throws a ForeignFailure that does not derive from std::exception.
    void FailOnForeign(const std::string& event);

    /// Records the event and throws when it was marked with FailOn or FailOnForeign.
    void Hit(const std::string& event);

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
    std::map<std::string, bool> failures_; // event -> throws ForeignFailure
};

/// Thrown by EventJournal::Hit for events marked with FailOnForeign, standing in
/// for an exception type from code built against another runtime.
struct ForeignFailure
{
    std::string event;
};

/**
 * @brief Base for fakes: records "construct:<name>" on creation and "destroy:<name>" on destruction.
 */
class RecordingFake
{
protected:
    RecordingFake(std::shared_ptr<EventJournal> journal, std::string name);
    ~RecordingFake();

    RecordingFake(const RecordingFake&) = delete;
    RecordingFake& operator=(const RecordingFake&) = delete;

    /// Records "<action>:<name>" and throws if that event was marked to fail.
    void Hit(const std::string& action);

private:
    std::shared_ptr<EventJournal> journal_;
    std::string name_;
};

class FakeSigScanner : public ISigScanner, protected RecordingFake
{
public:
    explicit FakeSigScanner(std::shared_ptr<EventJournal> journal = nullptr);

    std::map<std::string, uintptr_t> named;

    uintptr_t ScanText(const std::string& signature) override;
    std::optional<uintptr_t> TryScanText(const std::string& signature) override;
    uintptr_t Resolve(const std::string& name) override;
    std::optional<uintptr_t> TryResolve(const std::string& name) override;
    const std::string& ModuleName() const override { return module_; }
    uintptr_t BaseAddress() const override { return 0x140000000; }
    void Dispose() override;

private:
    std::string module_ = "fake_host";
};

class FakeLocalization : public ILocalization, protected RecordingFake
{
public:
    explicit FakeLocalization(std::shared_ptr<EventJournal> journal = nullptr);

    std::map<std::string, std::string> strings;

    void SetupWithLangCode(const std::string& code) override;
    void SetupWithUiCulture() override;
    std::string Localize(const std::string& key, const std::string& fallback) const override;
    std::string Format(const std::string& key, const std::string& fallback,
                       const std::unordered_map<std::string, std::string>& args) const override;
    std::string CurrentLanguage() const override { return language_; }
    LocalizationSource LastSource() const override { return source_; }
    SubscriptionId SubscribeLanguageChanged(std::function<void(const std::string&)> callback) override;
    void UnsubscribeLanguageChanged(SubscriptionId id) override;

private:
    std::string language_ = "en";
    LocalizationSource source_ = LocalizationSource::None;
    SubscriberList<const std::string&> changed_;
};

class FakeOverlay : public IOverlayRuntime, protected RecordingFake
{
public:
    explicit FakeOverlay(std::shared_ptr<EventJournal> journal);

    void Enable() override;
    SubscriptionId SubscribeDraw(std::function<void()> callback) override;
    void UnsubscribeDraw(SubscriptionId id) override;
    void WaitForFontRebuild() override;
    bool IsFontReady() const override { return font_ready_; }
    void Dispose() override;

    /// Runs every draw subscriber once.
    void DrawFrame() { draw_.Invoke(); }
    size_t SubscriberCount() const { return draw_.Size(); }

private:
    SubscriberList<> draw_;
    bool font_ready_ = false;
};

class FakePluginRuntime : public IPluginRuntime, protected RecordingFake
{
public:
    FakePluginRuntime(std::shared_ptr<EventJournal> journal, std::vector<LoadedPluginInfo> plugins);

    void LoadPlugins() override;
    void UnloadPlugins() override;
    std::vector<LoadedPluginInfo> LoadedPlugins() const override;

private:
    std::vector<LoadedPluginInfo> available_;
    std::vector<LoadedPluginInfo> loaded_;
};

/**
 * @brief ISubsystemFactory whose products only record into a shared journal.
 *
 * The command router and built-in commands are the real implementations so
 * chat commands can be exercised end to end.
 */
class FakeSubsystemFactory : public ISubsystemFactory
{
public:
    explicit FakeSubsystemFactory(std::shared_ptr<EventJournal> journal);

    RuntimeConfiguration configuration;
    std::vector<LoadedPluginInfo> plugins;
    std::map<std::string, uintptr_t> signatures;

    /// Values seen by the factory methods, for assertions.
    bool last_opt_out_telemetry = false;
    std::optional<ClientLanguage> last_client_language;
    std::string last_plugin_language;
    bool plugin_runtime_had_overlay = false;
    bool plugin_runtime_had_default_catalog = false;

    /// Installer calls, in order.
    std::vector<uintptr_t> installed_filters;

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
    std::unique_ptr<IBuiltinCommands> CreateBuiltinCommands(ICommandRouter& router, BuiltinCommandHooks hooks) override;
    std::unique_ptr<IChatFeatures> CreateChatFeatures(const ChatFeaturesCreateInfo& info) override;
    std::unique_ptr<IPluginRuntime> CreatePluginRuntime(const PluginRuntimeCreateInfo& info) override;
    std::unique_ptr<IExceptionFilterInstaller> CreateExceptionFilterInstaller() override;

private:
    std::shared_ptr<EventJournal> journal_;
};

/// StartInfo pointing at paths that are never touched by the fakes.
StartInfo MakeStartInfo();

/**
 * @brief A supervisor wired to a FakeSubsystemFactory.
 *
 * Configure `factory` and `journal` before calling Start.
 */
struct SupervisorHarness
{
    explicit SupervisorHarness(StartInfo info = MakeStartInfo());

    /// Everything enabled, hook guard off, on an ordinary date.
    static LaunchOptions DefaultOptions();

    void Start() { supervisor->Start(DefaultOptions()); }
    void Start(const LaunchOptions& options) { supervisor->Start(options); }

    std::shared_ptr<EventJournal> journal;
    FakeSubsystemFactory* factory = nullptr; // Owned by the supervisor
    utils::LogLevelSwitch log_level;
    OneShotSignal unload_finished;
    std::unique_ptr<Supervisor> supervisor;
};

} // namespace tether::test
