#include <catch2/catch_test_macros.hpp>
#include "tether/Version.hpp"
#include "tether/core/Supervisor.hpp"
#include "tether/utils/ErrorReporter.hpp"
#include "utils/FakeSubsystems.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace tether;
using namespace tether::test;

namespace {

bool ChatContains(const Supervisor& supervisor, const std::string& line) {
    auto log = supervisor.ChatLog();
    return std::find(log.begin(), log.end(), line) != log.end();
}

} // namespace

TEST_CASE("Supervisor - full startup reaches Ready", "[supervisor][startup]") {
    utils::ErrorReporter::ClearErrors();
    SupervisorHarness h;
    h.factory->plugins = { { "Alpha", "1.2.0", false }, { "Bundled", "0.1", true } };

    REQUIRE(h.supervisor->State() == LifecycleState::NotStarted);
    h.Start();

    REQUIRE(h.supervisor->State() == LifecycleState::Ready);
    REQUIRE(h.supervisor->IsReady());
    REQUIRE_FALSE(h.supervisor->UnloadRequested().IsSet());
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());

    SECTION("Subsystems are constructed in dependency order") {
        const std::vector<std::string> order = {
            "construct:Configuration",   "construct:SigScanner",     "construct:HookGuard",
            "construct:Framework",       "construct:NetworkOptimizer", "construct:NetworkHandlers",
            "construct:ClientState",     "construct:Localization",   "construct:PluginCatalog",
            "construct:RuntimeInterface", "construct:Overlay",       "construct:DataAssets",
            "initialize:DataAssets",     "construct:StringDecoder",  "construct:CommandRouter",
            "construct:BuiltinCommands", "construct:ChatFeatures",   "cleanup:PluginCatalog",
            "construct:PluginRuntime",   "load:PluginRuntime",       "enable:Framework",
            "enable:ClientState",
        };
        for (size_t i = 1; i < order.size(); ++i) {
            INFO(order[i - 1] << " before " << order[i]);
            REQUIRE(h.journal->Before(order[i - 1], order[i]));
        }
    }

    SECTION("Overlay is enabled, drawn into and font-ready before plugins load") {
        REQUIRE(h.journal->Before("enable:Overlay", "subscribe:Overlay"));
        REQUIRE(h.journal->Before("subscribe:Overlay", "fonts:Overlay"));
        REQUIRE(h.journal->Before("fonts:Overlay", "load:PluginRuntime"));
        REQUIRE(h.supervisor->Overlay() != nullptr);
        REQUIRE(h.factory->plugin_runtime_had_overlay);
    }

    SECTION("Both plugin catalogs are created") {
        REQUIRE(h.journal->WithPrefix("construct:PluginCatalog").size() == 2);
        REQUIRE(h.factory->plugin_runtime_had_default_catalog);
    }

    SECTION("Host hooks are enabled last") {
        REQUIRE(h.journal->Before("load:PluginRuntime", "enable:Framework"));
        REQUIRE(h.journal->Before("construct:ChatFeatures", "enable:ClientState"));
    }

    SECTION("Troubleshooting payload describes the session") {
        auto payload = nlohmann::json::parse(h.supervisor->TroubleshootingPayload());
        REQUIRE(payload["runtime_version"] == TETHER_VERSION_STRING);
        REQUIRE(payload["game_version"] == "2024.01.01.0000.0000");
        REQUIRE(payload["interface_loaded"] == true);
        REQUIRE(payload["loaded_plugins"].size() == 2);
        REQUIRE(payload["loaded_plugins"][1]["bundled"] == true);
    }

    SECTION("Hook guard is constructed but not enabled by default options") {
        REQUIRE(h.journal->Contains("construct:HookGuard"));
        REQUIRE_FALSE(h.journal->Contains("enable:HookGuard"));
        REQUIRE_FALSE(h.supervisor->HookGuard()->IsEnabled());
    }

    SECTION("Seasonal feature stays detached on an ordinary date") {
        REQUIRE_FALSE(h.journal->Contains("construct:SeasonalFeature"));
        REQUIRE(h.supervisor->Seasonal() == nullptr);
    }
}

TEST_CASE("Supervisor - launch options", "[supervisor][startup][options]") {
    SupervisorHarness h;
    auto options = SupervisorHarness::DefaultOptions();

    SECTION("Hook guard enabled on request") {
        options.hook_guard_enabled = true;
        h.Start(options);
        REQUIRE(h.journal->Contains("enable:HookGuard"));
        REQUIRE(h.supervisor->HookGuard()->IsEnabled());
    }

    SECTION("Overlay suppressed") {
        options.overlay_enabled = false;
        h.Start(options);
        REQUIRE(h.supervisor->IsReady());
        REQUIRE_FALSE(h.journal->Contains("construct:Overlay"));
        REQUIRE(h.supervisor->Overlay() == nullptr);
        REQUIRE_FALSE(h.factory->plugin_runtime_had_overlay);

        auto payload = nlohmann::json::parse(h.supervisor->TroubleshootingPayload());
        REQUIRE(payload["interface_loaded"] == false);
    }

    SECTION("Overlay suppressed leaves the seasonal feature out even on its date") {
        options.overlay_enabled = false;
        options.today = CivilDate{ 2021, 4, 1 };
        h.Start(options);
        REQUIRE(h.supervisor->IsReady());
        REQUIRE_FALSE(h.journal->Contains("construct:SeasonalFeature"));
    }

    SECTION("Seasonal feature attaches on its date") {
        options.today = CivilDate{ 2021, 4, 1 };
        h.Start(options);
        REQUIRE(h.journal->Contains("construct:SeasonalFeature"));
        REQUIRE(h.supervisor->Seasonal() != nullptr);
        REQUIRE(h.supervisor->Seasonal()->IsAttached());
    }

    SECTION("Plugins suppressed") {
        options.plugins_enabled = false;
        h.Start(options);
        REQUIRE(h.supervisor->IsReady());
        REQUIRE_FALSE(h.journal->Contains("cleanup:PluginCatalog"));
        REQUIRE_FALSE(h.journal->Contains("construct:PluginRuntime"));
        REQUIRE(h.supervisor->Plugins() == nullptr);
    }
}

TEST_CASE("Supervisor - start info is forwarded", "[supervisor][startup]") {
    auto info = MakeStartInfo();
    info.language = ClientLanguage::Japanese;
    info.opt_out_telemetry = true;
    info.default_plugin_directory.clear();

    SupervisorHarness h(info);
    h.Start();

    REQUIRE(h.factory->last_opt_out_telemetry);
    REQUIRE(h.factory->last_client_language == ClientLanguage::Japanese);
    REQUIRE(h.factory->last_plugin_language == "ja");
    REQUIRE(h.journal->WithPrefix("construct:PluginCatalog").size() == 1);
    REQUIRE_FALSE(h.factory->plugin_runtime_had_default_catalog);
}

TEST_CASE("Supervisor - localization source", "[supervisor][startup][i18n]") {
    SupervisorHarness h;

    SECTION("Configured override wins") {
        h.factory->configuration.language_override = "de";
        h.Start();
        REQUIRE(h.journal->Contains("override_de:Localization"));
        REQUIRE_FALSE(h.journal->Contains("culture:Localization"));
        REQUIRE(h.supervisor->Localization()->LastSource() == LocalizationSource::Override);
    }

    SECTION("UI culture otherwise") {
        h.Start();
        REQUIRE(h.journal->Contains("culture:Localization"));
        REQUIRE(h.supervisor->Localization()->LastSource() == LocalizationSource::UiCulture);
    }
}

TEST_CASE("Supervisor - configured log level is applied", "[supervisor][startup][logging]") {
    SupervisorHarness h;
    h.factory->configuration.logging_level = static_cast<int>(plog::debug);
    h.Start();
    REQUIRE(h.log_level.Get() == plog::debug);
}

TEST_CASE("Supervisor - bootstrap log level kept without a configured one", "[supervisor][startup][logging]") {
    SupervisorHarness h;
    h.log_level.Set(plog::verbose);
    REQUIRE_FALSE(h.factory->configuration.logging_level.has_value());

    h.Start();
    REQUIRE(h.supervisor->IsReady());
    REQUIRE(h.log_level.Get() == plog::verbose);
}

TEST_CASE("Supervisor - soft failures continue startup", "[supervisor][startup][failure]") {
    utils::ErrorReporter::ClearErrors();
    SupervisorHarness h;

    SECTION("Overlay enable failure disposes the overlay") {
        h.journal->FailOn("enable:Overlay");
        h.Start();

        REQUIRE(h.supervisor->IsReady());
        REQUIRE(h.supervisor->Overlay() == nullptr);
        REQUIRE(h.journal->Contains("dispose:Overlay"));
        REQUIRE(h.journal->Contains("destroy:Overlay"));
        REQUIRE_FALSE(h.factory->plugin_runtime_had_overlay);
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
    }

    SECTION("Overlay construction failure") {
        h.journal->FailOn("construct:Overlay");
        h.Start();
        REQUIRE(h.supervisor->IsReady());
        REQUIRE(h.supervisor->Overlay() == nullptr);
        REQUIRE(h.journal->Contains("construct:DataAssets"));
    }

    SECTION("Seasonal feature failure") {
        h.journal->FailOn("construct:SeasonalFeature");
        auto options = SupervisorHarness::DefaultOptions();
        options.today = CivilDate{ 2021, 4, 1 };
        h.Start(options);
        REQUIRE(h.supervisor->IsReady());
        REQUIRE(h.supervisor->Seasonal() == nullptr);
        REQUIRE(h.supervisor->Overlay() != nullptr);
    }

    SECTION("Plugin load failure") {
        h.journal->FailOn("load:PluginRuntime");
        h.Start();
        REQUIRE(h.supervisor->IsReady());
        REQUIRE(h.journal->Contains("enable:Framework"));
    }

    SECTION("Stale plugin cleanup failure skips plugin loading only") {
        h.journal->FailOn("cleanup:PluginCatalog");
        h.Start();
        REQUIRE(h.supervisor->IsReady());
        REQUIRE(h.supervisor->Plugins() == nullptr);
        REQUIRE(h.journal->Contains("enable:ClientState"));
    }
}

TEST_CASE("Supervisor - data asset failure aborts and unloads", "[supervisor][startup][failure]") {
    utils::ErrorReporter::ClearErrors();
    SupervisorHarness h;

    SECTION("Initialization failure") {
        h.journal->FailOn("initialize:DataAssets");
    }

    SECTION("Construction failure") {
        h.journal->FailOn("construct:DataAssets");
    }

    h.Start();

    REQUIRE(h.supervisor->State() == LifecycleState::FailedDuringStart);
    REQUIRE_FALSE(h.supervisor->IsReady());
    REQUIRE(h.supervisor->UnloadRequested().IsSet());
    REQUIRE_FALSE(h.journal->Contains("construct:StringDecoder"));
    REQUIRE_FALSE(h.journal->Contains("construct:PluginRuntime"));
    REQUIRE_FALSE(h.journal->Contains("enable:Framework"));
    REQUIRE(h.supervisor->TroubleshootingPayload().empty());

    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(std::any_of(errors.begin(), errors.end(), [](const auto& e) { return e.IsFatal(); }));
}

TEST_CASE("Supervisor - fatal failures unwind into unload", "[supervisor][startup][failure]") {
    SupervisorHarness h;

    SECTION("Scanner") {
        h.journal->FailOn("construct:SigScanner");
        h.Start();
        REQUIRE_FALSE(h.journal->Contains("construct:HookGuard"));
    }

    SECTION("Game subsystems") {
        h.journal->FailOn("construct:NetworkHandlers");
        h.Start();
        REQUIRE_FALSE(h.journal->Contains("construct:ClientState"));
        REQUIRE_FALSE(h.journal->Contains("construct:Localization"));
    }

    SECTION("Configuration") {
        h.journal->FailOn("construct:Configuration");
        h.Start();
        REQUIRE_FALSE(h.journal->Contains("construct:SigScanner"));
    }

    SECTION("Host hook installation") {
        h.journal->FailOn("enable:Framework");
        h.Start();
        REQUIRE_FALSE(h.journal->Contains("enable:ClientState"));
    }

    REQUIRE(h.supervisor->State() == LifecycleState::FailedDuringStart);
    REQUIRE(h.supervisor->UnloadRequested().IsSet());
}

TEST_CASE("Supervisor - non-standard exceptions during start", "[supervisor][startup][failure]") {
    utils::ErrorReporter::ClearErrors();
    SupervisorHarness h;

    SECTION("Fatal step unwinds into unload") {
        h.journal->FailOnForeign("construct:Framework");
        REQUIRE_NOTHROW(h.Start());
        REQUIRE(h.supervisor->State() == LifecycleState::FailedDuringStart);
        REQUIRE(h.supervisor->UnloadRequested().IsSet());
        REQUIRE_FALSE(h.journal->Contains("construct:Localization"));
    }

    SECTION("Soft step continues startup") {
        h.journal->FailOnForeign("load:PluginRuntime");
        REQUIRE_NOTHROW(h.Start());
        REQUIRE(h.supervisor->IsReady());
        REQUIRE(h.journal->Contains("enable:Framework"));
    }

    SECTION("Soft step cleanup failure is contained") {
        h.journal->FailOn("enable:Overlay");
        h.journal->FailOnForeign("dispose:Overlay");
        REQUIRE_NOTHROW(h.Start());
        REQUIRE(h.supervisor->IsReady());
        REQUIRE(h.supervisor->Overlay() == nullptr);
    }

    SECTION("Data assets abort") {
        h.journal->FailOnForeign("initialize:DataAssets");
        REQUIRE_NOTHROW(h.Start());
        REQUIRE(h.supervisor->State() == LifecycleState::FailedDuringStart);
        REQUIRE_FALSE(h.journal->Contains("construct:StringDecoder"));
    }

    REQUIRE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("Supervisor - Start runs once", "[supervisor][startup]") {
    SupervisorHarness h;
    h.Start();
    auto constructed = h.journal->WithPrefix("construct:").size();

    h.Start();
    REQUIRE(h.journal->WithPrefix("construct:").size() == constructed);
    REQUIRE(h.supervisor->IsReady());
}

TEST_CASE("Supervisor - unload requested before start completes", "[supervisor][startup][unload]") {
    SupervisorHarness h;
    h.supervisor->Unload();
    REQUIRE(h.supervisor->State() == LifecycleState::NotStarted);
    REQUIRE(h.supervisor->UnloadRequested().IsSet());

    h.Start();
    REQUIRE(h.supervisor->State() == LifecycleState::Unloading);
    REQUIRE_FALSE(h.supervisor->IsReady());
}

TEST_CASE("Supervisor - built-in commands", "[supervisor][commands]") {
    SupervisorHarness h;
    h.factory->plugins = { { "Alpha", "1.2.0", false }, { "Bundled", "0.1", true } };
    h.Start();
    auto* commands = h.supervisor->Commands();
    REQUIRE(commands != nullptr);

    SECTION("Version") {
        REQUIRE(commands->ProcessCommand("/tversion"));
        REQUIRE(ChatContains(*h.supervisor, std::string("tether ") + TETHER_VERSION_STRING));
    }

    SECTION("Plugin list") {
        REQUIRE(commands->ProcessCommand("/tplugins"));
        REQUIRE(ChatContains(*h.supervisor, "Alpha 1.2.0"));
        REQUIRE(ChatContains(*h.supervisor, "Bundled 0.1 (bundled)"));
    }

    SECTION("Log level") {
        REQUIRE(commands->ProcessCommand("/tloglevel warning"));
        REQUIRE(h.log_level.Get() == plog::warning);
        REQUIRE(ChatContains(*h.supervisor, "Log level set to warning."));

        REQUIRE(commands->ProcessCommand("/tloglevel loud"));
        REQUIRE(h.log_level.Get() == plog::warning);
        REQUIRE(ChatContains(*h.supervisor, "Unknown log level 'loud'."));
    }

    SECTION("Main window toggle") {
        REQUIRE(commands->ProcessCommand("/tmain"));
        REQUIRE(h.journal->Contains("toggle:RuntimeInterface"));
        REQUIRE(h.supervisor->Interface()->IsMainWindowOpen());
    }

    SECTION("Unload") {
        REQUIRE(commands->ProcessCommand("/tunload"));
        REQUIRE(ChatContains(*h.supervisor, "Unloading..."));
        REQUIRE(h.supervisor->UnloadRequested().IsSet());
        REQUIRE(h.supervisor->State() == LifecycleState::Unloading);
    }

    SECTION("Hidden commands stay out of help") {
        REQUIRE(commands->ProcessCommand("/thelp"));
        REQUIRE(ChatContains(*h.supervisor, "Available commands:"));
        auto log = h.supervisor->ChatLog();
        REQUIRE(std::none_of(log.begin(), log.end(),
                             [](const std::string& line) { return line.rfind("/texfilter", 0) == 0; }));
    }
}

TEST_CASE("Supervisor - exception filter replacement", "[supervisor][exfilter]") {
    SupervisorHarness h;

    SECTION("Host filter present") {
        h.factory->signatures["exception_filter"] = 0x140123450;
        h.Start();

        auto previous = h.supervisor->ReplaceExceptionHandler();
        REQUIRE(previous.has_value());
        REQUIRE(*previous == 0xC0FFEE);
        REQUIRE(h.factory->installed_filters == std::vector<uintptr_t>{ 0x140123450 });

        REQUIRE(h.supervisor->RestoreExceptionHandler(*previous));
        REQUIRE(h.factory->installed_filters.back() == 0xC0FFEE);
    }

    SECTION("Host filter missing") {
        h.Start();
        REQUIRE_FALSE(h.supervisor->ReplaceExceptionHandler().has_value());
        REQUIRE(h.factory->installed_filters.empty());

        REQUIRE(h.supervisor->Commands()->ProcessCommand("/texfilter"));
        REQUIRE(ChatContains(*h.supervisor, "Exception filter could not be replaced."));
    }

    SECTION("Before the scanner exists") {
        REQUIRE_FALSE(h.supervisor->ReplaceExceptionHandler().has_value());
        REQUIRE_FALSE(h.journal->Contains("construct:ExceptionFilterInstaller"));
    }
}
