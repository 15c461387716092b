#include <catch2/catch_test_macros.hpp>
#include "tether/overlay/OverlayRuntime.hpp"
#include "tether/overlay/RuntimeInterface.hpp"
#include "tether/overlay/SeasonalFeature.hpp"
#include "tether/utils/ErrorReporter.hpp"
#include "tether/utils/LogLevelSwitch.hpp"
#include "utils/FakeSubsystems.hpp"

#include <imgui.h>

#include <stdexcept>
#include <thread>

using namespace tether;

TEST_CASE("OverlayRuntime - frames without a present hook", "[overlay]") {
    OverlayRuntime overlay(std::nullopt, OverlaySettings{});

    SECTION("Nothing renders before Enable") {
        REQUIRE_FALSE(overlay.RenderFrame(0.016f));
        REQUIRE_FALSE(overlay.IsFontReady());
    }

    SECTION("First frame builds fonts and runs subscribers") {
        overlay.Enable();
        int draws = 0;
        overlay.SubscribeDraw([&] { ++draws; });
        overlay.SubscribeDraw([] { throw std::runtime_error("plugin draw failed"); });
        overlay.SubscribeDraw([] { throw 7; });

        ImDrawData* last = nullptr;
        overlay.SetDrawDataSink([&](ImDrawData* data) { last = data; });

        REQUIRE(overlay.RenderFrame(0.016f));
        REQUIRE(overlay.IsFontReady());
        REQUIRE(draws == 1);
        REQUIRE(last != nullptr);

        REQUIRE(overlay.RenderFrame(0.0f));
        REQUIRE(draws == 2);
        REQUIRE(overlay.FramesRendered() == 2);
    }

    SECTION("WaitForFontRebuild returns once the render thread built fonts") {
        overlay.Enable();
        std::thread render([&] { overlay.RenderFrame(0.016f); });
        overlay.WaitForFontRebuild();
        render.join();
        REQUIRE(overlay.IsFontReady());
    }

    SECTION("Unsubscribed callbacks stop running") {
        overlay.Enable();
        int draws = 0;
        auto id = overlay.SubscribeDraw([&] { ++draws; });
        overlay.RenderFrame(0.016f);
        overlay.UnsubscribeDraw(id);
        overlay.RenderFrame(0.016f);
        REQUIRE(draws == 1);
    }

    SECTION("No subscriber runs after Dispose") {
        overlay.Enable();
        int draws = 0;
        overlay.SubscribeDraw([&] { ++draws; });
        overlay.Dispose();

        REQUIRE_FALSE(overlay.RenderFrame(0.016f));
        REQUIRE(draws == 0);
        REQUIRE_THROWS(overlay.Enable());
        REQUIRE_NOTHROW(overlay.Dispose());
    }
}

TEST_CASE("RuntimeInterface - main window", "[overlay][interface]") {
    utils::ErrorReporter::ClearErrors();
    utils::LogLevelSwitch level;
    tether::test::FakeLocalization localization;
    int unload_requests = 0;

    RuntimeInterface shell(RuntimeInterfaceCreateInfo{
        "1.2.3",
        level,
        localization,
        [] { return std::vector<LoadedPluginInfo>{ { "Alpha", "1.0", false } }; },
        [&] { ++unload_requests; },
    });

    SECTION("Toggle") {
        REQUIRE_FALSE(shell.IsMainWindowOpen());
        shell.ToggleMainWindow();
        REQUIRE(shell.IsMainWindowOpen());
        shell.ToggleMainWindow();
        REQUIRE_FALSE(shell.IsMainWindowOpen());
    }

    SECTION("Reported errors open the window") {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Plugin, "Plugin failed to load", "details");
        shell.CollectErrors();
        REQUIRE(shell.IsMainWindowOpen());
        REQUIRE(shell.ShownErrors().size() == 1);
        REQUIRE(shell.ShownErrors().front().user_message == "Plugin failed to load");
        REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
    }

    SECTION("Shown errors are capped") {
        for (size_t i = 0; i < RuntimeInterface::kMaxShownErrors + 5; ++i)
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Hook, "warning " + std::to_string(i));
        shell.CollectErrors();
        REQUIRE(shell.ShownErrors().size() == RuntimeInterface::kMaxShownErrors);
        REQUIRE(shell.ShownErrors().back().user_message ==
                "warning " + std::to_string(RuntimeInterface::kMaxShownErrors + 4));
    }

    SECTION("Draws inside an overlay frame") {
        OverlayRuntime overlay(std::nullopt, OverlaySettings{});
        overlay.Enable();
        overlay.SubscribeDraw([&] { shell.Draw(); });

        shell.ToggleMainWindow();
        REQUIRE(overlay.RenderFrame(0.016f));
        REQUIRE(overlay.RenderFrame(0.016f));
        REQUIRE(shell.IsMainWindowOpen());
        REQUIRE(unload_requests == 0);
    }
}

TEST_CASE("SeasonalFeature - date gate and attachment", "[overlay][seasonal]") {
    REQUIRE(SeasonalFeature::IsActiveOn(CivilDate{ 2021, 4, 1 }));
    REQUIRE_FALSE(SeasonalFeature::IsActiveOn(CivilDate{ 2021, 4, 2 }));
    REQUIRE_FALSE(SeasonalFeature::IsActiveOn(CivilDate{ 2022, 4, 1 }));

    OverlayRuntime overlay(std::nullopt, OverlaySettings{});
    overlay.Enable();

    SeasonalFeature seasonal(overlay);
    REQUIRE(seasonal.IsAttached());
    REQUIRE(overlay.RenderFrame(0.5f));

    seasonal.Dispose();
    REQUIRE_FALSE(seasonal.IsAttached());
    REQUIRE_NOTHROW(seasonal.Dispose());
    REQUIRE(overlay.RenderFrame(0.5f));
}
