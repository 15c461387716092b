#include <catch2/catch_test_macros.hpp>
#include "tether/config/RuntimeConfiguration.hpp"
#include "utils/TempDirectory.hpp"

using namespace tether;
using tether::test::TempDirectory;

TEST_CASE("RuntimeConfiguration - missing file yields defaults", "[config]") {
    TempDirectory dir;
    auto config = RuntimeConfiguration::Load(dir.Path() / "absent.toml");

    REQUIRE_FALSE(config.language_override.has_value());
    REQUIRE_FALSE(config.logging_level.has_value());
    REQUIRE(config.disabled_plugins.empty());
    REQUIRE(config.overlay_font_scale == 1.0f);
    REQUIRE(config.Path() == dir.Path() / "absent.toml");
}

TEST_CASE("RuntimeConfiguration - load values", "[config]") {
    TempDirectory dir;
    auto path = dir.WriteFile("tether.toml", R"(
language_override = "ja"
logging_level = 6
disabled_plugins = ["Noisy", "Broken"]

[overlay]
font_scale = 1.5
show_startup_banner = false
)");

    auto config = RuntimeConfiguration::Load(path);
    REQUIRE(config.language_override == "ja");
    REQUIRE(config.logging_level == 6);
    REQUIRE(config.disabled_plugins.size() == 2);
    REQUIRE(config.IsPluginDisabled("Broken"));
    REQUIRE_FALSE(config.IsPluginDisabled("broken"));
    REQUIRE(config.overlay_font_scale == 1.5f);
    REQUIRE_FALSE(config.show_startup_banner);
}

TEST_CASE("RuntimeConfiguration - invalid values", "[config]") {
    TempDirectory dir;

    SECTION("Out-of-range level is ignored") {
        auto path = dir.WriteFile("tether.toml", "logging_level = 42\n");
        REQUIRE_FALSE(RuntimeConfiguration::Load(path).logging_level.has_value());
    }

    SECTION("Empty override is treated as absent") {
        auto path = dir.WriteFile("tether.toml", "language_override = \"\"\n");
        REQUIRE_FALSE(RuntimeConfiguration::Load(path).language_override.has_value());
    }

    SECTION("Syntax error throws") {
        auto path = dir.WriteFile("tether.toml", "logging_level = = 3\n");
        REQUIRE_THROWS_AS(RuntimeConfiguration::Load(path), ConfigurationError);
    }
}

TEST_CASE("RuntimeConfiguration - save then load", "[config][save]") {
    TempDirectory dir;
    auto path = dir.Path() / "nested" / "tether.toml";

    RuntimeConfiguration config = RuntimeConfiguration::Load(path);
    config.language_override = "fr";
    config.logging_level = 3;
    config.disabled_plugins = { "Legacy" };
    config.overlay_font_scale = 2.0f;

    REQUIRE(config.Save());
    REQUIRE(config.LastError().empty());

    auto reloaded = RuntimeConfiguration::Load(path);
    REQUIRE(reloaded.language_override == "fr");
    REQUIRE(reloaded.logging_level == 3);
    REQUIRE(reloaded.IsPluginDisabled("Legacy"));
    REQUIRE(reloaded.overlay_font_scale == 2.0f);
}

TEST_CASE("RuntimeConfiguration - unset level is not written", "[config][save]") {
    TempDirectory dir;
    auto path = dir.Path() / "tether.toml";

    RuntimeConfiguration config = RuntimeConfiguration::Load(path);
    config.disabled_plugins = { "Legacy" };
    REQUIRE(config.Save());

    auto reloaded = RuntimeConfiguration::Load(path);
    REQUIRE_FALSE(reloaded.logging_level.has_value());
    REQUIRE(reloaded.IsPluginDisabled("Legacy"));
}
