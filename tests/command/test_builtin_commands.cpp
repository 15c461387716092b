#include <catch2/catch_test_macros.hpp>
#include "tether/command/BuiltinCommands.hpp"
#include "tether/command/CommandRouter.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace tether;

namespace {

struct BuiltinFixture {
    CommandRouter router{ ClientLanguage::English };
    std::vector<std::string> printed;
    std::vector<std::string> plugins;
    std::string level;
    int toggles = 0;
    int unloads = 0;
    bool filter_result = true;
    BuiltinCommands builtins;

    BuiltinFixture()
        : builtins(router, MakeHooks())
    {
        builtins.Setup();
    }

    BuiltinCommandHooks MakeHooks() {
        BuiltinCommandHooks hooks;
        hooks.print = [this](const std::string& line) { printed.push_back(line); };
        hooks.version = [] { return std::string("9.8.7"); };
        hooks.plugin_summaries = [this] { return plugins; };
        hooks.set_log_level = [this](const std::string& text) {
            if (text != "debug" && text != "error")
                return false;
            level = text;
            return true;
        };
        hooks.toggle_main_window = [this] { ++toggles; };
        hooks.request_unload = [this] { ++unloads; };
        hooks.replace_exception_filter = [this] { return filter_result; };
        return hooks;
    }

    bool Printed(const std::string& line) const {
        return std::find(printed.begin(), printed.end(), line) != printed.end();
    }
};

} // namespace

TEST_CASE("BuiltinCommands - registration", "[command][builtin]") {
    BuiltinFixture f;
    auto names = f.builtins.CommandNames();

    REQUIRE(names.size() == 7);
    for (const char* expected : { "/thelp", "/tversion", "/tplugins", "/tloglevel", "/tmain", "/tunload", "/texfilter" })
        REQUIRE(std::find(names.begin(), names.end(), expected) != names.end());

    SECTION("Already-taken names are skipped") {
        CommandRouter router(ClientLanguage::English);
        CommandInfo taken;
        taken.handler = [](const std::string&, const std::string&) {};
        router.AddHandler("/tversion", taken);

        BuiltinCommands builtins(router, BuiltinCommandHooks{});
        builtins.Setup();
        REQUIRE(builtins.CommandNames().size() == 6);
    }
}

TEST_CASE("BuiltinCommands - help", "[command][builtin]") {
    BuiltinFixture f;

    SECTION("Lists visible commands") {
        f.router.ProcessCommand("/thelp");
        REQUIRE(f.printed.front() == "Available commands:");
        REQUIRE(f.Printed("/tversion: Shows the runtime version."));
        REQUIRE(std::none_of(f.printed.begin(), f.printed.end(),
                             [](const std::string& line) { return line.rfind("/texfilter", 0) == 0; }));
    }

    SECTION("Filters by argument") {
        f.router.ProcessCommand("/thelp plug");
        REQUIRE(f.printed.size() == 2);
        REQUIRE(f.printed[1].rfind("/tplugins", 0) == 0);
    }
}

TEST_CASE("BuiltinCommands - actions", "[command][builtin]") {
    BuiltinFixture f;

    SECTION("Version") {
        f.router.ProcessCommand("/tversion");
        REQUIRE(f.Printed("tether 9.8.7"));
    }

    SECTION("Plugins") {
        f.router.ProcessCommand("/tplugins");
        REQUIRE(f.Printed("No plugins loaded."));

        f.plugins = { "Alpha 1.0" };
        f.router.ProcessCommand("/tplugins");
        REQUIRE(f.Printed("Alpha 1.0"));
    }

    SECTION("Log level") {
        f.router.ProcessCommand("/tloglevel debug");
        REQUIRE(f.level == "debug");
        REQUIRE(f.Printed("Log level set to debug."));

        f.router.ProcessCommand("/tloglevel");
        REQUIRE(f.Printed("Unknown log level ''."));
        f.router.ProcessCommand("/tloglevel chatty");
        REQUIRE(f.Printed("Unknown log level 'chatty'."));
        REQUIRE(f.level == "debug");
    }

    SECTION("Window and unload") {
        f.router.ProcessCommand("/tmain");
        f.router.ProcessCommand("/tmain");
        REQUIRE(f.toggles == 2);

        f.router.ProcessCommand("/tunload");
        REQUIRE(f.unloads == 1);
        REQUIRE(f.Printed("Unloading..."));
    }

    SECTION("Exception filter") {
        f.router.ProcessCommand("/texfilter");
        REQUIRE(f.Printed("Exception filter replaced."));

        f.filter_result = false;
        f.router.ProcessCommand("/texfilter");
        REQUIRE(f.Printed("Exception filter could not be replaced."));
    }
}
