#include "BuiltinCommands.hpp"

#include <plog/Log.h>

namespace tether
{

BuiltinCommands::BuiltinCommands(ICommandRouter& router, BuiltinCommandHooks hooks)
    : router_(router)
    , hooks_(std::move(hooks))
{
}

void BuiltinCommands::Setup()
{
    auto add = [this](const std::string& command, std::string help, CommandInfo::Handler handler,
                      bool show_in_help = true) {
        CommandInfo info;
        info.handler = std::move(handler);
        info.help_message = std::move(help);
        info.show_in_help = show_in_help;
        if (router_.AddHandler(command, std::move(info)))
            registered_.push_back(command);
    };

    add("/thelp", "Shows the list of commands available.",
        [this](const std::string&, const std::string& args) { OnHelp(args); });
    add("/tversion", "Shows the runtime version.", [this](const std::string&, const std::string&) { OnVersion(); });
    add("/tplugins", "Lists loaded plugins.", [this](const std::string&, const std::string&) { OnPlugins(); });
    add("/tloglevel", "Sets the log level: verbose, debug, info, warning, error, fatal.",
        [this](const std::string&, const std::string& args) { OnLogLevel(args); });
    add("/tmain", "Toggles the runtime main window.", [this](const std::string&, const std::string&) {
        if (hooks_.toggle_main_window)
            hooks_.toggle_main_window();
    });
    add("/tunload", "Unloads the runtime from the game.", [this](const std::string&, const std::string&) {
        Print("Unloading...");
        if (hooks_.request_unload)
            hooks_.request_unload();
    });
    add(
        "/texfilter", "Reinstalls the game's own exception filter.",
        [this](const std::string&, const std::string&) { OnExceptionFilter(); }, false);

    PLOG_DEBUG << "Registered " << registered_.size() << " built-in command(s)";
}

std::vector<std::string> BuiltinCommands::CommandNames() const { return registered_; }

void BuiltinCommands::OnHelp(const std::string& arguments)
{
    Print("Available commands:");
    for (const auto& [command, help] : router_.Commands())
    {
        if (!arguments.empty() && command.find(arguments) == std::string::npos)
            continue;
        Print(command + ": " + help);
    }
}

void BuiltinCommands::OnVersion()
{
    Print("tether " + (hooks_.version ? hooks_.version() : std::string("unknown")));
}

void BuiltinCommands::OnPlugins()
{
    auto plugins = hooks_.plugin_summaries ? hooks_.plugin_summaries() : std::vector<std::string>{};
    if (plugins.empty())
    {
        Print("No plugins loaded.");
        return;
    }
    for (const auto& line : plugins)
        Print(line);
}

void BuiltinCommands::OnLogLevel(const std::string& arguments)
{
    if (arguments.empty() || !hooks_.set_log_level || !hooks_.set_log_level(arguments))
    {
        Print("Unknown log level '" + arguments + "'.");
        return;
    }
    Print("Log level set to " + arguments + ".");
}

void BuiltinCommands::OnExceptionFilter()
{
    bool replaced = hooks_.replace_exception_filter && hooks_.replace_exception_filter();
    Print(replaced ? "Exception filter replaced." : "Exception filter could not be replaced.");
}

void BuiltinCommands::Print(const std::string& line) const
{
    if (hooks_.print)
        hooks_.print(line);
}

} // namespace tether
