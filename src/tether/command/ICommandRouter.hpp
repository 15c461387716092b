#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tether
{

struct CommandInfo
{
    using Handler = std::function<void(const std::string& command, const std::string& arguments)>;

    /// Receives the command (with leading slash) and the argument string.
    Handler handler;
    std::string help_message;
    bool show_in_help = true;
};

class ICommandRouter
{
public:
    virtual ~ICommandRouter() = default;

    /// Returns false when the command is already registered.
    virtual bool AddHandler(const std::string& command, CommandInfo info) = 0;
    virtual bool RemoveHandler(const std::string& command) = 0;

    /// Dispatches "/command arguments". Returns false when no handler matches.
    virtual bool ProcessCommand(const std::string& content) = 0;

    /// Commands shown in help, with their help text, sorted by name.
    virtual std::vector<std::pair<std::string, std::string>> Commands() const = 0;

    /// Command text from the host's "unknown command" error message, if it is one.
    virtual std::optional<std::string> ExtractUnknownCommand(const std::string& message) const = 0;
};

/// Sink for lines the runtime prints to the player.
using ChatSink = std::function<void(const std::string&)>;

/**
 * @brief Runtime-provided actions behind the built-in commands.
 */
struct BuiltinCommandHooks
{
    ChatSink print;
    std::function<std::string()> version;
    std::function<std::vector<std::string>()> plugin_summaries;
    std::function<bool(const std::string& level)> set_log_level;
    std::function<void()> toggle_main_window;
    std::function<void()> request_unload;
    std::function<bool()> replace_exception_filter;
};

class IBuiltinCommands
{
public:
    virtual ~IBuiltinCommands() = default;

    /// Registers every built-in with the router.
    virtual void Setup() = 0;

    virtual std::vector<std::string> CommandNames() const = 0;
};

} // namespace tether
