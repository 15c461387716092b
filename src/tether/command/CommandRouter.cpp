#include "CommandRouter.hpp"
#include "tether/core/SubsystemError.hpp"

#include <plog/Log.h>

namespace tether
{

CommandRouter::CommandRouter(ClientLanguage language)
    : unknown_command_regex_(UnknownCommandPattern(language), std::regex::ECMAScript)
{
}

const char* CommandRouter::UnknownCommandPattern(ClientLanguage language)
{
    switch (language)
    {
    case ClientLanguage::Japanese: return "そのコマンドはありません。： \"(.+)\"";
    case ClientLanguage::English: return "Command not recognized: \"(.+)\"";
    case ClientLanguage::German: return "„(.+)“ existiert nicht als Textkommando\\.";
    case ClientLanguage::French: return "La commande texte “(.+)” n'existe pas\\.";
    }
    return "Command not recognized: \"(.+)\"";
}

bool CommandRouter::AddHandler(const std::string& command, CommandInfo info)
{
    if (command.empty() || command[0] != '/')
    {
        PLOG_WARNING << "Rejecting command '" << command << "': commands start with '/'";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = commands_.emplace(command, std::move(info));
    if (!inserted)
    {
        PLOG_WARNING << "Command " << command << " is already registered";
        return false;
    }
    PLOG_DEBUG << "Registered command " << command;
    return true;
}

bool CommandRouter::RemoveHandler(const std::string& command)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.erase(command) > 0;
}

bool CommandRouter::ProcessCommand(const std::string& content)
{
    std::string command = content;
    std::string arguments;
    auto space = content.find(' ');
    if (space != std::string::npos)
    {
        command = content.substr(0, space);
        arguments = content.substr(space + 1);
    }

    CommandInfo::Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = commands_.find(command);
        if (it == commands_.end())
            return false;
        handler = it->second.handler;
    }

    PLOG_DEBUG << "Dispatching " << command << " '" << arguments << "'";
    try
    {
        if (handler)
            handler(command, arguments);
    }
    catch (...)
    {
        PLOG_ERROR << "Command " << command << " failed: " << CurrentExceptionMessage();
    }
    return true;
}

std::vector<std::pair<std::string, std::string>> CommandRouter::Commands() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [name, info] : commands_)
    {
        if (info.show_in_help)
            out.emplace_back(name, info.help_message);
    }
    return out;
}

std::optional<std::string> CommandRouter::ExtractUnknownCommand(const std::string& message) const
{
    std::smatch match;
    if (!std::regex_search(message, match, unknown_command_regex_))
        return std::nullopt;
    return match[1].str();
}

} // namespace tether
