#pragma once

#include "ICommandRouter.hpp"
#include "tether/api/StartInfo.hpp"

#include <map>
#include <mutex>
#include <regex>

namespace tether
{

/**
 * @brief Slash-command registry and dispatcher.
 *
 * Command keys include the leading slash. The host answers unknown commands with
 * a language-specific error line; that line is how commands reach the router.
 */
class CommandRouter : public ICommandRouter
{
public:
    explicit CommandRouter(ClientLanguage language);

    bool AddHandler(const std::string& command, CommandInfo info) override;
    bool RemoveHandler(const std::string& command) override;
    bool ProcessCommand(const std::string& content) override;
    std::vector<std::pair<std::string, std::string>> Commands() const override;
    std::optional<std::string> ExtractUnknownCommand(const std::string& message) const override;

    /// Host error line pattern for a client language, the command in group 1.
    static const char* UnknownCommandPattern(ClientLanguage language);

private:
    std::regex unknown_command_regex_;

    mutable std::mutex mutex_;
    std::map<std::string, CommandInfo> commands_;
};

} // namespace tether
