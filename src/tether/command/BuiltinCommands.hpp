#pragma once

#include "ICommandRouter.hpp"

namespace tether
{

class BuiltinCommands : public IBuiltinCommands
{
public:
    BuiltinCommands(ICommandRouter& router, BuiltinCommandHooks hooks);

    void Setup() override;
    std::vector<std::string> CommandNames() const override;

private:
    void OnHelp(const std::string& arguments);
    void OnVersion();
    void OnPlugins();
    void OnLogLevel(const std::string& arguments);
    void OnExceptionFilter();

    void Print(const std::string& line) const;

    ICommandRouter& router_;
    BuiltinCommandHooks hooks_;
    std::vector<std::string> registered_;
};

} // namespace tether
