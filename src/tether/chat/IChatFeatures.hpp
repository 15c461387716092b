#pragma once

#include "tether/command/ICommandRouter.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tether
{

class IClientState;
class IDataAssets;
class ILocalization;
class INetworkHandlers;
class IStringDecoder;

enum class ChatType : uint8_t
{
    Say = 10,
    Shout = 11,
    Echo = 56,
    SystemMessage = 57,
    ErrorMessage = 60
};

struct ChatMessage
{
    ChatType type = ChatType::Say;
    std::string sender;
    std::string text;
};

class IChatFeatures
{
public:
    virtual ~IChatFeatures() = default;

    /// Returns true when the message was consumed and should not be shown.
    virtual bool HandleChatMessage(const ChatMessage& message) = 0;

    virtual std::optional<std::string> LastLink() const = 0;

    virtual void Dispose() = 0;
};

struct ChatFeaturesCreateInfo
{
    ICommandRouter& commands;
    ILocalization& localization;
    IClientState& client_state;
    INetworkHandlers& network;
    IDataAssets& data;
    IStringDecoder& decoder;
    ChatSink print;
    std::function<size_t()> loaded_plugin_count;
};

} // namespace tether
