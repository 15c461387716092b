#include "ChatFeatureSet.hpp"
#include "tether/Version.hpp"
#include "tether/data/IDataAssets.hpp"
#include "tether/game/IGameSubsystems.hpp"
#include "tether/i18n/ILocalization.hpp"

#include <cstring>

#include <plog/Log.h>

namespace tether
{

ChatFeatureSet::ChatFeatureSet(const ChatFeaturesCreateInfo& info)
    : commands_(info.commands)
    , localization_(info.localization)
    , client_state_(info.client_state)
    , network_(info.network)
    , decoder_(info.decoder)
    , print_(info.print)
    , loaded_plugin_count_(info.loaded_plugin_count)
    , url_regex_(R"((http|ftp|https)://([\w_-]+(?:(?:\.[\w_-]+)+))([\w.,@?^=%&:/~+#-]*[\w@?^=%&/~+#-])?)")
{
    auto opcode = info.data.ServerOpcode(kChatOpcodeName);
    if (opcode)
    {
        chat_handler_ = network_.RegisterHandler(*opcode, [this](const NetworkMessage& message) {
            if (auto chat = ParseChatPacket(message))
                HandleChatMessage(*chat);
        });
    }
    else
    {
        PLOG_WARNING << "No server opcode for " << kChatOpcodeName << ", chat commands are unavailable";
    }

    territory_subscription_ =
        client_state_.SubscribeTerritoryChanged([this](uint16_t territory) { OnTerritoryChanged(territory); });
}

ChatFeatureSet::~ChatFeatureSet() { Dispose(); }

void ChatFeatureSet::Dispose()
{
    if (disposed_.exchange(true))
        return;

    if (chat_handler_ != 0)
        network_.RemoveHandler(chat_handler_);
    client_state_.UnsubscribeTerritoryChanged(territory_subscription_);
}

std::optional<ChatMessage> ChatFeatureSet::ParseChatPacket(const NetworkMessage& message) const
{
    const auto& payload = message.payload;
    if (payload.size() < 3)
        return std::nullopt;

    uint16_t sender_length = 0;
    std::memcpy(&sender_length, payload.data() + 1, sizeof(sender_length));
    size_t text_start = 3 + static_cast<size_t>(sender_length);
    if (text_start > payload.size())
    {
        PLOG_DEBUG << "Chat packet sender overruns payload";
        return std::nullopt;
    }

    ChatMessage chat;
    chat.type = static_cast<ChatType>(payload[0]);
    chat.sender.assign(payload.begin() + 3, payload.begin() + text_start);

    std::vector<uint8_t> encoded(payload.begin() + text_start, payload.end());
    chat.text = decoder_.Decode(encoded).TextValue();
    return chat;
}

bool ChatFeatureSet::HandleChatMessage(const ChatMessage& message)
{
    std::smatch match;
    if (std::regex_search(message.text, match, url_regex_))
    {
        std::lock_guard<std::mutex> lock(link_mutex_);
        last_link_ = match[0].str();
    }

    if (message.type != ChatType::ErrorMessage)
        return false;

    auto command = commands_.ExtractUnknownCommand(message.text);
    if (!command)
        return false;

    bool handled = commands_.ProcessCommand(*command);
    PLOG_DEBUG << "Unknown command " << *command << (handled ? " handled" : " not ours");
    return handled;
}

std::optional<std::string> ChatFeatureSet::LastLink() const
{
    std::lock_guard<std::mutex> lock(link_mutex_);
    return last_link_;
}

void ChatFeatureSet::OnTerritoryChanged(uint16_t territory)
{
    if (welcomed_.exchange(true))
        return;

    size_t plugins = loaded_plugin_count_ ? loaded_plugin_count_() : 0;
    auto line = localization_.Format("chat.welcome", "tether {version} loaded. {count} plugin(s) loaded.",
                                     { { "version", TETHER_VERSION_STRING }, { "count", std::to_string(plugins) } });
    PLOG_DEBUG << "First territory " << territory << ", printing welcome";
    if (print_)
        print_(line);
}

} // namespace tether
