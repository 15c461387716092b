#pragma once

#include "IChatFeatures.hpp"
#include "tether/core/SubscriberList.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <regex>

namespace tether
{

struct NetworkMessage;

/**
 * @brief Chat-side runtime features.
 *
 * - Routes the host's "unknown command" errors to the command router and hides
 *   them when a handler ran.
 * - Remembers the last URL seen in chat.
 * - Prints a welcome line on the first territory change.
 */
class ChatFeatureSet : public IChatFeatures
{
public:
    static constexpr const char* kChatOpcodeName = "ChatMessage";

    explicit ChatFeatureSet(const ChatFeaturesCreateInfo& info);
    ~ChatFeatureSet() override;

    ChatFeatureSet(const ChatFeatureSet&) = delete;
    ChatFeatureSet& operator=(const ChatFeatureSet&) = delete;

    bool HandleChatMessage(const ChatMessage& message) override;
    std::optional<std::string> LastLink() const override;
    void Dispose() override;

    /// Chat packet body: [u8 type][u16 sender length][sender][encoded text].
    std::optional<ChatMessage> ParseChatPacket(const NetworkMessage& message) const;

private:
    void OnTerritoryChanged(uint16_t territory);

    ICommandRouter& commands_;
    ILocalization& localization_;
    IClientState& client_state_;
    INetworkHandlers& network_;
    IStringDecoder& decoder_;
    ChatSink print_;
    std::function<size_t()> loaded_plugin_count_;

    std::regex url_regex_;
    SubscriptionId chat_handler_ = 0;
    SubscriptionId territory_subscription_ = 0;
    std::atomic<bool> welcomed_{ false };
    std::atomic<bool> disposed_{ false };

    mutable std::mutex link_mutex_;
    std::optional<std::string> last_link_;
};

} // namespace tether
