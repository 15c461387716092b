#include <catch2/catch_test_macros.hpp>
#include "tether/chat/ChatFeatureSet.hpp"
#include "tether/command/CommandRouter.hpp"
#include "tether/data/StringDecoder.hpp"
#include "tether/game/ClientState.hpp"
#include "tether/game/Framework.hpp"
#include "tether/game/NetworkHandlers.hpp"
#include "utils/FakeSubsystems.hpp"

#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace tether;
using namespace tether::test;

namespace {

constexpr uintptr_t kUnhookedAddress = 0x1000;
constexpr uint16_t kChatOpcode = 0x0067;

// Opcode table only; no text sheets.
class OpcodeTable : public IDataAssets {
public:
    bool has_chat = true;

    void Initialize(const std::filesystem::path&) override {}
    bool IsReady() const override { return true; }
    ClientLanguage Language() const override { return ClientLanguage::English; }
    std::optional<uint16_t> ServerOpcode(const std::string& name) const override {
        if (has_chat && name == ChatFeatureSet::kChatOpcodeName)
            return kChatOpcode;
        return std::nullopt;
    }
    std::optional<uint16_t> ClientOpcode(const std::string&) const override { return std::nullopt; }
    std::optional<std::string> GetText(const std::string&, uint32_t) const override { return std::nullopt; }
    std::optional<int64_t> GetNumber(const std::string&, uint32_t, const std::string&) const override {
        return std::nullopt;
    }
    std::vector<std::string> SheetNames() const override { return {}; }
    void Dispose() override {}
};

NetworkMessage ChatPacket(ChatType type, const std::string& sender, const std::string& text) {
    NetworkMessage message;
    message.opcode = kChatOpcode;
    message.payload.push_back(static_cast<uint8_t>(type));
    uint16_t length = static_cast<uint16_t>(sender.size());
    message.payload.resize(3);
    std::memcpy(message.payload.data() + 1, &length, sizeof(length));
    message.payload.insert(message.payload.end(), sender.begin(), sender.end());
    message.payload.insert(message.payload.end(), text.begin(), text.end());
    return message;
}

struct ChatFixture {
    explicit ChatFixture(bool has_chat_opcode = true)
        : router(ClientLanguage::English)
        , framework(FrameworkCreateInfo{ kUnhookedAddress, 0 })
        , network(framework, false)
        , client_state(kUnhookedAddress, ClientLanguage::English)
        , decoder(data) {
        data.has_chat = has_chat_opcode;

        CommandInfo info;
        info.handler = [this](const std::string& command, const std::string& args) {
            last_command = command;
            last_args = args;
        };
        info.help_message = "Shows help";
        router.AddHandler("/thelp", info);

        chat = std::make_unique<ChatFeatureSet>(ChatFeaturesCreateInfo{
            router, localization, client_state, network, data, decoder,
            [this](const std::string& line) { printed.push_back(line); }, [] { return size_t{ 2 }; } });
    }

    CommandRouter router;
    FakeLocalization localization;
    OpcodeTable data;
    Framework framework;
    NetworkHandlers network;
    ClientState client_state;
    StringDecoder decoder;
    std::unique_ptr<ChatFeatureSet> chat;

    std::vector<std::string> printed;
    std::string last_command;
    std::string last_args;
};

} // namespace

TEST_CASE("ChatFeatureSet - unknown command errors reach the router", "[chat][command]") {
    ChatFixture f;

    SECTION("Registered command is run and the error hidden") {
        ChatMessage message{ ChatType::ErrorMessage, "", "Command not recognized: \"/thelp plugins\"" };
        REQUIRE(f.chat->HandleChatMessage(message));
        REQUIRE(f.last_command == "/thelp");
        REQUIRE(f.last_args == "plugins");
    }

    SECTION("Unregistered command stays visible") {
        ChatMessage message{ ChatType::ErrorMessage, "", "Command not recognized: \"/dance\"" };
        REQUIRE_FALSE(f.chat->HandleChatMessage(message));
        REQUIRE(f.last_command.empty());
    }

    SECTION("Only error messages are inspected") {
        ChatMessage message{ ChatType::Say, "Someone", "Command not recognized: \"/thelp\"" };
        REQUIRE_FALSE(f.chat->HandleChatMessage(message));
        REQUIRE(f.last_command.empty());
    }

    SECTION("Other error text is ignored") {
        ChatMessage message{ ChatType::ErrorMessage, "", "You cannot do that right now." };
        REQUIRE_FALSE(f.chat->HandleChatMessage(message));
    }
}

TEST_CASE("ChatFeatureSet - links seen in chat", "[chat][link]") {
    ChatFixture f;
    REQUIRE_FALSE(f.chat->LastLink());

    f.chat->HandleChatMessage({ ChatType::Say, "A", "see https://example.com/guide?page=2 for details" });
    REQUIRE(f.chat->LastLink() == "https://example.com/guide?page=2");

    f.chat->HandleChatMessage({ ChatType::Shout, "B", "no link here" });
    REQUIRE(f.chat->LastLink() == "https://example.com/guide?page=2");

    f.chat->HandleChatMessage({ ChatType::Echo, "", "ftp://files.example.org/patch" });
    REQUIRE(f.chat->LastLink() == "ftp://files.example.org/patch");
}

TEST_CASE("ChatFeatureSet - welcome line on first territory", "[chat][welcome]") {
    ChatFixture f;
    REQUIRE(f.printed.empty());

    f.client_state.OnTerritoryChanged(132);
    f.client_state.OnTerritoryChanged(133);

    REQUIRE(f.printed.size() == 1);
    REQUIRE(f.printed[0].find("2 plugin(s) loaded.") != std::string::npos);

    SECTION("Localized text is used when present") {
        ChatFixture g;
        g.localization.strings["chat.welcome"] = "Willkommen, {count} Plugins";
        g.client_state.OnTerritoryChanged(1);
        REQUIRE(g.printed.size() == 1);
        REQUIRE(g.printed[0] == "Willkommen, 2 Plugins");
    }
}

TEST_CASE("ChatFeatureSet - chat packets", "[chat][network]") {
    ChatFixture f;

    SECTION("Parsing") {
        auto chat = f.chat->ParseChatPacket(ChatPacket(ChatType::Shout, "Alice", "hello there"));
        REQUIRE(chat);
        REQUIRE(chat->type == ChatType::Shout);
        REQUIRE(chat->sender == "Alice");
        REQUIRE(chat->text == "hello there");
    }

    SECTION("Empty sender") {
        auto chat = f.chat->ParseChatPacket(ChatPacket(ChatType::SystemMessage, "", "notice"));
        REQUIRE(chat);
        REQUIRE(chat->sender.empty());
        REQUIRE(chat->text == "notice");
    }

    SECTION("Malformed packets") {
        NetworkMessage runt;
        runt.payload = { 10, 5 };
        REQUIRE_FALSE(f.chat->ParseChatPacket(runt));

        auto overrun = ChatPacket(ChatType::Say, "Bob", "");
        overrun.payload[1] = 0xFF;
        REQUIRE_FALSE(f.chat->ParseChatPacket(overrun));
    }

    SECTION("Packets routed by opcode run commands") {
        REQUIRE(f.network.Dispatch(ChatPacket(ChatType::ErrorMessage, "", "Command not recognized: \"/thelp\"")) == 1);
        REQUIRE(f.last_command == "/thelp");

        REQUIRE(f.network.Dispatch(ChatPacket(ChatType::Say, "C", "https://example.net")) == 1);
        REQUIRE(f.chat->LastLink() == "https://example.net");
    }
}

TEST_CASE("ChatFeatureSet - missing chat opcode", "[chat][network]") {
    ChatFixture f(false);

    REQUIRE(f.network.HandlerCount() == 0);
    REQUIRE(f.network.Dispatch(ChatPacket(ChatType::ErrorMessage, "", "Command not recognized: \"/thelp\"")) == 0);
    REQUIRE(f.last_command.empty());

    // Direct messages still work.
    REQUIRE(f.chat->HandleChatMessage({ ChatType::ErrorMessage, "", "Command not recognized: \"/thelp\"" }));
}

TEST_CASE("ChatFeatureSet - dispose", "[chat][dispose]") {
    ChatFixture f;
    REQUIRE(f.network.HandlerCount() == 1);

    f.chat->Dispose();
    f.chat->Dispose();

    REQUIRE(f.network.HandlerCount() == 0);
    f.client_state.OnTerritoryChanged(5);
    REQUIRE(f.printed.empty());

    f.chat.reset();
    REQUIRE(f.network.HandlerCount() == 0);
}
