#include <catch2/catch_test_macros.hpp>
#include "contextvm/transport/server_transport.hpp"
#include "contextvm/protocol/event_builder.hpp"
#include "contextvm/protocol/event_filter.hpp"
#include "contextvm/capabilities.pb.h"
#include "helpers/loopback_network.hpp"
#include <google/protobuf/util/json_util.h>
using namespace contextvm;
using namespace contextvm::transport;
using namespace contextvm::protocol;
using namespace contextvm::test_helpers;
namespace {
struct Publisher {
    std::shared_ptr<LocalRelay> relay = MakeRelay();
    std::shared_ptr<LocalRelayClient> server_relay = MakeRelayClient(relay);
    std::shared_ptr<LocalRelayClient> observer = MakeRelayClient(relay);
    std::unique_ptr<ServerTransport> server;

    explicit Publisher(ServerTransportConfig config = MakeServerConfig()) {
        server = std::move(ServerTransport::Create(server_relay, std::move(config))).Unwrap();
        REQUIRE(observer->Connect({std::string(LOOPBACK_RELAY_URL)}).IsOk());
    }

    std::vector<proto::nostr::Event> Fetch(const uint32_t kind) {
        auto fetched = observer->Fetch(MakeFilter({kind}, {server_relay->PublicKey().Unwrap()}));
        REQUIRE(fetched.IsOk());
        return std::move(fetched).Unwrap();
    }
};

google::protobuf::Struct ParseDocument(const std::string& json) {
    google::protobuf::Struct document;
    REQUIRE(google::protobuf::util::JsonStringToMessage(json, &document).ok());
    return document;
}
}
TEST_CASE("Server publication - Announcement", "[integration][publication]") {
    SECTION("Announcement carries the server info") {
        Publisher pub;
        auto announced = pub.server->Announce();
        REQUIRE(announced.IsOk());
        const auto events = pub.Fetch(EventKinds::SERVER_ANNOUNCEMENT);
        REQUIRE(events.size() == 1);
        const auto& event = events[0];
        REQUIRE(event.id() == announced.Unwrap());
        REQUIRE(event.pubkey() == pub.server->PublicKey());

        proto::capabilities::ServerAnnouncement content;
        REQUIRE(google::protobuf::util::JsonStringToMessage(event.content(), &content).ok());
        REQUIRE(content.name() == "loopback-server");
        REQUIRE(content.version() == "1.0.0");
        REQUIRE(content.about() == "Test server");

        REQUIRE(EventBuilder::FindTagValue(event, TagNames::NAME) == "loopback-server");
        REQUIRE(EventBuilder::FindTagValue(event, TagNames::WEBSITE) == "https://example.org");
        REQUIRE(EventBuilder::FindTagValue(event, TagNames::ABOUT) == "Test server");
        REQUIRE_FALSE(EventBuilder::FindTagValue(event, TagNames::PICTURE).has_value());
        REQUIRE(EventBuilder::FindTagValue(event, TagNames::SUPPORT_ENCRYPTION) == "true");
    }
    SECTION("Unset fields are omitted") {
        auto config = MakeServerConfig();
        config.server_info = ServerInfo{.name = "bare"};
        Publisher pub(config);
        REQUIRE(pub.server->Announce().IsOk());
        const auto events = pub.Fetch(EventKinds::SERVER_ANNOUNCEMENT);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].content().find("version") == std::string::npos);
        REQUIRE(events[0].content().find("about") == std::string::npos);
        REQUIRE_FALSE(EventBuilder::FindTagValue(events[0], TagNames::WEBSITE).has_value());
    }
    SECTION("Disabled encryption is advertised") {
        Publisher pub(MakeServerConfig(EncryptionMode::Disabled));
        REQUIRE(pub.server->Announce().IsOk());
        const auto events = pub.Fetch(EventKinds::SERVER_ANNOUNCEMENT);
        REQUIRE(EventBuilder::FindTagValue(events.at(0), TagNames::SUPPORT_ENCRYPTION) == "false");
    }
    SECTION("Re-announcing replaces the previous announcement") {
        Publisher pub;
        REQUIRE(pub.server->Announce().IsOk());
        auto second = pub.server->Announce();
        REQUIRE(second.IsOk());
        const auto events = pub.Fetch(EventKinds::SERVER_ANNOUNCEMENT);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].id() == second.Unwrap());
    }
}
TEST_CASE("Server publication - Missing server info", "[integration][publication]") {
    auto config = MakeServerConfig();
    config.server_info.reset();
    Publisher pub(config);
    SECTION("Announce fails") {
        auto announced = pub.server->Announce();
        REQUIRE(announced.IsErr());
        REQUIRE(announced.UnwrapErr().type == TransportFailureType::Other);
        REQUIRE(announced.UnwrapErr().message == ErrorMessages::SERVER_INFO_MISSING);
        REQUIRE(pub.relay->StoredEventCount() == 0);
    }
    SECTION("Start fails before subscribing") {
        auto started = pub.server->Start();
        REQUIRE(started.IsErr());
        REQUIRE(started.UnwrapErr().message == ErrorMessages::SERVER_INFO_MISSING);
        REQUIRE_FALSE(pub.server->IsRunning());
        REQUIRE(pub.relay->SubscriptionCount() == 0);
    }
    SECTION("Capability lists do not need server info") {
        REQUIRE(pub.server->PublishTools(ParseList(R"([{"name":"echo"}])")).IsOk());
    }
}
TEST_CASE("Server publication - Capability lists", "[integration][publication]") {
    Publisher pub;
    const auto tools = ParseList(R"([{"name":"echo","description":"Echo the input"},{"name":"add"}])");

    SECTION("Tools are published under the tools key") {
        auto published = pub.server->PublishTools(tools);
        REQUIRE(published.IsOk());
        const auto events = pub.Fetch(EventKinds::TOOLS_LIST);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].id() == published.Unwrap());
        const auto document = ParseDocument(events[0].content());
        REQUIRE(document.fields().size() == 1);
        const auto& list = document.fields().at("tools").list_value();
        REQUIRE(list.values_size() == 2);
        REQUIRE(list.values(0).struct_value().fields().at("name").string_value() == "echo");
    }
    SECTION("Every list kind uses its own key") {
        REQUIRE(pub.server->PublishResources(ParseList(R"([{"uri":"file:///a"}])")).IsOk());
        REQUIRE(pub.server->PublishResourceTemplates(ParseList(R"([{"uriTemplate":"file:///{path}"}])")).IsOk());
        REQUIRE(pub.server->PublishPrompts(ParseList(R"([{"name":"greet"}])")).IsOk());
        REQUIRE(ParseDocument(pub.Fetch(EventKinds::RESOURCES_LIST).at(0).content()).fields().contains("resources"));
        REQUIRE(ParseDocument(pub.Fetch(EventKinds::RESOURCE_TEMPLATES_LIST).at(0).content())
                    .fields().contains("resourceTemplates"));
        REQUIRE(ParseDocument(pub.Fetch(EventKinds::PROMPTS_LIST).at(0).content()).fields().contains("prompts"));
    }
    SECTION("An empty list is still published") {
        REQUIRE(pub.server->PublishTools(google::protobuf::ListValue{}).IsOk());
        const auto document = ParseDocument(pub.Fetch(EventKinds::TOOLS_LIST).at(0).content());
        REQUIRE(document.fields().at("tools").list_value().values_size() == 0);
    }
    SECTION("Oversized lists are rejected before publishing") {
        google::protobuf::ListValue huge;
        huge.add_values()->set_string_value(std::string(ProtocolConstants::MAX_MESSAGE_SIZE, 'x'));
        auto published = pub.server->PublishTools(huge);
        REQUIRE(published.IsErr());
        REQUIRE(published.UnwrapErr().type == TransportFailureType::InvalidMessage);
        REQUIRE(pub.Fetch(EventKinds::TOOLS_LIST).empty());
    }
}
TEST_CASE("Server publication - Start announces", "[integration][publication]") {
    Publisher pub;
    auto running = RunServer(*pub.server);
    REQUIRE(pub.Fetch(EventKinds::SERVER_ANNOUNCEMENT).size() == 1);
    SECTION("A second Start is refused while running") {
        auto again = pub.server->Start();
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == TransportFailureType::Other);
    }
    SECTION("Stop ends the loop") {
        running->Stop();
        REQUIRE(running->Finished());
        REQUIRE(running->Succeeded());
        REQUIRE_FALSE(pub.server->IsRunning());
    }
}
