#include <catch2/catch_test_macros.hpp>
#include "contextvm/protocol/mcp_message.hpp"
#include "contextvm/core/constants.hpp"
using namespace contextvm;
using namespace contextvm::protocol;
namespace {
McpMessage Parse(const std::string_view json) {
    auto result = McpMessage::FromJson(json);
    REQUIRE(result.IsOk());
    return std::move(result).Unwrap();
}
}
TEST_CASE("MCP message - Classification", "[mcp_message]") {
    SECTION("Method and id make a request") {
        const auto message = Parse(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
        REQUIRE(message.GetType() == McpMessageType::Request);
        REQUIRE(std::holds_alternative<McpRequest>(message.GetPayload()));
        REQUIRE(message.Method() == "tools/list");
    }
    SECTION("Method without id makes a notification") {
        const auto message = Parse(R"({"jsonrpc":"2.0","method":"notifications/progress"})");
        REQUIRE(message.GetType() == McpMessageType::Notification);
        REQUIRE(message.Method() == "notifications/progress");
    }
    SECTION("Result makes a response") {
        const auto message = Parse(R"({"jsonrpc":"2.0","id":1,"result":{}})");
        REQUIRE(message.GetType() == McpMessageType::Response);
        REQUIRE_FALSE(message.Method().has_value());
    }
    SECTION("Error makes a response") {
        const auto message = Parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"nope"}})");
        REQUIRE(message.GetType() == McpMessageType::Response);
    }
    SECTION("Any other object is carried as a request") {
        const auto message = Parse(R"({"op":"ping"})");
        REQUIRE(message.GetType() == McpMessageType::Request);
        REQUIRE_FALSE(message.Method().has_value());
        REQUIRE(message.FindString("op") == "ping");
    }
}
TEST_CASE("MCP message - Rejects non-objects", "[mcp_message]") {
    SECTION("Array") {
        auto result = McpMessage::FromJson("[1,2,3]");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransportFailureType::InvalidMessage);
    }
    SECTION("Bare number") {
        REQUIRE(McpMessage::FromJson("42").IsErr());
    }
    SECTION("Truncated object") {
        REQUIRE(McpMessage::FromJson(R"({"op":)").IsErr());
    }
    SECTION("Not JSON at all") {
        REQUIRE(McpMessage::FromJson("hello").IsErr());
    }
}
TEST_CASE("MCP message - JSON encoding keeps the body", "[mcp_message]") {
    const auto original = Parse(R"({"op":"echo","value":"x","nested":{"n":2}})");
    auto json = original.ToJson();
    REQUIRE(json.IsOk());
    const auto decoded = Parse(json.Unwrap());
    REQUIRE(decoded.FindString("value") == "x");
    REQUIRE(decoded.Body().fields().at("nested").struct_value().fields().at("n").number_value() == 2.0);
}
TEST_CASE("MCP message - Decoded text is re-emitted unchanged", "[mcp_message]") {
    SECTION("Integer id beyond double precision") {
        const std::string text = R"({"jsonrpc":"2.0","id":9007199254740993,"method":"ping"})";
        const auto message = Parse(text);
        REQUIRE(message.GetType() == McpMessageType::Request);
        REQUIRE(message.Method() == "ping");
        REQUIRE(message.ToJson().Unwrap() == text);
    }
    SECTION("Large integers inside the result") {
        const std::string text = R"({"jsonrpc":"2.0","id":1,"result":{"n":12345678901234567}})";
        REQUIRE(Parse(text).ToJson().Unwrap() == text);
    }
    SECTION("Key order and whitespace are preserved") {
        const std::string text = "{ \"b\": 1,\n  \"a\": [1.50, 2] }";
        REQUIRE(Parse(text).ToJson().Unwrap() == text);
    }
    SECTION("Messages built from a body are printed from it") {
        google::protobuf::Struct body;
        (*body.mutable_fields())["op"].set_string_value("pong");
        const auto json = McpMessage::FromStruct(std::move(body)).ToJson();
        REQUIRE(json.IsOk());
        REQUIRE(Parse(json.Unwrap()).FindString("op") == "pong");
    }
}
TEST_CASE("MCP message - Handshake detection", "[mcp_message]") {
    REQUIRE(Parse(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})").IsHandshake());
    REQUIRE(Parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").IsHandshake());
    REQUIRE_FALSE(Parse(R"({"jsonrpc":"2.0","id":2,"method":"tools/call"})").IsHandshake());
    REQUIRE_FALSE(Parse(R"({"jsonrpc":"2.0","id":0,"result":{"method":"initialize"}})").IsHandshake());
    SECTION("Non-string method is not a handshake") {
        const auto message = Parse(R"({"id":1,"method":7})");
        REQUIRE(message.GetType() == McpMessageType::Request);
        REQUIRE_FALSE(message.Method().has_value());
        REQUIRE_FALSE(message.IsHandshake());
    }
}
