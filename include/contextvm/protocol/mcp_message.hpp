#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include <google/protobuf/struct.pb.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
namespace contextvm::protocol {
enum class McpMessageType : uint8_t {
    Request,
    Response,
    Notification
};
struct McpRequest {
    google::protobuf::Struct body;
};
struct McpResponse {
    google::protobuf::Struct body;
};
struct McpNotification {
    google::protobuf::Struct body;
};
class McpMessage {
public:
    using Payload = std::variant<McpRequest, McpResponse, McpNotification>;

    explicit McpMessage(Payload payload);

    /// Decodes a JSON object. Anything that is not an object is InvalidMessage.
    /// The text is kept and ToJson() returns it unchanged, so numbers beyond
    /// double precision survive a relay hop.
    [[nodiscard]] static Result<McpMessage, TransportFailure> FromJson(std::string_view json);

    /// Classifies @p body: "method" + "id" is a request, "method" alone a
    /// notification, "result" or "error" a response. Any other object is
    /// carried as an opaque request.
    [[nodiscard]] static McpMessage FromStruct(google::protobuf::Struct body);

    /// The decoded text for messages from FromJson(), otherwise the body
    /// printed by protobuf.
    [[nodiscard]] Result<std::string, TransportFailure> ToJson() const;

    [[nodiscard]] McpMessageType GetType() const noexcept;
    [[nodiscard]] const Payload& GetPayload() const noexcept { return payload_; }
    [[nodiscard]] const google::protobuf::Struct& Body() const noexcept;

    [[nodiscard]] std::optional<std::string> Method() const;
    [[nodiscard]] std::optional<std::string> FindString(std::string_view key) const;

    /// True for `initialize` and `notifications/initialized`.
    [[nodiscard]] bool IsHandshake() const;

private:
    Payload payload_;
    std::optional<std::string> source_json_;
};
}
