#include "contextvm/protocol/mcp_message.hpp"
#include "contextvm/core/constants.hpp"
#include "contextvm/core/format.hpp"
#include <google/protobuf/util/json_util.h>

namespace contextvm::protocol {
    namespace {
        constexpr std::string_view METHOD_KEY = "method";
        constexpr std::string_view ID_KEY = "id";
        constexpr std::string_view RESULT_KEY = "result";
        constexpr std::string_view ERROR_KEY = "error";

        bool HasField(const google::protobuf::Struct &body, const std::string_view key) {
            return body.fields().contains(std::string(key));
        }

        bool StartsWithObject(const std::string_view json) {
            const auto first = json.find_first_not_of(" \t\r\n");
            return first != std::string_view::npos && json[first] == '{';
        }
    }

    McpMessage::McpMessage(Payload payload)
        : payload_(std::move(payload)) {
    }

    Result<McpMessage, TransportFailure> McpMessage::FromJson(const std::string_view json) {
        if (!StartsWithObject(json)) {
            return Result<McpMessage, TransportFailure>::Err(
                TransportFailure::InvalidMessage("Payload is not a JSON object"));
        }
        google::protobuf::Struct body;
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = false;
        const auto status = google::protobuf::util::JsonStringToMessage(
            std::string(json), &body, options);
        if (!status.ok()) {
            return Result<McpMessage, TransportFailure>::Err(
                TransportFailure::InvalidMessage(compat::format(
                    "Payload is not a JSON object: {}", status.ToString())));
        }
        McpMessage message = FromStruct(std::move(body));
        message.source_json_ = std::string(json);
        return Result<McpMessage, TransportFailure>::Ok(std::move(message));
    }

    McpMessage McpMessage::FromStruct(google::protobuf::Struct body) {
        if (HasField(body, METHOD_KEY)) {
            if (HasField(body, ID_KEY)) {
                return McpMessage(McpRequest{std::move(body)});
            }
            return McpMessage(McpNotification{std::move(body)});
        }
        if (HasField(body, RESULT_KEY) || HasField(body, ERROR_KEY)) {
            return McpMessage(McpResponse{std::move(body)});
        }
        return McpMessage(McpRequest{std::move(body)});
    }

    Result<std::string, TransportFailure> McpMessage::ToJson() const {
        if (source_json_.has_value()) {
            return Result<std::string, TransportFailure>::Ok(*source_json_);
        }
        std::string json;
        const auto status = google::protobuf::util::MessageToJsonString(Body(), &json);
        if (!status.ok()) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::InvalidMessage(compat::format(
                    "Failed to serialize message: {}", status.ToString())));
        }
        return Result<std::string, TransportFailure>::Ok(std::move(json));
    }

    McpMessageType McpMessage::GetType() const noexcept {
        switch (payload_.index()) {
            case 1: return McpMessageType::Response;
            case 2: return McpMessageType::Notification;
            default: return McpMessageType::Request;
        }
    }

    const google::protobuf::Struct &McpMessage::Body() const noexcept {
        return std::visit([](const auto &message) -> const google::protobuf::Struct & {
            return message.body;
        }, payload_);
    }

    std::optional<std::string> McpMessage::FindString(const std::string_view key) const {
        const auto &fields = Body().fields();
        const auto it = fields.find(std::string(key));
        if (it == fields.end() || !it->second.has_string_value()) {
            return std::nullopt;
        }
        return it->second.string_value();
    }

    std::optional<std::string> McpMessage::Method() const {
        if (GetType() == McpMessageType::Response) {
            return std::nullopt;
        }
        return FindString(METHOD_KEY);
    }

    bool McpMessage::IsHandshake() const {
        const auto method = Method();
        return method.has_value() &&
               (*method == McpMethods::INITIALIZE || *method == McpMethods::INITIALIZED_NOTIFICATION);
    }
}
