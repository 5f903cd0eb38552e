#pragma once
#include "contextvm/protocol/mcp_message.hpp"
#include <optional>
#include <string>
namespace contextvm::interfaces {
struct IncomingMessage {
    std::string sender_pubkey;
    /// Id of the inner request event; replies reference it in their `e` tag
    std::string event_id;
    protocol::McpMessage message;
    bool is_encrypted = false;
};
class IMessageHandler {
public:
    virtual ~IMessageHandler() = default;
    /// Returning a message sends it back to the sender as the reply.
    virtual std::optional<protocol::McpMessage> OnMessage(const IncomingMessage& incoming) = 0;
};
}
