#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "nostr/event.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace contextvm::protocol {
class EventBuilder {
public:
    /// Builds an event without id or signature. A zero @p created_at means now.
    [[nodiscard]] static proto::nostr::Event CreateUnsigned(
        std::string_view pubkey,
        uint32_t kind,
        std::string content,
        int64_t created_at = 0);

    static void AddTag(proto::nostr::Event& event, std::string_view name, std::string_view value);
    static void AddRecipientTag(proto::nostr::Event& event, std::string_view recipient_pubkey);
    static void AddReplyTag(proto::nostr::Event& event, std::string_view request_event_id);

    /// First value of the first tag named @p name.
    [[nodiscard]] static std::optional<std::string> FindTagValue(
        const proto::nostr::Event& event,
        std::string_view name);

    [[nodiscard]] static std::vector<std::string> FindAllTagValues(
        const proto::nostr::Event& event,
        std::string_view name);

    /// `[0,"<pubkey>",<created_at>,<kind>,<tags>,"<content>"]` with NIP-01
    /// string escaping. The event id is the SHA-256 of this string.
    [[nodiscard]] static std::string SerializeForId(const proto::nostr::Event& event);

    [[nodiscard]] static std::string ComputeId(const proto::nostr::Event& event);

    [[nodiscard]] static Result<Unit, TransportFailure> ValidateContentSize(std::string_view content);

    [[nodiscard]] static Result<std::string, TransportFailure> ToJson(const proto::nostr::Event& event);
    [[nodiscard]] static Result<proto::nostr::Event, TransportFailure> FromJson(std::string_view json);

    /// Copy of @p event with the signature cleared (a rumor).
    [[nodiscard]] static proto::nostr::Event StripSignature(proto::nostr::Event event);

    [[nodiscard]] static int64_t NowSeconds();

private:
    static void AppendEscaped(std::string& out, std::string_view value);

    EventBuilder() = delete;
};
}
