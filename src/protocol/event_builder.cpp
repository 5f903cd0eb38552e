#include "contextvm/protocol/event_builder.hpp"
#include "contextvm/crypto/sodium_interop.hpp"
#include "contextvm/core/constants.hpp"
#include "contextvm/core/format.hpp"
#include <google/protobuf/util/json_util.h>
#include <chrono>

namespace contextvm::protocol {
    using crypto::SodiumInterop;

    proto::nostr::Event EventBuilder::CreateUnsigned(
        const std::string_view pubkey,
        const uint32_t kind,
        std::string content,
        const int64_t created_at) {
        proto::nostr::Event event;
        event.set_pubkey(std::string(pubkey));
        event.set_kind(kind);
        event.set_content(std::move(content));
        event.set_created_at(created_at != 0 ? created_at : NowSeconds());
        return event;
    }

    void EventBuilder::AddTag(proto::nostr::Event &event, const std::string_view name,
                              const std::string_view value) {
        auto *tag = event.add_tags();
        tag->add_values(std::string(name));
        tag->add_values(std::string(value));
    }

    void EventBuilder::AddRecipientTag(proto::nostr::Event &event, const std::string_view recipient_pubkey) {
        AddTag(event, TagNames::PUBKEY, recipient_pubkey);
    }

    void EventBuilder::AddReplyTag(proto::nostr::Event &event, const std::string_view request_event_id) {
        AddTag(event, TagNames::EVENT_ID, request_event_id);
    }

    std::optional<std::string> EventBuilder::FindTagValue(
        const proto::nostr::Event &event,
        const std::string_view name) {
        for (const auto &tag: event.tags()) {
            if (tag.values_size() >= 2 && tag.values(0) == name) {
                return tag.values(1);
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> EventBuilder::FindAllTagValues(
        const proto::nostr::Event &event,
        const std::string_view name) {
        std::vector<std::string> values;
        for (const auto &tag: event.tags()) {
            if (tag.values_size() >= 2 && tag.values(0) == name) {
                values.push_back(tag.values(1));
            }
        }
        return values;
    }

    void EventBuilder::AppendEscaped(std::string &out, const std::string_view value) {
        out.push_back('"');
        for (const char c: value) {
            switch (c) {
                case '"': out.append("\\\""); break;
                case '\\': out.append("\\\\"); break;
                case '\n': out.append("\\n"); break;
                case '\r': out.append("\\r"); break;
                case '\t': out.append("\\t"); break;
                case '\b': out.append("\\b"); break;
                case '\f': out.append("\\f"); break;
                default: out.push_back(c); break;
            }
        }
        out.push_back('"');
    }

    std::string EventBuilder::SerializeForId(const proto::nostr::Event &event) {
        std::string out;
        out.reserve(event.content().size() + 128);
        out.append("[0,");
        AppendEscaped(out, event.pubkey());
        out.append(compat::format(",{},{},[", event.created_at(), event.kind()));
        for (int i = 0; i < event.tags_size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            out.push_back('[');
            const auto &tag = event.tags(i);
            for (int j = 0; j < tag.values_size(); ++j) {
                if (j > 0) {
                    out.push_back(',');
                }
                AppendEscaped(out, tag.values(j));
            }
            out.push_back(']');
        }
        out.append("],");
        AppendEscaped(out, event.content());
        out.push_back(']');
        return out;
    }

    std::string EventBuilder::ComputeId(const proto::nostr::Event &event) {
        const std::string canonical = SerializeForId(event);
        const auto digest = SodiumInterop::Sha256(std::span(
            reinterpret_cast<const uint8_t *>(canonical.data()), canonical.size()));
        return SodiumInterop::ToHex(digest);
    }

    Result<Unit, TransportFailure> EventBuilder::ValidateContentSize(const std::string_view content) {
        if (content.size() > ProtocolConstants::MAX_MESSAGE_SIZE) {
            return Result<Unit, TransportFailure>::Err(
                TransportFailure::InvalidMessage(compat::format(
                    "Message content of {} bytes exceeds the {} byte limit",
                    content.size(), ProtocolConstants::MAX_MESSAGE_SIZE)));
        }
        return Result<Unit, TransportFailure>::Ok(unit);
    }

    Result<std::string, TransportFailure> EventBuilder::ToJson(const proto::nostr::Event &event) {
        google::protobuf::util::JsonPrintOptions options;
        options.preserve_proto_field_names = true;
        std::string json;
        if (const auto status = google::protobuf::util::MessageToJsonString(event, &json, options);
            !status.ok()) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::InvalidMessage(compat::format(
                    "Failed to encode event: {}", status.ToString())));
        }
        return Result<std::string, TransportFailure>::Ok(std::move(json));
    }

    Result<proto::nostr::Event, TransportFailure> EventBuilder::FromJson(const std::string_view json) {
        proto::nostr::Event event;
        if (const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &event);
            !status.ok()) {
            return Result<proto::nostr::Event, TransportFailure>::Err(
                TransportFailure::InvalidMessage(compat::format(
                    "Failed to decode event: {}", status.ToString())));
        }
        return Result<proto::nostr::Event, TransportFailure>::Ok(std::move(event));
    }

    proto::nostr::Event EventBuilder::StripSignature(proto::nostr::Event event) {
        event.clear_sig();
        return event;
    }

    int64_t EventBuilder::NowSeconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}
