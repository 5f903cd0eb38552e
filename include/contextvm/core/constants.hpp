#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace contextvm {
struct EventKinds {
    static constexpr uint32_t CTXVM_MESSAGES = 25910;
    static constexpr uint32_t GIFT_WRAP = 1059;
    static constexpr uint32_t SEAL = 13;
    static constexpr uint32_t SERVER_ANNOUNCEMENT = 11316;
    static constexpr uint32_t TOOLS_LIST = 11317;
    static constexpr uint32_t RESOURCES_LIST = 11318;
    static constexpr uint32_t RESOURCE_TEMPLATES_LIST = 11319;
    static constexpr uint32_t PROMPTS_LIST = 11320;
    static constexpr uint32_t REPLACEABLE_RANGE_START = 10000;
    static constexpr uint32_t REPLACEABLE_RANGE_END = 20000;
    static constexpr uint32_t EPHEMERAL_RANGE_START = 20000;
    static constexpr uint32_t EPHEMERAL_RANGE_END = 30000;
};
enum class KindRetention : uint8_t {
    Regular,
    Ephemeral,
    Addressable
};
[[nodiscard]] constexpr KindRetention RetentionOf(const uint32_t kind) noexcept {
    if (kind == EventKinds::GIFT_WRAP) {
        return KindRetention::Ephemeral;
    }
    if (kind >= EventKinds::EPHEMERAL_RANGE_START && kind < EventKinds::EPHEMERAL_RANGE_END) {
        return KindRetention::Ephemeral;
    }
    if (kind >= EventKinds::REPLACEABLE_RANGE_START && kind < EventKinds::REPLACEABLE_RANGE_END) {
        return KindRetention::Addressable;
    }
    return KindRetention::Regular;
}
struct TagNames {
    static constexpr std::string_view PUBKEY = "p";
    static constexpr std::string_view EVENT_ID = "e";
    static constexpr std::string_view CAPABILITY = "cap";
    static constexpr std::string_view NAME = "name";
    static constexpr std::string_view WEBSITE = "website";
    static constexpr std::string_view PICTURE = "picture";
    static constexpr std::string_view ABOUT = "about";
    static constexpr std::string_view SUPPORT_ENCRYPTION = "support_encryption";
};
struct McpMethods {
    static constexpr std::string_view INITIALIZE = "initialize";
    static constexpr std::string_view INITIALIZED_NOTIFICATION = "notifications/initialized";
};
struct ProtocolConstants {
    static constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;
    static constexpr std::chrono::seconds DEFAULT_REQUEST_TIMEOUT{30};
    static constexpr std::chrono::seconds DEFAULT_SESSION_TIMEOUT{300};
    static constexpr std::chrono::seconds DEFAULT_CLEANUP_INTERVAL{60};
    static constexpr std::string_view DEFAULT_RELAY_URL = "wss://relay.damus.io";
    static constexpr size_t SEEN_EVENT_CACHE_CAPACITY = 4096;
    static constexpr std::string_view TOOLS_KEY = "tools";
    static constexpr std::string_view RESOURCES_KEY = "resources";
    static constexpr std::string_view RESOURCE_TEMPLATES_KEY = "resourceTemplates";
    static constexpr std::string_view PROMPTS_KEY = "prompts";
};
struct CryptoConstants {
    static constexpr size_t EVENT_ID_SIZE = 32;
    static constexpr size_t EVENT_ID_HEX_LENGTH = EVENT_ID_SIZE * 2;
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t PUBLIC_KEY_HEX_LENGTH = PUBLIC_KEY_SIZE * 2;
    static constexpr size_t SEED_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;
    static constexpr size_t SIGNATURE_HEX_LENGTH = SIGNATURE_SIZE * 2;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_CONNECTED = "Transport not connected";
    static constexpr std::string_view RESPONSE_CHANNEL_CLOSED = "Response channel closed";
    static constexpr std::string_view REQUEST_TIMED_OUT = "No response received before the request deadline";
    static constexpr std::string_view SERVER_INFO_MISSING = "Server info not configured for announcement";
    static constexpr std::string_view PLAINTEXT_REFUSED = "Plaintext message refused: encryption is required";
    static constexpr std::string_view NO_RELAYS = "At least one relay URL is required";
    static constexpr std::string_view SESSION_NOT_INITIALIZED = "Session has not completed the initialize handshake";
};
}
