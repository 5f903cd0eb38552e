#pragma once

#include "contextvm/core/constants.hpp"
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "contextvm/protocol/encryption_policy.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace contextvm::configuration {

using protocol::EncryptionMode;

/// Descriptive metadata published in the server announcement.
struct ServerInfo {
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> picture;
    std::optional<std::string> website;
    std::optional<std::string> about;
};

/// Configuration of the requesting role.
///
/// @example
/// ```cpp
/// auto config = ClientTransportConfig::Default();
/// config.relay_urls = {"wss://relay.example"};
/// config.encryption_mode = EncryptionMode::Required;
/// ```
struct ClientTransportConfig {
    std::vector<std::string> relay_urls;
    EncryptionMode encryption_mode = EncryptionMode::Optional;
    /// How long SendRequest waits for the matching reply
    std::chrono::milliseconds request_timeout = ProtocolConstants::DEFAULT_REQUEST_TIMEOUT;

    [[nodiscard]] static ClientTransportConfig Default();

    [[nodiscard]] Result<Unit, TransportFailure> Validate() const;
};

/// Configuration of the serving role.
struct ServerTransportConfig {
    std::vector<std::string> relay_urls;
    EncryptionMode encryption_mode = EncryptionMode::Optional;
    /// Required by Announce(); Start() announces first
    std::optional<ServerInfo> server_info;
    /// Sessions idle for longer than this are removed by the sweep
    std::chrono::milliseconds session_timeout = ProtocolConstants::DEFAULT_SESSION_TIMEOUT;
    /// When set, non-handshake messages from sessions that have not sent
    /// `initialize` are dropped
    bool require_initialization = false;

    [[nodiscard]] static ServerTransportConfig Default();

    [[nodiscard]] Result<Unit, TransportFailure> Validate() const;
};

}
