#include "contextvm/configuration/transport_config.hpp"
#include "contextvm/core/format.hpp"

namespace contextvm::configuration {
    namespace {
        Result<Unit, TransportFailure> ValidateRelayUrls(const std::vector<std::string> &relay_urls) {
            if (relay_urls.empty()) {
                return Result<Unit, TransportFailure>::Err(
                    TransportFailure::Other(std::string(ErrorMessages::NO_RELAYS)));
            }
            for (const auto &url: relay_urls) {
                if (url.empty()) {
                    return Result<Unit, TransportFailure>::Err(
                        TransportFailure::Other("Relay URL must not be empty"));
                }
            }
            return Result<Unit, TransportFailure>::Ok(unit);
        }

        Result<Unit, TransportFailure> ValidatePositive(const std::chrono::milliseconds value,
                                                        const std::string_view name) {
            if (value.count() <= 0) {
                return Result<Unit, TransportFailure>::Err(
                    TransportFailure::Other(compat::format("{} must be positive, got {} ms", name, value.count())));
            }
            return Result<Unit, TransportFailure>::Ok(unit);
        }
    }

    ClientTransportConfig ClientTransportConfig::Default() {
        ClientTransportConfig config;
        config.relay_urls.emplace_back(ProtocolConstants::DEFAULT_RELAY_URL);
        return config;
    }

    Result<Unit, TransportFailure> ClientTransportConfig::Validate() const {
        if (auto urls = ValidateRelayUrls(relay_urls); urls.IsErr()) {
            return urls;
        }
        return ValidatePositive(request_timeout, "request_timeout");
    }

    ServerTransportConfig ServerTransportConfig::Default() {
        ServerTransportConfig config;
        config.relay_urls.emplace_back(ProtocolConstants::DEFAULT_RELAY_URL);
        return config;
    }

    Result<Unit, TransportFailure> ServerTransportConfig::Validate() const {
        if (auto urls = ValidateRelayUrls(relay_urls); urls.IsErr()) {
            return urls;
        }
        return ValidatePositive(session_timeout, "session_timeout");
    }
}
