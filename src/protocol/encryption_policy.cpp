#include "contextvm/protocol/encryption_policy.hpp"
#include "contextvm/core/format.hpp"

namespace contextvm::protocol {
    namespace {
        constexpr std::string_view OPTIONAL_NAME = "optional";
        constexpr std::string_view REQUIRED_NAME = "required";
        constexpr std::string_view DISABLED_NAME = "disabled";
    }

    Result<EncryptionMode, TransportFailure> ParseEncryptionMode(const std::string_view value) {
        if (value == OPTIONAL_NAME) {
            return Result<EncryptionMode, TransportFailure>::Ok(EncryptionMode::Optional);
        }
        if (value == REQUIRED_NAME) {
            return Result<EncryptionMode, TransportFailure>::Ok(EncryptionMode::Required);
        }
        if (value == DISABLED_NAME) {
            return Result<EncryptionMode, TransportFailure>::Ok(EncryptionMode::Disabled);
        }
        return Result<EncryptionMode, TransportFailure>::Err(
            TransportFailure::Other(compat::format(
                "Invalid encryption mode '{}' (expected optional, required or disabled)", value)));
    }

    std::string_view EncryptionModeToString(const EncryptionMode mode) noexcept {
        switch (mode) {
            case EncryptionMode::Optional: return OPTIONAL_NAME;
            case EncryptionMode::Required: return REQUIRED_NAME;
            case EncryptionMode::Disabled: return DISABLED_NAME;
        }
        return OPTIONAL_NAME;
    }
}
