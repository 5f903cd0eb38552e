#pragma once

#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"

#include <cstdint>
#include <string_view>

namespace contextvm::protocol {

/// Encryption behavior of one transport role, fixed at construction.
enum class EncryptionMode : uint8_t {
    /// Encrypt a message iff the counterpart's message was encrypted
    Optional = 0,
    /// Always encrypt; plaintext inbound RPC traffic is refused
    Required = 1,
    /// Never encrypt
    Disabled = 2
};

/// Decides whether an outbound RPC message must be gift-wrapped.
///
/// For a reply, @p counterpart_encrypted is whether the triggering request
/// arrived wrapped. For a client request it is the caller's own
/// use_encryption choice.
[[nodiscard]] constexpr bool ShouldEncrypt(const EncryptionMode mode,
                                           const bool counterpart_encrypted) noexcept {
    switch (mode) {
        case EncryptionMode::Optional:
            return counterpart_encrypted;
        case EncryptionMode::Required:
            return true;
        case EncryptionMode::Disabled:
            return false;
    }
    return false;
}

/// Whether a role in @p mode accepts an inbound RPC message that arrived
/// unwrapped.
[[nodiscard]] constexpr bool AcceptsPlaintext(const EncryptionMode mode) noexcept {
    return mode != EncryptionMode::Required;
}

/// Parses "optional", "required" or "disabled". Anything else is a
/// configuration failure.
[[nodiscard]] Result<EncryptionMode, TransportFailure> ParseEncryptionMode(std::string_view value);

[[nodiscard]] std::string_view EncryptionModeToString(EncryptionMode mode) noexcept;

}
