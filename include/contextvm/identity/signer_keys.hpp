#pragma once
#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace contextvm::identity {

/**
 * @brief Ed25519 identity of one participant
 *
 * The public key in hex is the participant's address on the network. The
 * secret key never leaves this object and is wiped on destruction.
 */
class SignerKeys {
public:
    [[nodiscard]] static Result<SignerKeys, TransportFailure> Generate();

    /// Deterministic keys from a 64 hex character seed.
    [[nodiscard]] static Result<SignerKeys, TransportFailure> FromSeedHex(std::string_view seed_hex);

    SignerKeys(SignerKeys&& other) noexcept = default;
    SignerKeys& operator=(SignerKeys&& other) noexcept = default;
    SignerKeys(const SignerKeys&) = delete;
    SignerKeys& operator=(const SignerKeys&) = delete;
    ~SignerKeys();

    [[nodiscard]] const std::string& PublicKeyHex() const noexcept { return public_key_hex_; }

    /// Signs the 32 raw bytes behind @p event_id_hex; returns the signature in hex.
    [[nodiscard]] Result<std::string, TransportFailure> SignEventId(std::string_view event_id_hex) const;

    [[nodiscard]] Result<std::string, TransportFailure> EncryptTo(
        std::string_view recipient_pubkey_hex,
        std::string_view plaintext) const;

    [[nodiscard]] Result<std::string, TransportFailure> DecryptFrom(
        std::string_view sender_pubkey_hex,
        std::string_view ciphertext) const;

    [[nodiscard]] static bool VerifyEventSignature(
        std::string_view pubkey_hex,
        std::string_view event_id_hex,
        std::string_view signature_hex);

    [[nodiscard]] static Result<std::vector<uint8_t>, TransportFailure> DecodePublicKey(std::string_view pubkey_hex);

private:
    SignerKeys(std::vector<uint8_t> secret_key, std::vector<uint8_t> public_key);

    [[nodiscard]] static Result<SignerKeys, TransportFailure> FromSeed(std::span<const uint8_t> seed);

    std::vector<uint8_t> secret_key_;
    std::vector<uint8_t> public_key_;
    std::string public_key_hex_;
};
}
