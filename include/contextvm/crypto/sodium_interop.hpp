#pragma once

#include "contextvm/core/result.hpp"
#include "contextvm/core/failures.hpp"
#include "contextvm/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace contextvm::crypto {

/**
 * @brief Interop layer for the libsodium primitives the loopback network uses
 *
 * Identities are Ed25519 keys. Encryption converts both sides to X25519 and
 * uses crypto_box (XSalsa20-Poly1305), so a ciphertext authenticates its
 * sender as well as hiding the plaintext.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Hashing and randomness
    // ========================================================================

    static std::array<uint8_t, crypto_hash_sha256_BYTES> Sha256(std::span<const uint8_t> data);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Signatures
    // ========================================================================

    /**
     * @brief Derive an Ed25519 key pair from a 32-byte seed
     *
     * @return Ok((secret_key[64], public_key[32])) or Err
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>
    DeriveEd25519KeyPair(std::span<const uint8_t> seed);

    static Result<std::vector<uint8_t>, SodiumFailure> SignDetached(
        std::span<const uint8_t> message,
        std::span<const uint8_t> secret_key);

    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key);

    // ========================================================================
    // Public-key encryption
    // ========================================================================

    /**
     * @brief Encrypt @p plaintext from the holder of @p sender_secret_key to
     * @p recipient_public_key (both Ed25519)
     *
     * @return base64(nonce || ciphertext)
     */
    static Result<std::string, SodiumFailure> EncryptTo(
        std::span<const uint8_t> recipient_public_key,
        std::span<const uint8_t> sender_secret_key,
        std::string_view plaintext);

    /**
     * @brief Inverse of EncryptTo, run by the recipient
     *
     * Fails if the ciphertext was not produced by the holder of
     * @p sender_public_key for this recipient.
     */
    static Result<std::string, SodiumFailure> DecryptFrom(
        std::span<const uint8_t> sender_public_key,
        std::span<const uint8_t> recipient_secret_key,
        std::string_view encoded_ciphertext);

    // ========================================================================
    // Encoding
    // ========================================================================

    static std::string ToHex(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> FromHex(
        std::string_view hex,
        size_t expected_size);

    static std::string ToBase64(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view encoded);

    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>
    ConvertToBoxKeys(std::span<const uint8_t> ed25519_public_key,
                     std::span<const uint8_t> ed25519_secret_key);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
