#include "contextvm/crypto/sodium_interop.hpp"
#include "contextvm/core/format.hpp"

#include <algorithm>

namespace contextvm::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Hashing and randomness
// ============================================================================

std::array<uint8_t, crypto_hash_sha256_BYTES> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    std::array<uint8_t, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), buffer.size());
    }
    return buffer;
}

// ============================================================================
// Signatures
// ============================================================================

Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>
SodiumInterop::DeriveEd25519KeyPair(std::span<const uint8_t> seed) {
    using ResultType = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>;
    if (seed.size() != crypto_sign_SEEDBYTES) {
        return ResultType::Err(SodiumFailure::InvalidKey(
            compat::format("Seed must be {} bytes, got {}", crypto_sign_SEEDBYTES, seed.size())));
    }
    std::vector<uint8_t> secret_key(crypto_sign_SECRETKEYBYTES);
    std::vector<uint8_t> public_key(crypto_sign_PUBLICKEYBYTES);
    if (crypto_sign_seed_keypair(public_key.data(), secret_key.data(), seed.data()) != 0) {
        SecureWipe(secret_key);
        return ResultType::Err(SodiumFailure::InvalidKey("Ed25519 key derivation failed"));
    }
    return ResultType::Ok(std::make_pair(std::move(secret_key), std::move(public_key)));
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::SignDetached(
    std::span<const uint8_t> message,
    std::span<const uint8_t> secret_key) {
    if (secret_key.size() != crypto_sign_SECRETKEYBYTES) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidKey("Ed25519 secret key has the wrong size"));
    }
    std::vector<uint8_t> signature(crypto_sign_BYTES);
    if (crypto_sign_detached(signature.data(), nullptr, message.data(), message.size(),
                             secret_key.data()) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::SignatureFailed("crypto_sign_detached failed"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) {
    if (signature.size() != crypto_sign_BYTES || public_key.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       public_key.data()) == 0;
}

// ============================================================================
// Public-key encryption
// ============================================================================

Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>
SodiumInterop::ConvertToBoxKeys(std::span<const uint8_t> ed25519_public_key,
                                std::span<const uint8_t> ed25519_secret_key) {
    using ResultType = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>;
    if (ed25519_public_key.size() != crypto_sign_PUBLICKEYBYTES ||
        ed25519_secret_key.size() != crypto_sign_SECRETKEYBYTES) {
        return ResultType::Err(SodiumFailure::InvalidKey("Ed25519 key has the wrong size"));
    }
    std::vector<uint8_t> x_public(crypto_box_PUBLICKEYBYTES);
    std::vector<uint8_t> x_secret(crypto_box_SECRETKEYBYTES);
    if (crypto_sign_ed25519_pk_to_curve25519(x_public.data(), ed25519_public_key.data()) != 0) {
        return ResultType::Err(SodiumFailure::InvalidKey("Public key is not a valid Ed25519 point"));
    }
    if (crypto_sign_ed25519_sk_to_curve25519(x_secret.data(), ed25519_secret_key.data()) != 0) {
        return ResultType::Err(SodiumFailure::InvalidKey("Secret key conversion failed"));
    }
    return ResultType::Ok(std::make_pair(std::move(x_public), std::move(x_secret)));
}

Result<std::string, SodiumFailure> SodiumInterop::EncryptTo(
    std::span<const uint8_t> recipient_public_key,
    std::span<const uint8_t> sender_secret_key,
    const std::string_view plaintext) {
    auto keys_result = ConvertToBoxKeys(recipient_public_key, sender_secret_key);
    if (keys_result.IsErr()) {
        return Result<std::string, SodiumFailure>::Err(
            SodiumFailure::EncryptionFailed(keys_result.UnwrapErr().message));
    }
    auto [x_public, x_secret] = std::move(keys_result).Unwrap();

    std::vector<uint8_t> sealed(crypto_box_NONCEBYTES + crypto_box_MACBYTES + plaintext.size());
    randombytes_buf(sealed.data(), crypto_box_NONCEBYTES);
    const int rc = crypto_box_easy(
        sealed.data() + crypto_box_NONCEBYTES,
        reinterpret_cast<const unsigned char *>(plaintext.data()), plaintext.size(),
        sealed.data(), x_public.data(), x_secret.data());
    SecureWipe(x_secret);
    if (rc != 0) {
        return Result<std::string, SodiumFailure>::Err(
            SodiumFailure::EncryptionFailed("crypto_box_easy failed"));
    }
    return Result<std::string, SodiumFailure>::Ok(ToBase64(sealed));
}

Result<std::string, SodiumFailure> SodiumInterop::DecryptFrom(
    std::span<const uint8_t> sender_public_key,
    std::span<const uint8_t> recipient_secret_key,
    const std::string_view encoded_ciphertext) {
    auto sealed_result = FromBase64(encoded_ciphertext);
    if (sealed_result.IsErr()) {
        return Result<std::string, SodiumFailure>::Err(sealed_result.UnwrapErr());
    }
    const auto sealed = std::move(sealed_result).Unwrap();
    if (sealed.size() < crypto_box_NONCEBYTES + crypto_box_MACBYTES) {
        return Result<std::string, SodiumFailure>::Err(
            SodiumFailure::DecodeFailed("Ciphertext too small"));
    }

    auto keys_result = ConvertToBoxKeys(sender_public_key, recipient_secret_key);
    if (keys_result.IsErr()) {
        return Result<std::string, SodiumFailure>::Err(
            SodiumFailure::DecryptionFailed(keys_result.UnwrapErr().message));
    }
    auto [x_public, x_secret] = std::move(keys_result).Unwrap();

    const size_t cipher_size = sealed.size() - crypto_box_NONCEBYTES;
    std::string plaintext(cipher_size - crypto_box_MACBYTES, '\0');
    const int rc = crypto_box_open_easy(
        reinterpret_cast<unsigned char *>(plaintext.data()),
        sealed.data() + crypto_box_NONCEBYTES, cipher_size,
        sealed.data(), x_public.data(), x_secret.data());
    SecureWipe(x_secret);
    if (rc != 0) {
        return Result<std::string, SodiumFailure>::Err(
            SodiumFailure::DecryptionFailed("Authentication failed while opening ciphertext"));
    }
    return Result<std::string, SodiumFailure>::Ok(std::move(plaintext));
}

// ============================================================================
// Encoding
// ============================================================================

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromHex(
    const std::string_view hex,
    const size_t expected_size) {
    if (hex.size() != expected_size * 2) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::DecodeFailed(compat::format(
                "Expected {} hex characters, got {}", expected_size * 2, hex.size())));
    }
    std::vector<uint8_t> bytes(expected_size);
    size_t decoded = 0;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &decoded, nullptr) != 0 || decoded != expected_size) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::DecodeFailed("Invalid hex encoding"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(bytes));
}

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.resize(std::char_traits<char>::length(encoded.c_str()));
    return encoded;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromBase64(const std::string_view encoded) {
    std::vector<uint8_t> bytes(encoded.size() / 4 * 3 + 3);
    size_t decoded = 0;
    if (sodium_base642bin(bytes.data(), bytes.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::DecodeFailed("Invalid base64 encoding"));
    }
    bytes.resize(decoded);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(bytes));
}

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

}
