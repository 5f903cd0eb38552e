#include "contextvm/identity/signer_keys.hpp"
#include "contextvm/crypto/sodium_interop.hpp"
#include "contextvm/core/constants.hpp"

namespace contextvm::identity {
    using crypto::SodiumInterop;

    SignerKeys::SignerKeys(std::vector<uint8_t> secret_key, std::vector<uint8_t> public_key)
        : secret_key_(std::move(secret_key))
          , public_key_(std::move(public_key))
          , public_key_hex_(SodiumInterop::ToHex(public_key_)) {
    }

    SignerKeys::~SignerKeys() {
        SodiumInterop::SecureWipe(secret_key_);
    }

    Result<SignerKeys, TransportFailure> SignerKeys::FromSeed(std::span<const uint8_t> seed) {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<SignerKeys, TransportFailure>::Err(
                TransportFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto pair_result = SodiumInterop::DeriveEd25519KeyPair(seed);
        if (pair_result.IsErr()) {
            return Result<SignerKeys, TransportFailure>::Err(
                TransportFailure::FromSodiumFailure(pair_result.UnwrapErr()));
        }
        auto [secret_key, public_key] = std::move(pair_result).Unwrap();
        return Result<SignerKeys, TransportFailure>::Ok(
            SignerKeys(std::move(secret_key), std::move(public_key)));
    }

    Result<SignerKeys, TransportFailure> SignerKeys::Generate() {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<SignerKeys, TransportFailure>::Err(
                TransportFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto seed = SodiumInterop::GetRandomBytes(CryptoConstants::SEED_SIZE);
        auto keys = FromSeed(seed);
        SodiumInterop::SecureWipe(seed);
        return keys;
    }

    Result<SignerKeys, TransportFailure> SignerKeys::FromSeedHex(const std::string_view seed_hex) {
        auto seed_result = SodiumInterop::FromHex(seed_hex, CryptoConstants::SEED_SIZE);
        if (seed_result.IsErr()) {
            return Result<SignerKeys, TransportFailure>::Err(
                TransportFailure::Other("Signer seed must be 64 hex characters"));
        }
        auto seed = std::move(seed_result).Unwrap();
        auto keys = FromSeed(seed);
        SodiumInterop::SecureWipe(seed);
        return keys;
    }

    Result<std::vector<uint8_t>, TransportFailure> SignerKeys::DecodePublicKey(const std::string_view pubkey_hex) {
        auto decoded = SodiumInterop::FromHex(pubkey_hex, CryptoConstants::PUBLIC_KEY_SIZE);
        if (decoded.IsErr()) {
            return Result<std::vector<uint8_t>, TransportFailure>::Err(
                TransportFailure::Protocol("Malformed public key: " + decoded.UnwrapErr().message));
        }
        return Result<std::vector<uint8_t>, TransportFailure>::Ok(std::move(decoded).Unwrap());
    }

    Result<std::string, TransportFailure> SignerKeys::SignEventId(const std::string_view event_id_hex) const {
        auto id_bytes = SodiumInterop::FromHex(event_id_hex, CryptoConstants::EVENT_ID_SIZE);
        if (id_bytes.IsErr()) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::Protocol("Malformed event id: " + id_bytes.UnwrapErr().message));
        }
        auto signature = SodiumInterop::SignDetached(id_bytes.Unwrap(), secret_key_);
        if (signature.IsErr()) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::FromSodiumFailure(signature.UnwrapErr()));
        }
        return Result<std::string, TransportFailure>::Ok(SodiumInterop::ToHex(signature.Unwrap()));
    }

    bool SignerKeys::VerifyEventSignature(
        const std::string_view pubkey_hex,
        const std::string_view event_id_hex,
        const std::string_view signature_hex) {
        auto public_key = SodiumInterop::FromHex(pubkey_hex, CryptoConstants::PUBLIC_KEY_SIZE);
        auto id_bytes = SodiumInterop::FromHex(event_id_hex, CryptoConstants::EVENT_ID_SIZE);
        auto signature = SodiumInterop::FromHex(signature_hex, CryptoConstants::SIGNATURE_SIZE);
        if (public_key.IsErr() || id_bytes.IsErr() || signature.IsErr()) {
            return false;
        }
        return SodiumInterop::VerifyDetached(id_bytes.Unwrap(), signature.Unwrap(), public_key.Unwrap());
    }

    Result<std::string, TransportFailure> SignerKeys::EncryptTo(
        const std::string_view recipient_pubkey_hex,
        const std::string_view plaintext) const {
        auto recipient = DecodePublicKey(recipient_pubkey_hex);
        if (recipient.IsErr()) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::Encryption(recipient.UnwrapErr().message));
        }
        auto ciphertext = SodiumInterop::EncryptTo(recipient.Unwrap(), secret_key_, plaintext);
        if (ciphertext.IsErr()) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::FromSodiumFailure(ciphertext.UnwrapErr()));
        }
        return Result<std::string, TransportFailure>::Ok(std::move(ciphertext).Unwrap());
    }

    Result<std::string, TransportFailure> SignerKeys::DecryptFrom(
        const std::string_view sender_pubkey_hex,
        const std::string_view ciphertext) const {
        auto sender = DecodePublicKey(sender_pubkey_hex);
        if (sender.IsErr()) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::Decryption(sender.UnwrapErr().message));
        }
        auto plaintext = SodiumInterop::DecryptFrom(sender.Unwrap(), secret_key_, ciphertext);
        if (plaintext.IsErr()) {
            return Result<std::string, TransportFailure>::Err(
                TransportFailure::FromSodiumFailure(plaintext.UnwrapErr()));
        }
        return Result<std::string, TransportFailure>::Ok(std::move(plaintext).Unwrap());
    }
}
