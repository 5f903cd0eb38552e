#pragma once
#include <string>
#include <string_view>
namespace contextvm {
enum class SodiumFailureType {
    InitializationFailed,
    InvalidKey,
    SignatureFailed,
    EncryptionFailed,
    DecryptionFailed,
    DecodeFailed,
    HashFailed
};
enum class TransportFailureType {
    Transport,
    Encryption,
    Decryption,
    Timeout,
    SessionNotFound,
    InvalidMessage,
    Protocol,
    EncryptionRequired,
    Other
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidKey(std::string msg) {
        return {SodiumFailureType::InvalidKey, std::move(msg)};
    }
    static SodiumFailure SignatureFailed(std::string msg) {
        return {SodiumFailureType::SignatureFailed, std::move(msg)};
    }
    static SodiumFailure EncryptionFailed(std::string msg) {
        return {SodiumFailureType::EncryptionFailed, std::move(msg)};
    }
    static SodiumFailure DecryptionFailed(std::string msg) {
        return {SodiumFailureType::DecryptionFailed, std::move(msg)};
    }
    static SodiumFailure DecodeFailed(std::string msg) {
        return {SodiumFailureType::DecodeFailed, std::move(msg)};
    }
    static SodiumFailure HashFailed(std::string msg) {
        return {SodiumFailureType::HashFailed, std::move(msg)};
    }
};
class TransportFailure {
public:
    TransportFailureType type;
    std::string message;
    TransportFailure(const TransportFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static TransportFailure Transport(std::string msg) {
        return {TransportFailureType::Transport, std::move(msg)};
    }
    static TransportFailure Encryption(std::string msg) {
        return {TransportFailureType::Encryption, std::move(msg)};
    }
    static TransportFailure Decryption(std::string msg) {
        return {TransportFailureType::Decryption, std::move(msg)};
    }
    static TransportFailure Timeout(std::string msg) {
        return {TransportFailureType::Timeout, std::move(msg)};
    }
    static TransportFailure SessionNotFound(std::string msg) {
        return {TransportFailureType::SessionNotFound, std::move(msg)};
    }
    static TransportFailure InvalidMessage(std::string msg) {
        return {TransportFailureType::InvalidMessage, std::move(msg)};
    }
    static TransportFailure Protocol(std::string msg) {
        return {TransportFailureType::Protocol, std::move(msg)};
    }
    static TransportFailure EncryptionRequired(std::string msg) {
        return {TransportFailureType::EncryptionRequired, std::move(msg)};
    }
    static TransportFailure Other(std::string msg) {
        return {TransportFailureType::Other, std::move(msg)};
    }
    static TransportFailure FromSodiumFailure(const SodiumFailure& sf) {
        switch (sf.type) {
            case SodiumFailureType::EncryptionFailed:
                return Encryption(sf.message);
            case SodiumFailureType::DecryptionFailed:
            case SodiumFailureType::DecodeFailed:
                return Decryption(sf.message);
            case SodiumFailureType::SignatureFailed:
                return Protocol(sf.message);
            default:
                return Other(sf.message);
        }
    }
};
[[nodiscard]] constexpr std::string_view FailureTypeToString(const TransportFailureType type) noexcept {
    switch (type) {
        case TransportFailureType::Transport: return "Transport";
        case TransportFailureType::Encryption: return "Encryption";
        case TransportFailureType::Decryption: return "Decryption";
        case TransportFailureType::Timeout: return "Timeout";
        case TransportFailureType::SessionNotFound: return "SessionNotFound";
        case TransportFailureType::InvalidMessage: return "InvalidMessage";
        case TransportFailureType::Protocol: return "Protocol";
        case TransportFailureType::EncryptionRequired: return "EncryptionRequired";
        case TransportFailureType::Other: return "Other";
    }
    return "Unknown";
}
}
