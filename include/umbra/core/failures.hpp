#pragma once
#include <string>
#include <string_view>
namespace umbra::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    Identification,
    Authorization,
    ProtocolViolation,
    Authentication,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    InvalidState,
    Encode,
    Decode,
    ObjectDisposed,
    ReplayAttack,
    Timeout,
    Cancelled
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
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    // Malformed or invalid curve point / key encoding.
    static ProtocolFailure Identification(std::string msg) {
        return {ProtocolFailureType::Identification, std::move(msg)};
    }
    // Peer public key is not in the membership set.
    static ProtocolFailure Authorization(std::string msg) {
        return {ProtocolFailureType::Authorization, std::move(msg)};
    }
    // Missing or malformed handshake fields, unexpected message shape.
    static ProtocolFailure ProtocolViolation(std::string msg) {
        return {ProtocolFailureType::ProtocolViolation, std::move(msg)};
    }
    // Fragment tag mismatch.
    static ProtocolFailure Authentication(std::string msg) {
        return {ProtocolFailureType::Authentication, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure ObjectDisposed(std::string msg) {
        return {ProtocolFailureType::ObjectDisposed, std::move(msg)};
    }
    static ProtocolFailure ReplayAttack(std::string msg) {
        return {ProtocolFailureType::ReplayAttack, std::move(msg)};
    }
    static ProtocolFailure Timeout(std::string msg) {
        return {ProtocolFailureType::Timeout, std::move(msg)};
    }
    static ProtocolFailure Cancelled(std::string msg) {
        return {ProtocolFailureType::Cancelled, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};
constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::Identification: return "Identification";
        case ProtocolFailureType::Authorization: return "Authorization";
        case ProtocolFailureType::ProtocolViolation: return "ProtocolViolation";
        case ProtocolFailureType::Authentication: return "Authentication";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::Encode: return "Encode";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::ObjectDisposed: return "ObjectDisposed";
        case ProtocolFailureType::ReplayAttack: return "ReplayAttack";
        case ProtocolFailureType::Timeout: return "Timeout";
        case ProtocolFailureType::Cancelled: return "Cancelled";
    }
    return "Unknown";
}
}
