#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace umbra::protocol {

inline constexpr uint32_t kWireVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kSharedKeyBytes = 32;
inline constexpr size_t kHashBytes = 32;
inline constexpr size_t kAuthTagBytes = 32;

inline constexpr size_t kConnectionIdBytes = 16;
inline constexpr size_t kClientEphemeralIdBytes = 16;
inline constexpr size_t kTimeOrderedIdBytes = 16;

using ConnectionId = std::array<uint8_t, kConnectionIdBytes>;

// Nonce = 64-bit band counter (high) || 256-bit process seed (low).
inline constexpr size_t kNonceSeedBytes = 32;
inline constexpr size_t kNonceBandBytes = 8;
inline constexpr size_t kNonceBytes = kNonceBandBytes + kNonceSeedBytes;

inline constexpr size_t kStreamNonceBytes = 24;
inline constexpr size_t kMaxFragmentPayloadBytes = 64 * 1024;
inline constexpr size_t kMaxEnvelopeBytes = kMaxFragmentPayloadBytes + 1024;

inline constexpr std::string_view kEncryptionDomainTag = "umbra-fragment-enc-v1";
inline constexpr std::string_view kAuthenticationDomainTag = "umbra-fragment-auth-v1";

inline constexpr std::string_view kPurposeEphemeralX25519 = "ephemeral-x25519";
inline constexpr std::string_view kPurposeStaticX25519 = "static-x25519";

struct ChannelDefaults {
    static constexpr std::chrono::milliseconds IDLE_TIMEOUT{20'000};
    static constexpr std::chrono::milliseconds HANDSHAKE_TIMEOUT{10'000};
    static constexpr uint32_t REPLAY_WINDOW = 1000;
    static constexpr uint32_t MAX_REPLAY_WINDOW = 1'000'000;
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view CHANNEL_CLOSED = "Channel has been torn down";
    static constexpr std::string_view REGISTRY_SHUT_DOWN = "Channel registry has been shut down";
};

}  // namespace umbra::protocol
