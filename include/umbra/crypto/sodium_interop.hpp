#pragma once

#include "umbra/core/result.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/core/constants.hpp"
#include "umbra/crypto/sodium_secure_memory_handle.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace umbra::protocol::crypto {

using PublicKey = std::array<uint8_t, kX25519PublicKeyBytes>;
using Digest = std::array<uint8_t, kHashBytes>;

/**
 * @brief Interop layer for the libsodium primitives the channel protocol uses
 *
 * Curve arithmetic (X25519), hashing (BLAKE2b-256) and keystream generation
 * (XChaCha20) are delegated to libsodium. Nothing here reimplements a
 * primitive; this class only adapts buffers and error reporting.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching content.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Generate an X25519 key pair
     *
     * The scalar is written straight into guarded memory.
     *
     * @param key_purpose Used in error messages only
     * @return Ok((secret handle, public point)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, PublicKey>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Compute scalar * G for a scalar held in guarded memory
     */
    static Result<PublicKey, ProtocolFailure> DerivePublicKey(
        const SecureMemoryHandle& secret_key);

    /**
     * @brief Compute scalar * point
     *
     * The caller validates the point first (DhValidator); libsodium still
     * refuses an all-zero result, which is reported as an identification
     * failure since only a degenerate peer point can produce it.
     */
    static Result<std::array<uint8_t, kX25519SharedSecretBytes>, ProtocolFailure> ScalarMult(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> peer_point);

    // BLAKE2b-256 over the concatenation of all parts.
    static Digest Hash(std::initializer_list<std::span<const uint8_t>> parts);

    // XChaCha20 keystream under a single-use subkey (all-zero stream nonce).
    static Result<std::vector<uint8_t>, ProtocolFailure> Keystream(
        std::span<const uint8_t> subkey,
        size_t length);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

inline std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // namespace umbra::protocol::crypto
