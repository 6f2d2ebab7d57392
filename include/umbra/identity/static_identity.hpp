#pragma once
#include "umbra/core/result.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include "umbra/crypto/sodium_secure_memory_handle.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace umbra::protocol::identity {

using crypto::PublicKey;
using crypto::SecureMemoryHandle;

/**
 * @brief Long-lived X25519 identity of this process
 *
 * The public key is advertised in every handshake. The secret key stays in
 * guarded memory and is only ever used as a scalar inside libsodium calls.
 */
class StaticIdentity {
public:
    [[nodiscard]] static Result<StaticIdentity, ProtocolFailure> Generate();

    /**
     * @brief Restore an identity from a 32-byte scalar
     *
     * The public key is recomputed; the caller should wipe its copy.
     */
    [[nodiscard]] static Result<StaticIdentity, ProtocolFailure> FromSecretKey(
        std::span<const uint8_t> secret_key);

    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept { return public_key_; }

    [[nodiscard]] const SecureMemoryHandle& SecretKey() const noexcept { return secret_key_; }

    StaticIdentity(StaticIdentity&&) noexcept = default;
    StaticIdentity& operator=(StaticIdentity&&) noexcept = default;
    StaticIdentity(const StaticIdentity&) = delete;
    StaticIdentity& operator=(const StaticIdentity&) = delete;
    ~StaticIdentity() = default;

private:
    StaticIdentity(SecureMemoryHandle secret_key, const PublicKey& public_key) noexcept;

    SecureMemoryHandle secret_key_;
    PublicKey public_key_{};
};

} // namespace umbra::protocol::identity
