#pragma once
#include "umbra/core/result.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/core/constants.hpp"
#include "umbra/crypto/sodium_secure_memory_handle.hpp"
#include "umbra/protocol/nonce.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace umbra::protocol::crypto {

using AuthTag = std::array<uint8_t, kAuthTagBytes>;

/**
 * @brief One sealed fragment: {seq, ciphertext, authTag}
 *
 * Immutable after construction. The ciphertext can be moved out once the
 * fragment is handed to the wire encoder.
 */
class Fragment {
public:
    Fragment(const Nonce& seq, std::vector<uint8_t> ciphertext, const AuthTag& auth_tag)
        : seq_(seq), ciphertext_(std::move(ciphertext)), auth_tag_(auth_tag) {}

    /**
     * @brief Rebuild a fragment from wire fields
     *
     * ProtocolViolation if seq or tag has the wrong length or the ciphertext
     * is larger than one fragment may be.
     */
    [[nodiscard]] static Result<Fragment, ProtocolFailure> FromWire(
        std::span<const uint8_t> seq,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> auth_tag);

    [[nodiscard]] const Nonce& Seq() const noexcept { return seq_; }
    [[nodiscard]] std::span<const uint8_t> Ciphertext() const noexcept { return ciphertext_; }
    [[nodiscard]] const AuthTag& Tag() const noexcept { return auth_tag_; }

    [[nodiscard]] std::vector<uint8_t> TakeCiphertext() && { return std::move(ciphertext_); }

private:
    Nonce seq_;
    std::vector<uint8_t> ciphertext_;
    AuthTag auth_tag_;
};

/**
 * @brief Per-fragment encrypt-then-MAC under a channel key
 *
 * With H = BLAKE2b-256:
 *   ciphertext = plaintext XOR XChaCha20(H(ENC || key || seq))
 *   authTag    = H(H(AUTH || key || seq) || seq || ciphertext)
 *
 * The keystream subkey is unique per (key, seq), so the all-zero stream
 * nonce is never used twice under one subkey as long as the caller never
 * reuses a seq under a key. Decryption checks the tag in constant time and
 * releases no plaintext on mismatch.
 */
class FragmentCipher {
public:
    [[nodiscard]] static Result<Fragment, ProtocolFailure> Encrypt(
        std::span<const uint8_t> key,
        const Nonce& seq,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<Fragment, ProtocolFailure> Encrypt(
        const SecureMemoryHandle& key,
        const Nonce& seq,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> key,
        const Fragment& fragment);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        const SecureMemoryHandle& key,
        const Fragment& fragment);

    // XOR stream for (domain_tag, key, seq); exposed for known-answer tests.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Keystream(
        std::string_view domain_tag,
        std::span<const uint8_t> key,
        const Nonce& seq,
        size_t length);

    [[nodiscard]] static AuthTag ComputeTag(
        std::span<const uint8_t> key,
        const Nonce& seq,
        std::span<const uint8_t> ciphertext);

private:
    FragmentCipher() = delete;
};

} // namespace umbra::protocol::crypto
