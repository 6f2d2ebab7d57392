#include "umbra/crypto/sodium_interop.hpp"
#include "umbra/crypto/sodium_secure_memory_handle.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <string>

namespace umbra::protocol::crypto {

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
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > SodiumConstants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                fmt::format("Buffer size {} exceeds maximum {}",
                            buffer.size(), SodiumConstants::MAX_BUFFER_SIZE)));
    }

    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS;
}

// ============================================================================
// Curve25519
// ============================================================================

Result<std::pair<SecureMemoryHandle, PublicKey>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using ResultType = Result<std::pair<SecureMemoryHandle, PublicKey>, ProtocolFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (sk_handle_result.IsErr()) {
        return ResultType::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> sk_bytes = GetRandomBytes(kX25519PrivateKeyBytes);
    auto write_result = sk_handle.Write(sk_bytes);
    sodium_memzero(sk_bytes.data(), sk_bytes.size());
    if (write_result.IsErr()) {
        return ResultType::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    auto pk_result = DerivePublicKey(sk_handle);
    if (pk_result.IsErr()) {
        return ResultType::Err(ProtocolFailure::KeyGeneration(
            fmt::format("Failed to derive {} public key: {}",
                        key_purpose, pk_result.UnwrapErr().message)));
    }

    return ResultType::Ok(std::make_pair(std::move(sk_handle), std::move(pk_result).Unwrap()));
}

Result<PublicKey, ProtocolFailure> SodiumInterop::DerivePublicKey(
    const SecureMemoryHandle& secret_key) {

    if (secret_key.Size() != kX25519PrivateKeyBytes) {
        return Result<PublicKey, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Invalid X25519 scalar size: expected {}, got {}",
                            kX25519PrivateKeyBytes, secret_key.Size())));
    }

    PublicKey public_key{};
    auto derive_result = secret_key.WithReadAccess([&public_key](std::span<const uint8_t> sk) {
        return crypto_scalarmult_base(public_key.data(), sk.data());
    });
    if (derive_result.IsErr()) {
        return Result<PublicKey, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (derive_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<PublicKey, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("crypto_scalarmult_base failed"));
    }
    return Result<PublicKey, ProtocolFailure>::Ok(public_key);
}

Result<std::array<uint8_t, kX25519SharedSecretBytes>, ProtocolFailure> SodiumInterop::ScalarMult(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> peer_point) {
    using ResultType = Result<std::array<uint8_t, kX25519SharedSecretBytes>, ProtocolFailure>;

    if (secret_key.Size() != kX25519PrivateKeyBytes ||
        peer_point.size() != kX25519PublicKeyBytes) {
        return ResultType::Err(
            ProtocolFailure::InvalidInput("Invalid X25519 key size for scalar multiplication"));
    }

    std::array<uint8_t, kX25519SharedSecretBytes> product{};
    auto mult_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto_scalarmult(product.data(), sk.data(), peer_point.data());
    });
    if (mult_result.IsErr()) {
        return ResultType::Err(ProtocolFailure::FromSodiumFailure(mult_result.UnwrapErr()));
    }
    if (mult_result.Unwrap() != SodiumConstants::SUCCESS) {
        sodium_memzero(product.data(), product.size());
        return ResultType::Err(ProtocolFailure::Identification(
            "Peer point produced a degenerate shared secret"));
    }
    return ResultType::Ok(product);
}

// ============================================================================
// Hashing and keystream
// ============================================================================

Digest SodiumInterop::Hash(std::initializer_list<std::span<const uint8_t>> parts) {
    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, kHashBytes);
    for (const auto& part : parts) {
        crypto_generichash_update(&state, part.data(), part.size());
    }
    Digest digest{};
    crypto_generichash_final(&state, digest.data(), digest.size());
    sodium_memzero(&state, sizeof(state));
    return digest;
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::Keystream(
    std::span<const uint8_t> subkey,
    size_t length) {

    if (subkey.size() != crypto_stream_xchacha20_KEYBYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Keystream subkey must be 32 bytes"));
    }

    std::vector<uint8_t> stream(length);
    if (length == 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(stream));
    }

    static_assert(crypto_stream_xchacha20_NONCEBYTES == kStreamNonceBytes);
    const std::array<uint8_t, kStreamNonceBytes> zero_nonce{};
    if (crypto_stream_xchacha20(stream.data(), stream.size(), zero_nonce.data(), subkey.data()) !=
        SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("XChaCha20 keystream generation failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(stream));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace umbra::protocol::crypto
