#include "umbra/identity/static_identity.hpp"
#include "umbra/core/constants.hpp"
#include "umbra/debug/channel_logger.hpp"
#include <fmt/core.h>

namespace umbra::protocol::identity {

using crypto::SodiumInterop;

StaticIdentity::StaticIdentity(SecureMemoryHandle secret_key, const PublicKey& public_key) noexcept
    : secret_key_(std::move(secret_key))
    , public_key_(public_key) {
}

Result<StaticIdentity, ProtocolFailure> StaticIdentity::Generate() {
    auto keypair_result = SodiumInterop::GenerateX25519KeyPair(kPurposeStaticX25519);
    if (keypair_result.IsErr()) {
        return Result<StaticIdentity, ProtocolFailure>::Err(std::move(keypair_result).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(keypair_result).Unwrap();
    UMBRA_LOG_KEY(debug::Side::Unknown, "IDENTITY", "static_public", public_key);
    return Result<StaticIdentity, ProtocolFailure>::Ok(
        StaticIdentity(std::move(secret_key), public_key));
}

Result<StaticIdentity, ProtocolFailure> StaticIdentity::FromSecretKey(
    std::span<const uint8_t> secret_key) {

    if (secret_key.size() != kX25519PrivateKeyBytes) {
        return Result<StaticIdentity, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Static secret key must be {} bytes, got {}",
                            kX25519PrivateKeyBytes, secret_key.size())));
    }

    auto handle_result = SecureMemoryHandle::FromBytes(secret_key);
    if (handle_result.IsErr()) {
        return Result<StaticIdentity, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    auto public_result = SodiumInterop::DerivePublicKey(handle);
    if (public_result.IsErr()) {
        return Result<StaticIdentity, ProtocolFailure>::Err(std::move(public_result).UnwrapErr());
    }
    return Result<StaticIdentity, ProtocolFailure>::Ok(
        StaticIdentity(std::move(handle), public_result.Unwrap()));
}

} // namespace umbra::protocol::identity
