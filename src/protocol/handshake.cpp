#include "umbra/protocol/handshake.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include "umbra/debug/channel_logger.hpp"
#include "umbra/security/validation/dh_validator.hpp"
#include <fmt/core.h>
#include <sodium.h>
#include <algorithm>
#include <string>

namespace umbra::protocol {
    using crypto::SodiumInterop;
    using security::DhValidator;
    using SharedSecret = std::array<uint8_t, kX25519SharedSecretBytes>;

    namespace {
        std::span<const uint8_t> AsSpan(const std::string& field) {
            return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
        }

        std::string AsField(std::span<const uint8_t> bytes) {
            return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
        }

        Result<Unit, ProtocolFailure> RequireField(
            const std::string& field,
            std::string_view name) {
            if (field.empty()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::ProtocolViolation(fmt::format("Handshake field '{}' is missing", name)));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> RequireSize(
            const std::string& field,
            const size_t expected,
            std::string_view name) {
            if (field.size() != expected) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::ProtocolViolation(
                        fmt::format("Handshake field '{}' must be {} bytes, got {}",
                                    name, expected, field.size())));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<PublicKey, ProtocolFailure> ReadPoint(const std::string& field, std::string_view name) {
            if (auto valid = DhValidator::ValidateX25519PublicKey(AsSpan(field), name); valid.IsErr()) {
                return Result<PublicKey, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
            }
            PublicKey point{};
            std::copy(field.begin(), field.end(), point.begin());
            return Result<PublicKey, ProtocolFailure>::Ok(point);
        }

        void WipeSecrets(SharedSecret& p1, SharedSecret& p2, SharedSecret& p3) {
            sodium_memzero(p1.data(), p1.size());
            sodium_memzero(p2.data(), p2.size());
            sodium_memzero(p3.data(), p3.size());
        }

        // Runs the three scalar multiplications in order and hashes the results.
        Result<SecureMemoryHandle, ProtocolFailure> AgreeSharedKey(
            const SecureMemoryHandle& s1, std::span<const uint8_t> q1,
            const SecureMemoryHandle& s2, std::span<const uint8_t> q2,
            const SecureMemoryHandle& s3, std::span<const uint8_t> q3) {

            auto r1 = SodiumInterop::ScalarMult(s1, q1);
            if (r1.IsErr()) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(std::move(r1).UnwrapErr());
            }
            auto r2 = SodiumInterop::ScalarMult(s2, q2);
            if (r2.IsErr()) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(std::move(r2).UnwrapErr());
            }
            auto r3 = SodiumInterop::ScalarMult(s3, q3);
            if (r3.IsErr()) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(std::move(r3).UnwrapErr());
            }
            SharedSecret& p1 = r1.Unwrap();
            SharedSecret& p2 = r2.Unwrap();
            SharedSecret& p3 = r3.Unwrap();
            auto key = DeriveSharedKey(p1, p2, p3);
            WipeSecrets(p1, p2, p3);
            return key;
        }
    }

    Result<SecureMemoryHandle, ProtocolFailure> DeriveSharedKey(
        std::span<const uint8_t> p1,
        std::span<const uint8_t> p2,
        std::span<const uint8_t> p3) {

        if (p1.size() != kX25519SharedSecretBytes ||
            p2.size() != kX25519SharedSecretBytes ||
            p3.size() != kX25519SharedSecretBytes) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("Shared key inputs must be three 32-byte X25519 outputs"));
        }

        crypto::Digest digest = SodiumInterop::Hash({p1, p2, p3});
        auto handle = SecureMemoryHandle::FromBytes(digest);
        sodium_memzero(digest.data(), digest.size());
        if (handle.IsErr()) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle).Unwrap());
    }

    HandshakeInitiator::HandshakeInitiator(
        const identity::StaticIdentity& identity,
        std::shared_ptr<const security::AuthorizationPolicy> policy,
        SecureMemoryHandle ephemeral_secret)
        : identity_(identity)
        , policy_(std::move(policy))
        , ephemeral_secret_(std::move(ephemeral_secret)) {
    }

    HandshakeInitiator::~HandshakeInitiator() = default;

    Result<std::unique_ptr<HandshakeInitiator>, ProtocolFailure> HandshakeInitiator::Start(
        const identity::StaticIdentity& identity,
        std::shared_ptr<const security::AuthorizationPolicy> policy) {

        if (!policy) {
            return Result<std::unique_ptr<HandshakeInitiator>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Authorization policy is required"));
        }

        auto keypair = SodiumInterop::GenerateX25519KeyPair(kPurposeEphemeralX25519);
        if (keypair.IsErr()) {
            return Result<std::unique_ptr<HandshakeInitiator>, ProtocolFailure>::Err(
                std::move(keypair).UnwrapErr());
        }
        auto [ephemeral_secret, ephemeral_public] = std::move(keypair).Unwrap();

        std::unique_ptr<HandshakeInitiator> initiator(
            new HandshakeInitiator(identity, std::move(policy), std::move(ephemeral_secret)));

        const auto id_bytes = SodiumInterop::GetRandomBytes(kClientEphemeralIdBytes);
        std::copy(id_bytes.begin(), id_bytes.end(), initiator->client_ephemeral_id_.begin());

        auto& request = initiator->request_;
        request.set_version(kWireVersion);
        request.set_tag(umbra::proto::protocol::SERVER_CONNECT);
        request.set_client_ephemeral_id(AsField(initiator->client_ephemeral_id_));
        request.set_ephemeral_public(AsField(ephemeral_public));
        request.set_client_public_key(AsField(identity.GetPublicKey()));

        UMBRA_LOG_ID(debug::Side::Initiator, "HANDSHAKE", "client_ephemeral_id", initiator->client_ephemeral_id_);
        UMBRA_LOG_KEY(debug::Side::Initiator, "HANDSHAKE", "ephemeral_public", ephemeral_public);

        return Result<std::unique_ptr<HandshakeInitiator>, ProtocolFailure>::Ok(std::move(initiator));
    }

    Result<ChannelKeys, ProtocolFailure> HandshakeInitiator::Finish(
        const umbra::proto::protocol::HandshakeReply& reply) {
        if (finished_) {
            return Result<ChannelKeys, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Handshake already finished"));
        }
        finished_ = true;
        auto result = Complete(reply);
        ephemeral_secret_.Wipe();
        if (result.IsErr()) {
            UMBRA_LOG_MSG(debug::Side::Initiator, "HANDSHAKE", result.UnwrapErr().message);
        }
        return result;
    }

    Result<ChannelKeys, ProtocolFailure> HandshakeInitiator::Complete(
        const umbra::proto::protocol::HandshakeReply& reply) {

        if (reply.version() != kWireVersion) {
            return Result<ChannelKeys, ProtocolFailure>::Err(
                ProtocolFailure::ProtocolViolation(
                    fmt::format("Unsupported handshake version {}", reply.version())));
        }
        for (auto check : {
                 RequireSize(reply.connection_id(), kConnectionIdBytes, "connection_id"),
                 RequireField(reply.ephemeral_public(), "ephemeral_public"),
                 RequireField(reply.server_public_key(), "server_public_key"),
                 RequireSize(reply.client_ephemeral_id(), kClientEphemeralIdBytes, "client_ephemeral_id")}) {
            if (check.IsErr()) {
                return Result<ChannelKeys, ProtocolFailure>::Err(std::move(check).UnwrapErr());
            }
        }
        if (!SodiumInterop::ConstantTimeEquals(AsSpan(reply.client_ephemeral_id()), client_ephemeral_id_)) {
            return Result<ChannelKeys, ProtocolFailure>::Err(
                ProtocolFailure::ProtocolViolation("Reply does not echo this attempt's client_ephemeral_id"));
        }

        auto responder_ephemeral = ReadPoint(reply.ephemeral_public(), "responder ephemeral key");
        if (responder_ephemeral.IsErr()) {
            return Result<ChannelKeys, ProtocolFailure>::Err(std::move(responder_ephemeral).UnwrapErr());
        }
        auto server_public = ReadPoint(reply.server_public_key(), "server public key");
        if (server_public.IsErr()) {
            return Result<ChannelKeys, ProtocolFailure>::Err(std::move(server_public).UnwrapErr());
        }
        if (auto allowed = policy_->Authorize(server_public.Unwrap(), "Responder"); allowed.IsErr()) {
            return Result<ChannelKeys, ProtocolFailure>::Err(std::move(allowed).UnwrapErr());
        }

        const PublicKey& b_point = responder_ephemeral.Unwrap();
        const PublicKey& s_point = server_public.Unwrap();
        // a*B || c*B || a*S
        auto shared_key = AgreeSharedKey(
            ephemeral_secret_, b_point,
            identity_.SecretKey(), b_point,
            ephemeral_secret_, s_point);
        if (shared_key.IsErr()) {
            return Result<ChannelKeys, ProtocolFailure>::Err(std::move(shared_key).UnwrapErr());
        }

        ChannelKeys keys;
        std::copy(reply.connection_id().begin(), reply.connection_id().end(), keys.connection_id.begin());
        keys.shared_key = std::move(shared_key).Unwrap();
        keys.peer_public_key = s_point;
        UMBRA_LOG_ID(debug::Side::Initiator, "HANDSHAKE", "connection_id", keys.connection_id);
        return Result<ChannelKeys, ProtocolFailure>::Ok(std::move(keys));
    }

    Result<HandshakeResponder::Response, ProtocolFailure> HandshakeResponder::Respond(
        const umbra::proto::protocol::HandshakeRequest& request,
        const identity::StaticIdentity& identity,
        const security::AuthorizationPolicy& policy) {

        if (request.version() != kWireVersion) {
            return Result<Response, ProtocolFailure>::Err(
                ProtocolFailure::ProtocolViolation(
                    fmt::format("Unsupported handshake version {}", request.version())));
        }
        if (request.tag() != umbra::proto::protocol::SERVER_CONNECT) {
            return Result<Response, ProtocolFailure>::Err(
                ProtocolFailure::ProtocolViolation("Handshake request tag is not SERVER_CONNECT"));
        }
        for (auto check : {
                 RequireSize(request.client_ephemeral_id(), kClientEphemeralIdBytes, "client_ephemeral_id"),
                 RequireField(request.ephemeral_public(), "ephemeral_public"),
                 RequireField(request.client_public_key(), "client_public_key")}) {
            if (check.IsErr()) {
                return Result<Response, ProtocolFailure>::Err(std::move(check).UnwrapErr());
            }
        }

        auto initiator_ephemeral = ReadPoint(request.ephemeral_public(), "initiator ephemeral key");
        if (initiator_ephemeral.IsErr()) {
            return Result<Response, ProtocolFailure>::Err(std::move(initiator_ephemeral).UnwrapErr());
        }
        auto client_public = ReadPoint(request.client_public_key(), "client public key");
        if (client_public.IsErr()) {
            return Result<Response, ProtocolFailure>::Err(std::move(client_public).UnwrapErr());
        }
        if (auto allowed = policy.Authorize(client_public.Unwrap(), "Initiator"); allowed.IsErr()) {
            return Result<Response, ProtocolFailure>::Err(std::move(allowed).UnwrapErr());
        }

        auto keypair = SodiumInterop::GenerateX25519KeyPair(kPurposeEphemeralX25519);
        if (keypair.IsErr()) {
            return Result<Response, ProtocolFailure>::Err(std::move(keypair).UnwrapErr());
        }
        auto [ephemeral_secret, ephemeral_public] = std::move(keypair).Unwrap();

        const PublicKey& a_point = initiator_ephemeral.Unwrap();
        const PublicKey& c_point = client_public.Unwrap();
        // b*A || b*C || s*A
        auto shared_key = AgreeSharedKey(
            ephemeral_secret, a_point,
            ephemeral_secret, c_point,
            identity.SecretKey(), a_point);
        ephemeral_secret.Wipe();
        if (shared_key.IsErr()) {
            return Result<Response, ProtocolFailure>::Err(std::move(shared_key).UnwrapErr());
        }

        Response response;
        const auto cid = SodiumInterop::GetRandomBytes(kConnectionIdBytes);
        std::copy(cid.begin(), cid.end(), response.keys.connection_id.begin());
        response.keys.shared_key = std::move(shared_key).Unwrap();
        response.keys.peer_public_key = c_point;

        auto& reply = response.reply;
        reply.set_version(kWireVersion);
        reply.set_connection_id(AsField(response.keys.connection_id));
        reply.set_ephemeral_public(AsField(ephemeral_public));
        reply.set_server_public_key(AsField(identity.GetPublicKey()));
        reply.set_client_ephemeral_id(request.client_ephemeral_id());

        UMBRA_LOG_ID(debug::Side::Responder, "HANDSHAKE", "connection_id", response.keys.connection_id);
        UMBRA_LOG_KEY(debug::Side::Responder, "HANDSHAKE", "ephemeral_public", ephemeral_public);
        return Result<Response, ProtocolFailure>::Ok(std::move(response));
    }

}
