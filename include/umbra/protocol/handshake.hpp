#pragma once
#include "umbra/core/constants.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/core/result.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include "umbra/crypto/sodium_secure_memory_handle.hpp"
#include "umbra/identity/static_identity.hpp"
#include "umbra/security/authorization_policy.hpp"
#include "protocol/channel_wire.pb.h"
#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace umbra::protocol {

using crypto::PublicKey;
using crypto::SecureMemoryHandle;

/**
 * @brief Output of a completed handshake, consumed by Channel::Create
 */
struct ChannelKeys {
    ConnectionId connection_id{};
    SecureMemoryHandle shared_key;
    PublicKey peer_public_key{};
};

/**
 * @brief EKey = H(p1 || p2 || p3), H = BLAKE2b-256
 *
 * Inputs are the three X25519 outputs, in the order both roles agree on:
 * ephemeral-ephemeral, initiator static with responder ephemeral,
 * initiator ephemeral with responder static.
 */
[[nodiscard]] Result<SecureMemoryHandle, ProtocolFailure> DeriveSharedKey(
    std::span<const uint8_t> p1,
    std::span<const uint8_t> p2,
    std::span<const uint8_t> p3);

/**
 * @brief Initiator (client) half of the channel handshake
 *
 * Start() builds the request; the caller sends it and later feeds the reply
 * to Finish(). Nothing blocks in between. Finish() may run once; the
 * ephemeral scalar is wiped when it returns, whatever the outcome.
 *
 * There is no signature anywhere in the exchange. The peer is authenticated
 * only implicitly: a party without the matching static secret derives a
 * different EKey and cannot open any fragment. Because every message is
 * computable from public keys plus freshly chosen ephemerals, either side
 * (or a third party) can fabricate a transcript. The handshake is deniable
 * and gives no non-repudiation.
 *
 * The identity must outlive the initiator.
 */
class HandshakeInitiator {
public:
    [[nodiscard]] static Result<std::unique_ptr<HandshakeInitiator>, ProtocolFailure> Start(
        const identity::StaticIdentity& identity,
        std::shared_ptr<const security::AuthorizationPolicy> policy);

    [[nodiscard]] const umbra::proto::protocol::HandshakeRequest& Request() const noexcept {
        return request_;
    }

    [[nodiscard]] const std::array<uint8_t, kClientEphemeralIdBytes>& ClientEphemeralId() const noexcept {
        return client_ephemeral_id_;
    }

    /**
     * @brief Complete the exchange from the responder's reply
     *
     * @return ChannelKeys, or
     *         ProtocolViolation (missing/malformed fields, wrong echo),
     *         Identification (invalid point), Authorization (responder key
     *         not allowed), InvalidState (called twice)
     */
    [[nodiscard]] Result<ChannelKeys, ProtocolFailure> Finish(
        const umbra::proto::protocol::HandshakeReply& reply);

    [[nodiscard]] bool IsFinished() const noexcept { return finished_; }

    HandshakeInitiator(const HandshakeInitiator&) = delete;
    HandshakeInitiator& operator=(const HandshakeInitiator&) = delete;
    ~HandshakeInitiator();

private:
    HandshakeInitiator(
        const identity::StaticIdentity& identity,
        std::shared_ptr<const security::AuthorizationPolicy> policy,
        SecureMemoryHandle ephemeral_secret);

    Result<ChannelKeys, ProtocolFailure> Complete(
        const umbra::proto::protocol::HandshakeReply& reply);

    const identity::StaticIdentity& identity_;
    std::shared_ptr<const security::AuthorizationPolicy> policy_;
    SecureMemoryHandle ephemeral_secret_;
    std::array<uint8_t, kClientEphemeralIdBytes> client_ephemeral_id_{};
    umbra::proto::protocol::HandshakeRequest request_{};
    bool finished_ = false;
};

/**
 * @brief Responder (server) half: one request in, one reply out
 *
 * Stateless between calls. The responder's ephemeral scalar lives only for
 * the duration of Respond().
 */
class HandshakeResponder {
public:
    struct Response {
        umbra::proto::protocol::HandshakeReply reply;
        ChannelKeys keys;
    };

    [[nodiscard]] static Result<Response, ProtocolFailure> Respond(
        const umbra::proto::protocol::HandshakeRequest& request,
        const identity::StaticIdentity& identity,
        const security::AuthorizationPolicy& policy);

private:
    HandshakeResponder() = delete;
};

}  // namespace umbra::protocol
