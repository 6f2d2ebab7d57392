#pragma once
#include "umbra/configuration/channel_config.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/core/result.hpp"
#include "umbra/identity/static_identity.hpp"
#include "umbra/interfaces/i_channel_event_handler.hpp"
#include "umbra/interfaces/i_fragment_chunker.hpp"
#include "umbra/interfaces/i_fragment_reassembler.hpp"
#include "umbra/interfaces/i_transport.hpp"
#include "umbra/protocol/channel.hpp"
#include "umbra/protocol/nonce.hpp"
#include "umbra/security/authorization_policy.hpp"
#include <asio/io_context.hpp>
#include <asio/strand.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace umbra::protocol {

/**
 * @brief Address-to-channel map with on-demand handshakes and idle teardown
 *
 * All registry state lives on one asio strand. Public calls post to it and
 * return immediately; results arrive through the supplied callback, also on
 * the strand. Nothing blocks waiting for a peer.
 *
 * Outbound: GetOrCreate/Send reuse the live channel for an address or start
 * a handshake. Callers arriving while one is in flight join it, so there is
 * at most one handshake per address.
 *
 * Inbound: OnReceive answers handshake requests (responder role), completes
 * in-flight attempts from their replies (initiator role) and routes fragment
 * frames by connection id.
 *
 * Each channel has an idle timer. Every authenticated fragment in either
 * direction pushes it back; on expiry the channel is dropped from every
 * index and its key wiped.
 */
class ChannelRegistry : public std::enable_shared_from_this<ChannelRegistry> {
public:
    using ChannelCallback = std::function<void(Result<std::shared_ptr<Channel>, ProtocolFailure>)>;
    using SendCallback = std::function<void(Result<Unit, ProtocolFailure>)>;

    struct Collaborators {
        std::shared_ptr<ITransport> transport;
        std::shared_ptr<IFragmentChunker> chunker;
        std::shared_ptr<IFragmentReassembler> reassembler;
        std::shared_ptr<IChannelEventHandler> event_handler;
    };

    /**
     * @brief Build a registry bound to io_context
     *
     * transport is required. Without a chunker every payload is sent as a
     * single fragment. Without a reassembler accepted plaintext is dropped.
     */
    [[nodiscard]] static Result<std::shared_ptr<ChannelRegistry>, ProtocolFailure> Create(
        asio::io_context& io_context,
        identity::StaticIdentity identity,
        std::shared_ptr<const security::AuthorizationPolicy> policy,
        Collaborators collaborators,
        const configuration::ChannelConfig& config = configuration::ChannelConfig::Default());

    void GetOrCreate(std::string peer_address, ChannelCallback callback);

    // Chunk, seal and emit. callback runs once every fragment is handed to the transport;
    // if any piece fails to seal, nothing is sent.
    void Send(std::string peer_address, std::vector<uint8_t> payload, SendCallback callback);

    // Reply path for channels this registry accepted as responder.
    void SendOnConnection(const ConnectionId& connection_id, std::vector<uint8_t> payload, SendCallback callback);

    void OnReceive(std::string from_address, std::vector<uint8_t> bytes);

    // Abandon the in-flight attempt; its waiters get Cancelled.
    void Cancel(std::string peer_address);

    // Tear down every channel to or from peer_address.
    void Close(std::string peer_address);

    void Shutdown();

    void Find(std::string peer_address, std::function<void(std::shared_ptr<Channel>)> callback);
    void FindByConnection(const ConnectionId& connection_id, std::function<void(std::shared_ptr<Channel>)> callback);
    void ChannelCount(std::function<void(size_t)> callback);
    void PendingHandshakeCount(std::function<void(size_t)> callback);

    [[nodiscard]] const PublicKey& LocalPublicKey() const noexcept { return identity_.GetPublicKey(); }
    [[nodiscard]] const configuration::ChannelConfig& Config() const noexcept { return config_; }

    ChannelRegistry(const ChannelRegistry&) = delete;
    ChannelRegistry& operator=(const ChannelRegistry&) = delete;
    ~ChannelRegistry();

private:
    struct Entry;
    struct PendingHandshake;

    // (from address, client ephemeral id)
    using RequestKey = std::pair<std::string, std::string>;

    // A request this registry answered; a retransmission gets the same reply.
    struct AcceptedRequest {
        ConnectionId connection_id{};
        std::string ephemeral_public;
        std::vector<uint8_t> reply_bytes;
    };

    ChannelRegistry(
        asio::io_context& io_context,
        identity::StaticIdentity identity,
        std::shared_ptr<const security::AuthorizationPolicy> policy,
        Collaborators collaborators,
        std::shared_ptr<NonceSource> nonce_source,
        const configuration::ChannelConfig& config);

    void DoGetOrCreate(const std::string& peer_address, ChannelCallback callback);
    void StartHandshake(const std::string& peer_address, ChannelCallback callback);
    void FailPending(const std::string& peer_address, uint64_t attempt_id, const ProtocolFailure& failure);

    void HandleHandshakeRequest(const std::string& from_address, const umbra::proto::protocol::HandshakeRequest& request);
    void HandleHandshakeReply(const std::string& from_address, const umbra::proto::protocol::HandshakeReply& reply);
    void HandleFragment(const std::string& from_address, const umbra::proto::protocol::FragmentFrame& frame);
    // ends_pending_attempt: an unreadable envelope also fails the attempt waiting on that address.
    void RejectEnvelope(const std::string& from_address, const ProtocolFailure& failure, bool ends_pending_attempt = false);

    Result<std::shared_ptr<Entry>, ProtocolFailure> Register(
        ChannelKeys keys, const std::string& peer_address, ChannelRole role);
    void ArmIdleTimer(const std::shared_ptr<Entry>& entry);
    void OnIdleTimer(const ConnectionId& connection_id);
    void TearDown(std::shared_ptr<Entry> entry, ChannelCloseReason reason);

    void SealAndEmit(const std::shared_ptr<Channel>& channel, std::span<const uint8_t> payload, const SendCallback& callback);

    asio::strand<asio::io_context::executor_type> strand_;
    identity::StaticIdentity identity_;
    std::shared_ptr<const security::AuthorizationPolicy> policy_;
    Collaborators collaborators_;
    std::shared_ptr<NonceSource> nonce_source_;
    const configuration::ChannelConfig config_;

    std::unordered_map<std::string, std::shared_ptr<Entry>> by_address_;
    std::map<ConnectionId, std::shared_ptr<Entry>> by_connection_;
    std::unordered_map<std::string, std::unique_ptr<PendingHandshake>> pending_;
    std::map<RequestKey, AcceptedRequest> accepted_requests_;
    uint64_t next_attempt_id_ = 0;
    bool shut_down_ = false;
};

}  // namespace umbra::protocol
