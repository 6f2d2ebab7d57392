#include "umbra/protocol/channel_registry.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include "umbra/debug/channel_logger.hpp"
#include <asio/bind_executor.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <optional>

namespace umbra::protocol {
    using crypto::Fragment;
    using crypto::SodiumInterop;
    using umbra::proto::protocol::ChannelEnvelope;

    struct ChannelRegistry::Entry {
        Entry(std::shared_ptr<Channel> c, const asio::strand<asio::io_context::executor_type>& strand)
            : channel(std::move(c))
            , idle_timer(strand) {
        }

        std::shared_ptr<Channel> channel;
        asio::steady_timer idle_timer;
        // Set for responder channels.
        std::optional<RequestKey> request_key;
    };

    struct ChannelRegistry::PendingHandshake {
        explicit PendingHandshake(const asio::strand<asio::io_context::executor_type>& strand)
            : timeout(strand) {
        }

        uint64_t attempt_id = 0;
        std::unique_ptr<HandshakeInitiator> initiator;
        std::vector<ChannelCallback> waiters;
        asio::steady_timer timeout;
    };

    namespace {
        Result<std::vector<uint8_t>, ProtocolFailure> EncodeEnvelope(const ChannelEnvelope& envelope) {
            std::string output;
            if (!envelope.SerializeToString(&output)) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::Encode("Failed to serialize channel envelope"));
            }
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
                std::vector<uint8_t>(output.begin(), output.end()));
        }

        std::string AsField(std::span<const uint8_t> bytes) {
            return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
        }

        std::span<const uint8_t> AsSpan(const std::string& field) {
            return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
        }
    }

    ChannelRegistry::ChannelRegistry(
        asio::io_context& io_context,
        identity::StaticIdentity identity,
        std::shared_ptr<const security::AuthorizationPolicy> policy,
        Collaborators collaborators,
        std::shared_ptr<NonceSource> nonce_source,
        const configuration::ChannelConfig& config)
        : strand_(asio::make_strand(io_context))
        , identity_(std::move(identity))
        , policy_(std::move(policy))
        , collaborators_(std::move(collaborators))
        , nonce_source_(std::move(nonce_source))
        , config_(config) {
    }

    ChannelRegistry::~ChannelRegistry() {
        for (auto& [connection_id, entry] : by_connection_) {
            entry->channel->Close();
        }
    }

    Result<std::shared_ptr<ChannelRegistry>, ProtocolFailure> ChannelRegistry::Create(
        asio::io_context& io_context,
        identity::StaticIdentity identity,
        std::shared_ptr<const security::AuthorizationPolicy> policy,
        Collaborators collaborators,
        const configuration::ChannelConfig& config) {

        if (!collaborators.transport) {
            return Result<std::shared_ptr<ChannelRegistry>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("ChannelRegistry requires a transport"));
        }
        if (!policy) {
            return Result<std::shared_ptr<ChannelRegistry>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("ChannelRegistry requires an authorization policy"));
        }
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::shared_ptr<ChannelRegistry>, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
        }
        auto nonce_source = NonceSource::Global();
        if (nonce_source.IsErr()) {
            return Result<std::shared_ptr<ChannelRegistry>, ProtocolFailure>::Err(std::move(nonce_source).UnwrapErr());
        }
        return Result<std::shared_ptr<ChannelRegistry>, ProtocolFailure>::Ok(
            std::shared_ptr<ChannelRegistry>(new ChannelRegistry(
                io_context, std::move(identity), std::move(policy), std::move(collaborators),
                std::move(nonce_source).Unwrap(), config)));
    }

    // ========================================================================
    // Public entry points: each hops onto the strand
    // ========================================================================

    void ChannelRegistry::GetOrCreate(std::string peer_address, ChannelCallback callback) {
        asio::post(strand_, [self = shared_from_this(), peer_address = std::move(peer_address),
                             callback = std::move(callback)]() mutable {
            self->DoGetOrCreate(peer_address, std::move(callback));
        });
    }

    void ChannelRegistry::Send(std::string peer_address, std::vector<uint8_t> payload, SendCallback callback) {
        asio::post(strand_, [self = shared_from_this(), peer_address = std::move(peer_address),
                             payload = std::move(payload), callback = std::move(callback)]() mutable {
            ChannelRegistry* registry = self.get();
            registry->DoGetOrCreate(peer_address,
                [registry, payload = std::move(payload), callback = std::move(callback)](
                    Result<std::shared_ptr<Channel>, ProtocolFailure> channel) {
                    if (channel.IsErr()) {
                        callback(Result<Unit, ProtocolFailure>::Err(std::move(channel).UnwrapErr()));
                        return;
                    }
                    registry->SealAndEmit(channel.Unwrap(), payload, callback);
                });
        });
    }

    void ChannelRegistry::SendOnConnection(
        const ConnectionId& connection_id,
        std::vector<uint8_t> payload,
        SendCallback callback) {
        asio::post(strand_, [self = shared_from_this(), connection_id,
                             payload = std::move(payload), callback = std::move(callback)]() {
            const auto it = self->by_connection_.find(connection_id);
            if (it == self->by_connection_.end()) {
                callback(Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidState("No live channel for connection id")));
                return;
            }
            self->SealAndEmit(it->second->channel, payload, callback);
        });
    }

    void ChannelRegistry::OnReceive(std::string from_address, std::vector<uint8_t> bytes) {
        asio::post(strand_, [self = shared_from_this(), from_address = std::move(from_address),
                             bytes = std::move(bytes)]() {
            if (bytes.size() > kMaxEnvelopeBytes) {
                self->RejectEnvelope(from_address, ProtocolFailure::ProtocolViolation(
                    fmt::format("Envelope of {} bytes exceeds limit", bytes.size())));
                return;
            }
            ChannelEnvelope envelope;
            if (!envelope.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
                self->RejectEnvelope(from_address,
                    ProtocolFailure::ProtocolViolation("Malformed channel envelope"), true);
                return;
            }
            switch (envelope.body_case()) {
                case ChannelEnvelope::kHandshakeRequest:
                    self->HandleHandshakeRequest(from_address, envelope.handshake_request());
                    break;
                case ChannelEnvelope::kHandshakeReply:
                    self->HandleHandshakeReply(from_address, envelope.handshake_reply());
                    break;
                case ChannelEnvelope::kFragment:
                    self->HandleFragment(from_address, envelope.fragment());
                    break;
                default:
                    self->RejectEnvelope(from_address,
                        ProtocolFailure::ProtocolViolation("Channel envelope has no body"), true);
                    break;
            }
        });
    }

    void ChannelRegistry::Cancel(std::string peer_address) {
        asio::post(strand_, [self = shared_from_this(), peer_address = std::move(peer_address)]() {
            const auto it = self->pending_.find(peer_address);
            if (it == self->pending_.end()) {
                return;
            }
            self->FailPending(peer_address, it->second->attempt_id,
                ProtocolFailure::Cancelled("Handshake cancelled by caller"));
        });
    }

    void ChannelRegistry::Close(std::string peer_address) {
        asio::post(strand_, [self = shared_from_this(), peer_address = std::move(peer_address)]() {
            std::vector<std::shared_ptr<Entry>> matching;
            for (const auto& [connection_id, entry] : self->by_connection_) {
                if (entry->channel->PeerAddress() == peer_address) {
                    matching.push_back(entry);
                }
            }
            for (auto& entry : matching) {
                self->TearDown(std::move(entry), ChannelCloseReason::Closed);
            }
        });
    }

    void ChannelRegistry::Shutdown() {
        asio::post(strand_, [self = shared_from_this()]() {
            self->shut_down_ = true;
            std::vector<std::pair<std::string, uint64_t>> attempts;
            for (const auto& [address, pending] : self->pending_) {
                attempts.emplace_back(address, pending->attempt_id);
            }
            for (const auto& [address, attempt_id] : attempts) {
                self->FailPending(address, attempt_id,
                    ProtocolFailure::Cancelled(std::string(ErrorMessages::REGISTRY_SHUT_DOWN)));
            }
            std::vector<std::shared_ptr<Entry>> entries;
            for (const auto& [connection_id, entry] : self->by_connection_) {
                entries.push_back(entry);
            }
            for (auto& entry : entries) {
                self->TearDown(std::move(entry), ChannelCloseReason::Shutdown);
            }
        });
    }

    void ChannelRegistry::Find(std::string peer_address, std::function<void(std::shared_ptr<Channel>)> callback) {
        asio::post(strand_, [self = shared_from_this(), peer_address = std::move(peer_address),
                             callback = std::move(callback)]() {
            const auto it = self->by_address_.find(peer_address);
            callback(it == self->by_address_.end() ? nullptr : it->second->channel);
        });
    }

    void ChannelRegistry::FindByConnection(
        const ConnectionId& connection_id,
        std::function<void(std::shared_ptr<Channel>)> callback) {
        asio::post(strand_, [self = shared_from_this(), connection_id, callback = std::move(callback)]() {
            const auto it = self->by_connection_.find(connection_id);
            callback(it == self->by_connection_.end() ? nullptr : it->second->channel);
        });
    }

    void ChannelRegistry::ChannelCount(std::function<void(size_t)> callback) {
        asio::post(strand_, [self = shared_from_this(), callback = std::move(callback)]() {
            callback(self->by_connection_.size());
        });
    }

    void ChannelRegistry::PendingHandshakeCount(std::function<void(size_t)> callback) {
        asio::post(strand_, [self = shared_from_this(), callback = std::move(callback)]() {
            callback(self->pending_.size());
        });
    }

    // ========================================================================
    // Initiator side
    // ========================================================================

    void ChannelRegistry::DoGetOrCreate(const std::string& peer_address, ChannelCallback callback) {
        if (shut_down_) {
            callback(Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(std::string(ErrorMessages::REGISTRY_SHUT_DOWN))));
            return;
        }

        if (const auto it = by_address_.find(peer_address); it != by_address_.end()) {
            auto entry = it->second;
            const bool expired = Channel::Clock::now() - entry->channel->LastActivity() >= config_.idle_timeout;
            if (!expired && !entry->channel->IsClosed()) {
                callback(Result<std::shared_ptr<Channel>, ProtocolFailure>::Ok(entry->channel));
                return;
            }
            TearDown(std::move(entry), ChannelCloseReason::IdleTimeout);
        }

        if (const auto it = pending_.find(peer_address); it != pending_.end()) {
            it->second->waiters.push_back(std::move(callback));
            return;
        }

        StartHandshake(peer_address, std::move(callback));
    }

    void ChannelRegistry::StartHandshake(const std::string& peer_address, ChannelCallback callback) {
        auto initiator = HandshakeInitiator::Start(identity_, policy_);
        if (initiator.IsErr()) {
            if (collaborators_.event_handler) {
                collaborators_.event_handler->OnHandshakeFailed(peer_address, initiator.UnwrapErr());
            }
            callback(Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(std::move(initiator).UnwrapErr()));
            return;
        }

        ChannelEnvelope envelope;
        *envelope.mutable_handshake_request() = initiator.Unwrap()->Request();
        auto bytes = EncodeEnvelope(envelope);
        if (bytes.IsErr()) {
            callback(Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(std::move(bytes).UnwrapErr()));
            return;
        }

        auto pending = std::make_unique<PendingHandshake>(strand_);
        pending->attempt_id = ++next_attempt_id_;
        pending->initiator = std::move(initiator).Unwrap();
        pending->waiters.push_back(std::move(callback));
        pending->timeout.expires_after(config_.handshake_timeout);
        pending->timeout.async_wait(asio::bind_executor(strand_,
            [weak = weak_from_this(), peer_address, attempt_id = pending->attempt_id](const std::error_code& ec) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                if (auto self = weak.lock()) {
                    self->FailPending(peer_address, attempt_id,
                        ProtocolFailure::Timeout("Handshake reply not received in time"));
                }
            }));
        pending_.emplace(peer_address, std::move(pending));

        UMBRA_LOG_MSG(debug::Side::Initiator, "REGISTRY", "handshake started: " + peer_address);
        collaborators_.transport->Send(peer_address, std::move(bytes).Unwrap());
    }

    void ChannelRegistry::FailPending(
        const std::string& peer_address,
        const uint64_t attempt_id,
        const ProtocolFailure& failure) {
        const auto it = pending_.find(peer_address);
        if (it == pending_.end() || it->second->attempt_id != attempt_id) {
            return;
        }
        std::unique_ptr<PendingHandshake> pending = std::move(it->second);
        pending_.erase(it);
        pending->timeout.cancel();
        pending->initiator.reset();

        UMBRA_LOG_MSG(debug::Side::Initiator, "REGISTRY", "handshake failed: " + failure.message);
        if (collaborators_.event_handler) {
            collaborators_.event_handler->OnHandshakeFailed(peer_address, failure);
        }
        for (auto& waiter : pending->waiters) {
            waiter(Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(failure));
        }
    }

    void ChannelRegistry::HandleHandshakeReply(
        const std::string& from_address,
        const umbra::proto::protocol::HandshakeReply& reply) {

        const auto it = pending_.find(from_address);
        if (it == pending_.end()) {
            RejectEnvelope(from_address,
                ProtocolFailure::ProtocolViolation("Handshake reply with no attempt in flight"));
            return;
        }
        if (reply.client_ephemeral_id() != AsField(it->second->initiator->ClientEphemeralId())) {
            RejectEnvelope(from_address,
                ProtocolFailure::ProtocolViolation("Handshake reply for an abandoned attempt"));
            return;
        }

        std::unique_ptr<PendingHandshake> pending = std::move(it->second);
        pending_.erase(it);
        pending->timeout.cancel();

        auto keys = pending->initiator->Finish(reply);
        pending->initiator.reset();

        const auto outcome = [&]() -> Result<std::shared_ptr<Channel>, ProtocolFailure> {
            if (keys.IsErr()) {
                return Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(std::move(keys).UnwrapErr());
            }
            auto entry = Register(std::move(keys).Unwrap(), from_address, ChannelRole::Initiator);
            if (entry.IsErr()) {
                return Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(std::move(entry).UnwrapErr());
            }
            by_address_[from_address] = entry.Unwrap();
            return Result<std::shared_ptr<Channel>, ProtocolFailure>::Ok(entry.Unwrap()->channel);
        }();

        if (outcome.IsErr() && collaborators_.event_handler) {
            collaborators_.event_handler->OnHandshakeFailed(from_address, outcome.UnwrapErr());
        }
        for (auto& waiter : pending->waiters) {
            waiter(outcome);
        }
    }

    // ========================================================================
    // Responder side and fragment routing
    // ========================================================================

    void ChannelRegistry::HandleHandshakeRequest(
        const std::string& from_address,
        const umbra::proto::protocol::HandshakeRequest& request) {

        if (shut_down_) {
            return;
        }
        RequestKey request_key{from_address, request.client_ephemeral_id()};
        if (const auto it = accepted_requests_.find(request_key); it != accepted_requests_.end()) {
            if (it->second.ephemeral_public != request.ephemeral_public()) {
                RejectEnvelope(from_address,
                    ProtocolFailure::ProtocolViolation("Handshake request reuses a client ephemeral id"));
                return;
            }
            UMBRA_LOG_MSG(debug::Side::Responder, "REGISTRY", "handshake request repeated: " + from_address);
            collaborators_.transport->Send(from_address, it->second.reply_bytes);
            return;
        }

        auto response = HandshakeResponder::Respond(request, identity_, *policy_);
        if (response.IsErr()) {
            UMBRA_LOG_MSG(debug::Side::Responder, "REGISTRY", "handshake rejected: " + response.UnwrapErr().message);
            if (collaborators_.event_handler) {
                collaborators_.event_handler->OnHandshakeFailed(from_address, response.UnwrapErr());
            }
            return;
        }
        auto [reply, keys] = std::move(response).Unwrap();

        auto entry = Register(std::move(keys), from_address, ChannelRole::Responder);
        if (entry.IsErr()) {
            if (collaborators_.event_handler) {
                collaborators_.event_handler->OnHandshakeFailed(from_address, entry.UnwrapErr());
            }
            return;
        }

        ChannelEnvelope envelope;
        *envelope.mutable_handshake_reply() = std::move(reply);
        auto bytes = EncodeEnvelope(envelope);
        if (bytes.IsErr()) {
            TearDown(entry.Unwrap(), ChannelCloseReason::Closed);
            return;
        }
        entry.Unwrap()->request_key = request_key;
        accepted_requests_[request_key] = AcceptedRequest{
            entry.Unwrap()->channel->GetConnectionId(), request.ephemeral_public(), bytes.Unwrap()};
        collaborators_.transport->Send(from_address, std::move(bytes).Unwrap());
    }

    void ChannelRegistry::HandleFragment(
        const std::string& from_address,
        const umbra::proto::protocol::FragmentFrame& frame) {

        if (frame.connection_id().size() != kConnectionIdBytes) {
            RejectEnvelope(from_address, ProtocolFailure::ProtocolViolation("Fragment connection id has wrong size"));
            return;
        }
        ConnectionId connection_id{};
        std::copy(frame.connection_id().begin(), frame.connection_id().end(), connection_id.begin());

        const auto it = by_connection_.find(connection_id);
        if (it == by_connection_.end()) {
            RejectEnvelope(from_address, ProtocolFailure::ProtocolViolation("Fragment for unknown connection"));
            return;
        }
        const std::shared_ptr<Entry> entry = it->second;
        const auto& channel = entry->channel;

        auto fragment = Fragment::FromWire(AsSpan(frame.seq()), AsSpan(frame.ciphertext()), AsSpan(frame.auth_tag()));
        if (fragment.IsErr()) {
            if (collaborators_.event_handler) {
                collaborators_.event_handler->OnFragmentRejected(connection_id, channel->PeerAddress(), fragment.UnwrapErr());
            }
            return;
        }

        auto plaintext = channel->Open(fragment.Unwrap());
        if (plaintext.IsErr()) {
            const ProtocolFailure& failure = plaintext.UnwrapErr();
            if (collaborators_.event_handler) {
                collaborators_.event_handler->OnFragmentRejected(connection_id, channel->PeerAddress(), failure);
            }
            if (failure.type == ProtocolFailureType::Authentication &&
                config_.fragment_failure_policy == FragmentFailurePolicy::TearDownChannel) {
                TearDown(entry, ChannelCloseReason::AuthenticationFailure);
            }
            return;
        }

        if (collaborators_.reassembler) {
            collaborators_.reassembler->Accept(
                connection_id, channel->PeerAddress(), fragment.Unwrap().Seq(), std::move(plaintext).Unwrap());
        }
    }

    void ChannelRegistry::RejectEnvelope(
        const std::string& from_address,
        const ProtocolFailure& failure,
        const bool ends_pending_attempt) {
        if (ends_pending_attempt) {
            if (const auto it = pending_.find(from_address); it != pending_.end()) {
                FailPending(from_address, it->second->attempt_id, failure);
                return;
            }
        }
        if (collaborators_.event_handler) {
            collaborators_.event_handler->OnEnvelopeDropped(from_address, failure);
        }
    }

    // ========================================================================
    // Channel lifecycle
    // ========================================================================

    Result<std::shared_ptr<ChannelRegistry::Entry>, ProtocolFailure> ChannelRegistry::Register(
        ChannelKeys keys,
        const std::string& peer_address,
        const ChannelRole role) {

        if (by_connection_.contains(keys.connection_id)) {
            return Result<std::shared_ptr<Entry>, ProtocolFailure>::Err(
                ProtocolFailure::ProtocolViolation("Connection id already in use"));
        }
        auto channel = Channel::Create(std::move(keys), peer_address, role, nonce_source_, config_);
        if (channel.IsErr()) {
            return Result<std::shared_ptr<Entry>, ProtocolFailure>::Err(std::move(channel).UnwrapErr());
        }
        auto entry = std::make_shared<Entry>(std::move(channel).Unwrap(), strand_);
        by_connection_.emplace(entry->channel->GetConnectionId(), entry);
        ArmIdleTimer(entry);

        if (collaborators_.event_handler) {
            collaborators_.event_handler->OnChannelEstablished(entry->channel->GetConnectionId(), peer_address, role);
        }
        return Result<std::shared_ptr<Entry>, ProtocolFailure>::Ok(std::move(entry));
    }

    void ChannelRegistry::ArmIdleTimer(const std::shared_ptr<Entry>& entry) {
        entry->idle_timer.expires_at(entry->channel->LastActivity() + config_.idle_timeout);
        entry->idle_timer.async_wait(asio::bind_executor(strand_,
            [weak = weak_from_this(), connection_id = entry->channel->GetConnectionId()](const std::error_code& ec) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                if (auto self = weak.lock()) {
                    self->OnIdleTimer(connection_id);
                }
            }));
    }

    void ChannelRegistry::OnIdleTimer(const ConnectionId& connection_id) {
        const auto it = by_connection_.find(connection_id);
        if (it == by_connection_.end()) {
            return;
        }
        auto entry = it->second;
        if (Channel::Clock::now() - entry->channel->LastActivity() >= config_.idle_timeout) {
            TearDown(std::move(entry), ChannelCloseReason::IdleTimeout);
            return;
        }
        // Traffic since the timer was armed; wait out the remainder.
        ArmIdleTimer(entry);
    }

    void ChannelRegistry::TearDown(std::shared_ptr<Entry> entry, const ChannelCloseReason reason) {
        const ConnectionId connection_id = entry->channel->GetConnectionId();
        const std::string& peer_address = entry->channel->PeerAddress();

        entry->idle_timer.cancel();
        entry->channel->Close();

        if (const auto it = by_connection_.find(connection_id); it != by_connection_.end() && it->second == entry) {
            by_connection_.erase(it);
        }
        if (const auto it = by_address_.find(peer_address); it != by_address_.end() && it->second == entry) {
            by_address_.erase(it);
        }
        if (entry->request_key) {
            if (const auto it = accepted_requests_.find(*entry->request_key);
                it != accepted_requests_.end() && it->second.connection_id == connection_id) {
                accepted_requests_.erase(it);
            }
        }

        UMBRA_LOG_MSG(debug::Side::Unknown, "REGISTRY",
                      "channel closed (" + std::string(ToString(reason)) + "): " + peer_address);
        if (collaborators_.event_handler) {
            collaborators_.event_handler->OnChannelClosed(connection_id, peer_address, reason);
        }
    }

    void ChannelRegistry::SealAndEmit(
        const std::shared_ptr<Channel>& channel,
        std::span<const uint8_t> payload,
        const SendCallback& callback) {

        std::vector<std::vector<uint8_t>> pieces;
        if (collaborators_.chunker) {
            pieces = collaborators_.chunker->Split(payload);
        } else {
            pieces.emplace_back(payload.begin(), payload.end());
        }

        // Nothing reaches the transport unless every piece sealed.
        std::vector<std::vector<uint8_t>> envelopes;
        envelopes.reserve(pieces.size());
        for (const auto& piece : pieces) {
            auto sealed = channel->Seal(piece);
            if (sealed.IsErr()) {
                callback(Result<Unit, ProtocolFailure>::Err(std::move(sealed).UnwrapErr()));
                return;
            }
            Fragment fragment = std::move(sealed).Unwrap();

            ChannelEnvelope envelope;
            auto* frame = envelope.mutable_fragment();
            frame->set_connection_id(AsField(channel->GetConnectionId()));
            frame->set_seq(AsField(fragment.Seq().Encode()));
            frame->set_auth_tag(AsField(fragment.Tag()));
            frame->set_ciphertext(AsField(fragment.Ciphertext()));

            auto bytes = EncodeEnvelope(envelope);
            if (bytes.IsErr()) {
                callback(Result<Unit, ProtocolFailure>::Err(std::move(bytes).UnwrapErr()));
                return;
            }
            envelopes.push_back(std::move(bytes).Unwrap());
        }
        for (auto& bytes : envelopes) {
            collaborators_.transport->Send(channel->PeerAddress(), std::move(bytes));
        }
        callback(Result<Unit, ProtocolFailure>::Ok(unit));
    }

}
