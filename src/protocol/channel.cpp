#include "umbra/protocol/channel.hpp"
#include "umbra/debug/channel_logger.hpp"

namespace umbra::protocol {
    using crypto::Fragment;
    using crypto::FragmentCipher;

    namespace {
        debug::Side LogSide(const ChannelRole role) {
            return role == ChannelRole::Initiator ? debug::Side::Initiator : debug::Side::Responder;
        }
    }

    Channel::Channel(
        ChannelKeys keys,
        std::string peer_address,
        const ChannelRole role,
        std::shared_ptr<NonceSource> nonce_source,
        const configuration::ChannelConfig& config)
        : connection_id_(keys.connection_id)
        , peer_public_key_(keys.peer_public_key)
        , peer_address_(std::move(peer_address))
        , role_(role)
        , nonce_source_(std::move(nonce_source))
        , sealed_log_(config.replay_window)
        , shared_key_(std::move(keys.shared_key))
        , last_activity_(Clock::now().time_since_epoch().count()) {
        if (config.reject_duplicate_fragments) {
            replay_guard_ = std::make_unique<security::ReplayProtection>(config.replay_window);
        }
    }

    Channel::~Channel() {
        Close();
    }

    Result<std::shared_ptr<Channel>, ProtocolFailure> Channel::Create(
        ChannelKeys keys,
        std::string peer_address,
        const ChannelRole role,
        std::shared_ptr<NonceSource> nonce_source,
        const configuration::ChannelConfig& config) {

        if (keys.shared_key.IsInvalid() || keys.shared_key.Size() != kSharedKeyBytes) {
            return Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Channel requires a 32-byte shared key"));
        }
        if (!nonce_source) {
            return Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Channel requires a nonce source"));
        }
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::shared_ptr<Channel>, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
        }
        std::shared_ptr<Channel> channel(new Channel(
            std::move(keys), std::move(peer_address), role, std::move(nonce_source), config));
        UMBRA_LOG_ID(LogSide(role), "CHANNEL", "opened", channel->connection_id_);
        return Result<std::shared_ptr<Channel>, ProtocolFailure>::Ok(std::move(channel));
    }

    Result<Fragment, ProtocolFailure> Channel::Seal(std::span<const uint8_t> plaintext) {
        std::lock_guard guard(lock_);
        if (closed_) {
            return Result<Fragment, ProtocolFailure>::Err(
                ProtocolFailure::ObjectDisposed(std::string(ErrorMessages::CHANNEL_CLOSED)));
        }
        auto seq = nonce_source_->Next();
        if (seq.IsErr()) {
            return Result<Fragment, ProtocolFailure>::Err(std::move(seq).UnwrapErr());
        }
        auto fragment = FragmentCipher::Encrypt(shared_key_, seq.Unwrap(), plaintext);
        if (fragment.IsOk()) {
            sealed_log_.Record(seq.Unwrap());
            sealed_.fetch_add(1, std::memory_order_relaxed);
            Touch();
        }
        return fragment;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Channel::Open(const Fragment& fragment) {
        std::lock_guard guard(lock_);
        if (closed_) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::ObjectDisposed(std::string(ErrorMessages::CHANNEL_CLOSED)));
        }
        auto plaintext = FragmentCipher::Decrypt(shared_key_, fragment);
        if (plaintext.IsErr()) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return plaintext;
        }
        if (sealed_log_.Contains(fragment.Seq())) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::ReplayAttack("Fragment was sealed by this channel"));
        }
        if (replay_guard_) {
            if (auto fresh = replay_guard_->CheckAndRecord(fragment.Seq()); fresh.IsErr()) {
                rejected_.fetch_add(1, std::memory_order_relaxed);
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(fresh).UnwrapErr());
            }
        }
        opened_.fetch_add(1, std::memory_order_relaxed);
        Touch();
        return plaintext;
    }

    void Channel::Touch() noexcept {
        last_activity_.store(Clock::now().time_since_epoch().count(), std::memory_order_release);
    }

    Channel::Clock::time_point Channel::LastActivity() const noexcept {
        return Clock::time_point(Clock::duration(last_activity_.load(std::memory_order_acquire)));
    }

    void Channel::Close() noexcept {
        std::lock_guard guard(lock_);
        if (closed_) {
            return;
        }
        closed_ = true;
        shared_key_.Wipe();
        UMBRA_LOG_ID(LogSide(role_), "CHANNEL", "closed", connection_id_);
    }

    bool Channel::IsClosed() const noexcept {
        std::lock_guard guard(lock_);
        return closed_;
    }

#ifdef UMBRA_TEST_BUILD
    Result<std::vector<uint8_t>, ProtocolFailure> Channel::DebugGetSharedKey() const {
        std::lock_guard guard(lock_);
        auto bytes = shared_key_.ReadBytes(kSharedKeyBytes);
        if (bytes.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::ObjectDisposed(bytes.UnwrapErr().message));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes).Unwrap());
    }
#endif

}
