#pragma once
#include "umbra/configuration/channel_config.hpp"
#include "umbra/core/constants.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/core/result.hpp"
#include "umbra/crypto/fragment_cipher.hpp"
#include "umbra/enums/channel_role.hpp"
#include "umbra/protocol/handshake.hpp"
#include "umbra/protocol/nonce.hpp"
#include "umbra/security/replay_protection.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace umbra::protocol {

/**
 * @brief One live secure session with a peer
 *
 * Owns the EKey for as long as the channel is open. Close() wipes it; every
 * fragment sealed under it is undecryptable from then on, by both peers.
 *
 * Seal/Open may be called from any thread. A per-channel mutex serializes
 * them with Close(), so no fragment is ever sealed or opened with a wiped
 * key. Touch() and LastActivity() are lock-free.
 */
class Channel {
public:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] static Result<std::shared_ptr<Channel>, ProtocolFailure> Create(
        ChannelKeys keys,
        std::string peer_address,
        ChannelRole role,
        std::shared_ptr<NonceSource> nonce_source,
        const configuration::ChannelConfig& config);

    /**
     * @brief Encrypt one fragment under a freshly drawn seq
     *
     * ObjectDisposed after Close().
     */
    [[nodiscard]] Result<crypto::Fragment, ProtocolFailure> Seal(std::span<const uint8_t> plaintext);

    /**
     * @brief Authenticate, replay-check and decrypt one fragment
     *
     * Authentication on tag mismatch, ReplayAttack on a seq seen before or
     * on a fragment this channel sealed itself (both directions share the
     * EKey, so a reflected fragment authenticates), ObjectDisposed after
     * Close(). Only an accepted fragment counts as
     * activity.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Open(const crypto::Fragment& fragment);

    void Touch() noexcept;
    [[nodiscard]] Clock::time_point LastActivity() const noexcept;

    // Wipes the key. Idempotent.
    void Close() noexcept;
    [[nodiscard]] bool IsClosed() const noexcept;

    [[nodiscard]] const ConnectionId& GetConnectionId() const noexcept { return connection_id_; }
    [[nodiscard]] const std::string& PeerAddress() const noexcept { return peer_address_; }
    [[nodiscard]] ChannelRole Role() const noexcept { return role_; }
    [[nodiscard]] const PublicKey& PeerPublicKey() const noexcept { return peer_public_key_; }

    [[nodiscard]] uint64_t FragmentsSealed() const noexcept { return sealed_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t FragmentsOpened() const noexcept { return opened_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t FragmentsRejected() const noexcept { return rejected_.load(std::memory_order_relaxed); }

#ifdef UMBRA_TEST_BUILD
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DebugGetSharedKey() const;
#endif

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    ~Channel();

private:
    Channel(
        ChannelKeys keys,
        std::string peer_address,
        ChannelRole role,
        std::shared_ptr<NonceSource> nonce_source,
        const configuration::ChannelConfig& config);

    const ConnectionId connection_id_;
    const PublicKey peer_public_key_;
    const std::string peer_address_;
    const ChannelRole role_;
    std::shared_ptr<NonceSource> nonce_source_;
    std::unique_ptr<security::ReplayProtection> replay_guard_;
    // Most recent seqs drawn by Seal().
    security::ReplayProtection sealed_log_;

    mutable std::mutex lock_;
    SecureMemoryHandle shared_key_;
    bool closed_ = false;

    std::atomic<Clock::rep> last_activity_;
    std::atomic<uint64_t> sealed_{0};
    std::atomic<uint64_t> opened_{0};
    std::atomic<uint64_t> rejected_{0};
};

}  // namespace umbra::protocol
