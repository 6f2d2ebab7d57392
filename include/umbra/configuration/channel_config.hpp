#pragma once

#include "umbra/core/constants.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/core/result.hpp"
#include "umbra/enums/channel_close_reason.hpp"
#include <chrono>
#include <cstdint>
#include <fmt/core.h>

namespace umbra::protocol::configuration {

/**
 * @brief Lifecycle and failure-handling knobs for a ChannelRegistry
 *
 * **Timers**:
 * - idle_timeout: a channel without inbound or outbound traffic for this long
 *   is torn down and its key wiped. The next send to that peer runs a new
 *   handshake.
 * - handshake_timeout: an attempt with no reply after this long fails every
 *   waiter with Timeout.
 *
 * **Fragment failures**:
 * - DropFragment (default): a fragment whose tag does not verify is dropped
 *   and reported; the channel stays up.
 * - TearDownChannel: the first forged fragment closes the channel.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = ChannelConfig::Default();
 * config.idle_timeout = std::chrono::seconds(5);
 * if (auto valid = config.Validate(); valid.IsErr()) { ... }
 * ```
 */
struct ChannelConfig {
    std::chrono::milliseconds idle_timeout = ChannelDefaults::IDLE_TIMEOUT;
    std::chrono::milliseconds handshake_timeout = ChannelDefaults::HANDSHAKE_TIMEOUT;
    FragmentFailurePolicy fragment_failure_policy = FragmentFailurePolicy::DropFragment;
    bool reject_duplicate_fragments = true;
    // Number of most recent seqs remembered per channel.
    uint32_t replay_window = ChannelDefaults::REPLAY_WINDOW;

    [[nodiscard]] static ChannelConfig Default() noexcept {
        return ChannelConfig{};
    }

    // Forged fragments close the channel.
    [[nodiscard]] static ChannelConfig Strict() noexcept {
        ChannelConfig config;
        config.fragment_failure_policy = FragmentFailurePolicy::TearDownChannel;
        return config;
    }

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const {
        if (idle_timeout.count() <= 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("idle_timeout must be positive"));
        }
        if (handshake_timeout.count() <= 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("handshake_timeout must be positive"));
        }
        if (reject_duplicate_fragments &&
            (replay_window == 0 || replay_window > ChannelDefaults::MAX_REPLAY_WINDOW)) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    fmt::format("replay_window must be in [1, {}], got {}",
                                ChannelDefaults::MAX_REPLAY_WINDOW, replay_window)));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    [[nodiscard]] bool operator==(const ChannelConfig& other) const noexcept = default;
};

} // namespace umbra::protocol::configuration
