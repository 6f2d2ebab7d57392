#pragma once
#include "umbra/core/result.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/protocol/nonce.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>

namespace umbra::protocol::security {

/**
 * @brief Per-channel record of accepted fragment seqs
 *
 * Keeps the window_size highest seqs seen. A seq already in the window is a
 * replay; a seq at or below the highest evicted one is too old to judge and
 * is rejected as well. Fragments may otherwise arrive in any order.
 */
class ReplayProtection {
public:
    explicit ReplayProtection(uint32_t window_size);
    ReplayProtection(const ReplayProtection&) = delete;
    ReplayProtection& operator=(const ReplayProtection&) = delete;
    ReplayProtection(ReplayProtection&&) = delete;
    ReplayProtection& operator=(ReplayProtection&&) = delete;
    ~ReplayProtection() = default;

    // Only call for fragments that already authenticated.
    Result<Unit, ProtocolFailure> CheckAndRecord(const Nonce& seq);

    // Unconditional insert, for seqs this side drew itself.
    void Record(const Nonce& seq);

    // Window membership only; the eviction floor is not consulted.
    [[nodiscard]] bool Contains(const Nonce& seq) const;

    [[nodiscard]] size_t GetTrackedCount() const;

    [[nodiscard]] uint32_t GetWindowSize() const noexcept { return window_size_; }

    void Reset();

private:
    void EvictOverflow();

    const uint32_t window_size_;
    mutable std::mutex lock_;
    std::set<Nonce> seen_;
    std::optional<Nonce> floor_;
};

}
