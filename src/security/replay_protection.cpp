#include "umbra/security/replay_protection.hpp"

namespace umbra::protocol::security {

    ReplayProtection::ReplayProtection(const uint32_t window_size)
        : window_size_(window_size == 0 ? 1 : window_size) {
    }

    Result<Unit, ProtocolFailure> ReplayProtection::CheckAndRecord(const Nonce& seq) {
        std::lock_guard guard(lock_);
        if (floor_.has_value() && seq <= *floor_) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ReplayAttack("Fragment seq too old (below replay window)"));
        }
        if (const auto [it, inserted] = seen_.insert(seq); !inserted) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ReplayAttack("Fragment seq already processed"));
        }
        EvictOverflow();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void ReplayProtection::Record(const Nonce& seq) {
        std::lock_guard guard(lock_);
        seen_.insert(seq);
        EvictOverflow();
    }

    bool ReplayProtection::Contains(const Nonce& seq) const {
        std::lock_guard guard(lock_);
        return seen_.contains(seq);
    }

    void ReplayProtection::EvictOverflow() {
        while (seen_.size() > window_size_) {
            floor_ = *seen_.begin();
            seen_.erase(seen_.begin());
        }
    }

    size_t ReplayProtection::GetTrackedCount() const {
        std::lock_guard guard(lock_);
        return seen_.size();
    }

    void ReplayProtection::Reset() {
        std::lock_guard guard(lock_);
        seen_.clear();
        floor_.reset();
    }
}
