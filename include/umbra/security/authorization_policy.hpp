#pragma once
#include "umbra/core/result.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include <cstdint>
#include <set>
#include <span>
#include <string_view>
#include <vector>

namespace umbra::protocol::security {

using crypto::PublicKey;

/**
 * @brief Set of peer public keys allowed to complete a handshake
 *
 * Consulted by both roles: the initiator checks the responder's static key,
 * the responder checks the initiator's. The set is immutable once built, so
 * a shared instance can be read from any thread.
 */
class AuthorizationPolicy {
public:
    // Accept any well-formed peer key.
    [[nodiscard]] static AuthorizationPolicy AllowAll();

    [[nodiscard]] static Result<AuthorizationPolicy, ProtocolFailure> Members(
        const std::vector<std::vector<uint8_t>>& public_keys);

    [[nodiscard]] static AuthorizationPolicy Members(const std::vector<PublicKey>& public_keys);

    [[nodiscard]] bool RequiresMembership() const noexcept { return requires_membership_; }

    [[nodiscard]] bool IsMember(std::span<const uint8_t> public_key) const;

    /**
     * @brief Ok when the key may complete a handshake, Authorization failure otherwise
     *
     * @param role Which peer the key belongs to, for the error message
     */
    [[nodiscard]] Result<Unit, ProtocolFailure> Authorize(
        std::span<const uint8_t> public_key,
        std::string_view role) const;

    [[nodiscard]] size_t Size() const noexcept { return members_.size(); }

private:
    AuthorizationPolicy(std::set<PublicKey> members, bool requires_membership);

    std::set<PublicKey> members_;
    bool requires_membership_;
};

} // namespace umbra::protocol::security
