#include "umbra/security/authorization_policy.hpp"
#include "umbra/core/constants.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace umbra::protocol::security {

AuthorizationPolicy::AuthorizationPolicy(std::set<PublicKey> members, const bool requires_membership)
    : members_(std::move(members))
    , requires_membership_(requires_membership) {
}

AuthorizationPolicy AuthorizationPolicy::AllowAll() {
    return AuthorizationPolicy({}, false);
}

Result<AuthorizationPolicy, ProtocolFailure> AuthorizationPolicy::Members(
    const std::vector<std::vector<uint8_t>>& public_keys) {
    std::set<PublicKey> members;
    for (const auto& key : public_keys) {
        if (key.size() != kX25519PublicKeyBytes) {
            return Result<AuthorizationPolicy, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    fmt::format("Authorized key must be {} bytes, got {}",
                                kX25519PublicKeyBytes, key.size())));
        }
        PublicKey entry{};
        std::copy(key.begin(), key.end(), entry.begin());
        members.insert(entry);
    }
    return Result<AuthorizationPolicy, ProtocolFailure>::Ok(
        AuthorizationPolicy(std::move(members), true));
}

AuthorizationPolicy AuthorizationPolicy::Members(const std::vector<PublicKey>& public_keys) {
    return AuthorizationPolicy(std::set<PublicKey>(public_keys.begin(), public_keys.end()), true);
}

bool AuthorizationPolicy::IsMember(std::span<const uint8_t> public_key) const {
    if (public_key.size() != kX25519PublicKeyBytes) {
        return false;
    }
    PublicKey candidate{};
    std::copy(public_key.begin(), public_key.end(), candidate.begin());
    return members_.contains(candidate);
}

Result<Unit, ProtocolFailure> AuthorizationPolicy::Authorize(
    std::span<const uint8_t> public_key,
    std::string_view role) const {
    if (!requires_membership_ || IsMember(public_key)) {
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    return Result<Unit, ProtocolFailure>::Err(
        ProtocolFailure::Authorization(
            fmt::format("{} public key is not in the authorization set", role)));
}

} // namespace umbra::protocol::security
