#include "umbra/security/validation/dh_validator.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include <fmt/core.h>

namespace umbra::protocol::security {

using crypto::SodiumInterop;

Result<Unit, ProtocolFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key,
    std::string_view field_name) {

    if (public_key.size() != kX25519PublicKeyBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Identification(
                fmt::format("Invalid X25519 {} size: expected {}, got {}",
                            field_name, kX25519PublicKeyBytes, public_key.size())));
    }

    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Identification(
                fmt::format("X25519 {} is not a canonical Curve25519 field element", field_name)));
    }

    if (HasSmallOrder(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Identification(
                fmt::format("X25519 {} is a small-order point", field_name)));
    }

    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) noexcept {
    bool found = false;
    for (const auto& small_order_point : SMALL_ORDER_POINTS) {
        // No early exit: the scan touches every candidate.
        found |= SodiumInterop::ConstantTimeEquals(public_key, small_order_point);
    }
    return found;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) noexcept {
    if (public_key.size() != kX25519PublicKeyBytes) {
        return false;
    }

    // Compare u (top bit cleared) against p from the most significant byte.
    for (size_t i = kX25519PublicKeyBytes; i-- > 0;) {
        uint8_t byte = public_key[i];
        if (i == kX25519PublicKeyBytes - 1) {
            byte &= 0x7f;
        }
        if (byte < CURVE_25519_PRIME[i]) {
            return true;
        }
        if (byte > CURVE_25519_PRIME[i]) {
            return false;
        }
    }
    // u == p
    return false;
}

} // namespace umbra::protocol::security
