#pragma once
#include "umbra/core/result.hpp"
#include "umbra/core/failures.hpp"
#include "umbra/core/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace umbra::protocol::security {

/**
 * @brief Structural validation of X25519 points received from a peer
 *
 * A point is accepted when it is exactly 32 bytes, encodes a canonical field
 * element (u < 2^255 - 19 once the unused top bit is cleared) and is not one
 * of the small-order points that would force a predictable shared secret.
 * Failures are reported as Identification failures.
 */
class DhValidator {
public:
    [[nodiscard]] static Result<Unit, ProtocolFailure> ValidateX25519PublicKey(
        std::span<const uint8_t> public_key,
        std::string_view field_name = "public key");

    [[nodiscard]] static bool HasSmallOrder(std::span<const uint8_t> public_key) noexcept;

    [[nodiscard]] static bool IsCanonicalFieldElement(std::span<const uint8_t> public_key) noexcept;

private:
    // Little-endian 2^255 - 19.
    static constexpr std::array<uint8_t, kX25519PublicKeyBytes> CURVE_25519_PRIME = {
        0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f
    };

    static constexpr std::array<std::array<uint8_t, kX25519PublicKeyBytes>, 5> SMALL_ORDER_POINTS = {{
        // 0 (order 4)
        {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        // 1 (order 1)
        {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        // order 8
        {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae,
         0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
         0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd,
         0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
        // order 8
        {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24,
         0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
         0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86,
         0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
        // p - 1 (order 2)
        {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f}
    }};
};

} // namespace umbra::protocol::security
