#pragma once
#include "umbra/core/failures.hpp"
#include "umbra/core/result.hpp"
#include "umbra/core/constants.hpp"
#include <array>
#include <atomic>
#include <compare>
#include <cstdint>
#include <memory>
#include <span>

namespace umbra::protocol {

/**
 * @brief 320-bit fragment sequence number
 *
 * Value = band * 2^256 + seed. Encoded as 40 bytes big-endian (band first),
 * so the byte order of the encoding and the numeric order agree.
 */
class Nonce {
public:
    using Seed = std::array<uint8_t, kNonceSeedBytes>;
    using Encoded = std::array<uint8_t, kNonceBytes>;

    Nonce() = default;
    Nonce(uint64_t band, const Seed& seed) noexcept
        : band_(band), seed_(seed) {}

    [[nodiscard]] uint64_t Band() const noexcept { return band_; }
    [[nodiscard]] const Seed& SeedBytes() const noexcept { return seed_; }

    [[nodiscard]] Encoded Encode() const noexcept;

    [[nodiscard]] static Result<Nonce, ProtocolFailure> Decode(std::span<const uint8_t> bytes);

    auto operator<=>(const Nonce&) const = default;
    bool operator==(const Nonce&) const = default;

private:
    uint64_t band_ = 0;
    Seed seed_{};
};

/**
 * @brief Process-wide strictly increasing nonce generator
 *
 * Seeded once from a hash of a fresh time-ordered id. Every draw advances
 * the band counter by one, i.e. adds 2^256 to the value, so consecutive
 * draws never overlap any 256-bit hash output. Next() is lock-free and may
 * be called from any thread.
 *
 * Nothing is persisted: a restart produces a new seed, and every key the
 * nonces were used under is gone by then.
 */
class NonceSource {
public:
    [[nodiscard]] static Result<std::shared_ptr<NonceSource>, ProtocolFailure> Create();

    // Shared instance, created on first use.
    [[nodiscard]] static Result<std::shared_ptr<NonceSource>, ProtocolFailure> Global();

    /**
     * @brief Draw the next nonce
     *
     * @return A value greater than every value previously returned by this
     *         source, or InvalidState once the band counter is exhausted
     */
    [[nodiscard]] Result<Nonce, ProtocolFailure> Next();

#ifdef UMBRA_TEST_BUILD
    struct State {
        Nonce::Seed seed{};
        uint64_t band = 0;
    };

    [[nodiscard]] static Result<std::shared_ptr<NonceSource>, ProtocolFailure> FromState(const State& state);
    [[nodiscard]] State ExportState() const;
#endif

    /**
     * @brief 16-byte time-ordered unique id
     *
     * 48-bit big-endian Unix millisecond timestamp, version nibble 7,
     * RFC 4122 variant bits, remaining bits random.
     */
    [[nodiscard]] static std::array<uint8_t, kTimeOrderedIdBytes> MakeTimeOrderedId();

    NonceSource(const NonceSource&) = delete;
    NonceSource& operator=(const NonceSource&) = delete;

private:
    NonceSource(const Nonce::Seed& seed, uint64_t band) noexcept;

    const Nonce::Seed seed_;
    std::atomic<uint64_t> band_;
};

}  // namespace umbra::protocol
