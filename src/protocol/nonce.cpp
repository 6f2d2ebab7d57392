#include "umbra/protocol/nonce.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include "umbra/debug/channel_logger.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <chrono>
#include <limits>

namespace umbra::protocol {
    using crypto::SodiumInterop;

    Nonce::Encoded Nonce::Encode() const noexcept {
        Encoded out{};
        for (size_t i = 0; i < kNonceBandBytes; ++i) {
            out[i] = static_cast<uint8_t>((band_ >> ((kNonceBandBytes - 1 - i) * 8)) & 0xFF);
        }
        std::copy(seed_.begin(), seed_.end(), out.begin() + kNonceBandBytes);
        return out;
    }

    Result<Nonce, ProtocolFailure> Nonce::Decode(std::span<const uint8_t> bytes) {
        if (bytes.size() != kNonceBytes) {
            return Result<Nonce, ProtocolFailure>::Err(
                ProtocolFailure::ProtocolViolation(
                    fmt::format("Sequence number must be {} bytes, got {}", kNonceBytes, bytes.size())));
        }
        uint64_t band = 0;
        for (size_t i = 0; i < kNonceBandBytes; ++i) {
            band = (band << 8) | bytes[i];
        }
        Seed seed{};
        std::copy(bytes.begin() + kNonceBandBytes, bytes.end(), seed.begin());
        return Result<Nonce, ProtocolFailure>::Ok(Nonce(band, seed));
    }

    NonceSource::NonceSource(const Nonce::Seed& seed, const uint64_t band) noexcept
        : seed_(seed)
        , band_(band) {
    }

    std::array<uint8_t, kTimeOrderedIdBytes> NonceSource::MakeTimeOrderedId() {
        std::array<uint8_t, kTimeOrderedIdBytes> id{};
        const auto millis = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        for (size_t i = 0; i < 6; ++i) {
            id[i] = static_cast<uint8_t>((millis >> ((5 - i) * 8)) & 0xFF);
        }
        randombytes_buf(id.data() + 6, id.size() - 6);
        id[6] = static_cast<uint8_t>(0x70 | (id[6] & 0x0F));
        id[8] = static_cast<uint8_t>(0x80 | (id[8] & 0x3F));
        return id;
    }

    Result<std::shared_ptr<NonceSource>, ProtocolFailure> NonceSource::Create() {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::shared_ptr<NonceSource>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto id = MakeTimeOrderedId();
        const Nonce::Seed seed = SodiumInterop::Hash({std::span<const uint8_t>(id)});
        sodium_memzero(id.data(), id.size());
        UMBRA_LOG_KEY(debug::Side::Unknown, "NONCE", "seed", seed);
        return Result<std::shared_ptr<NonceSource>, ProtocolFailure>::Ok(
            std::shared_ptr<NonceSource>(new NonceSource(seed, 0)));
    }

    Result<std::shared_ptr<NonceSource>, ProtocolFailure> NonceSource::Global() {
        static const Result<std::shared_ptr<NonceSource>, ProtocolFailure> instance = Create();
        return instance;
    }

    Result<Nonce, ProtocolFailure> NonceSource::Next() {
        uint64_t current = band_.load(std::memory_order_relaxed);
        do {
            if (current == std::numeric_limits<uint64_t>::max()) {
                return Result<Nonce, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidState("Nonce band counter overflow"));
            }
        } while (!band_.compare_exchange_weak(
            current, current + 1, std::memory_order_acq_rel, std::memory_order_relaxed));
        return Result<Nonce, ProtocolFailure>::Ok(Nonce(current + 1, seed_));
    }

#ifdef UMBRA_TEST_BUILD
    Result<std::shared_ptr<NonceSource>, ProtocolFailure> NonceSource::FromState(const State& state) {
        if (state.band == std::numeric_limits<uint64_t>::max()) {
            return Result<std::shared_ptr<NonceSource>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Nonce band counter is exhausted"));
        }
        return Result<std::shared_ptr<NonceSource>, ProtocolFailure>::Ok(
            std::shared_ptr<NonceSource>(new NonceSource(state.seed, state.band)));
    }

    NonceSource::State NonceSource::ExportState() const {
        return State{.seed = seed_, .band = band_.load(std::memory_order_acquire)};
    }
#endif

}
