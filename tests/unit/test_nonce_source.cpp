#include <catch2/catch_test_macros.hpp>
#include "umbra/protocol/nonce.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include <limits>
#include <set>
#include <vector>

using namespace umbra::protocol;
using namespace umbra::protocol::crypto;

TEST_CASE("NonceSource - Draws are strictly increasing", "[nonce][unit]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto source_result = NonceSource::Create();
    REQUIRE(source_result.IsOk());
    auto source = source_result.Unwrap();

    SECTION("Each draw exceeds the previous one") {
        auto previous = source->Next();
        REQUIRE(previous.IsOk());
        for (int i = 0; i < 1000; ++i) {
            auto next = source->Next();
            REQUIRE(next.IsOk());
            REQUIRE(next.Unwrap() > previous.Unwrap());
            previous = next;
        }
    }

    SECTION("Each draw adds exactly 2^256") {
        auto first = source->Next().Unwrap();
        auto second = source->Next().Unwrap();
        REQUIRE(second.Band() == first.Band() + 1);
        REQUIRE(second.SeedBytes() == first.SeedBytes());
    }

    SECTION("Low 256 bits are the seed") {
        const auto state = source->ExportState();
        auto nonce = source->Next().Unwrap();
        REQUIRE(nonce.SeedBytes() == state.seed);
        REQUIRE(nonce.Band() == state.band + 1);
    }
}

TEST_CASE("NonceSource - Seeds differ between sources", "[nonce][unit]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto a = NonceSource::Create();
    auto b = NonceSource::Create();
    REQUIRE(a.IsOk());
    REQUIRE(b.IsOk());
    REQUIRE(a.Unwrap()->ExportState().seed != b.Unwrap()->ExportState().seed);
}

TEST_CASE("NonceSource - Global instance is shared", "[nonce][unit]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto first = NonceSource::Global();
    auto second = NonceSource::Global();
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(first.Unwrap().get() == second.Unwrap().get());
}

TEST_CASE("NonceSource - Band counter exhaustion", "[nonce][unit][boundary]") {
    NonceSource::State state;
    state.seed.fill(0x42);

    SECTION("Last band is still usable, the one after is refused") {
        state.band = std::numeric_limits<uint64_t>::max() - 1;
        auto source = NonceSource::FromState(state);
        REQUIRE(source.IsOk());
        auto last = source.Unwrap()->Next();
        REQUIRE(last.IsOk());
        REQUIRE(last.Unwrap().Band() == std::numeric_limits<uint64_t>::max());

        auto overflow = source.Unwrap()->Next();
        REQUIRE(overflow.IsErr());
        REQUIRE(overflow.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }

    SECTION("Restoring an exhausted state is refused") {
        state.band = std::numeric_limits<uint64_t>::max();
        auto source = NonceSource::FromState(state);
        REQUIRE(source.IsErr());
        REQUIRE(source.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("Nonce - Encoding is 40 bytes big-endian", "[nonce][unit]") {
    Nonce::Seed seed{};
    seed.fill(0x00);
    seed[31] = 0x07;
    const Nonce nonce(0x0102030405060708ULL, seed);

    const auto encoded = nonce.Encode();
    REQUIRE(encoded.size() == kNonceBytes);
    REQUIRE(encoded[0] == 0x01);
    REQUIRE(encoded[7] == 0x08);
    REQUIRE(encoded[8] == 0x00);
    REQUIRE(encoded[39] == 0x07);

    auto decoded = Nonce::Decode(encoded);
    REQUIRE(decoded.IsOk());
    REQUIRE(decoded.Unwrap() == nonce);

    SECTION("Wrong length is a protocol violation") {
        std::vector<uint8_t> short_bytes(encoded.begin(), encoded.end() - 1);
        auto result = Nonce::Decode(short_bytes);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::ProtocolViolation);
    }
}

TEST_CASE("Nonce - Ordering follows the numeric value", "[nonce][unit]") {
    Nonce::Seed low{};
    Nonce::Seed high{};
    high.fill(0xFF);

    // Band dominates: (1, 0...) > (0, FF...)
    REQUIRE(Nonce(1, low) > Nonce(0, high));
    REQUIRE(Nonce(0, low) < Nonce(0, high));
    REQUIRE(Nonce(5, high) == Nonce(5, high));

    // Byte order of the encoding agrees with the numeric order.
    REQUIRE(Nonce(1, low).Encode() > Nonce(0, high).Encode());
}

TEST_CASE("NonceSource - Time-ordered id layout", "[nonce][unit]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto first = NonceSource::MakeTimeOrderedId();
    const auto second = NonceSource::MakeTimeOrderedId();

    REQUIRE((first[6] & 0xF0) == 0x70);
    REQUIRE((first[8] & 0xC0) == 0x80);
    REQUIRE(first != second);

    const auto timestamp = [](const std::array<uint8_t, kTimeOrderedIdBytes>& id) {
        uint64_t millis = 0;
        for (size_t i = 0; i < 6; ++i) {
            millis = (millis << 8) | id[i];
        }
        return millis;
    };
    REQUIRE(timestamp(second) >= timestamp(first));
    REQUIRE(timestamp(first) > 0);
}
