#include <catch2/catch_test_macros.hpp>
#include "umbra/crypto/sodium_secure_memory_handle.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include <numeric>
#include <vector>

using namespace umbra::protocol;
using namespace umbra::protocol::crypto;

TEST_CASE("SecureMemoryHandle - Holding a key", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(32);
    std::iota(key.begin(), key.end(), uint8_t{0});

    auto handle_result = SecureMemoryHandle::FromBytes(key);
    REQUIRE(handle_result.IsOk());
    auto handle = std::move(handle_result).Unwrap();
    REQUIRE(handle.Size() == 32);
    REQUIRE(handle.ReadBytes(32).Unwrap() == key);

    SECTION("Read access sees the same bytes") {
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            return std::accumulate(bytes.begin(), bytes.end(), 0);
        });
        REQUIRE(sum.Unwrap() == std::accumulate(key.begin(), key.end(), 0));
    }

    SECTION("Overwrite") {
        const std::vector<uint8_t> other(32, 0xEE);
        REQUIRE(handle.Write(other).IsOk());
        REQUIRE(handle.ReadBytes(32).Unwrap() == other);
    }

    SECTION("Oversized write and read fail") {
        const std::vector<uint8_t> too_big(33, 0x01);
        REQUIRE(handle.Write(too_big).IsErr());
        REQUIRE(handle.ReadBytes(33).IsErr());
    }

    SECTION("Wipe disposes the handle") {
        handle.Wipe();
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.ReadBytes(32).IsErr());
        auto access = handle.WithReadAccess([](std::span<const uint8_t>) { return 0; });
        REQUIRE(access.IsErr());
        handle.Wipe();
    }

    SECTION("Move leaves the source empty") {
        SecureMemoryHandle moved(std::move(handle));
        REQUIRE(handle.IsInvalid());
        REQUIRE(moved.ReadBytes(32).Unwrap() == key);
    }
}

TEST_CASE("SecureMemoryHandle - Allocation limits", "[crypto][memory][boundary]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    REQUIRE(SecureMemoryHandle::Allocate(64).IsOk());

    SecureMemoryHandle empty;
    REQUIRE(empty.IsInvalid());
    REQUIRE(empty.Size() == 0);
}
