#include <catch2/catch_test_macros.hpp>
#include "umbra/security/authorization_policy.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include "umbra/identity/static_identity.hpp"

using namespace umbra::protocol;
using namespace umbra::protocol::crypto;
using namespace umbra::protocol::identity;
using namespace umbra::protocol::security;

TEST_CASE("AuthorizationPolicy - Open policy", "[authorization][unit]") {
    const auto policy = AuthorizationPolicy::AllowAll();
    const PublicKey anyone{};

    REQUIRE_FALSE(policy.RequiresMembership());
    REQUIRE(policy.Size() == 0);
    REQUIRE(policy.Authorize(anyone, "Initiator").IsOk());
}

TEST_CASE("AuthorizationPolicy - Membership", "[authorization][unit]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto member = StaticIdentity::Generate().Unwrap();
    auto outsider = StaticIdentity::Generate().Unwrap();

    const auto policy = AuthorizationPolicy::Members(std::vector<PublicKey>{member.GetPublicKey()});
    REQUIRE(policy.RequiresMembership());
    REQUIRE(policy.IsMember(member.GetPublicKey()));
    REQUIRE_FALSE(policy.IsMember(outsider.GetPublicKey()));

    REQUIRE(policy.Authorize(member.GetPublicKey(), "Responder").IsOk());

    auto denied = policy.Authorize(outsider.GetPublicKey(), "Responder");
    REQUIRE(denied.IsErr());
    REQUIRE(denied.UnwrapErr().type == ProtocolFailureType::Authorization);
    REQUIRE(denied.UnwrapErr().message.find("Responder") != std::string::npos);

    SECTION("Empty set admits nobody") {
        const auto closed = AuthorizationPolicy::Members(std::vector<PublicKey>{});
        REQUIRE(closed.RequiresMembership());
        REQUIRE(closed.Authorize(member.GetPublicKey(), "Initiator").IsErr());
    }

    SECTION("Key of the wrong length is never a member") {
        const std::vector<uint8_t> truncated(member.GetPublicKey().begin(), member.GetPublicKey().end() - 1);
        REQUIRE_FALSE(policy.IsMember(truncated));
    }
}

TEST_CASE("AuthorizationPolicy - Raw key list", "[authorization][unit][validation]") {
    SECTION("Well-sized keys") {
        auto policy = AuthorizationPolicy::Members({std::vector<uint8_t>(32, 0x09), std::vector<uint8_t>(32, 0x0A)});
        REQUIRE(policy.IsOk());
        REQUIRE(policy.Unwrap().Size() == 2);
    }

    SECTION("Short key is refused") {
        auto policy = AuthorizationPolicy::Members({std::vector<uint8_t>(31, 0x09)});
        REQUIRE(policy.IsErr());
        REQUIRE(policy.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
