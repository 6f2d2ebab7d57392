#include <catch2/catch_test_macros.hpp>
#include "umbra/configuration/channel_config.hpp"

using namespace umbra::protocol;
using namespace umbra::protocol::configuration;
using namespace std::chrono_literals;

TEST_CASE("ChannelConfig - Presets", "[config][unit]") {
    const auto defaults = ChannelConfig::Default();
    REQUIRE(defaults.idle_timeout == ChannelDefaults::IDLE_TIMEOUT);
    REQUIRE(defaults.handshake_timeout == ChannelDefaults::HANDSHAKE_TIMEOUT);
    REQUIRE(defaults.fragment_failure_policy == FragmentFailurePolicy::DropFragment);
    REQUIRE(defaults.reject_duplicate_fragments);
    REQUIRE(defaults.Validate().IsOk());

    const auto strict = ChannelConfig::Strict();
    REQUIRE(strict.fragment_failure_policy == FragmentFailurePolicy::TearDownChannel);
    REQUIRE(strict.Validate().IsOk());
    REQUIRE_FALSE(strict == defaults);
}

TEST_CASE("ChannelConfig - Validation", "[config][unit][validation]") {
    ChannelConfig config;

    SECTION("Zero idle timeout") {
        config.idle_timeout = 0ms;
        auto result = config.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Negative handshake timeout") {
        config.handshake_timeout = -5ms;
        REQUIRE(config.Validate().IsErr());
    }

    SECTION("Replay window bounds") {
        config.replay_window = 0;
        REQUIRE(config.Validate().IsErr());
        config.replay_window = ChannelDefaults::MAX_REPLAY_WINDOW + 1;
        REQUIRE(config.Validate().IsErr());
        config.replay_window = ChannelDefaults::MAX_REPLAY_WINDOW;
        REQUIRE(config.Validate().IsOk());
    }

    SECTION("Window is ignored when duplicates are allowed") {
        config.reject_duplicate_fragments = false;
        config.replay_window = 0;
        REQUIRE(config.Validate().IsOk());
    }
}
