#pragma once
#include <cstdint>
#include <string_view>

namespace umbra::protocol {

enum class ChannelCloseReason : uint8_t {
    IdleTimeout,
    AuthenticationFailure,
    Closed,
    Shutdown
};

constexpr std::string_view ToString(const ChannelCloseReason reason) noexcept {
    switch (reason) {
        case ChannelCloseReason::IdleTimeout: return "IdleTimeout";
        case ChannelCloseReason::AuthenticationFailure: return "AuthenticationFailure";
        case ChannelCloseReason::Closed: return "Closed";
        case ChannelCloseReason::Shutdown: return "Shutdown";
    }
    return "Unknown";
}

enum class FragmentFailurePolicy : uint8_t {
    DropFragment,
    TearDownChannel
};

}
