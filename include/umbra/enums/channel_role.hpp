#pragma once
#include <cstdint>
#include <string_view>

namespace umbra::protocol {

enum class ChannelRole : uint8_t {
    Initiator,
    Responder
};

constexpr std::string_view ToString(const ChannelRole role) noexcept {
    switch (role) {
        case ChannelRole::Initiator: return "Initiator";
        case ChannelRole::Responder: return "Responder";
    }
    return "Unknown";
}

}
