#pragma once

/**
 * @file channel_logger.hpp
 * @brief Debug tracing for handshakes and channel lifecycle.
 *
 * UMBRA_DEBUG_CHANNELS prints protocol events to stdout. UMBRA_DEBUG_KEYS
 * additionally prints key material and must never be enabled in production.
 * Without either option every macro expands to nothing and its arguments are
 * not evaluated.
 *
 * Enable via CMake: -DUMBRA_DEBUG_CHANNELS=ON [-DUMBRA_DEBUG_KEYS=ON]
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace umbra::debug {

enum class Side {
    Initiator,
    Responder,
    Unknown
};

#if defined(UMBRA_DEBUG_CHANNELS) || defined(UMBRA_DEBUG_KEYS)

inline std::string ToHex(std::span<const uint8_t> data, const size_t max_bytes = 48) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2 + 16);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

inline const char* SideToString(const Side side) {
    switch (side) {
        case Side::Initiator: return "INITIATOR";
        case Side::Responder: return "RESPONDER";
        default: return "PROCESS";
    }
}

#define UMBRA_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[UMBRA] %s %s %s\n", \
            ::umbra::debug::SideToString(side), operation, std::string(message).c_str()); \
        fflush(stdout); \
    } while (0)

// Connection ids and peer addresses are not secret.
#define UMBRA_LOG_ID(side, operation, name, data) \
    do { \
        fprintf(stdout, "[UMBRA] %s %s %s: %s\n", \
            ::umbra::debug::SideToString(side), operation, name, \
            ::umbra::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while (0)

#else

#define UMBRA_LOG_MSG(side, operation, message) ((void)0)
#define UMBRA_LOG_ID(side, operation, name, data) ((void)0)

#endif

#ifdef UMBRA_DEBUG_KEYS

#define UMBRA_LOG_KEY(side, operation, key_name, data) \
    do { \
        fprintf(stdout, "[UMBRA-KEYS] %s %s %s: %s\n", \
            ::umbra::debug::SideToString(side), operation, key_name, \
            ::umbra::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while (0)

#else

#define UMBRA_LOG_KEY(side, operation, key_name, data) ((void)0)

#endif

} // namespace umbra::debug
