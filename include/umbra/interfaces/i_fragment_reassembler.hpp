#pragma once
#include "umbra/protocol/nonce.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace umbra::protocol {

/**
 * @brief Receives authenticated plaintext fragments in arrival order
 *
 * Arrival order is arbitrary. seq orders fragments of one sender, since
 * every sealed fragment draws a larger seq than the one before it.
 */
class IFragmentReassembler {
public:
    virtual ~IFragmentReassembler() = default;
    virtual void Accept(
        const ConnectionId& connection_id,
        const std::string& peer_address,
        const Nonce& seq,
        std::vector<uint8_t> plaintext) = 0;
};

}
