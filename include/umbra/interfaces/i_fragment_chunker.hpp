#pragma once
#include <cstdint>
#include <span>
#include <vector>

namespace umbra::protocol {

class IFragmentChunker {
public:
    virtual ~IFragmentChunker() = default;

    // Every piece must fit in one fragment (kMaxFragmentPayloadBytes).
    virtual std::vector<std::vector<uint8_t>> Split(std::span<const uint8_t> payload) = 0;
};

}
