#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace umbra::protocol {

/**
 * @brief Outbound half of the message substrate
 *
 * Send must not block and must not call back into the registry before it
 * returns. Delivery order and delivery itself are not guaranteed; received
 * datagrams are handed to ChannelRegistry::OnReceive.
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual void Send(const std::string& address, std::vector<uint8_t> bytes) = 0;
};

}
