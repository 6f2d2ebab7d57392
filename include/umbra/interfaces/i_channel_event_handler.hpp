#pragma once
#include "umbra/core/failures.hpp"
#include "umbra/enums/channel_close_reason.hpp"
#include "umbra/enums/channel_role.hpp"
#include "umbra/interfaces/i_fragment_reassembler.hpp"
#include <string>

namespace umbra::protocol {

/**
 * @brief Lifecycle and rejection notifications from a ChannelRegistry
 *
 * Invoked on the registry strand. Implementations must not block.
 */
class IChannelEventHandler {
public:
    virtual ~IChannelEventHandler() = default;
    virtual void OnChannelEstablished(
        const ConnectionId& connection_id, const std::string& peer_address, ChannelRole role) = 0;
    virtual void OnChannelClosed(
        const ConnectionId& connection_id, const std::string& peer_address, ChannelCloseReason reason) = 0;
    virtual void OnHandshakeFailed(const std::string& peer_address, const ProtocolFailure& failure) = 0;
    virtual void OnFragmentRejected(
        const ConnectionId& connection_id, const std::string& peer_address, const ProtocolFailure& failure) = 0;
    // Envelope that could not be attributed to any channel or attempt.
    virtual void OnEnvelopeDropped(const std::string& from_address, const ProtocolFailure& failure) = 0;
};

}
