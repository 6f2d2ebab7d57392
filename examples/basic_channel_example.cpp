/**
 * @file basic_channel_example.cpp
 * @brief Two registries talking over UDP on the loopback interface
 *
 * The client sends a message to the server. The first send triggers the
 * handshake; the server answers on the connection it accepted.
 */

#include "umbra/protocol/channel_registry.hpp"
#include "umbra/crypto/sodium_interop.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>
#include <fmt/core.h>

#include <array>
#include <chrono>
#include <memory>
#include <string>

using namespace umbra::protocol;

namespace {

std::string ToAddress(const asio::ip::udp::endpoint& endpoint) {
    return fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

// "host:port" addresses, one datagram per envelope.
class UdpTransport : public ITransport, public std::enable_shared_from_this<UdpTransport> {
public:
    explicit UdpTransport(asio::io_context& io)
        : socket_(io, asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    void Start(std::weak_ptr<ChannelRegistry> registry) {
        registry_ = std::move(registry);
        Receive();
    }

    void Send(const std::string& address, std::vector<uint8_t> bytes) override {
        const auto colon = address.rfind(':');
        const asio::ip::udp::endpoint target(
            asio::ip::make_address(address.substr(0, colon)),
            static_cast<unsigned short>(std::stoul(address.substr(colon + 1))));
        auto buffer = std::make_shared<std::vector<uint8_t>>(std::move(bytes));
        socket_.async_send_to(asio::buffer(*buffer), target,
            [buffer](const std::error_code& ec, std::size_t) {
                if (ec) {
                    fmt::print(stderr, "send failed: {}\n", ec.message());
                }
            });
    }

    [[nodiscard]] std::string LocalAddress() const { return ToAddress(socket_.local_endpoint()); }

    void Close() {
        std::error_code ignored;
        socket_.close(ignored);
    }

private:
    void Receive() {
        socket_.async_receive_from(asio::buffer(buffer_), sender_,
            [self = shared_from_this()](const std::error_code& ec, const std::size_t length) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                if (!ec) {
                    if (auto registry = self->registry_.lock()) {
                        registry->OnReceive(ToAddress(self->sender_),
                            std::vector<uint8_t>(self->buffer_.begin(), self->buffer_.begin() + length));
                    }
                }
                self->Receive();
            });
    }

    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint sender_;
    std::array<uint8_t, kMaxEnvelopeBytes> buffer_{};
    std::weak_ptr<ChannelRegistry> registry_;
};

class PrintingReassembler : public IFragmentReassembler {
public:
    explicit PrintingReassembler(std::string name) : name_(std::move(name)) {}

    void Accept(const ConnectionId&, const std::string& peer_address,
                const Nonce&, std::vector<uint8_t> plaintext) override {
        fmt::print("[{}] from {}: {}\n", name_, peer_address,
                   std::string(plaintext.begin(), plaintext.end()));
        received = true;
    }

    bool received = false;

private:
    std::string name_;
};

class PrintingEvents : public IChannelEventHandler {
public:
    explicit PrintingEvents(std::string name) : name_(std::move(name)) {}

    void OnChannelEstablished(const ConnectionId& connection_id, const std::string& peer_address,
                              const ChannelRole role) override {
        fmt::print("[{}] channel established with {} as {}\n", name_, peer_address, ToString(role));
        last_connection_id = connection_id;
    }
    void OnChannelClosed(const ConnectionId&, const std::string& peer_address,
                         const ChannelCloseReason reason) override {
        fmt::print("[{}] channel to {} closed: {}\n", name_, peer_address, ToString(reason));
    }
    void OnHandshakeFailed(const std::string& peer_address, const ProtocolFailure& failure) override {
        fmt::print("[{}] handshake with {} failed: {}\n", name_, peer_address, failure.message);
    }
    void OnFragmentRejected(const ConnectionId&, const std::string& peer_address,
                            const ProtocolFailure& failure) override {
        fmt::print("[{}] fragment from {} rejected: {}\n", name_, peer_address, failure.message);
    }
    void OnEnvelopeDropped(const std::string& from_address, const ProtocolFailure& failure) override {
        fmt::print("[{}] envelope from {} dropped: {}\n", name_, from_address, failure.message);
    }

    ConnectionId last_connection_id{};

private:
    std::string name_;
};

struct Peer {
    std::shared_ptr<UdpTransport> transport;
    std::shared_ptr<ChannelRegistry> registry;
    std::shared_ptr<PrintingReassembler> inbox;
    std::shared_ptr<PrintingEvents> events;
};

Result<Peer, ProtocolFailure> MakePeer(asio::io_context& io, const std::string& name) {
    auto identity = identity::StaticIdentity::Generate();
    if (identity.IsErr()) {
        return Result<Peer, ProtocolFailure>::Err(std::move(identity).UnwrapErr());
    }
    Peer peer;
    peer.transport = std::make_shared<UdpTransport>(io);
    peer.inbox = std::make_shared<PrintingReassembler>(name);
    peer.events = std::make_shared<PrintingEvents>(name);

    ChannelRegistry::Collaborators collaborators;
    collaborators.transport = peer.transport;
    collaborators.reassembler = peer.inbox;
    collaborators.event_handler = peer.events;

    auto registry = ChannelRegistry::Create(
        io, std::move(identity).Unwrap(),
        std::make_shared<const security::AuthorizationPolicy>(security::AuthorizationPolicy::AllowAll()),
        std::move(collaborators));
    if (registry.IsErr()) {
        return Result<Peer, ProtocolFailure>::Err(std::move(registry).UnwrapErr());
    }
    peer.registry = std::move(registry).Unwrap();
    peer.transport->Start(peer.registry);
    return Result<Peer, ProtocolFailure>::Ok(std::move(peer));
}

void Pump(asio::io_context& io, const std::chrono::milliseconds duration) {
    io.restart();
    io.run_for(duration);
}

}  // namespace

int main() {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        fmt::print(stderr, "libsodium initialization failed: {}\n", init.UnwrapErr().message);
        return 1;
    }

    asio::io_context io;
    auto client = MakePeer(io, "client");
    auto server = MakePeer(io, "server");
    if (client.IsErr() || server.IsErr()) {
        fmt::print(stderr, "failed to create peers\n");
        return 1;
    }
    Peer& alice = client.Unwrap();
    Peer& bob = server.Unwrap();
    const std::string server_address = bob.transport->LocalAddress();
    fmt::print("server listening on {}\n", server_address);

    const std::string greeting = "hello over an ephemeral channel";
    alice.registry->Send(server_address, std::vector<uint8_t>(greeting.begin(), greeting.end()),
        [](const Result<Unit, ProtocolFailure>& result) {
            if (result.IsErr()) {
                fmt::print(stderr, "send failed: {}\n", result.UnwrapErr().message);
            }
        });
    Pump(io, std::chrono::milliseconds(200));

    if (!bob.inbox->received) {
        fmt::print(stderr, "nothing arrived\n");
        return 1;
    }

    const std::string reply = "received, thanks";
    bob.registry->SendOnConnection(bob.events->last_connection_id,
        std::vector<uint8_t>(reply.begin(), reply.end()),
        [](const Result<Unit, ProtocolFailure>& result) {
            if (result.IsErr()) {
                fmt::print(stderr, "reply failed: {}\n", result.UnwrapErr().message);
            }
        });
    Pump(io, std::chrono::milliseconds(200));

    alice.registry->Shutdown();
    bob.registry->Shutdown();
    Pump(io, std::chrono::milliseconds(50));
    alice.transport->Close();
    bob.transport->Close();
    Pump(io, std::chrono::milliseconds(10));
    return 0;
}
