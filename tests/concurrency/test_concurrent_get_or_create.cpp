#include <catch2/catch_test_macros.hpp>
#include "umbra/crypto/sodium_interop.hpp"
#include "protocol/channel_wire.pb.h"
#include "../helpers/loopback_network.hpp"
#include <asio/executor_work_guard.hpp>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace umbra::protocol;
using namespace umbra::protocol::crypto;
using namespace umbra::protocol::security;
using namespace umbra::protocol::test_helpers;

namespace {
    size_t CountHandshakeRequests(const std::vector<Datagram>& sent) {
        size_t count = 0;
        for (const auto& datagram : sent) {
            umbra::proto::protocol::ChannelEnvelope envelope;
            if (envelope.ParseFromArray(datagram.bytes.data(), static_cast<int>(datagram.bytes.size())) &&
                envelope.has_handshake_request()) {
                ++count;
            }
        }
        return count;
    }
}

TEST_CASE("Concurrent GetOrCreate - One handshake per address", "[concurrency][registry]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    asio::io_context io;
    auto network = std::make_shared<LoopbackNetwork>(io);
    auto open = std::make_shared<const AuthorizationPolicy>(AuthorizationPolicy::AllowAll());
    auto client = MakeNode(io, network, "client", open);
    auto server = MakeNode(io, network, "server", open);

    constexpr int kCallers = 50;
    std::mutex lock;
    std::vector<std::shared_ptr<Channel>> channels;
    std::atomic<int> failures{0};
    std::atomic<int> completed{0};

    // Keep the request in flight until every caller has joined it.
    network->Hold(true);

    auto work = asio::make_work_guard(io);
    std::vector<std::thread> runners;
    for (int i = 0; i < 4; ++i) {
        runners.emplace_back([&io] { io.run(); });
    }

    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&] {
            client.registry->GetOrCreate("server",
                [&](Result<std::shared_ptr<Channel>, ProtocolFailure> result) {
                    if (result.IsErr()) {
                        failures.fetch_add(1);
                    } else {
                        std::lock_guard guard(lock);
                        channels.push_back(result.Unwrap());
                    }
                    completed.fetch_add(1);
                });
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    // Posted after every GetOrCreate, so the strand has queued them all by now.
    std::promise<size_t> pending_count;
    client.registry->PendingHandshakeCount([&pending_count](const size_t count) { pending_count.set_value(count); });
    auto pending_future = pending_count.get_future();
    // CHECK, not REQUIRE: the runner threads must still be joined below.
    const bool answered = pending_future.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    CHECK(answered);
    if (answered) {
        CHECK(pending_future.get() == 1);
    }
    CHECK(completed.load() == 0);
    CHECK(network->Held().size() == 1);

    network->Hold(false);
    network->ReleaseHeld();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (completed.load() < kCallers && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    work.reset();
    io.stop();
    for (auto& runner : runners) {
        runner.join();
    }

    REQUIRE(completed.load() == kCallers);
    REQUIRE(failures.load() == 0);
    REQUIRE(channels.size() == kCallers);
    for (const auto& channel : channels) {
        REQUIRE(channel == channels.front());
    }
    REQUIRE(CountHandshakeRequests(network->Sent()) == 1);
    REQUIRE(client.events->established.size() == 1);
    REQUIRE(server.events->established.size() == 1);
}

TEST_CASE("Concurrent GetOrCreate - Distinct addresses get distinct channels", "[concurrency][registry]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    asio::io_context io;
    auto network = std::make_shared<LoopbackNetwork>(io);
    auto open = std::make_shared<const AuthorizationPolicy>(AuthorizationPolicy::AllowAll());
    auto client = MakeNode(io, network, "client", open);
    auto server_a = MakeNode(io, network, "server-a", open);
    auto server_b = MakeNode(io, network, "server-b", open);

    std::vector<std::shared_ptr<Channel>> to_a;
    std::vector<std::shared_ptr<Channel>> to_b;
    for (int i = 0; i < 10; ++i) {
        client.registry->GetOrCreate("server-a", [&](auto result) { to_a.push_back(result.Unwrap()); });
        client.registry->GetOrCreate("server-b", [&](auto result) { to_b.push_back(result.Unwrap()); });
    }
    REQUIRE(RunUntil(io, [&] { return to_a.size() == 10 && to_b.size() == 10; }));

    REQUIRE(to_a.front() != to_b.front());
    REQUIRE(to_a.front()->GetConnectionId() != to_b.front()->GetConnectionId());
    REQUIRE(Query<size_t>(io, [&](auto cb) { client.registry->ChannelCount(cb); }) == 2);
    REQUIRE(CountHandshakeRequests(network->Sent()) == 2);
}
