#include <catch2/catch_test_macros.hpp>
#include "umbra/protocol/nonce.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace umbra::protocol;
using namespace umbra::protocol::crypto;

TEST_CASE("Concurrent nonces - Draws never collide", "[concurrency][nonce]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto source = NonceSource::Create().Unwrap();

    constexpr int kThreads = 8;
    constexpr int kDrawsPerThread = 2000;

    std::vector<std::vector<Nonce>> per_thread(kThreads);
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            per_thread[t].reserve(kDrawsPerThread);
            for (int i = 0; i < kDrawsPerThread; ++i) {
                auto nonce = source->Next();
                if (nonce.IsErr()) {
                    failures.fetch_add(1);
                    continue;
                }
                per_thread[t].push_back(nonce.Unwrap());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);

    std::set<Nonce> all;
    for (const auto& draws : per_thread) {
        REQUIRE(draws.size() == kDrawsPerThread);
        for (size_t i = 1; i < draws.size(); ++i) {
            REQUIRE(draws[i - 1] < draws[i]);
        }
        all.insert(draws.begin(), draws.end());
    }
    REQUIRE(all.size() == static_cast<size_t>(kThreads * kDrawsPerThread));

    // No band was skipped or reused.
    REQUIRE(source->ExportState().band == static_cast<uint64_t>(kThreads * kDrawsPerThread));
}

TEST_CASE("Concurrent nonces - Shared across channels", "[concurrency][nonce]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto global = NonceSource::Global().Unwrap();

    std::mutex lock;
    std::set<Nonce> seen;
    bool collided = false;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                const Nonce nonce = global->Next().Unwrap();
                std::lock_guard guard(lock);
                if (!seen.insert(nonce).second) {
                    collided = true;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE_FALSE(collided);
    REQUIRE(seen.size() == 2000);
}
