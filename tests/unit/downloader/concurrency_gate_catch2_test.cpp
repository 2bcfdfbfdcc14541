#include <catch2/catch_test_macros.hpp>

#include <wildfetch/downloader/concurrency_gate.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace wildfetch::downloader;
using namespace std::chrono_literals;

namespace {

template <typename Pred> bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

TEST_CASE("ConcurrencyGate: permits are counted and released by RAII", "[downloader][gate]") {
    ConcurrencyGate gate(2);
    CHECK(gate.capacity() == 2);
    CHECK(gate.inUse() == 0);

    {
        auto a = gate.acquire();
        CHECK(a.held());
        CHECK(gate.inUse() == 1);
        {
            auto b = gate.acquire();
            CHECK(gate.inUse() == 2);
        }
        CHECK(gate.inUse() == 1);
    }
    CHECK(gate.inUse() == 0);
    CHECK(gate.highWaterMark() == 2);
}

TEST_CASE("ConcurrencyGate: capacity is at least one", "[downloader][gate]") {
    ConcurrencyGate gate(0);
    CHECK(gate.capacity() == 1);
    auto p = gate.acquire();
    CHECK(gate.inUse() == 1);
}

TEST_CASE("GatePermit: move transfers ownership, explicit release is idempotent",
          "[downloader][gate]") {
    ConcurrencyGate gate(1);
    auto first = gate.acquire();
    GatePermit moved = std::move(first);
    CHECK_FALSE(first.held());
    CHECK(moved.held());
    CHECK(gate.inUse() == 1);

    moved.release();
    CHECK_FALSE(moved.held());
    CHECK(gate.inUse() == 0);
    moved.release();
    CHECK(gate.inUse() == 0);
}

TEST_CASE("ConcurrencyGate: unmatched release does not grow capacity", "[downloader][gate]") {
    ConcurrencyGate gate(1);
    gate.release();
    CHECK(gate.inUse() == 0);

    auto p = gate.acquire();
    CHECK(gate.inUse() == 1);
    CHECK(gate.highWaterMark() == 1);
}

TEST_CASE("ConcurrencyGate: holders never exceed capacity", "[downloader][gate]") {
    constexpr std::size_t kCapacity = 3;
    ConcurrencyGate gate(kCapacity);
    std::atomic<std::size_t> holding{0};
    std::atomic<std::size_t> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            for (int round = 0; round < 5; ++round) {
                auto permit = gate.acquire();
                const auto now = ++holding;
                auto prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(1ms);
                --holding;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    CHECK(peak.load() <= kCapacity);
    CHECK(gate.highWaterMark() <= kCapacity);
    CHECK(gate.inUse() == 0);
    CHECK(gate.waiting() == 0);
}

TEST_CASE("ConcurrencyGate: waiters are admitted in arrival order", "[downloader][gate]") {
    ConcurrencyGate gate(1);
    auto held = gate.acquire();

    std::mutex orderMutex;
    std::vector<int> order;
    auto waiter = [&](int id) {
        auto permit = gate.acquire();
        std::lock_guard<std::mutex> lk(orderMutex);
        order.push_back(id);
    };

    std::thread first(waiter, 1);
    REQUIRE(waitFor([&] { return gate.waiting() == 1; }));
    std::thread second(waiter, 2);
    REQUIRE(waitFor([&] { return gate.waiting() == 2; }));
    std::thread third(waiter, 3);
    REQUIRE(waitFor([&] { return gate.waiting() == 3; }));

    held.release();
    first.join();
    second.join();
    third.join();

    CHECK(order == std::vector<int>{1, 2, 3});
}
