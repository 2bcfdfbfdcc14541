#include <catch2/catch_test_macros.hpp>

#include <wildfetch/cli/stop_signal.h>

#include <atomic>
#include <csignal>
#include <thread>

using namespace wildfetch::cli;

TEST_CASE("stop_signal: SIGINT raises the flag seen by worker threads", "[cli][signal]") {
    install_stop_handlers();
    CHECK_FALSE(stop_requested());

    REQUIRE(std::raise(SIGINT) == 0);
    CHECK(stop_requested());

    // The orchestrator's units poll the flag from their own threads
    std::atomic<bool> seenByWorker{false};
    std::thread worker([&] { seenByWorker = stop_requested(); });
    worker.join();
    CHECK(seenByWorker.load());
}
