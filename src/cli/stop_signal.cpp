#include <wildfetch/cli/stop_signal.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstring>

#include <signal.h>

namespace wildfetch::cli {

namespace {

std::atomic<bool> g_stop{false};
static_assert(std::atomic<bool>::is_always_lock_free, "stop flag is written from a signal handler");

void on_stop_signal(int) {
    g_stop.store(true);
}

} // namespace

void install_stop_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    // One-shot: a second Ctrl-C falls back to the default action
    sa.sa_flags = SA_RESETHAND;
    if (sigaction(SIGINT, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGINT handler");
    if (sigaction(SIGTERM, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGTERM handler");
}

bool stop_requested() noexcept {
    return g_stop.load();
}

} // namespace wildfetch::cli
