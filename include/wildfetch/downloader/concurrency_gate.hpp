#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace wildfetch::downloader {

class GatePermit;

/**
 * Counting admission control with FIFO hand-off.
 *
 * acquire() blocks until a permit is free and every earlier waiter has been served.
 * Thread-safe; one gate is shared by all transfer units of a run.
 */
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(std::size_t permits);
    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    [[nodiscard]] GatePermit acquire();
    void release();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t inUse() const;
    [[nodiscard]] std::size_t waiting() const;
    [[nodiscard]] std::size_t highWaterMark() const;

private:
    const std::size_t capacity_;
    std::size_t available_;
    std::size_t highWater_{0};
    std::uint64_t nextTicket_{0};
    std::deque<std::uint64_t> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * RAII holder for one permit. Releases on destruction or explicit release().
 */
class GatePermit {
public:
    GatePermit() = default;
    explicit GatePermit(ConcurrencyGate* gate) noexcept : gate_(gate) {}
    GatePermit(const GatePermit&) = delete;
    GatePermit& operator=(const GatePermit&) = delete;
    GatePermit(GatePermit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
    GatePermit& operator=(GatePermit&& other) noexcept {
        if (this != &other) {
            release();
            gate_ = other.gate_;
            other.gate_ = nullptr;
        }
        return *this;
    }
    ~GatePermit() { release(); }

    void release() noexcept;
    [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }

private:
    ConcurrencyGate* gate_{nullptr};
};

} // namespace wildfetch::downloader
