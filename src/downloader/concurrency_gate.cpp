#include <wildfetch/downloader/concurrency_gate.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace wildfetch::downloader {

ConcurrencyGate::ConcurrencyGate(std::size_t permits)
    : capacity_(std::max<std::size_t>(1, permits)), available_(capacity_) {}

GatePermit ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lk(mutex_);
    const auto ticket = nextTicket_++;
    queue_.push_back(ticket);
    cv_.wait(lk, [&] { return available_ > 0 && queue_.front() == ticket; });
    queue_.pop_front();
    --available_;
    highWater_ = std::max(highWater_, capacity_ - available_);
    // The next waiter may also be admissible if more than one permit is free
    if (available_ > 0 && !queue_.empty()) {
        cv_.notify_all();
    }
    return GatePermit{this};
}

void ConcurrencyGate::release() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (available_ >= capacity_) {
            spdlog::warn("ConcurrencyGate: release() without a matching acquire()");
            return;
        }
        ++available_;
    }
    cv_.notify_all();
}

std::size_t ConcurrencyGate::inUse() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return capacity_ - available_;
}

std::size_t ConcurrencyGate::waiting() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return queue_.size();
}

std::size_t ConcurrencyGate::highWaterMark() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return highWater_;
}

void GatePermit::release() noexcept {
    if (gate_) {
        auto* gate = gate_;
        gate_ = nullptr;
        try {
            gate->release();
        } catch (const std::exception& e) {
            spdlog::error("GatePermit: release failed: {}", e.what());
        }
    }
}

} // namespace wildfetch::downloader
