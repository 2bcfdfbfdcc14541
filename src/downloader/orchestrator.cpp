/*
 * wildfetch/src/downloader/orchestrator.cpp
 *
 * Thread-per-target driver. Each unit writes only its own outcome slot; counters and the
 * failure list are computed after every thread has been joined.
 */

#include <wildfetch/downloader/concurrency_gate.hpp>
#include <wildfetch/downloader/orchestrator.hpp>
#include <wildfetch/downloader/range_expander.hpp>
#include <wildfetch/downloader/transfer_unit.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace wildfetch::downloader {

namespace {

// Wraps the caller's observer so that callbacks from different units never overlap
TransferObserver makeSerializedObserver(const TransferObserver& inner, std::mutex& mu) {
    TransferObserver relay;
    if (inner.onStart) {
        relay.onStart = [&inner, &mu](const std::string& filename) {
            std::lock_guard<std::mutex> lk(mu);
            inner.onStart(filename);
        };
    }
    if (inner.onProgress) {
        relay.onProgress = [&inner, &mu](const std::string& filename, std::uint64_t bytes,
                                          std::uint64_t total) {
            std::lock_guard<std::mutex> lk(mu);
            inner.onProgress(filename, bytes, total);
        };
    }
    if (inner.onComplete) {
        relay.onComplete = [&inner, &mu](const std::string& filename, bool success,
                                          const std::string& message) {
            std::lock_guard<std::mutex> lk(mu);
            inner.onComplete(filename, success, message);
        };
    }
    return relay;
}

RunSummary summarize(std::vector<TransferOutcome> outcomes) {
    RunSummary summary;
    summary.total = outcomes.size();
    for (const auto& o : outcomes) {
        switch (o.status) {
            case TransferStatus::Completed:
                ++summary.completed;
                break;
            case TransferStatus::AlreadyPresent:
                ++summary.completed;
                ++summary.alreadyPresent;
                break;
            case TransferStatus::Cancelled:
                ++summary.cancelled;
                break;
            case TransferStatus::Failed:
                ++summary.failed;
                summary.failures.push_back(
                    {o.target.filename,
                     truncateMessage(o.error ? o.error->message : std::string("unknown error"))});
                break;
        }
    }
    summary.outcomes = std::move(outcomes);
    return summary;
}

} // namespace

DownloadOrchestrator::DownloadOrchestrator(std::unique_ptr<IHttpAdapter> http,
                                           std::unique_ptr<IDiskWriter> disk,
                                           std::unique_ptr<ISidecarStore> sidecars)
    : http_(std::move(http)), disk_(std::move(disk)), sidecars_(std::move(sidecars)) {
    if (!http_)
        http_ = makeCurlHttpAdapter();
    if (!disk_)
        disk_ = makeDiskWriter();
    if (!sidecars_)
        sidecars_ = makeJsonSidecarStore();
}

DownloadOrchestrator::~DownloadOrchestrator() = default;

Expected<RunSummary> DownloadOrchestrator::run(const DownloadSpec& spec,
                                               const TransferObserver& observer,
                                               const ShouldCancel& shouldCancel) {
    const auto startedAt = std::chrono::steady_clock::now();

    auto valid = validateSpec(spec);
    if (!valid) {
        return valid.error();
    }

    auto urls = expandUrlTemplate(spec.urlTemplate);
    if (!urls) {
        return urls.error();
    }

    auto expanded = makeTargets(urls.value(), spec.outputDir);
    if (!expanded) {
        return expanded.error();
    }

    auto dir = disk_->ensureDirectory(spec.outputDir);
    if (!dir) {
        return dir.error();
    }

    auto targets = std::move(expanded).value();
    spdlog::info("Downloading {} file(s) into {} (max {} concurrent)", targets.size(),
                 spec.outputDir.string(), spec.maxConcurrent);

    ConcurrencyGate gate(static_cast<std::size_t>(spec.maxConcurrent));
    std::mutex observerMutex;
    const auto relay = makeSerializedObserver(observer, observerMutex);

    ShouldCancel cancelPredicate = [this, &shouldCancel]() {
        return cancel_.load(std::memory_order_relaxed) || (shouldCancel && shouldCancel());
    };

    TransferServices services{*http_, *disk_, *sidecars_, gate};
    std::vector<TransferOutcome> outcomes(targets.size());

    auto runUnit = [&](std::size_t i) {
        TransferUnit unit(targets[i], spec, services, relay, cancelPredicate);
        outcomes[i] = unit.run();
    };

    std::vector<std::thread> workers;
    workers.reserve(targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        try {
            workers.emplace_back(runUnit, i);
        } catch (const std::system_error& e) {
            // Out of threads: run this target on the calling thread instead
            spdlog::warn("Could not start worker for {} ({}); running inline",
                         targets[i].filename, e.what());
            runUnit(i);
        }
    }
    for (auto& w : workers) {
        if (w.joinable())
            w.join();
    }

    lastPeak_.store(gate.highWaterMark());

    auto summary = summarize(std::move(outcomes));
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt);

    spdlog::info("Finished: {}/{} ok ({} already present), {} failed, {} cancelled in {} ms",
                 summary.completed, summary.total, summary.alreadyPresent, summary.failed,
                 summary.cancelled, summary.elapsed.count());
    return summary;
}

void DownloadOrchestrator::requestCancel() noexcept {
    cancel_.store(true);
}

bool DownloadOrchestrator::cancelRequested() const noexcept {
    return cancel_.load();
}

std::size_t DownloadOrchestrator::lastPeakConcurrency() const noexcept {
    return lastPeak_.load();
}

} // namespace wildfetch::downloader
