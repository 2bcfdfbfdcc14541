#pragma once

#include <wildfetch/downloader/downloader.hpp>

#include <atomic>
#include <cstddef>
#include <memory>

namespace wildfetch::downloader {

/**
 * Runs one bulk download: expands the template, starts one transfer unit per target on its
 * own thread, bounds content transfer with a ConcurrencyGate and returns the aggregate.
 *
 * Only DownloadSpec validation, template expansion and output directory creation errors are
 * returned as errors; per-file failures are reported in the RunSummary.
 *
 * Observer callbacks are invoked one at a time (serialized by the orchestrator).
 */
class DownloadOrchestrator {
public:
    /**
     * Null collaborators are replaced by the production implementations
     * (libcurl adapter, filesystem writer, JSON sidecar store).
     */
    explicit DownloadOrchestrator(std::unique_ptr<IHttpAdapter> http = nullptr,
                                  std::unique_ptr<IDiskWriter> disk = nullptr,
                                  std::unique_ptr<ISidecarStore> sidecars = nullptr);
    ~DownloadOrchestrator();

    DownloadOrchestrator(const DownloadOrchestrator&) = delete;
    DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

    Expected<RunSummary> run(const DownloadSpec& spec, const TransferObserver& observer = {},
                             const ShouldCancel& shouldCancel = {});

    /**
     * Ask every running unit to stop at its next chunk boundary. Sticky for the lifetime of
     * the orchestrator; safe to call from a signal-watching thread.
     */
    void requestCancel() noexcept;
    [[nodiscard]] bool cancelRequested() const noexcept;

    /**
     * Peak number of units that held a gate permit during the last run.
     */
    [[nodiscard]] std::size_t lastPeakConcurrency() const noexcept;

private:
    std::unique_ptr<IHttpAdapter> http_;
    std::unique_ptr<IDiskWriter> disk_;
    std::unique_ptr<ISidecarStore> sidecars_;
    std::atomic<bool> cancel_{false};
    std::atomic<std::size_t> lastPeak_{0};
};

} // namespace wildfetch::downloader
