#pragma once

#include <wildfetch/downloader/concurrency_gate.hpp>
#include <wildfetch/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace wildfetch::downloader {

/**
 * Collaborators shared by every unit of a run. The adapter, writer and store must be safe
 * to call from several units at once.
 */
struct TransferServices {
    IHttpAdapter& http;
    IDiskWriter& disk;
    ISidecarStore& sidecars;
    ConcurrencyGate& gate;
};

/**
 * State machine for one target:
 *   Probing -> Deciding -> Fetching -> Persisting -> {Completed | Failed | Cancelled}
 *
 * - Probe failures downgrade to "size unknown, no ranges" and never fail the unit
 * - Resume appends from the local file size; it never truncates a partial file
 * - Transient failures are retried with a fixed delay; the offset is re-read from disk
 * - A gate permit is held only while the content request is in flight
 * - onComplete fires exactly once per run(); onStart always precedes it
 */
class TransferUnit {
public:
    TransferUnit(ExpandedTarget target, const DownloadSpec& spec, TransferServices services,
                 TransferObserver observer, ShouldCancel shouldCancel = {});

    TransferUnit(const TransferUnit&) = delete;
    TransferUnit& operator=(const TransferUnit&) = delete;

    /**
     * Drive the unit to a terminal phase. Does not throw.
     */
    TransferOutcome run();

    [[nodiscard]] const TransferState& state() const noexcept { return state_; }
    [[nodiscard]] const ExpandedTarget& target() const noexcept { return target_; }

private:
    struct Plan {
        WriteMode mode{WriteMode::Fresh};
        std::uint64_t offset{0};
    };

    TransferOutcome execute();
    void probeRemote();
    Plan decide(std::optional<std::uint64_t> localSize, bool consultSidecar);
    Expected<void> attempt(const Plan& plan);
    Expected<void> finalizeExisting();
    Expected<void> checkStatus(const ResponseHead& head, const Plan& plan);
    void learnTotal(const ResponseHead& head);
    Expected<void> writeChunk(IOutputFile& file, std::vector<std::byte>& pending);
    Expected<void> verifySize();

    [[nodiscard]] bool resumePossible() const noexcept;
    [[nodiscard]] bool cancelled() const;
    bool sleepUnlessCancelled(std::chrono::milliseconds delay) const;
    void saveSidecar();
    void enterPhase(TransferPhase phase);
    void emitStart();
    void emitProgress();
    void emitComplete(const TransferOutcome& outcome);
    FetchRequest makeRequest() const;

    TransferOutcome finish(TransferStatus status, std::optional<Error> error = std::nullopt);

    ExpandedTarget target_;
    const DownloadSpec& spec_;
    TransferServices services_;
    TransferObserver observer_;
    ShouldCancel shouldCancel_;

    TransferState state_{};
    bool acceptsRanges_{false};
    bool resumeRejected_{false}; // server ignored or contradicted a Range request
    bool started_{false};
    std::uint64_t lastReportedBytes_{0};
    std::uint64_t networkBytes_{0};
};

} // namespace wildfetch::downloader
