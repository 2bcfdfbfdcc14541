/*
 * wildfetch/src/downloader/transfer_unit.cpp
 *
 * Per-file state machine. Notes:
 * - The body is re-chunked to spec.chunkSizeBytes before it reaches disk; cancellation is
 *   polled before every chunk write, progress is emitted after it
 * - The file is opened only after the response status has been accepted, so a bad status
 *   never truncates a partial download
 * - Sidecar lifecycle: written before fetching, removed on success and on terminal failure,
 *   kept on cancellation
 */

#include <wildfetch/downloader/transfer_unit.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <string>
#include <thread>
#include <utility>

namespace wildfetch::downloader {

namespace {

constexpr auto kCancelPollSlice = std::chrono::milliseconds(50);

Error cancelledError() {
    return Error{ErrorCode::Cancelled, "cancelled"};
}

} // namespace

TransferUnit::TransferUnit(ExpandedTarget target, const DownloadSpec& spec,
                           TransferServices services, TransferObserver observer,
                           ShouldCancel shouldCancel)
    : target_(std::move(target)), spec_(spec), services_(services),
      observer_(std::move(observer)), shouldCancel_(std::move(shouldCancel)) {}

TransferOutcome TransferUnit::run() {
    const auto startedAt = std::chrono::steady_clock::now();

    TransferOutcome outcome;
    try {
        outcome = execute();
    } catch (const std::exception& ex) {
        spdlog::error("{}: unexpected exception: {}", target_.filename, ex.what());
        services_.sidecars.remove(target_);
        state_.phase = TransferPhase::Failed;
        outcome.status = TransferStatus::Failed;
        outcome.error = Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
    }

    outcome.target = target_;
    outcome.attempts = state_.attemptCount;
    outcome.bytesTransferred = networkBytes_;
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt);

    emitComplete(outcome);
    return outcome;
}

TransferOutcome TransferUnit::execute() {
    if (cancelled()) {
        return finish(TransferStatus::Cancelled, cancelledError());
    }

    probeRemote();

    enterPhase(TransferPhase::Deciding);
    auto local = services_.disk.fileSize(target_.localPath);
    if (!local) {
        return finish(TransferStatus::Failed, local.error());
    }
    const auto& localSize = local.value();

    if (localSize && state_.bytesExpectedTotal && *localSize == *state_.bytesExpectedTotal) {
        spdlog::info("{}: already downloaded ({} bytes)", target_.filename, *localSize);
        services_.sidecars.remove(target_);
        state_.bytesDownloaded = *localSize;
        return finish(TransferStatus::AlreadyPresent);
    }

    auto plan = decide(localSize, /*consultSidecar=*/true);
    saveSidecar();

    const int maxAttempts = spec_.retry.enabled ? spec_.retry.maxAttempts : 1;
    for (;;) {
        ++state_.attemptCount;
        auto result = attempt(plan);
        if (result) {
            return finish(TransferStatus::Completed);
        }

        const Error err = result.error();
        if (err.code == ErrorCode::Cancelled) {
            return finish(TransferStatus::Cancelled, err);
        }
        if (!isTransient(err.code) || state_.attemptCount >= maxAttempts) {
            return finish(TransferStatus::Failed, err);
        }

        spdlog::warn("{}: attempt {}/{} failed ({}: {}); retrying in {} ms", target_.filename,
                     state_.attemptCount, maxAttempts, errorCodeName(err.code), err.message,
                     spec_.retry.delay.count());
        if (!sleepUnlessCancelled(spec_.retry.delay)) {
            return finish(TransferStatus::Cancelled, cancelledError());
        }

        // Offset comes from what is actually on disk, not from in-memory counters
        enterPhase(TransferPhase::Deciding);
        auto restat = services_.disk.fileSize(target_.localPath);
        if (!restat) {
            return finish(TransferStatus::Failed, restat.error());
        }
        const auto onDisk = restat.value().value_or(0);
        if (state_.bytesExpectedTotal && onDisk == *state_.bytesExpectedTotal) {
            auto fin = finalizeExisting();
            if (!fin) {
                return finish(TransferStatus::Failed, fin.error());
            }
            return finish(TransferStatus::Completed);
        }
        plan = decide(restat.value(), /*consultSidecar=*/false);
    }
}

void TransferUnit::probeRemote() {
    enterPhase(TransferPhase::Probing);
    auto probed = services_.http.probe(makeRequest());
    if (!probed) {
        spdlog::debug("{}: probe failed ({}); continuing with unknown size", target_.filename,
                      probed.error().message);
        acceptsRanges_ = false;
        state_.bytesExpectedTotal.reset();
        return;
    }
    const auto& info = probed.value();
    acceptsRanges_ = info.acceptsRanges;
    if (info.contentLength && *info.contentLength > 0) {
        state_.bytesExpectedTotal = info.contentLength;
    } else {
        state_.bytesExpectedTotal.reset();
    }
    spdlog::debug("{}: probe size={} ranges={}", target_.filename,
                  state_.bytesExpectedTotal ? std::to_string(*state_.bytesExpectedTotal)
                                            : std::string("unknown"),
                  acceptsRanges_);
}

TransferUnit::Plan TransferUnit::decide(std::optional<std::uint64_t> localSize,
                                        bool consultSidecar) {
    Plan plan;
    if (!localSize || *localSize == 0) {
        return plan;
    }
    if (!resumePossible()) {
        spdlog::debug("{}: resume not possible, starting over from offset 0", target_.filename);
        return plan;
    }
    if (*localSize > *state_.bytesExpectedTotal) {
        spdlog::info("{}: local file ({} bytes) is larger than remote ({} bytes); starting over",
                     target_.filename, *localSize, *state_.bytesExpectedTotal);
        return plan;
    }

    if (consultSidecar) {
        auto meta = services_.sidecars.load(target_);
        if (!meta) {
            spdlog::debug("{}: sidecar unreadable ({}); trusting local size", target_.filename,
                          meta.error().message);
        } else if (meta.value()) {
            const auto& recorded = *meta.value();
            const bool sameUrl = recorded.url == target_.url;
            const bool sameSize = !recorded.expectedTotalSize ||
                                  *recorded.expectedTotalSize == *state_.bytesExpectedTotal;
            if (!sameUrl || !sameSize) {
                spdlog::info("{}: partial file belongs to a different source; starting over",
                             target_.filename);
                return plan;
            }
        }
    }

    plan.mode = WriteMode::Append;
    plan.offset = *localSize;
    spdlog::info("{}: resuming at byte {} of {}", target_.filename, plan.offset,
                 *state_.bytesExpectedTotal);
    return plan;
}

Expected<void> TransferUnit::attempt(const Plan& plan) {
    state_.resumeOffset = plan.offset;
    state_.bytesDownloaded = plan.offset;

    GatePermit permit = services_.gate.acquire();
    if (cancelled()) {
        return cancelledError();
    }
    enterPhase(TransferPhase::Fetching);
    emitStart();

    auto request = makeRequest();
    if (plan.mode == WriteMode::Append) {
        request.rangeStart = plan.offset;
    }

    const std::size_t chunkSize = spec_.chunkSizeBytes;
    std::unique_ptr<IOutputFile> file;
    std::vector<std::byte> pending;
    pending.reserve(chunkSize);

    HeadHandler onHead = [&](const ResponseHead& head) -> Expected<void> {
        auto accepted = checkStatus(head, plan);
        if (!accepted) {
            return accepted;
        }
        learnTotal(head);
        auto opened = services_.disk.open(target_.localPath, plan.mode);
        if (!opened) {
            return opened.error();
        }
        file = std::move(opened).value();
        return Expected<void>{};
    };

    ChunkSink sink = [&](std::span<const std::byte> data) -> Expected<void> {
        if (!file) {
            return Error{ErrorCode::IoError, "response body arrived before headers"};
        }
        networkBytes_ += data.size();
        while (!data.empty()) {
            const auto take = std::min(chunkSize - pending.size(), data.size());
            pending.insert(pending.end(), data.begin(),
                           data.begin() + static_cast<std::ptrdiff_t>(take));
            data = data.subspan(take);
            if (pending.size() == chunkSize) {
                auto written = writeChunk(*file, pending);
                if (!written) {
                    return written;
                }
            }
        }
        return Expected<void>{};
    };

    auto fetched = services_.http.fetch(request, onHead, sink);
    if (!fetched) {
        const Error err = fetched.error();
        if (file) {
            // Keep what already arrived so the next attempt can resume after it
            if (!pending.empty() && isTransient(err.code)) {
                auto written = writeChunk(*file, pending);
                if (!written) {
                    spdlog::debug("{}: could not keep buffered bytes: {}", target_.filename,
                                  written.error().message);
                }
            }
            auto closed = file->close();
            if (!closed) {
                spdlog::debug("{}: close after failed fetch: {}", target_.filename,
                              closed.error().message);
            }
        }
        return err;
    }
    permit.release();

    enterPhase(TransferPhase::Persisting);
    if (!file) {
        auto opened = services_.disk.open(target_.localPath, plan.mode);
        if (!opened) {
            return opened.error();
        }
        file = std::move(opened).value();
    }
    if (!pending.empty()) {
        auto written = writeChunk(*file, pending);
        if (!written) {
            return written;
        }
    }
    auto closed = file->close();
    if (!closed) {
        return closed;
    }
    auto verified = verifySize();
    if (!verified) {
        return verified;
    }
    services_.sidecars.remove(target_);
    return Expected<void>{};
}

Expected<void> TransferUnit::finalizeExisting() {
    enterPhase(TransferPhase::Persisting);
    auto opened = services_.disk.open(target_.localPath, WriteMode::Append);
    if (!opened) {
        return opened.error();
    }
    auto closed = opened.value()->close();
    if (!closed) {
        return closed;
    }
    state_.bytesDownloaded = *state_.bytesExpectedTotal;
    services_.sidecars.remove(target_);
    spdlog::debug("{}: local file already complete after retry", target_.filename);
    return Expected<void>{};
}

Expected<void> TransferUnit::checkStatus(const ResponseHead& head, const Plan& plan) {
    const auto status = std::to_string(head.httpStatus);
    if (plan.mode == WriteMode::Append) {
        if (head.httpStatus == 206) {
            if (head.contentRangeStart && *head.contentRangeStart != plan.offset) {
                resumeRejected_ = true;
                return Error{ErrorCode::StatusMismatch,
                             "Content-Range starts at " + std::to_string(*head.contentRangeStart) +
                                 ", expected " + std::to_string(plan.offset)};
            }
            if (head.contentRangeTotal && state_.bytesExpectedTotal &&
                *head.contentRangeTotal != *state_.bytesExpectedTotal) {
                resumeRejected_ = true;
                return Error{ErrorCode::StatusMismatch,
                             "remote size changed from " +
                                 std::to_string(*state_.bytesExpectedTotal) + " to " +
                                 std::to_string(*head.contentRangeTotal)};
            }
            return Expected<void>{};
        }
        if (head.httpStatus == 200) {
            resumeRejected_ = true;
            return Error{ErrorCode::StatusMismatch, "server ignored Range request (HTTP 200)"};
        }
    } else if (head.httpStatus == 200) {
        return Expected<void>{};
    }

    if (head.httpStatus >= 400) {
        return Error{ErrorCode::ServerError, "HTTP " + status};
    }
    return Error{ErrorCode::StatusMismatch,
                 "unexpected HTTP " + status + " (expected " +
                     (plan.mode == WriteMode::Append ? "206" : "200") + ")"};
}

void TransferUnit::learnTotal(const ResponseHead& head) {
    std::optional<std::uint64_t> total;
    if (head.httpStatus == 206) {
        total = head.contentRangeTotal;
    } else if (head.contentLength) {
        total = head.contentLength;
    }
    if (!total || *total == 0 || total == state_.bytesExpectedTotal) {
        return;
    }
    spdlog::debug("{}: response reports {} bytes", target_.filename, *total);
    state_.bytesExpectedTotal = total;
    saveSidecar();
}

Expected<void> TransferUnit::writeChunk(IOutputFile& file, std::vector<std::byte>& pending) {
    if (cancelled()) {
        return cancelledError();
    }
    auto appended = file.append(std::span<const std::byte>(pending.data(), pending.size()));
    if (!appended) {
        return appended;
    }
    state_.bytesDownloaded += pending.size();
    pending.clear();
    emitProgress();
    return Expected<void>{};
}

Expected<void> TransferUnit::verifySize() {
    auto size = services_.disk.fileSize(target_.localPath);
    if (!size) {
        return size.error();
    }
    if (!state_.bytesExpectedTotal) {
        return Expected<void>{};
    }
    const auto actual = size.value().value_or(0);
    const auto expected = *state_.bytesExpectedTotal;
    if (actual < expected) {
        return Error{ErrorCode::NetworkError, "short body: have " + std::to_string(actual) +
                                                  " of " + std::to_string(expected) + " bytes"};
    }
    if (actual > expected) {
        return Error{ErrorCode::ServerError, "received " + std::to_string(actual) +
                                                 " bytes, more than the expected " +
                                                 std::to_string(expected)};
    }
    return Expected<void>{};
}

bool TransferUnit::resumePossible() const noexcept {
    return spec_.resume && acceptsRanges_ && !resumeRejected_ &&
           state_.bytesExpectedTotal.has_value();
}

bool TransferUnit::cancelled() const {
    return shouldCancel_ && shouldCancel_();
}

bool TransferUnit::sleepUnlessCancelled(std::chrono::milliseconds delay) const {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + delay;
    for (;;) {
        if (cancelled()) {
            return false;
        }
        const auto now = clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(
            std::min(std::chrono::duration_cast<clock::duration>(kCancelPollSlice),
                     deadline - now));
    }
}

void TransferUnit::saveSidecar() {
    SidecarMetadata meta;
    meta.expectedTotalSize = state_.bytesExpectedTotal;
    meta.url = target_.url;
    auto saved = services_.sidecars.save(target_, meta);
    if (!saved) {
        spdlog::warn("{}: could not write sidecar: {}", target_.filename, saved.error().message);
    }
}

void TransferUnit::enterPhase(TransferPhase phase) {
    state_.phase = phase;
    spdlog::trace("{}: -> {}", target_.filename, phaseName(phase));
}

void TransferUnit::emitStart() {
    if (started_) {
        return;
    }
    started_ = true;
    if (observer_.onStart) {
        observer_.onStart(target_.filename);
    }
}

void TransferUnit::emitProgress() {
    // After a restart from offset 0 stay silent until the count catches up again
    if (state_.bytesDownloaded < lastReportedBytes_) {
        return;
    }
    lastReportedBytes_ = state_.bytesDownloaded;
    const auto total = state_.bytesExpectedTotal
                           ? std::max(*state_.bytesExpectedTotal, state_.bytesDownloaded)
                           : state_.bytesDownloaded;
    if (observer_.onProgress) {
        observer_.onProgress(target_.filename, state_.bytesDownloaded, total);
    }
}

void TransferUnit::emitComplete(const TransferOutcome& outcome) {
    std::string message;
    switch (outcome.status) {
        case TransferStatus::Completed:
            spdlog::info("{}: done ({} bytes, {} attempt(s))", target_.filename,
                         outcome.finalSize, outcome.attempts);
            break;
        case TransferStatus::AlreadyPresent:
            message = "already downloaded";
            break;
        case TransferStatus::Cancelled:
            message = "cancelled";
            spdlog::info("{}: cancelled, partial file kept ({} bytes)", target_.filename,
                         outcome.finalSize);
            break;
        case TransferStatus::Failed:
            message = outcome.error ? outcome.error->message : std::string("unknown error");
            spdlog::warn("{}: failed after {} attempt(s): {}", target_.filename, outcome.attempts,
                         message);
            break;
    }

    try {
        emitStart();
        if (observer_.onComplete) {
            observer_.onComplete(target_.filename, outcome.success(), message);
        }
    } catch (const std::exception& ex) {
        spdlog::error("{}: completion observer threw: {}", target_.filename, ex.what());
    }
}

FetchRequest TransferUnit::makeRequest() const {
    FetchRequest req;
    req.url = target_.url;
    req.headers = spec_.headers;
    req.timeout = spec_.timeout;
    req.tls = spec_.tls;
    req.proxy = spec_.proxy;
    req.followRedirects = spec_.followRedirects;
    req.userAgent = spec_.userAgent;
    req.bufferSizeHint = spec_.chunkSizeBytes;
    return req;
}

TransferOutcome TransferUnit::finish(TransferStatus status, std::optional<Error> error) {
    switch (status) {
        case TransferStatus::Completed:
        case TransferStatus::AlreadyPresent:
            enterPhase(TransferPhase::Completed);
            break;
        case TransferStatus::Failed:
            enterPhase(TransferPhase::Failed);
            services_.sidecars.remove(target_);
            break;
        case TransferStatus::Cancelled:
            enterPhase(TransferPhase::Cancelled);
            break;
    }

    TransferOutcome out;
    out.status = status;
    out.error = std::move(error);
    auto size = services_.disk.fileSize(target_.localPath);
    if (size && size.value()) {
        out.finalSize = *size.value();
    }
    return out;
}

} // namespace wildfetch::downloader
