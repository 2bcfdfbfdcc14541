#include <wildfetch/downloader/downloader.hpp>

#include <string>

namespace wildfetch::downloader {

std::string_view errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::InvalidTemplate:
            return "InvalidTemplate";
        case ErrorCode::InvalidRange:
            return "InvalidRange";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TlsVerificationFailed";
        case ErrorCode::ServerError:
            return "ServerError";
        case ErrorCode::StatusMismatch:
            return "StatusMismatch";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

std::string_view phaseName(TransferPhase phase) noexcept {
    switch (phase) {
        case TransferPhase::Probing:
            return "probing";
        case TransferPhase::Deciding:
            return "deciding";
        case TransferPhase::Fetching:
            return "fetching";
        case TransferPhase::Persisting:
            return "persisting";
        case TransferPhase::Completed:
            return "completed";
        case TransferPhase::Failed:
            return "failed";
        case TransferPhase::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::string_view statusName(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Completed:
            return "completed";
        case TransferStatus::AlreadyPresent:
            return "already_present";
        case TransferStatus::Failed:
            return "failed";
        case TransferStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

bool isTransient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
        case ErrorCode::StatusMismatch:
            return true;
        default:
            return false;
    }
}

Expected<void> validateSpec(const DownloadSpec& spec) {
    if (spec.urlTemplate.empty()) {
        return Error{ErrorCode::InvalidArgument, "url_template must not be empty"};
    }
    if (spec.outputDir.empty()) {
        return Error{ErrorCode::InvalidArgument, "output_dir must not be empty"};
    }
    if (spec.maxConcurrent < 1) {
        return Error{ErrorCode::InvalidArgument, "max_concurrent must be at least 1 (got " +
                                                     std::to_string(spec.maxConcurrent) + ")"};
    }
    if (spec.chunkSizeBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk_size must be positive"};
    }
    if (spec.retry.maxAttempts < 1) {
        return Error{ErrorCode::InvalidArgument, "retries.max_attempts must be at least 1 (got " +
                                                     std::to_string(spec.retry.maxAttempts) + ")"};
    }
    if (spec.retry.delay.count() < 0) {
        return Error{ErrorCode::InvalidArgument, "retries.delay must not be negative"};
    }
    if (spec.timeout.total.count() < 0 || spec.timeout.connect.count() < 0) {
        return Error{ErrorCode::InvalidArgument, "timeouts must not be negative"};
    }
    if (spec.retry.delay > kMaxDuration || spec.timeout.total > kMaxDuration ||
        spec.timeout.connect > kMaxDuration) {
        return Error{ErrorCode::InvalidArgument,
                     "timeouts and retries.delay must not exceed " +
                         std::to_string(kMaxDuration.count()) + " seconds"};
    }
    return Expected<void>{};
}

std::string truncateMessage(std::string_view message, std::size_t maxLength) {
    if (message.size() <= maxLength) {
        return std::string(message);
    }
    if (maxLength < 3) {
        return std::string(message.substr(0, maxLength));
    }
    std::string out(message.substr(0, maxLength - 3));
    out.append("...");
    return out;
}

} // namespace wildfetch::downloader
