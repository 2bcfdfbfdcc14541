#pragma once

/*
 * wildfetch Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * download engine. It intentionally contains no implementation details.
 *
 * Design principles:
 * - One transfer unit per expanded URL; content transfer gated by a bounded permit pool
 * - Resume by appending from the local file size, never by truncating
 * - Errors are values (Expected<T>); failures stay scoped to one file
 * - Clear separation of concerns (HTTP adapter, disk writer, sidecar store, orchestration)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wildfetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Canonical error codes for downloader operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    InvalidTemplate,
    InvalidRange,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    StatusMismatch,
    IoError,
    Cancelled,
    Unknown
};

/**
 * Lifecycle phases of a single transfer unit.
 */
enum class TransferPhase { Probing, Deciding, Fetching, Persisting, Completed, Failed, Cancelled };

/**
 * How the local file is opened for a content request.
 */
enum class WriteMode {
    Fresh, // truncate, request full body
    Append // keep existing bytes, request Range from the local size
};

/**
 * Terminal status of a transfer unit.
 */
enum class TransferStatus { Completed, AlreadyPresent, Failed, Cancelled };

inline constexpr std::size_t kDefaultChunkSize = 8192;
inline constexpr std::size_t kMaxFailureMessageLength = 200;
// Upper bound for timeouts and the retry delay (one week); keeps millisecond counts inside
// the 32-bit `long` libcurl takes for its timeout options
inline constexpr std::chrono::seconds kMaxDuration{7 * 24 * 60 * 60};

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Fixed-delay retry policy. maxAttempts counts the first attempt.
 */
struct RetryPolicy {
    bool enabled{true};
    int maxAttempts{3};
    std::chrono::milliseconds delay{1000};
};

/**
 * Per network call timeouts.
 */
struct TimeoutConfig {
    std::chrono::milliseconds total{30000};
    std::chrono::milliseconds connect{10000};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Immutable description of one bulk download run.
 */
struct DownloadSpec {
    std::string urlTemplate;
    std::filesystem::path outputDir{"./downloads"};
    int maxConcurrent{10};
    std::size_t chunkSizeBytes{kDefaultChunkSize};
    RetryPolicy retry{};
    bool resume{true};

    TimeoutConfig timeout{};
    std::vector<Header> headers;
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
    std::string userAgent{"wildfetch/0.1"};
};

/**
 * One concrete URL produced by template expansion.
 */
struct ExpandedTarget {
    std::string url;
    std::string filename;
    std::filesystem::path localPath;
    std::size_t index{0};
};

/**
 * Mutable per-unit state. Owned exclusively by its TransferUnit.
 */
struct TransferState {
    std::uint64_t bytesDownloaded{0};
    std::optional<std::uint64_t> bytesExpectedTotal{};
    int attemptCount{0};
    TransferPhase phase{TransferPhase::Probing};
    std::uint64_t resumeOffset{0};
};

/**
 * What a metadata-only request learned about the remote object.
 */
struct ProbeResult {
    bool acceptsRanges{false};
    std::optional<std::uint64_t> contentLength{}; // nullopt when missing or zero
};

/**
 * Record persisted next to a partial download: outputDir/.<filename>.meta
 */
struct SidecarMetadata {
    std::optional<std::uint64_t> expectedTotalSize{};
    std::string url;
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Final result for a single target.
 */
struct TransferOutcome {
    ExpandedTarget target;
    TransferStatus status{TransferStatus::Failed};
    std::uint64_t bytesTransferred{0}; // fetched over the network during this run
    std::uint64_t finalSize{0};        // local file size at the end
    int attempts{0};
    std::optional<Error> error{};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool success() const noexcept {
        return status == TransferStatus::Completed || status == TransferStatus::AlreadyPresent;
    }
};

/**
 * Caller-owned aggregate of one orchestrator run.
 */
struct RunSummary {
    struct Failure {
        std::string filename;
        std::string message;
    };

    std::size_t total{0};
    std::size_t completed{0}; // includes alreadyPresent
    std::size_t alreadyPresent{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    std::vector<Failure> failures;         // ordered by target index
    std::vector<TransferOutcome> outcomes; // expansion order
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool allSucceeded() const noexcept { return completed == total; }
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using StartCallback = std::function<void(const std::string& filename)>;
using ProgressCallback = std::function<void(const std::string& filename,
                                            std::uint64_t bytesDownloaded,
                                            std::uint64_t bytesTotalOrBestEffort)>;
using CompleteCallback =
    std::function<void(const std::string& filename, bool success, const std::string& message)>;
using ShouldCancel = std::function<bool()>; // return true to cancel ASAP

/**
 * Event contract exposed to observers (console renderer, JSON lines, logs).
 * Any callback may be empty.
 */
struct TransferObserver {
    StartCallback onStart;
    ProgressCallback onProgress;
    CompleteCallback onComplete;
};

// ==========================
// Service interface classes
// ==========================

/**
 * Parameters of one network call.
 */
struct FetchRequest {
    std::string url;
    std::vector<Header> headers;
    std::optional<std::uint64_t> rangeStart{}; // set => "Range: bytes=<start>-"
    TimeoutConfig timeout{};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
    std::string userAgent;
    std::size_t bufferSizeHint{0}; // 0 = transport default
};

/**
 * Status line and size headers of a content response.
 */
struct ResponseHead {
    long httpStatus{0};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> contentRangeStart{};
    std::optional<std::uint64_t> contentRangeTotal{};
};

using HeadHandler = std::function<Expected<void>(const ResponseHead&)>;
using ChunkSink = std::function<Expected<void>(std::span<const std::byte>)>;

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Probe server metadata (HEAD preferred) for range support and content length.
     * An error means the probe failed; callers downgrade rather than abort.
     */
    virtual Expected<ProbeResult> probe(const FetchRequest& request) = 0;

    /**
     * Issue a GET (ranged when request.rangeStart is set) and stream the body.
     * onHead is invoked exactly once, before the first body byte reaches the sink; an error
     * from onHead or from the sink aborts the transfer and is returned unchanged.
     */
    virtual Expected<ResponseHead> fetch(const FetchRequest& request, const HeadHandler& onHead,
                                         const ChunkSink& sink) = 0;
};

/**
 * Open local output file. Closed (flushed + synced) by close() or, best-effort, on destruction.
 */
class IOutputFile {
public:
    virtual ~IOutputFile() = default;

    virtual Expected<void> append(std::span<const std::byte> data) = 0;
    virtual Expected<void> close() = 0;
};

/**
 * Filesystem sink for transfer units. Each unit owns its own paths exclusively.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    virtual Expected<void> ensureDirectory(const std::filesystem::path& dir) = 0;

    /**
     * Size of a regular file, or nullopt if it does not exist.
     */
    virtual Expected<std::optional<std::uint64_t>>
    fileSize(const std::filesystem::path& path) = 0;

    virtual Expected<std::unique_ptr<IOutputFile>> open(const std::filesystem::path& path,
                                                        WriteMode mode) = 0;

    /**
     * Best-effort removal.
     */
    virtual void remove(const std::filesystem::path& path) noexcept = 0;
};

/**
 * Sidecar persistence for partial downloads, keyed by the target's local path.
 */
class ISidecarStore {
public:
    virtual ~ISidecarStore() = default;

    virtual Expected<std::optional<SidecarMetadata>> load(const ExpandedTarget& target) = 0;
    virtual Expected<void> save(const ExpandedTarget& target, const SidecarMetadata& meta) = 0;
    virtual void remove(const ExpandedTarget& target) noexcept = 0;
};

// ======================
// Free helpers
// ======================

[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;
[[nodiscard]] std::string_view phaseName(TransferPhase phase) noexcept;
[[nodiscard]] std::string_view statusName(TransferStatus status) noexcept;

/**
 * Transient failures are eligible for retry.
 */
[[nodiscard]] bool isTransient(ErrorCode code) noexcept;

/**
 * Reject specs that cannot be run (InvalidArgument).
 */
Expected<void> validateSpec(const DownloadSpec& spec);

/**
 * Shorten a message for user-visible summaries, appending "..." when cut.
 */
[[nodiscard]] std::string truncateMessage(std::string_view message,
                                          std::size_t maxLength = kMaxFailureMessageLength);

/**
 * Sidecar location for a local file: <dir>/.<filename>.meta
 */
[[nodiscard]] inline std::filesystem::path sidecarPathFor(const std::filesystem::path& localPath) {
    auto name = std::string(".") + localPath.filename().string() + ".meta";
    return localPath.parent_path() / name;
}

// ======================
// Factories
// ======================

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<ISidecarStore> makeJsonSidecarStore();

} // namespace wildfetch::downloader
