/*
 * wildfetch/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Output files live directly under the run's output directory (no staging)
 * - Fresh mode truncates; Append mode never touches existing bytes
 * - close() flushes, closes and fsyncs the file, then best-effort fsyncs the directory
 */

#include <wildfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace wildfetch::downloader {

namespace fs = std::filesystem;

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::IoError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::IoError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

static void fsync_dir_best_effort(const fs::path& dir) noexcept {
#if !defined(_WIN32)
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return;
    }
    if (::fsync(fd) != 0) {
        spdlog::debug("fsync(dir) failed for {} (continuing)", dir.string());
    }
    ::close(fd);
#else
    (void)dir;
#endif
}

// ---------- OutputFile ----------

class OutputFile final : public IOutputFile {
public:
    OutputFile(fs::path path, std::ofstream stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    ~OutputFile() override {
        if (stream_.is_open()) {
            // Partial files are kept; flush what we have
            stream_.flush();
            stream_.close();
        }
    }

    Expected<void> append(std::span<const std::byte> data) override {
        if (!stream_.is_open()) {
            return Error{ErrorCode::IoError, "write after close: " + path_.string()};
        }
        stream_.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
        if (!stream_.good()) {
            return Error{ErrorCode::IoError, "write failed on: " + path_.string()};
        }
        return Expected<void>{};
    }

    Expected<void> close() override {
        if (!stream_.is_open()) {
            return Expected<void>{};
        }
        stream_.flush();
        const bool flushed = stream_.good();
        stream_.close();
        if (!flushed || stream_.fail()) {
            return Error{ErrorCode::IoError, "flush/close failed on: " + path_.string()};
        }
        auto r = fsync_file(path_);
        if (!r.ok())
            return r;
        fsync_dir_best_effort(path_.parent_path());
        return Expected<void>{};
    }

private:
    fs::path path_;
    std::ofstream stream_;
};

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    Expected<void> ensureDirectory(const fs::path& dir) override {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create output dir: " + dir.string() + " (" + ec.message() +
                             ")"};
        }
        if (!fs::is_directory(dir, ec)) {
            return Error{ErrorCode::IoError, "Output path is not a directory: " + dir.string()};
        }
        return Expected<void>{};
    }

    Expected<std::optional<std::uint64_t>> fileSize(const fs::path& path) override {
        std::error_code ec;
        auto st = fs::status(path, ec);
        if (ec || st.type() == fs::file_type::not_found) {
            return std::optional<std::uint64_t>{};
        }
        if (st.type() != fs::file_type::regular) {
            return Error{ErrorCode::IoError, "Not a regular file: " + path.string()};
        }
        auto sz = fs::file_size(path, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "file_size failed for " + path.string() + ": " + ec.message()};
        }
        return std::optional<std::uint64_t>{static_cast<std::uint64_t>(sz)};
    }

    Expected<std::unique_ptr<IOutputFile>> open(const fs::path& path, WriteMode mode) override {
        const auto flags = std::ios::binary | std::ios::out |
                           (mode == WriteMode::Append ? std::ios::app : std::ios::trunc);
        std::ofstream os(path, flags);
        if (!os.good()) {
            return Error{ErrorCode::IoError, "Failed to open " + path.string() + " for " +
                                                 (mode == WriteMode::Append ? "append" : "write") +
                                                 ": " + std::strerror(errno)};
        }
        return std::unique_ptr<IOutputFile>(std::make_unique<OutputFile>(path, std::move(os)));
    }

    void remove(const fs::path& path) noexcept override {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            spdlog::debug("remove: failed to delete {}: {}", path.string(), ec.message());
        }
    }
};

/// Factory
std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace wildfetch::downloader
