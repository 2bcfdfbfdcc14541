#pragma once

#include <wildfetch/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace wildfetch::cli {

enum class ProgressMode { Human, Json, None };

std::optional<ProgressMode> parse_progress_mode(std::string_view s);

/**
 * Console observer for a run.
 *
 * Human: one line per started/finished file plus a single aggregate status line that is
 * redrawn in place (at most every 100 ms).
 * Json: one JSON object per event, newline-delimited.
 *
 * Callbacks arrive serialized from the orchestrator; the renderer does no locking.
 */
class ProgressRenderer {
public:
    ProgressRenderer(ProgressMode mode, std::size_t totalFiles, std::FILE* out = stderr);

    [[nodiscard]] downloader::TransferObserver observer();

    // Clears the status line, if one is showing
    void finish();

    void onStart(const std::string& filename);
    void onProgress(const std::string& filename, std::uint64_t bytes, std::uint64_t total);
    void onComplete(const std::string& filename, bool success, const std::string& message);

private:
    struct FileProgress {
        std::uint64_t bytes{0};
        std::uint64_t total{0};
    };

    void printLine(const std::string& line);
    void drawStatus(bool force);
    void clearStatus();

    ProgressMode mode_;
    std::size_t totalFiles_;
    std::FILE* out_;
    bool colors_{false};

    std::map<std::string, FileProgress> active_;
    std::size_t finished_{0};
    std::size_t failed_{0};
    std::uint64_t finishedBytes_{0};
    std::size_t statusWidth_{0};
    std::chrono::steady_clock::time_point lastDraw_{};
};

} // namespace wildfetch::cli
