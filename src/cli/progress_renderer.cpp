#include <wildfetch/cli/progress_renderer.h>
#include <wildfetch/cli/ui_helpers.hpp>
#include <wildfetch/config/config_helpers.h>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace wildfetch::cli {

using json = nlohmann::json;

namespace {

constexpr auto kRedrawInterval = std::chrono::milliseconds(100);

} // namespace

std::optional<ProgressMode> parse_progress_mode(std::string_view s) {
    if (s == "human")
        return ProgressMode::Human;
    if (s == "json")
        return ProgressMode::Json;
    if (s == "none")
        return ProgressMode::None;
    return std::nullopt;
}

ProgressRenderer::ProgressRenderer(ProgressMode mode, std::size_t totalFiles, std::FILE* out)
    : mode_(mode), totalFiles_(totalFiles), out_(out), colors_(ui::colors_enabled(out)) {}

downloader::TransferObserver ProgressRenderer::observer() {
    downloader::TransferObserver obs;
    if (mode_ == ProgressMode::None) {
        return obs;
    }
    obs.onStart = [this](const std::string& filename) { onStart(filename); };
    obs.onProgress = [this](const std::string& filename, std::uint64_t bytes,
                            std::uint64_t total) { onProgress(filename, bytes, total); };
    obs.onComplete = [this](const std::string& filename, bool success,
                            const std::string& message) { onComplete(filename, success, message); };
    return obs;
}

void ProgressRenderer::onStart(const std::string& filename) {
    active_[filename] = FileProgress{};
    if (mode_ == ProgressMode::Json) {
        json j;
        j["type"] = "start";
        j["file"] = filename;
        printLine(j.dump());
        return;
    }
    if (mode_ == ProgressMode::Human) {
        printLine(fmt::format("{} {}", ui::colorize("start    ", ui::Ansi::CYAN, colors_),
                              config::sanitize_for_terminal(filename)));
        drawStatus(true);
    }
}

void ProgressRenderer::onProgress(const std::string& filename, std::uint64_t bytes,
                                  std::uint64_t total) {
    auto& fp = active_[filename];
    fp.bytes = bytes;
    fp.total = total;
    if (mode_ == ProgressMode::Json) {
        json j;
        j["type"] = "progress";
        j["file"] = filename;
        j["downloaded_bytes"] = bytes;
        j["total_bytes"] = total;
        printLine(j.dump());
        return;
    }
    if (mode_ == ProgressMode::Human) {
        drawStatus(false);
    }
}

void ProgressRenderer::onComplete(const std::string& filename, bool success,
                                  const std::string& message) {
    std::uint64_t bytes = 0;
    if (auto it = active_.find(filename); it != active_.end()) {
        bytes = it->second.bytes;
        active_.erase(it);
    }
    ++finished_;
    finishedBytes_ += bytes;
    if (!success)
        ++failed_;

    if (mode_ == ProgressMode::Json) {
        json j;
        j["type"] = "complete";
        j["file"] = filename;
        j["success"] = success;
        j["message"] = message;
        printLine(j.dump());
        return;
    }
    if (mode_ != ProgressMode::Human) {
        return;
    }

    const auto name = config::sanitize_for_terminal(filename);
    std::string line;
    if (success && message.empty()) {
        line = fmt::format("{} {} ({})", ui::colorize("done     ", ui::Ansi::GREEN, colors_), name,
                           ui::format_bytes(bytes));
    } else if (success) {
        line = fmt::format("{} {} ({})", ui::colorize("skip     ", ui::Ansi::DIM, colors_), name,
                           message);
    } else if (message == "cancelled") {
        line = fmt::format("{} {}", ui::colorize("cancelled", ui::Ansi::YELLOW, colors_), name);
    } else {
        line = fmt::format("{} {}: {}", ui::colorize("failed   ", ui::Ansi::RED, colors_), name,
                           config::sanitize_for_terminal(downloader::truncateMessage(message)));
    }
    printLine(line);
    drawStatus(true);
}

void ProgressRenderer::finish() {
    clearStatus();
}

void ProgressRenderer::printLine(const std::string& line) {
    clearStatus();
    fmt::print(out_, "{}\n", line);
    std::fflush(out_);
}

void ProgressRenderer::drawStatus(bool force) {
    // Redrawing in place only makes sense on a terminal
    if (!ui::stream_is_tty(out_)) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (!force && now - lastDraw_ < kRedrawInterval) {
        return;
    }
    lastDraw_ = now;

    std::uint64_t bytes = finishedBytes_;
    std::uint64_t known = 0;
    std::uint64_t knownDone = 0;
    for (const auto& [name, fp] : active_) {
        bytes += fp.bytes;
        known += fp.total;
        knownDone += fp.bytes;
    }
    const double fraction =
        totalFiles_ == 0 ? 1.0 : static_cast<double>(finished_) / static_cast<double>(totalFiles_);
    std::string content =
        fmt::format("{} {}/{} files, {} active, {}", ui::progress_bar(fraction, 20, true),
                    finished_, totalFiles_, active_.size(), ui::format_bytes(bytes));
    if (known > 0) {
        content += fmt::format(" (active {}/{})", ui::format_bytes(knownDone),
                               ui::format_bytes(known));
    }
    if (failed_ > 0) {
        content += fmt::format(", {} failed", failed_);
    }

    std::string out = "\r" + content;
    if (statusWidth_ > content.size()) {
        out += std::string(statusWidth_ - content.size(), ' ');
    }
    fmt::print(out_, "{}", out);
    std::fflush(out_);
    statusWidth_ = content.size();
}

void ProgressRenderer::clearStatus() {
    if (statusWidth_ == 0) {
        return;
    }
    fmt::print(out_, "\r{}\r", std::string(statusWidth_, ' '));
    statusWidth_ = 0;
}

} // namespace wildfetch::cli
