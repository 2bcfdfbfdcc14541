#include <wildfetch/cli/run_report.h>
#include <wildfetch/cli/ui_helpers.hpp>
#include <wildfetch/config/config_helpers.h>

#include <fmt/core.h>

namespace wildfetch::cli {

using json = nlohmann::json;
namespace dl = wildfetch::downloader;

int exit_code_for(const dl::RunSummary& summary) {
    return summary.failed == 0 && summary.cancelled == 0 ? kExitOk : kExitFailures;
}

int exit_code_for(const dl::Error& error) {
    switch (error.code) {
        case dl::ErrorCode::InvalidArgument:
        case dl::ErrorCode::InvalidTemplate:
        case dl::ErrorCode::InvalidRange:
            return kExitConfigError;
        default:
            return kExitFailures;
    }
}

json summary_to_json(const dl::RunSummary& summary) {
    json j;
    j["total"] = summary.total;
    j["completed"] = summary.completed;
    j["already_present"] = summary.alreadyPresent;
    j["failed"] = summary.failed;
    j["cancelled"] = summary.cancelled;
    j["elapsed_ms"] = summary.elapsed.count();
    j["success"] = summary.allSucceeded();

    j["failures"] = json::array();
    for (const auto& f : summary.failures) {
        j["failures"].push_back({{"file", f.filename}, {"message", f.message}});
    }

    j["files"] = json::array();
    for (const auto& o : summary.outcomes) {
        json f;
        f["url"] = o.target.url;
        f["file"] = o.target.filename;
        f["path"] = o.target.localPath.string();
        f["status"] = std::string(dl::statusName(o.status));
        f["bytes_transferred"] = o.bytesTransferred;
        f["size_bytes"] = o.finalSize;
        f["attempts"] = o.attempts;
        f["elapsed_ms"] = o.elapsed.count();
        if (o.error && o.status == dl::TransferStatus::Failed) {
            f["error"] = {{"code", std::string(dl::errorCodeName(o.error->code))},
                          {"message", dl::truncateMessage(o.error->message)}};
        }
        j["files"].push_back(std::move(f));
    }
    return j;
}

std::string format_summary(const dl::RunSummary& summary, bool colors) {
    std::uint64_t transferred = 0;
    for (const auto& o : summary.outcomes) {
        transferred += o.bytesTransferred;
    }

    const char* headColor = summary.allSucceeded() ? ui::Ansi::GREEN : ui::Ansi::YELLOW;
    std::string out = ui::colorize(
        fmt::format("Downloaded {}/{} file(s)", summary.completed, summary.total), headColor,
        colors);
    out += fmt::format(" in {:.1f}s, {} transferred", summary.elapsed.count() / 1000.0,
                       ui::format_bytes(transferred));
    if (summary.alreadyPresent > 0) {
        out += fmt::format(", {} already present", summary.alreadyPresent);
    }
    if (summary.cancelled > 0) {
        out += fmt::format(", {} cancelled", summary.cancelled);
    }
    out += "\n";

    if (!summary.failures.empty()) {
        out += ui::colorize(fmt::format("Failed ({}):", summary.failed), ui::Ansi::RED, colors);
        out += "\n";
        for (const auto& f : summary.failures) {
            out += fmt::format("  - {}: {}\n", config::sanitize_for_terminal(f.filename),
                               config::sanitize_for_terminal(f.message));
        }
    }
    return out;
}

} // namespace wildfetch::cli
