#include <catch2/catch_test_macros.hpp>

#include <wildfetch/cli/progress_renderer.h>
#include <wildfetch/cli/run_report.h>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

using namespace wildfetch::cli;
namespace dl = wildfetch::downloader;
using json = nlohmann::json;

namespace {

dl::TransferOutcome outcome(const std::string& name, dl::TransferStatus status,
                            std::uint64_t bytes = 0) {
    dl::TransferOutcome o;
    o.target.url = "http://h/" + name;
    o.target.filename = name;
    o.target.localPath = "downloads/" + name;
    o.status = status;
    o.bytesTransferred = bytes;
    o.finalSize = bytes;
    o.attempts = status == dl::TransferStatus::AlreadyPresent ? 0 : 1;
    return o;
}

dl::RunSummary mixedSummary() {
    dl::RunSummary s;
    s.outcomes.push_back(outcome("a.csv", dl::TransferStatus::Completed, 2048));
    s.outcomes.push_back(outcome("b.csv", dl::TransferStatus::AlreadyPresent));
    auto failed = outcome("c.csv", dl::TransferStatus::Failed);
    failed.error = dl::Error{dl::ErrorCode::ServerError, "HTTP 503"};
    s.outcomes.push_back(failed);
    s.total = 3;
    s.completed = 2;
    s.alreadyPresent = 1;
    s.failed = 1;
    s.failures.push_back({"c.csv", "HTTP 503"});
    s.elapsed = std::chrono::milliseconds(1500);
    return s;
}

// Everything written to a temporary FILE*
std::string drain(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string out;
    char buf[512];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        out.append(buf, n);
    }
    return out;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty())
            out.push_back(line);
    }
    return out;
}

} // namespace

TEST_CASE("exit_code_for: run outcomes", "[cli][report]") {
    dl::RunSummary ok;
    ok.total = 2;
    ok.completed = 2;
    CHECK(exit_code_for(ok) == kExitOk);

    CHECK(exit_code_for(mixedSummary()) == kExitFailures);

    dl::RunSummary cancelled;
    cancelled.total = 2;
    cancelled.completed = 1;
    cancelled.cancelled = 1;
    CHECK(exit_code_for(cancelled) == kExitFailures);
}

TEST_CASE("exit_code_for: run-level errors", "[cli][report]") {
    CHECK(exit_code_for(dl::Error{dl::ErrorCode::InvalidTemplate, "x"}) == kExitConfigError);
    CHECK(exit_code_for(dl::Error{dl::ErrorCode::InvalidRange, "x"}) == kExitConfigError);
    CHECK(exit_code_for(dl::Error{dl::ErrorCode::InvalidArgument, "x"}) == kExitConfigError);
    CHECK(exit_code_for(dl::Error{dl::ErrorCode::IoError, "x"}) == kExitFailures);
}

TEST_CASE("summary_to_json: totals, failures and per-file entries", "[cli][report]") {
    auto j = summary_to_json(mixedSummary());

    CHECK(j["total"] == 3);
    CHECK(j["completed"] == 2);
    CHECK(j["already_present"] == 1);
    CHECK(j["failed"] == 1);
    CHECK(j["success"] == false);
    CHECK(j["elapsed_ms"] == 1500);

    REQUIRE(j["failures"].size() == 1);
    CHECK(j["failures"][0]["file"] == "c.csv");
    CHECK(j["failures"][0]["message"] == "HTTP 503");

    REQUIRE(j["files"].size() == 3);
    CHECK(j["files"][0]["status"] == "completed");
    CHECK(j["files"][0]["bytes_transferred"] == 2048);
    CHECK_FALSE(j["files"][0].contains("error"));
    CHECK(j["files"][1]["status"] == "already_present");
    CHECK(j["files"][2]["status"] == "failed");
    CHECK(j["files"][2]["error"]["code"] == "ServerError");
}

TEST_CASE("format_summary: plain text without colors", "[cli][report]") {
    auto text = format_summary(mixedSummary(), false);

    CHECK(text.find("Downloaded 2/3 file(s)") != std::string::npos);
    CHECK(text.find("1 already present") != std::string::npos);
    CHECK(text.find("Failed (1):") != std::string::npos);
    CHECK(text.find("  - c.csv: HTTP 503") != std::string::npos);
    CHECK(text.find('\x1b') == std::string::npos);
}

TEST_CASE("ProgressRenderer: JSON lines", "[cli][progress]") {
    std::FILE* f = std::tmpfile();
    REQUIRE(f != nullptr);
    {
        ProgressRenderer renderer(ProgressMode::Json, 2, f);
        auto obs = renderer.observer();
        obs.onStart("a.csv");
        obs.onProgress("a.csv", 10, 40);
        obs.onComplete("a.csv", true, "");
        obs.onStart("b.csv");
        obs.onComplete("b.csv", false, "HTTP 404");
        renderer.finish();
    }
    auto out = lines(drain(f));
    std::fclose(f);

    REQUIRE(out.size() == 5);
    auto start = json::parse(out[0]);
    CHECK(start["type"] == "start");
    CHECK(start["file"] == "a.csv");

    auto progress = json::parse(out[1]);
    CHECK(progress["type"] == "progress");
    CHECK(progress["downloaded_bytes"] == 10);
    CHECK(progress["total_bytes"] == 40);

    auto done = json::parse(out[2]);
    CHECK(done["type"] == "complete");
    CHECK(done["success"] == true);

    auto failed = json::parse(out[4]);
    CHECK(failed["success"] == false);
    CHECK(failed["message"] == "HTTP 404");
}

TEST_CASE("ProgressRenderer: human lines", "[cli][progress]") {
    std::FILE* f = std::tmpfile();
    REQUIRE(f != nullptr);
    {
        ProgressRenderer renderer(ProgressMode::Human, 3, f);
        auto obs = renderer.observer();
        obs.onStart("a.csv");
        obs.onProgress("a.csv", 1536, 1536);
        obs.onComplete("a.csv", true, "");
        obs.onComplete("b.csv", true, "already downloaded");
        obs.onComplete("c.csv", false, "cancelled");
        renderer.finish();
    }
    auto out = lines(drain(f));
    std::fclose(f);

    // Not a terminal: no in-place status line, one line per event
    REQUIRE(out.size() == 4);
    CHECK(out[0] == "start     a.csv");
    CHECK(out[1] == "done      a.csv (1.5 KB)");
    CHECK(out[2] == "skip      b.csv (already downloaded)");
    CHECK(out[3] == "cancelled c.csv");
}

TEST_CASE("ProgressRenderer: none mode has no callbacks", "[cli][progress]") {
    ProgressRenderer renderer(ProgressMode::None, 1);
    auto obs = renderer.observer();
    CHECK_FALSE(obs.onStart);
    CHECK_FALSE(obs.onProgress);
    CHECK_FALSE(obs.onComplete);
}

TEST_CASE("parse_progress_mode", "[cli][progress]") {
    CHECK(parse_progress_mode("human") == ProgressMode::Human);
    CHECK(parse_progress_mode("json") == ProgressMode::Json);
    CHECK(parse_progress_mode("none") == ProgressMode::None);
    CHECK_FALSE(parse_progress_mode("fancy").has_value());
}
