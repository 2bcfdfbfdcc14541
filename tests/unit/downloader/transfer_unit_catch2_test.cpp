#include <catch2/catch_test_macros.hpp>

#include "../../support/fake_http_adapter.hpp"
#include "../../support/download_sandbox.hpp"

#include <wildfetch/downloader/concurrency_gate.hpp>
#include <wildfetch/downloader/transfer_unit.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace wildfetch::downloader;
using wildfetch::test_support::EventRecorder;
using wildfetch::test_support::FakeHttpAdapter;
using wildfetch::test_support::FakeResource;
using wildfetch::test_support::DownloadSandbox;
using Kind = EventRecorder::Event::Kind;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

const std::string kBody = "0123456789abcdefghijklmnopqrstuvwxyz"; // 36 bytes

struct UnitFixture {
    DownloadSandbox dir{"wildfetch-unit"};
    FakeHttpAdapter http;
    std::unique_ptr<IDiskWriter> disk = makeDiskWriter();
    std::unique_ptr<ISidecarStore> sidecars = makeJsonSidecarStore();
    ConcurrencyGate gate{4};
    EventRecorder events;
    DownloadSpec spec;

    UnitFixture() {
        spec.urlTemplate = "http://fake.test/f_{1..1}.bin";
        spec.outputDir = dir.outputDir();
        spec.chunkSizeBytes = 4;
        spec.retry.delay = 0ms;
    }

    ExpandedTarget target(const std::string& name = "f_1.bin") const {
        ExpandedTarget t;
        t.url = "http://fake.test/" + name;
        t.filename = name;
        t.localPath = dir.pathOf(name);
        return t;
    }

    TransferOutcome runUnit(const ExpandedTarget& t, ShouldCancel cancel = {}) {
        TransferUnit unit(t, spec, TransferServices{http, *disk, *sidecars, gate},
                          events.observer(), std::move(cancel));
        return unit.run();
    }
};

} // namespace

TEST_CASE("TransferUnit: fresh download", "[downloader][unit]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});

    auto out = fx.runUnit(t);

    CHECK(out.status == TransferStatus::Completed);
    CHECK(out.success());
    CHECK_FALSE(out.error.has_value());
    CHECK(out.attempts == 1);
    CHECK(out.bytesTransferred == kBody.size());
    CHECK(out.finalSize == kBody.size());
    CHECK(fx.dir.contents(t.filename) == kBody);
    CHECK(fx.dir.sidecars().empty());

    auto reqs = fx.http.requestsFor(t.url);
    REQUIRE(reqs.size() == 1);
    CHECK_FALSE(reqs[0].rangeStart.has_value());

    auto all = fx.events.eventsFor(t.filename);
    REQUIRE(all.size() >= 3);
    CHECK(all.front().kind == Kind::Start);
    CHECK(all.back().kind == Kind::Complete);
    CHECK(all.back().success);
    CHECK(all.back().message.empty());

    auto progress = fx.events.ofKind(t.filename, Kind::Progress);
    REQUIRE_FALSE(progress.empty());
    for (std::size_t i = 1; i < progress.size(); ++i) {
        CHECK(progress[i].bytes >= progress[i - 1].bytes);
    }
    CHECK(progress.back().bytes == kBody.size());
    CHECK(progress.back().total == kBody.size());
    CHECK(fx.events.ofKind(t.filename, Kind::Start).size() == 1);
    CHECK(fx.events.ofKind(t.filename, Kind::Complete).size() == 1);
}

TEST_CASE("TransferUnit: resumes a partial file by appending", "[downloader][unit][resume]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});
    fx.dir.put(t.filename, kBody.substr(0, 10));

    auto out = fx.runUnit(t);

    REQUIRE(out.status == TransferStatus::Completed);
    CHECK(fx.dir.contents(t.filename) == kBody);
    CHECK(out.bytesTransferred == kBody.size() - 10);

    auto reqs = fx.http.requestsFor(t.url);
    REQUIRE(reqs.size() == 1);
    REQUIRE(reqs[0].rangeStart.has_value());
    CHECK(*reqs[0].rangeStart == 10);

    auto progress = fx.events.ofKind(t.filename, Kind::Progress);
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.front().bytes > 10);
    CHECK(progress.back().bytes == kBody.size());
}

TEST_CASE("TransferUnit: complete local file short-circuits", "[downloader][unit][resume]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});
    fx.dir.put(t.filename, kBody);

    auto out = fx.runUnit(t);

    CHECK(out.status == TransferStatus::AlreadyPresent);
    CHECK(out.success());
    CHECK(out.attempts == 0);
    CHECK(out.bytesTransferred == 0);
    CHECK(fx.http.requests().empty());
    CHECK(fx.dir.contents(t.filename) == kBody);

    auto all = fx.events.eventsFor(t.filename);
    REQUIRE(all.size() == 2);
    CHECK(all[0].kind == Kind::Start);
    CHECK(all[1].kind == Kind::Complete);
    CHECK(all[1].success);
    CHECK(all[1].message == "already downloaded");
}

TEST_CASE("TransferUnit: falls back to a fresh write when resume is impossible",
          "[downloader][unit][resume]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};

    SECTION("Server does not accept ranges") {
        res.acceptsRanges = false;
    }
    SECTION("Size unknown") {
        res.reportLength = false;
    }
    SECTION("Probe fails") {
        res.probeFails = true;
    }
    SECTION("Resume disabled") {
        fx.spec.resume = false;
    }

    fx.http.serve(t.url, res);
    fx.dir.put(t.filename, "STALE-BYTES");

    auto out = fx.runUnit(t);

    REQUIRE(out.status == TransferStatus::Completed);
    CHECK(fx.dir.contents(t.filename) == kBody);
    auto reqs = fx.http.requestsFor(t.url);
    REQUIRE(reqs.size() == 1);
    CHECK_FALSE(reqs[0].rangeStart.has_value());
}

TEST_CASE("TransferUnit: unknown size reports bytes as the total", "[downloader][unit]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};
    res.reportLength = false;
    fx.http.serve(t.url, res);

    auto out = fx.runUnit(t);

    REQUIRE(out.status == TransferStatus::Completed);
    for (const auto& e : fx.events.ofKind(t.filename, Kind::Progress)) {
        CHECK(e.total == e.bytes);
    }
}

TEST_CASE("TransferUnit: local file larger than remote starts over", "[downloader][unit][resume]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});
    fx.dir.put(t.filename, kBody + kBody);

    auto out = fx.runUnit(t);

    REQUIRE(out.status == TransferStatus::Completed);
    CHECK(fx.dir.contents(t.filename) == kBody);
    auto reqs = fx.http.requestsFor(t.url);
    REQUIRE(reqs.size() == 1);
    CHECK_FALSE(reqs[0].rangeStart.has_value());
}

TEST_CASE("TransferUnit: sidecar decides whether a partial file is trusted",
          "[downloader][unit][sidecar]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});
    fx.dir.put(t.filename, kBody.substr(0, 12));

    SECTION("Matching sidecar resumes") {
        REQUIRE(fx.sidecars->save(t, SidecarMetadata{kBody.size(), t.url}).ok());
        auto out = fx.runUnit(t);
        REQUIRE(out.status == TransferStatus::Completed);
        auto reqs = fx.http.requestsFor(t.url);
        REQUIRE(reqs.size() == 1);
        REQUIRE(reqs[0].rangeStart.has_value());
        CHECK(*reqs[0].rangeStart == 12);
    }

    SECTION("Sidecar from another URL restarts") {
        REQUIRE(fx.sidecars->save(t, SidecarMetadata{kBody.size(), "http://other/f_1.bin"}).ok());
        auto out = fx.runUnit(t);
        REQUIRE(out.status == TransferStatus::Completed);
        auto reqs = fx.http.requestsFor(t.url);
        REQUIRE(reqs.size() == 1);
        CHECK_FALSE(reqs[0].rangeStart.has_value());
    }

    SECTION("Sidecar with a different total restarts") {
        REQUIRE(fx.sidecars->save(t, SidecarMetadata{kBody.size() + 100, t.url}).ok());
        auto out = fx.runUnit(t);
        REQUIRE(out.status == TransferStatus::Completed);
        auto reqs = fx.http.requestsFor(t.url);
        REQUIRE(reqs.size() == 1);
        CHECK_FALSE(reqs[0].rangeStart.has_value());
    }

    CHECK(fx.dir.contents(t.filename) == kBody);
    CHECK(fx.dir.sidecars().empty());
}

TEST_CASE("TransferUnit: retry re-reads the offset from disk", "[downloader][unit][retry]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};
    res.failAfterBytes = {10};
    fx.http.serve(t.url, res);

    auto out = fx.runUnit(t);

    REQUIRE(out.status == TransferStatus::Completed);
    CHECK(out.attempts == 2);
    CHECK(fx.dir.contents(t.filename) == kBody);

    auto reqs = fx.http.requestsFor(t.url);
    REQUIRE(reqs.size() == 2);
    CHECK_FALSE(reqs[0].rangeStart.has_value());
    REQUIRE(reqs[1].rangeStart.has_value());
    CHECK(*reqs[1].rangeStart == 10);

    CHECK(fx.events.ofKind(t.filename, Kind::Start).size() == 1);
    auto completes = fx.events.ofKind(t.filename, Kind::Complete);
    REQUIRE(completes.size() == 1);
    CHECK(completes[0].success);
}

TEST_CASE("TransferUnit: retry without resume support restarts from zero",
          "[downloader][unit][retry]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};
    res.acceptsRanges = false;
    res.failAfterBytes = {20};
    fx.http.serve(t.url, res);

    auto out = fx.runUnit(t);

    REQUIRE(out.status == TransferStatus::Completed);
    CHECK(fx.dir.contents(t.filename) == kBody);
    auto reqs = fx.http.requestsFor(t.url);
    REQUIRE(reqs.size() == 2);
    CHECK_FALSE(reqs[1].rangeStart.has_value());

    // Progress stays monotone across the restart
    auto progress = fx.events.ofKind(t.filename, Kind::Progress);
    for (std::size_t i = 1; i < progress.size(); ++i) {
        CHECK(progress[i].bytes >= progress[i - 1].bytes);
    }
}

TEST_CASE("TransferUnit: exhausting retries fails once", "[downloader][unit][retry]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};
    res.failAfterBytes = {0, 0, 0, 0};
    fx.http.serve(t.url, res);
    fx.spec.retry.maxAttempts = 3;

    auto out = fx.runUnit(t);

    CHECK(out.status == TransferStatus::Failed);
    CHECK(out.attempts == 3);
    REQUIRE(out.error.has_value());
    CHECK(out.error->code == ErrorCode::NetworkError);
    CHECK(fx.http.requestsFor(t.url).size() == 3);
    CHECK(fx.dir.sidecars().empty());

    auto completes = fx.events.ofKind(t.filename, Kind::Complete);
    REQUIRE(completes.size() == 1);
    CHECK_FALSE(completes[0].success);
    CHECK_FALSE(completes[0].message.empty());
}

TEST_CASE("TransferUnit: disabled retry makes a single attempt", "[downloader][unit][retry]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};
    res.statusOverride = 503;
    fx.http.serve(t.url, res);
    fx.spec.retry.enabled = false;
    fx.spec.retry.maxAttempts = 5;

    auto out = fx.runUnit(t);

    CHECK(out.status == TransferStatus::Failed);
    CHECK(out.attempts == 1);
    REQUIRE(out.error.has_value());
    CHECK(out.error->code == ErrorCode::ServerError);
    CHECK(fx.http.requestsFor(t.url).size() == 1);
}

TEST_CASE("TransferUnit: a bad status never truncates a partial file", "[downloader][unit]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};
    res.statusOverride = 500;
    fx.http.serve(t.url, res);
    fx.spec.retry.maxAttempts = 2;
    fx.dir.put(t.filename, kBody.substr(0, 8));

    auto out = fx.runUnit(t);

    CHECK(out.status == TransferStatus::Failed);
    CHECK(fx.dir.contents(t.filename) == kBody.substr(0, 8));
    CHECK(out.finalSize == 8);
}

TEST_CASE("TransferUnit: server ignoring Range restarts fresh", "[downloader][unit][resume]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};
    res.ignoreRange = true;
    fx.http.serve(t.url, res);
    fx.dir.put(t.filename, kBody.substr(0, 10));

    auto out = fx.runUnit(t);

    REQUIRE(out.status == TransferStatus::Completed);
    CHECK(out.attempts == 2);
    CHECK(fx.dir.contents(t.filename) == kBody);

    auto reqs = fx.http.requestsFor(t.url);
    REQUIRE(reqs.size() == 2);
    REQUIRE(reqs[0].rangeStart.has_value());
    CHECK(*reqs[0].rangeStart == 10);
    CHECK_FALSE(reqs[1].rangeStart.has_value());
}

TEST_CASE("TransferUnit: non-transient local errors fail without a request",
          "[downloader][unit]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});
    fs::create_directories(t.localPath); // a directory where the file should go

    auto out = fx.runUnit(t);

    CHECK(out.status == TransferStatus::Failed);
    REQUIRE(out.error.has_value());
    CHECK(out.error->code == ErrorCode::IoError);
    CHECK(fx.http.requests().empty());
    CHECK(fx.events.ofKind(t.filename, Kind::Start).size() == 1);
    CHECK(fx.events.ofKind(t.filename, Kind::Complete).size() == 1);
}

TEST_CASE("TransferUnit: cancellation keeps the partial file and sidecar",
          "[downloader][unit][cancel]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});
    fx.http.setSliceSize(4);

    std::atomic<bool> stop{false};
    fx.http.setSliceHook([&](const std::string&, std::uint64_t delivered) {
        if (delivered >= 8)
            stop = true;
    });

    auto out = fx.runUnit(t, [&] { return stop.load(); });

    CHECK(out.status == TransferStatus::Cancelled);
    CHECK_FALSE(out.success());
    CHECK(out.attempts == 1);
    CHECK(fx.dir.contents(t.filename) == kBody.substr(0, 8));
    CHECK(fx.dir.sidecars() == std::vector<std::string>{".f_1.bin.meta"});

    auto completes = fx.events.ofKind(t.filename, Kind::Complete);
    REQUIRE(completes.size() == 1);
    CHECK_FALSE(completes[0].success);
    CHECK(completes[0].message == "cancelled");

    SECTION("A later run resumes after the kept bytes") {
        fx.http.setSliceHook({});
        auto again = fx.runUnit(t);
        REQUIRE(again.status == TransferStatus::Completed);
        CHECK(fx.dir.contents(t.filename) == kBody);
        auto reqs = fx.http.requestsFor(t.url);
        REQUIRE(reqs.size() == 2);
        REQUIRE(reqs[1].rangeStart.has_value());
        CHECK(*reqs[1].rangeStart == 8);
        CHECK(fx.dir.sidecars().empty());
    }
}

TEST_CASE("TransferUnit: cancelled before start does no work", "[downloader][unit][cancel]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});

    auto out = fx.runUnit(t, [] { return true; });

    CHECK(out.status == TransferStatus::Cancelled);
    CHECK(fx.http.probeCount() == 0);
    CHECK(fx.http.requests().empty());
    CHECK(fx.dir.entries().empty());

    auto all = fx.events.eventsFor(t.filename);
    REQUIRE(all.size() == 2);
    CHECK(all[0].kind == Kind::Start);
    CHECK(all[1].kind == Kind::Complete);
    CHECK_FALSE(all[1].success);
}

TEST_CASE("TransferUnit: cancellation interrupts the retry delay", "[downloader][unit][cancel]") {
    UnitFixture fx;
    const auto t = fx.target();
    FakeResource res{kBody};
    res.failAfterBytes = {0};
    fx.http.serve(t.url, res);
    fx.spec.retry.delay = 10s;

    const auto started = std::chrono::steady_clock::now();
    auto out = fx.runUnit(t, [&] { return !fx.http.requests().empty(); });
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(out.status == TransferStatus::Cancelled);
    CHECK(out.attempts == 1);
    CHECK(elapsed < 5s);
}

TEST_CASE("TransferUnit: phase reflects the terminal state", "[downloader][unit]") {
    UnitFixture fx;
    const auto t = fx.target();
    fx.http.serve(t.url, FakeResource{kBody});

    TransferUnit unit(t, fx.spec, TransferServices{fx.http, *fx.disk, *fx.sidecars, fx.gate},
                      fx.events.observer());
    CHECK(unit.state().phase == TransferPhase::Probing);
    auto out = unit.run();

    REQUIRE(out.status == TransferStatus::Completed);
    CHECK(unit.state().phase == TransferPhase::Completed);
    CHECK(unit.state().bytesDownloaded == kBody.size());
    REQUIRE(unit.state().bytesExpectedTotal.has_value());
    CHECK(*unit.state().bytesExpectedTotal == kBody.size());
    CHECK(fx.gate.inUse() == 0);
}
