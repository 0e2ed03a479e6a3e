#include <catch2/catch.hpp>

#include "rangeget/coordinator.hpp"
#include "rangeget/error.hpp"

#include "fake_transport.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

using rangeget::ChunkError;
using rangeget::Coordinator;
using rangeget::DownloadRequest;
using rangeget::DownloadState;

namespace {

const std::string kUrl = "http://example.test/file.bin";

class RecordingListener final : public rangeget::DownloadListener {
public:
    void onStateChanged(DownloadState state) override { states.push_back(state); }

    void onPlanned(const rangeget::ResourceInfo& resource,
                   const std::vector<rangeget::ChunkSpec>& chunks) override {
        planned_size = resource.total_size;
        planned_chunks = chunks.size();
    }

    void onProgress(const rangeget::ProgressEvent& event, std::uint64_t downloaded_total) override {
        progress_sum += event.bytes_since_last;
        last_total = downloaded_total;
    }

    void onChunkFinished(const rangeget::ChunkResult& result) override {
        finished.push_back(result.chunk_index);
    }

    std::vector<DownloadState> states;
    std::optional<std::uint64_t> planned_size;
    std::size_t planned_chunks{0};
    std::uint64_t progress_sum{0};
    std::uint64_t last_total{0};
    std::vector<std::uint32_t> finished;
};

} // namespace

TEST_CASE("Coordinator downloads 1000 bytes with four range requests") {
    TempDir tmp;
    const auto destination = tmp.path() / "file.bin";
    const auto body = makeBody(1000);
    auto transport = std::make_shared<FakeTransport>(body);
    auto listener = std::make_shared<RecordingListener>();

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 4}, transport);
    coordinator.subscribe(listener);
    const auto outcome = coordinator.run();

    REQUIRE(outcome.succeeded());
    CHECK(coordinator.state() == DownloadState::Success);
    CHECK(outcome.total_bytes_written == 1000);
    CHECK(outcome.failed_chunks.empty());
    CHECK(outcome.error_message.empty());
    REQUIRE(outcome.chunks.size() == 4);
    REQUIRE(outcome.results.size() == 4);
    for (std::uint32_t i = 0; i < 4; ++i) {
        CHECK(outcome.results[i].chunk_index == i);
        CHECK(outcome.results[i].bytes_written == 250);
    }

    std::set<std::string> requested;
    for (const auto& range : transport->requestedRanges()) {
        REQUIRE(range.has_value());
        requested.insert(rangeget::formatRangeHeader(*range));
    }
    CHECK(requested == std::set<std::string>{"bytes=0-249", "bytes=250-499", "bytes=500-749", "bytes=750-999"});

    CHECK(readFile(destination) == body);

    CHECK(listener->states == std::vector<DownloadState>{DownloadState::Planning, DownloadState::Running,
                                                         DownloadState::Finalizing, DownloadState::Success});
    CHECK(listener->planned_size == std::optional<std::uint64_t>(1000));
    CHECK(listener->planned_chunks == 4);
    CHECK(listener->progress_sum == 1000);
    CHECK(listener->last_total == 1000);
    CHECK(listener->finished.size() == 4);
}

TEST_CASE("Coordinator uses one request when the server does not accept ranges") {
    TempDir tmp;
    const auto destination = tmp.path() / "file.bin";
    const auto body = makeBody(1000);
    auto transport = std::make_shared<FakeTransport>(body);
    transport->advertise_ranges = false;

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 4}, transport);
    const auto outcome = coordinator.run();

    REQUIRE(outcome.succeeded());
    REQUIRE(outcome.chunks.size() == 1);
    CHECK(rangeget::describeRange(outcome.chunks[0]) == "0-999");
    const auto ranges = transport->requestedRanges();
    REQUIRE(ranges.size() == 1);
    CHECK_FALSE(ranges[0].has_value());
    CHECK(readFile(destination) == body);
}

TEST_CASE("Coordinator keeps sibling chunks when one chunk fails") {
    TempDir tmp;
    const auto destination = tmp.path() / "file.bin";
    const auto body = makeBody(1000);
    auto transport = std::make_shared<FakeTransport>(body);
    transport->failRangeAfter(500, 100);
    auto listener = std::make_shared<RecordingListener>();

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 4}, transport);
    coordinator.subscribe(listener);
    const auto outcome = coordinator.run();

    CHECK_FALSE(outcome.succeeded());
    CHECK(outcome.state == DownloadState::PartialFailure);
    CHECK(outcome.failed_chunks == std::set<std::uint32_t>{2});
    CHECK(outcome.results[2].error == ChunkError::TransportError);
    CHECK(outcome.total_bytes_written == 850);
    CHECK(listener->states.back() == DownloadState::PartialFailure);
    CHECK(listener->finished.size() == 4);

    // The partial file stays for inspection.
    const auto file = readFile(destination);
    REQUIRE(file.size() == 1000);
    CHECK(file.substr(0, 500) == body.substr(0, 500));
    CHECK(file.substr(500, 100) == body.substr(500, 100));
    CHECK(file.substr(750) == body.substr(750));
}

TEST_CASE("Coordinator streams a resource of unknown length") {
    TempDir tmp;
    const auto destination = tmp.path() / "stream.bin";
    const auto body = makeBody(4321);
    auto transport = std::make_shared<FakeTransport>(body);
    transport->send_content_length = false;

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 8}, transport);
    const auto outcome = coordinator.run();

    REQUIRE(outcome.succeeded());
    REQUIRE(outcome.chunks.size() == 1);
    CHECK_FALSE(outcome.chunks[0].endOffset().has_value());
    CHECK(outcome.total_bytes_written == 4321);
    CHECK(std::filesystem::file_size(destination) == 4321);
    CHECK(readFile(destination) == body);
}

TEST_CASE("Coordinator completes an empty resource without requests") {
    TempDir tmp;
    const auto destination = tmp.path() / "empty.bin";
    auto transport = std::make_shared<FakeTransport>("");

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 4}, transport);
    const auto outcome = coordinator.run();

    REQUIRE(outcome.succeeded());
    CHECK(outcome.total_bytes_written == 0);
    REQUIRE(outcome.chunks.size() == 1);
    CHECK(outcome.chunks[0].isEmpty());
    CHECK(transport->requestedRanges().empty());
    CHECK(std::filesystem::exists(destination));
    CHECK(std::filesystem::file_size(destination) == 0);
}

TEST_CASE("Coordinator stops after a failed probe") {
    TempDir tmp;
    const auto destination = tmp.path() / "file.bin";
    auto transport = std::make_shared<FakeTransport>(makeBody(100));
    transport->head_status = 404;
    auto listener = std::make_shared<RecordingListener>();

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 4}, transport);
    coordinator.subscribe(listener);
    const auto outcome = coordinator.run();

    CHECK(outcome.state == DownloadState::PartialFailure);
    CHECK(outcome.chunks.empty());
    CHECK(outcome.failed_chunks.empty());
    CHECK_FALSE(outcome.resource.has_value());
    CHECK_THAT(outcome.error_message, Catch::Contains("404"));
    CHECK(transport->requestedRanges().empty());
    CHECK_FALSE(std::filesystem::exists(destination));
    CHECK(listener->states == std::vector<DownloadState>{DownloadState::Planning, DownloadState::PartialFailure});
}

TEST_CASE("Coordinator reports an unwritable destination before any chunk work") {
    TempDir tmp;
    const auto destination = tmp.path() / "no-such-dir" / "file.bin";
    auto transport = std::make_shared<FakeTransport>(makeBody(100));

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 2}, transport);
    const auto outcome = coordinator.run();

    CHECK(outcome.state == DownloadState::PartialFailure);
    CHECK(outcome.results.empty());
    CHECK_FALSE(outcome.error_message.empty());
    CHECK(transport->requestedRanges().empty());
}

TEST_CASE("Coordinator fails every chunk when ranges are advertised but ignored") {
    TempDir tmp;
    const auto destination = tmp.path() / "file.bin";
    auto transport = std::make_shared<FakeTransport>(makeBody(1000));
    transport->honor_ranges = false;

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 3}, transport);
    const auto outcome = coordinator.run();

    CHECK(outcome.failed_chunks == std::set<std::uint32_t>{0, 1, 2});
    for (const auto& result : outcome.results) {
        CHECK(result.error == ChunkError::RangeMismatch);
    }
    CHECK(outcome.total_bytes_written == 0);
}

TEST_CASE("Coordinator runs only once") {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>(makeBody(10));
    Coordinator coordinator(DownloadRequest{kUrl, (tmp.path() / "once.bin").string(), 2}, transport);

    const auto outcome = coordinator.run();
    CHECK(outcome.succeeded());
    CHECK_THROWS_AS(coordinator.run(), rangeget::Error);
}

TEST_CASE("Coordinator requires a transport") {
    CHECK_THROWS_AS(Coordinator(DownloadRequest{kUrl, "unused.bin", 2}, nullptr), rangeget::Error);
}

namespace {

class ThrowingListener final : public rangeget::DownloadListener {
public:
    void onProgress(const rangeget::ProgressEvent&, std::uint64_t) override {
        ++calls;
        throw std::runtime_error("panel exploded");
    }
    void onChunkFinished(const rangeget::ChunkResult&) override { throw std::runtime_error("panel exploded"); }

    int calls{0};
};

} // namespace

TEST_CASE("Coordinator keeps collecting when a listener throws") {
    TempDir tmp;
    const auto destination = tmp.path() / "file.bin";
    const auto body = makeBody(100000);
    auto transport = std::make_shared<FakeTransport>(body);
    auto throwing = std::make_shared<ThrowingListener>();
    auto recording = std::make_shared<RecordingListener>();

    Coordinator coordinator(DownloadRequest{kUrl, destination.string(), 4}, transport);
    coordinator.subscribe(throwing);
    coordinator.subscribe(recording);

    rangeget::DownloadOutcome outcome;
    REQUIRE_NOTHROW(outcome = coordinator.run());

    CHECK(outcome.succeeded());
    CHECK(outcome.total_bytes_written == 100000);
    CHECK(throwing->calls > 0);
    CHECK(recording->progress_sum == 100000);
    CHECK(recording->finished.size() == 4);
    CHECK(readFile(destination) == body);
}
