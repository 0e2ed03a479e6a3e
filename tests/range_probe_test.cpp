#include <catch2/catch.hpp>

#include "rangeget/error.hpp"
#include "rangeget/range_probe.hpp"

#include "fake_transport.hpp"
#include "test_helpers.hpp"

using rangeget::RangeProbe;

namespace {
const std::string kUrl = "http://example.test/file.bin";
}

TEST_CASE("RangeProbe reports size and range support from HEAD") {
    FakeTransport transport(makeBody(1000));

    const auto info = RangeProbe{transport}.probe(kUrl);

    CHECK(info.total_size == std::optional<std::uint64_t>(1000));
    CHECK(info.supports_ranges);
    CHECK(transport.headCalls() == 1);
    CHECK(transport.requestedRanges().empty());
}

TEST_CASE("RangeProbe treats a missing Accept-Ranges as unsupported") {
    FakeTransport transport(makeBody(1000));
    transport.advertise_ranges = false;

    const auto info = RangeProbe{transport}.probe(kUrl);
    CHECK(info.total_size == std::optional<std::uint64_t>(1000));
    CHECK_FALSE(info.supports_ranges);
}

TEST_CASE("RangeProbe treats Accept-Ranges: none as unsupported") {
    FakeTransport transport(makeBody(1000));
    transport.accept_ranges_value = GENERATE(as<std::string>{}, "none", "None", "");

    const auto info = RangeProbe{transport}.probe(kUrl);
    CHECK(info.total_size == std::optional<std::uint64_t>(1000));
    CHECK_FALSE(info.supports_ranges);
}

TEST_CASE("RangeProbe leaves the size unknown without Content-Length") {
    FakeTransport transport(makeBody(10));
    transport.send_content_length = false;

    const auto info = RangeProbe{transport}.probe(kUrl);

    CHECK_FALSE(info.total_size.has_value());
    CHECK(info.supports_ranges);
}

TEST_CASE("RangeProbe reports an empty resource") {
    FakeTransport transport("");

    const auto info = RangeProbe{transport}.probe(kUrl);

    CHECK(info.total_size == std::optional<std::uint64_t>(0));
}

TEST_CASE("RangeProbe falls back to GET when HEAD is rejected") {
    FakeTransport transport(makeBody(500));
    transport.head_status = GENERATE(405L, 501L);

    const auto info = RangeProbe{transport}.probe(kUrl);

    CHECK(info.total_size == std::optional<std::uint64_t>(500));
    CHECK(info.supports_ranges);
    const auto ranges = transport.requestedRanges();
    REQUIRE(ranges.size() == 1);
    CHECK_FALSE(ranges[0].has_value());
}

TEST_CASE("RangeProbe fails on error statuses") {
    FakeTransport transport(makeBody(100));
    transport.head_status = GENERATE(404L, 403L, 500L, 503L);

    CHECK_THROWS_AS(RangeProbe{transport}.probe(kUrl), rangeget::ProbeError);
    CHECK(transport.requestedRanges().empty());
}

TEST_CASE("RangeProbe fails when the GET fallback is rejected too") {
    FakeTransport transport(makeBody(100));
    transport.head_status = 405;
    transport.get_status = 403;

    CHECK_THROWS_WITH(RangeProbe{transport}.probe(kUrl), Catch::Contains("HTTP 403"));
}

TEST_CASE("RangeProbe fails when the server is unreachable") {
    FakeTransport transport(makeBody(100));
    transport.unreachable = true;

    CHECK_THROWS_WITH(RangeProbe{transport}.probe(kUrl), Catch::Contains("Connection refused"));
}

TEST_CASE("RangeProbe::interpret reads response heads") {
    rangeget::ResponseHead head;
    head.status = 200;
    head.content_length = 42;
    head.accept_ranges = "BYTES";

    auto info = RangeProbe::interpret(head);
    CHECK(info.total_size == std::optional<std::uint64_t>(42));
    CHECK(info.supports_ranges);

    head.accept_ranges.reset();
    info = RangeProbe::interpret(head);
    CHECK_FALSE(info.supports_ranges);
}
