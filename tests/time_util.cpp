#include <doctest/doctest.h>
#include "trustchain/time_util.hpp"

using namespace trustchain;
using namespace std::chrono;

TEST_CASE("FormatRfc3339 uses UTC with milliseconds") {
    auto tp = Clock::from_time_t(0) + milliseconds(123);
    CHECK(formatRfc3339(tp) == "1970-01-01T00:00:00.123Z");
}

TEST_CASE("ParseRfc3339 basic forms") {
    auto z = parseRfc3339("2025-03-01T12:00:00Z");
    REQUIRE(z.has_value());
    CHECK(formatRfc3339(*z) == "2025-03-01T12:00:00.000Z");

    auto fractional = parseRfc3339("2025-03-01T12:00:00.250Z");
    REQUIRE(fractional.has_value());
    CHECK(*fractional - *z == milliseconds(250));

    auto dateOnly = parseRfc3339("2025-03-01");
    REQUIRE(dateOnly.has_value());
    CHECK(formatRfc3339(*dateOnly) == "2025-03-01T00:00:00.000Z");
}

TEST_CASE("ParseRfc3339 applies offsets") {
    auto utc = parseRfc3339("2025-03-01T12:00:00Z");
    auto plusTwo = parseRfc3339("2025-03-01T14:00:00+02:00");
    auto minusFive = parseRfc3339("2025-03-01T07:00:00-05:00");
    REQUIRE(utc.has_value());
    REQUIRE(plusTwo.has_value());
    REQUIRE(minusFive.has_value());
    CHECK(*utc == *plusTwo);
    CHECK(*utc == *minusFive);
}

TEST_CASE("ParseRfc3339 rejects malformed input") {
    CHECK_FALSE(parseRfc3339("").has_value());
    CHECK_FALSE(parseRfc3339("yesterday").has_value());
    CHECK_FALSE(parseRfc3339("2025-13-01T00:00:00Z").has_value());
    CHECK_FALSE(parseRfc3339("2025-03-01T25:00:00Z").has_value());
    CHECK_FALSE(parseRfc3339("2025-03-01T12:00:00Zjunk").has_value());
    CHECK_FALSE(parseRfc3339("2025-03-01T12:00:00.Z").has_value());
}

TEST_CASE("Format then parse keeps millisecond precision") {
    auto now = time_point_cast<milliseconds>(Clock::now());
    auto parsed = parseRfc3339(formatRfc3339(now));
    REQUIRE(parsed.has_value());
    CHECK(*parsed == now);
}
