#include "errors.hpp"
#include "util/timestamp.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace {
// 2021-01-01 12:00:00 UTC
constexpr std::int64_t kNow = 1609502400;
constexpr std::int64_t kDay = 86400;
constexpr std::int64_t kMidnight = 1609459200;
} // namespace

TEST_CASE("timestamp from numbers truncates", "[timestamp]") {
  REQUIRE(spf::to_timestamp(1700000000) == 1700000000);
  REQUIRE(spf::to_timestamp(12.9) == 12);
  REQUIRE(spf::to_timestamp(-12.9) == -12);
  REQUIRE(spf::to_timestamp(0.0f) == 0);
  REQUIRE(spf::to_timestamp(std::numeric_limits<double>::infinity()) == 0);
  REQUIRE(spf::to_timestamp(std::numeric_limits<double>::quiet_NaN()) == 0);
}

TEST_CASE("timestamp from numeric text", "[timestamp]") {
  REQUIRE(spf::to_timestamp("1700000000") == 1700000000);
  REQUIRE(spf::to_timestamp("12.9") == 12);
  REQUIRE(spf::to_timestamp(" -7 ") == -7);
  REQUIRE(spf::to_timestamp("1e3") == 1000);
  REQUIRE(spf::is_numeric_text("+3.5"));
  REQUIRE_FALSE(spf::is_numeric_text("3.5h"));
  REQUIRE_FALSE(spf::is_numeric_text(""));
}

TEST_CASE("timestamp from time point", "[timestamp]") {
  std::chrono::system_clock::time_point tp{std::chrono::seconds(kNow)};
  REQUIRE(spf::to_timestamp(tp) == kNow);
  tp += std::chrono::milliseconds(999);
  REQUIRE(spf::to_timestamp(tp) == kNow);
}

TEST_CASE("timestamp from absolute date text", "[timestamp]") {
  REQUIRE(spf::to_timestamp(std::string("2021-01-01"), kNow) == kMidnight);
  REQUIRE(spf::to_timestamp(std::string("2021-01-01 12:00:00"), kNow) ==
          kNow);
  REQUIRE(spf::to_timestamp(std::string("2021-01-01T12:00:00Z"), kNow) ==
          kNow);
  REQUIRE(spf::to_timestamp(std::string("2021-01-01T14:00:00+02:00"), kNow) ==
          kNow);
  REQUIRE(spf::to_timestamp(std::string("2021-01-01T12:00:00.250Z"), kNow) ==
          kNow);
  REQUIRE(spf::to_timestamp(std::string("2021/01/02"), kNow) ==
          kMidnight + kDay);
  REQUIRE(spf::to_timestamp(std::string("Fri, 01 Jan 2021 12:00:00 +0000"),
                            kNow) == kNow);
}

TEST_CASE("timestamp from time of day uses the reference day", "[timestamp]") {
  REQUIRE(spf::to_timestamp(std::string("10:30"), kNow) ==
          kMidnight + 10 * 3600 + 30 * 60);
  REQUIRE(spf::to_timestamp(std::string("23:59:59"), kNow) ==
          kMidnight + kDay - 1);
}

TEST_CASE("timestamp from keywords and offsets", "[timestamp]") {
  REQUIRE(spf::to_timestamp(std::string("now"), kNow) == kNow);
  REQUIRE(spf::to_timestamp(std::string("today"), kNow) == kMidnight);
  REQUIRE(spf::to_timestamp(std::string("noon"), kNow) == kNow);
  REQUIRE(spf::to_timestamp(std::string("Tomorrow"), kNow) ==
          kMidnight + kDay);
  REQUIRE(spf::to_timestamp(std::string("yesterday"), kNow) ==
          kMidnight - kDay);
  REQUIRE(spf::to_timestamp(std::string("+1 day"), kNow) == kNow + kDay);
  REQUIRE(spf::to_timestamp(std::string("3 hours ago"), kNow) ==
          kNow - 3 * 3600);
  REQUIRE(spf::to_timestamp(std::string("now -2 weeks"), kNow) ==
          kNow - 14 * kDay);
  REQUIRE(spf::to_timestamp(std::string("@123"), kNow) == 123);
}

TEST_CASE("timestamp rejects offsets outside the 64-bit range",
          "[timestamp]") {
  constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
  REQUIRE_THROWS_AS(
      spf::to_timestamp(std::string("+99999999999999999 weeks"), 0),
      spf::InvalidTimeRepresentation);
  REQUIRE_THROWS_AS(spf::to_timestamp(
                        std::string("now +3000000000000000000 seconds"),
                        9000000000000000000),
                    spf::InvalidTimeRepresentation);
  REQUIRE_THROWS_AS(
      spf::to_timestamp(std::string("5000000000000000000 seconds "
                                    "5000000000000000000 seconds"),
                        0),
      spf::InvalidTimeRepresentation);
  REQUIRE_THROWS_AS(spf::to_timestamp(std::string("tomorrow"), max),
                    spf::InvalidTimeRepresentation);
  REQUIRE_THROWS_AS(spf::to_timestamp(std::string("23:59:59"), max),
                    spf::InvalidTimeRepresentation);
  REQUIRE(spf::to_timestamp(std::string("-1 second"), max) == max - 1);
  REQUIRE(spf::to_timestamp(std::string("9223372036854775807 seconds ago"),
                            0) == -max);
}

TEST_CASE("timestamp saturates oversized unsigned values", "[timestamp]") {
  constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
  REQUIRE(spf::to_timestamp(std::numeric_limits<std::uint64_t>::max()) == max);
  REQUIRE(spf::to_timestamp(static_cast<std::uint64_t>(max)) == max);
  REQUIRE(spf::to_timestamp(42u) == 42);
}

TEST_CASE("timestamp rejects unparseable text", "[timestamp]") {
  REQUIRE_THROWS_AS(spf::to_timestamp("not a date"),
                    spf::InvalidTimeRepresentation);
  REQUIRE_THROWS_AS(spf::to_timestamp(""), spf::InvalidTimeRepresentation);
  REQUIRE_THROWS_AS(spf::to_timestamp(std::string("2021-13-45x"), kNow),
                    spf::InvalidTimeRepresentation);
  try {
    spf::to_timestamp("nonsense");
    FAIL("expected InvalidTimeRepresentation");
  } catch (const spf::InvalidTimeRepresentation &e) {
    REQUIRE(e.input() == "nonsense");
    REQUIRE(std::string(e.what()) ==
            "Unable to convert 'nonsense' to a valid timestamp");
  }
}
