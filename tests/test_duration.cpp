#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <limits>

TEST_CASE("duration clock forms", "[duration]") {
  REQUIRE(spf::to_seconds("12:30:00") == 45000);
  REQUIRE(spf::to_seconds("30:15") == 1815);
  REQUIRE(spf::to_seconds("1:05\n") == 65);
  REQUIRE(spf::to_seconds("0:00") == 0);
  REQUIRE(spf::to_seconds("1:2:3:4") == 0);
}

TEST_CASE("duration unit tokens", "[duration]") {
  REQUIRE(spf::to_seconds("5min") == 300);
  REQUIRE(spf::to_seconds("3 hours 4 minutes 10 seconds") == 11050);
  REQUIRE(spf::to_seconds("2 hours, 30 minutes") == 9000);
  REQUIRE(spf::to_seconds("1h 1m 1s") == 3661);
  REQUIRE(spf::to_seconds("90 secs") == 90);
  REQUIRE(spf::to_seconds("2hr") == 7200);
  REQUIRE(spf::to_seconds("4.5h") == 16200);
  REQUIRE(spf::to_seconds(".5 min") == 30);
  REQUIRE(spf::to_seconds("1.5s") == 1);
}

TEST_CASE("duration first non-zero value per unit wins", "[duration]") {
  REQUIRE(spf::to_seconds("2h 2h") == 7200);
  REQUIRE(spf::to_seconds("2h 5h") == 7200);
  REQUIRE(spf::to_seconds("0h 2h") == 7200);
}

TEST_CASE("duration rejects malformed input", "[duration]") {
  REQUIRE(spf::to_seconds("garbage") == 0);
  REQUIRE(spf::to_seconds("5 bananas") == 0);
  REQUIRE(spf::to_seconds("") == 0);
  REQUIRE(spf::to_seconds(" 5min") == 0);
  REQUIRE(spf::to_seconds("5MIN") == 0);
  REQUIRE(spf::to_seconds("5") == 0);
  REQUIRE(spf::to_seconds("1.2.3h") == 0);
  REQUIRE(spf::to_seconds("5 days") == 0);
}

TEST_CASE("duration treats multi-byte separators as one space",
          "[duration]") {
  // no-break space (U+00A0) and em dash (U+2014)
  REQUIRE(spf::to_seconds("2\xC2\xA0hours") == 7200);
  REQUIRE(spf::to_seconds("3h\xE2\x80\x94"
                          "4m") == 11040);
  REQUIRE(spf::to_seconds("1h\xE2\x80\x94\xE2\x80\x94 30s") == 3630);
}

TEST_CASE("duration saturates values beyond the 64-bit range",
          "[duration]") {
  constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
  REQUIRE(spf::to_seconds("99999999999999999999h") == max);
  REQUIRE(spf::to_seconds("9223372036854775807s 1h") == max);
  REQUIRE(spf::to_seconds("3000000000000000h") == max);
}
