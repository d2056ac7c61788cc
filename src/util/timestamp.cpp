#include "util/timestamp.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <limits>
#include <locale>
#include <memory>
#include <optional>
#include <regex>
#include <sstream>
#include <string_view>

namespace spf {

namespace {

constexpr std::int64_t kMinute = 60;
constexpr std::int64_t kHour = 60 * kMinute;
constexpr std::int64_t kDay = 24 * kHour;
constexpr std::int64_t kWeek = 7 * kDay;

std::shared_ptr<spdlog::logger> timestamp_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("timestamp");
  }();
  return logger;
}

std::string trim_copy(const std::string &value) {
  auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
                return std::isspace(c) != 0;
              }).base();
  return first < last ? std::string(first, last) : std::string();
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

constexpr std::int64_t kMaxTime = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMinTime = std::numeric_limits<std::int64_t>::min();

/// Sum of @p a and @p b, or nullopt when it does not fit 64 bits.
std::optional<std::int64_t> checked_add(std::int64_t a, std::int64_t b) {
  if ((b > 0 && a > kMaxTime - b) || (b < 0 && a < kMinTime - b)) {
    return std::nullopt;
  }
  return a + b;
}

/// Product of a non-negative @p count and a positive @p unit.
std::optional<std::int64_t> checked_scale(std::int64_t count,
                                          std::int64_t unit) {
  if (count > kMaxTime / unit) {
    return std::nullopt;
  }
  return count * unit;
}

/**
 * Floor of @p t to 00:00:00 UTC of the same day. Within one day of the
 * int64 minimum, where the floor is not representable, rounds toward zero.
 */
std::int64_t start_of_day(std::int64_t t) {
  std::int64_t into_day = t % kDay;
  if (into_day < 0 && t >= kMinTime + kDay) {
    into_day += kDay;
  }
  return t - into_day;
}

/**
 * Parse integer text, saturating on overflow.
 */
std::int64_t parse_integer(const std::string &digits) {
  std::string_view view(digits);
  bool negative = false;
  if (!view.empty() && (view.front() == '+' || view.front() == '-')) {
    negative = view.front() == '-';
    view.remove_prefix(1);
  }
  std::int64_t value = 0;
  auto res = std::from_chars(view.data(), view.data() + view.size(), value);
  if (res.ec == std::errc::result_out_of_range) {
    return negative ? std::numeric_limits<std::int64_t>::min()
                    : std::numeric_limits<std::int64_t>::max();
  }
  return negative ? -value : value;
}

std::time_t utc_time(std::tm &tm) {
#ifdef _WIN32
  return _mkgmtime(&tm);
#else
  return timegm(&tm);
#endif
}

/**
 * Interpret a trailing zone designator.
 *
 * @return Offset east of UTC in seconds, or nullopt when @p rest is not a
 *         recognised designator.
 */
std::optional<std::int64_t> parse_zone(const std::string &rest) {
  static const std::regex offset{R"(^([+-])(\d{2}):?(\d{2})?$)"};
  std::string zone = to_lower_copy(trim_copy(rest));
  if (zone.empty() || zone == "z" || zone == "utc" || zone == "gmt") {
    return 0;
  }
  std::smatch m;
  if (!std::regex_match(zone, m, offset)) {
    return std::nullopt;
  }
  std::int64_t hours = std::stoll(m[2].str());
  std::int64_t minutes = m[3].matched ? std::stoll(m[3].str()) : 0;
  if (hours > 14 || minutes > 59) {
    return std::nullopt;
  }
  std::int64_t seconds = hours * kHour + minutes * kMinute;
  return m[1].str() == "-" ? -seconds : seconds;
}

struct TextFormat {
  const char *pattern;
  bool has_date;
};

// Longest patterns first so a shorter one never claims a prefix.
constexpr std::array<TextFormat, 17> kFormats{{
    {"%Y-%m-%dT%H:%M:%S", true},
    {"%Y-%m-%d %H:%M:%S", true},
    {"%Y-%m-%dT%H:%M", true},
    {"%Y-%m-%d %H:%M", true},
    {"%Y-%m-%d", true},
    {"%Y/%m/%d %H:%M:%S", true},
    {"%Y/%m/%d %H:%M", true},
    {"%Y/%m/%d", true},
    {"%a, %d %b %Y %H:%M:%S", true},
    {"%d %b %Y %H:%M:%S", true},
    {"%d %b %Y %H:%M", true},
    {"%d %b %Y", true},
    {"%b %d %Y %H:%M:%S", true},
    {"%b %d, %Y", true},
    {"%b %d %Y", true},
    {"%H:%M:%S", false},
    {"%H:%M", false},
}};

/**
 * Try the absolute date/time formats against @p text.
 */
std::optional<std::int64_t> parse_absolute(const std::string &text,
                                           std::int64_t now) {
  static const std::regex fraction{R"(^[.,]\d+)"};
  for (const auto &format : kFormats) {
    std::tm tm{};
    std::istringstream ss(text);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, format.pattern);
    if (ss.fail()) {
      continue;
    }
    std::string rest((std::istreambuf_iterator<char>(ss)),
                     std::istreambuf_iterator<char>());
    std::smatch m;
    if (std::regex_search(rest, m, fraction)) {
      rest = m.suffix().str();
    }
    auto zone = parse_zone(rest);
    if (!zone) {
      continue;
    }
    std::optional<std::int64_t> local;
    if (format.has_date) {
      local = static_cast<std::int64_t>(utc_time(tm));
    } else {
      local = checked_add(start_of_day(now), tm.tm_hour * kHour +
                                                 tm.tm_min * kMinute +
                                                 tm.tm_sec);
    }
    return local ? checked_add(*local, -*zone) : std::nullopt;
  }
  return std::nullopt;
}

std::int64_t unit_seconds(const std::string &unit) {
  if (unit.rfind("sec", 0) == 0) {
    return 1;
  }
  if (unit.rfind("min", 0) == 0) {
    return kMinute;
  }
  if (unit.rfind("hour", 0) == 0) {
    return kHour;
  }
  if (unit.rfind("day", 0) == 0) {
    return kDay;
  }
  if (unit.rfind("fortnight", 0) == 0) {
    return 2 * kWeek;
  }
  return kWeek;
}

/**
 * Parse a keyword optionally followed by relative offsets, e.g. "tomorrow",
 * "+1 week", "now -2 hours" or "3 hours ago".
 */
std::optional<std::int64_t> parse_relative(const std::string &lower,
                                           std::int64_t now) {
  static const std::regex keyword{
      R"(^(now|today|midnight|noon|tomorrow|yesterday)(?=\s|$))"};
  static const std::regex offset{
      R"(^\s*([+-]?)\s*(\d+)\s*(seconds?|secs?|minutes?|mins?|hours?|days?|weeks?|fortnights?)(?=\s|$))"};
  static const std::regex ago{R"(^\s+ago\s*$)"};

  std::optional<std::int64_t> base = now;
  bool matched = false;
  std::string rest = lower;
  std::smatch m;
  if (std::regex_search(rest, m, keyword)) {
    const std::string word = m[1].str();
    if (word == "today" || word == "midnight") {
      base = start_of_day(now);
    } else if (word == "noon") {
      base = checked_add(start_of_day(now), 12 * kHour);
    } else if (word == "tomorrow") {
      base = checked_add(start_of_day(now), kDay);
    } else if (word == "yesterday") {
      base = checked_add(start_of_day(now), -kDay);
    }
    rest = m.suffix().str();
    matched = true;
  }

  std::optional<std::int64_t> delta = 0;
  while (delta && std::regex_search(rest, m, offset)) {
    auto amount =
        checked_scale(parse_integer(m[2].str()), unit_seconds(m[3].str()));
    if (!amount) {
      return std::nullopt;
    }
    delta = checked_add(*delta, m[1].str() == "-" ? -*amount : *amount);
    rest = m.suffix().str();
    matched = true;
  }
  // offsets beyond the 64-bit range are not a point in time
  if (!base || !delta) {
    return std::nullopt;
  }
  if (std::regex_match(rest, ago)) {
    if (*delta == kMinTime) {
      return std::nullopt;
    }
    delta = -*delta;
    rest.clear();
  }
  if (!matched || !trim_copy(rest).empty()) {
    return std::nullopt;
  }
  return checked_add(*base, *delta);
}

} // namespace

std::int64_t truncate_timestamp(double value) {
  if (!std::isfinite(value) || value >= 9.2233720368547758e18 ||
      value < -9.2233720368547758e18) {
    return 0;
  }
  return static_cast<std::int64_t>(value);
}

std::int64_t to_timestamp(std::chrono::system_clock::time_point value) {
  return std::chrono::duration_cast<std::chrono::seconds>(
             value.time_since_epoch())
      .count();
}

bool is_numeric_text(const std::string &text) {
  static const std::regex numeric{
      R"(^\s*[+-]?(\d+(\.\d*)?|\.\d+)([eE][+-]?\d+)?\s*$)"};
  return std::regex_match(text, numeric);
}

std::int64_t to_timestamp(const std::string &text, std::int64_t now) {
  static const std::regex epoch{R"(^@([+-]?\d+)$)"};

  if (is_numeric_text(text)) {
    std::string number = trim_copy(text);
    if (number.find_first_of(".eE") == std::string::npos) {
      return parse_integer(number);
    }
    return truncate_timestamp(std::strtod(number.c_str(), nullptr));
  }

  const std::string trimmed = trim_copy(text);
  std::smatch m;
  if (std::regex_match(trimmed, m, epoch)) {
    return parse_integer(m[1].str());
  }
  if (!trimmed.empty()) {
    if (auto relative = parse_relative(to_lower_copy(trimmed), now)) {
      return *relative;
    }
    if (auto absolute = parse_absolute(trimmed, now)) {
      return *absolute;
    }
  }
  timestamp_log()->debug("Unable to resolve '{}' to a point in time", text);
  throw InvalidTimeRepresentation(text);
}

std::int64_t to_timestamp(const std::string &text) {
  return to_timestamp(text, to_timestamp(std::chrono::system_clock::now()));
}

} // namespace spf
