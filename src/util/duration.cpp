#include "util/duration.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>
#include <vector>

namespace spf {

namespace {

/// Number of one unit slot; integral unless the text had a fraction.
struct Scale {
  bool real{false};
  std::int64_t integer{0};
  double value{0.0};

  bool empty() const { return real ? value == 0.0 : integer == 0; }
  double as_double() const {
    return real ? value : static_cast<double>(integer);
  }
};

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

/**
 * Coerce the numeric part of a token. Integral values stay integers, values
 * with a fractional part (or too large for 64 bits) become reals.
 */
Scale parse_scale(const std::string &text) {
  Scale scale;
  if (text.find('.') == std::string::npos) {
    auto res = std::from_chars(text.data(), text.data() + text.size(),
                               scale.integer);
    if (res.ec == std::errc{}) {
      return scale;
    }
  }
  double value = std::strtod(text.c_str(), nullptr);
  if (std::trunc(value) == value && std::fabs(value) < 9.0e18) {
    scale.integer = static_cast<std::int64_t>(value);
    return scale;
  }
  scale.real = true;
  scale.value = value;
  return scale;
}

std::int64_t saturate(double total) {
  if (std::isnan(total)) {
    return 0;
  }
  if (total >= static_cast<double>(kMax)) {
    return kMax;
  }
  return static_cast<std::int64_t>(total);
}

std::int64_t total_seconds(const Scale &hours, const Scale &minutes,
                           const Scale &seconds) {
  bool exact = !hours.real && !minutes.real && !seconds.real &&
               hours.integer <= kMax / 3600 / 3 &&
               minutes.integer <= kMax / 60 / 3 &&
               seconds.integer <= kMax / 3;
  if (exact) {
    return hours.integer * 3600 + minutes.integer * 60 + seconds.integer;
  }
  return saturate(hours.as_double() * 3600 + minutes.as_double() * 60 +
                  seconds.as_double());
}

std::vector<std::string> split_spaces(const std::string &str) {
  std::vector<std::string> items;
  std::string::size_type start = 0;
  while (true) {
    auto pos = str.find(' ', start);
    items.push_back(str.substr(start, pos - start));
    if (pos == std::string::npos) {
      break;
    }
    start = pos + 1;
  }
  return items;
}

} // namespace

std::int64_t to_seconds(const std::string &str) {
  static const std::regex min_sec{R"(^(\d+):(\d+)$)"};
  static const std::regex hour_min_sec{R"(^(\d+):(\d+):(\d+)$)"};
  static const std::regex invalid_chars{"[^a-zA-Z0-9. ]+"};
  static const std::regex repeated_spaces{" {2,}"};
  static const std::regex scale_then_unit{"([0-9.]+) ([cdehimnorstu]+)"};
  static const std::regex item{R"(^(\d+\.?\d*|\.\d+)([cdehimnorstu]+)$)"};
  static const std::regex hour_unit{"^h(r|our|ours)?$"};
  static const std::regex minute_unit{"^m(in|ins|inute|inutes)?$"};
  static const std::regex second_unit{"^s(ec|ecs|econd|econds)?$"};

  Scale hours;
  Scale minutes;
  Scale seconds;

  // A single trailing newline is tolerated by the clock forms.
  std::string clock = str;
  if (!clock.empty() && clock.back() == '\n') {
    clock.pop_back();
  }

  std::smatch m;
  if (std::regex_match(clock, m, min_sec)) {
    minutes = parse_scale(m[1].str());
    seconds = parse_scale(m[2].str());
    return total_seconds(hours, minutes, seconds);
  }
  if (std::regex_match(clock, m, hour_min_sec)) {
    hours = parse_scale(m[1].str());
    minutes = parse_scale(m[2].str());
    seconds = parse_scale(m[3].str());
    return total_seconds(hours, minutes, seconds);
  }

  // convert invalid characters to spaces, squeeze, then glue "2 hours" into
  // "2hours"
  std::string normalized = std::regex_replace(str, invalid_chars, " ");
  normalized = std::regex_replace(normalized, repeated_spaces, " ");
  normalized = std::regex_replace(normalized, scale_then_unit, "$1$2");

  for (const auto &chunk : split_spaces(normalized)) {
    std::smatch parts;
    if (!std::regex_match(chunk, parts, item)) {
      return 0;
    }
    const Scale scale = parse_scale(parts[1].str());
    const std::string unit = parts[2].str();

    Scale *slot = nullptr;
    if (std::regex_match(unit, hour_unit)) {
      slot = &hours;
    } else if (std::regex_match(unit, minute_unit)) {
      slot = &minutes;
    } else if (std::regex_match(unit, second_unit)) {
      slot = &seconds;
    } else {
      return 0;
    }
    // first non-zero value wins
    if (slot->empty()) {
      *slot = scale;
    }
  }

  return total_seconds(hours, minutes, seconds);
}

} // namespace spf
