#include "tuid/util/time.hpp"

#include <cstdint>
#include <iomanip>
#include <regex>
#include <sstream>

namespace tuid::util {

namespace {

constexpr std::uint64_t kNanosPerMicro = 1'000;
constexpr std::uint64_t kNanosPerMilli = 1'000'000;
constexpr std::uint64_t kNanosPerSecond = 1'000'000'000;
constexpr std::uint64_t kNanosPerMinute = 60 * kNanosPerSecond;

// Render value / 10^precision, dropping trailing zeros of the fraction
std::string fixedPoint(std::uint64_t value, int precision) {
  std::uint64_t scale = 1;
  for (int i = 0; i < precision; ++i) {
    scale *= 10;
  }

  std::string result = std::to_string(value / scale);
  std::uint64_t fraction = value % scale;
  if (fraction == 0) {
    return result;
  }

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(precision) << fraction;
  std::string digits = oss.str();
  digits.erase(digits.find_last_not_of('0') + 1);

  return result + "." + digits;
}

}  // namespace

std::string Time::toRfc3339Nano(Timestamp time) {
  auto days = std::chrono::floor<std::chrono::days>(time);
  std::chrono::year_month_day ymd{days};
  std::chrono::hh_mm_ss<std::chrono::nanoseconds> hms{time - days};

  std::ostringstream oss;
  oss << std::setfill('0')
      << std::setw(4) << static_cast<int>(ymd.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
      << std::setw(2) << hms.hours().count() << ':'
      << std::setw(2) << hms.minutes().count() << ':'
      << std::setw(2) << hms.seconds().count() << '.'
      << std::setw(9) << hms.subseconds().count() << 'Z';

  return oss.str();
}

Result<Timestamp> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(Z|([+-])(\d{2}):(\d{2})))");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::chrono::year_month_day ymd{std::chrono::year{std::stoi(match[1])},
                                  std::chrono::month{static_cast<unsigned>(std::stoi(match[2]))},
                                  std::chrono::day{static_cast<unsigned>(std::stoi(match[3]))}};
  int hours = std::stoi(match[4]);
  int minutes = std::stoi(match[5]);
  int seconds = std::stoi(match[6]);

  if (!ymd.ok() || hours > 23 || minutes > 59 || seconds > 59) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  std::chrono::sys_seconds seconds_point = std::chrono::sys_days{ymd} +
                                           std::chrono::hours(hours) +
                                           std::chrono::minutes(minutes) +
                                           std::chrono::seconds(seconds);

  // Numeric offset: local time = UTC + offset
  if (match[9].matched) {
    int offset_hours = std::stoi(match[10]);
    int offset_minutes = std::stoi(match[11]);
    if (offset_hours > 23 || offset_minutes > 59) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Invalid UTC offset: " + str));
    }
    auto offset = std::chrono::hours(offset_hours) + std::chrono::minutes(offset_minutes);
    seconds_point = match[9] == "+" ? seconds_point - offset : seconds_point + offset;
  }

  // Fractional seconds, right-padded to nanoseconds
  std::int64_t fraction_nanos = 0;
  if (match[7].matched) {
    std::string fraction = match[7];
    fraction.append(9 - fraction.size(), '0');
    fraction_nanos = std::stoll(fraction);
  }

  // Timestamp holds signed 64-bit nanoseconds (about 1677-09-21 to 2262-04-11)
  const auto min_seconds = std::chrono::ceil<std::chrono::seconds>(Timestamp::min());
  const auto max_seconds = std::chrono::floor<std::chrono::seconds>(Timestamp::max());
  if (seconds_point < min_seconds || seconds_point > max_seconds) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Time out of range: " + str));
  }

  Timestamp time_point = std::chrono::time_point_cast<std::chrono::nanoseconds>(seconds_point);
  if (seconds_point == max_seconds && fraction_nanos > (Timestamp::max() - time_point).count()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Time out of range: " + str));
  }
  time_point += std::chrono::nanoseconds(fraction_nanos);

  return time_point;
}

Timestamp Time::now() {
  return std::chrono::time_point_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now());
}

std::string Time::formatDuration(std::chrono::nanoseconds duration) {
  auto count = duration.count();
  if (count == 0) {
    return "0s";
  }

  bool negative = count < 0;
  // Unsigned negation also covers the most negative value
  std::uint64_t magnitude = negative ? std::uint64_t{0} - static_cast<std::uint64_t>(count)
                                     : static_cast<std::uint64_t>(count);

  std::string result;
  if (magnitude < kNanosPerMicro) {
    result = fixedPoint(magnitude, 0) + "ns";
  } else if (magnitude < kNanosPerMilli) {
    result = fixedPoint(magnitude, 3) + "\xC2\xB5s";  // µs
  } else if (magnitude < kNanosPerSecond) {
    result = fixedPoint(magnitude, 6) + "ms";
  } else {
    result = fixedPoint(magnitude % kNanosPerMinute, 9) + "s";
    std::uint64_t total_minutes = magnitude / kNanosPerMinute;
    if (total_minutes > 0) {
      result = std::to_string(total_minutes % 60) + "m" + result;
      std::uint64_t hours = total_minutes / 60;
      if (hours > 0) {
        result = std::to_string(hours) + "h" + result;
      }
    }
  }

  return negative ? "-" + result : result;
}

}  // namespace tuid::util
