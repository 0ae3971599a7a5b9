#include "snip/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace snip::util {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

unsigned daysInMonth(int year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2) {
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return kDays[month - 1];
}

}  // namespace

std::string Time::toRfc3339Nano(std::chrono::system_clock::time_point time) {
  auto since_epoch = time.time_since_epoch();
  auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
  auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);

  std::time_t time_t = seconds.count();
  std::tm tm{};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(9) << nanoseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})[Tt](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(?:([Zz])|([+-])(\d{2}):(\d{2})))");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  int year = std::stoi(match[1]);
  unsigned month = static_cast<unsigned>(std::stoi(match[2]));
  unsigned day = static_cast<unsigned>(std::stoi(match[3]));
  int hour = std::stoi(match[4]);
  int minute = std::stoi(match[5]);
  int second = std::stoi(match[6]);

  // Leap second 60 is not representable by system_clock
  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
      hour > 23 || minute > 59 || second > 59) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  std::chrono::seconds since_epoch{
      daysFromCivil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second};

  std::chrono::nanoseconds fraction{0};
  if (match[7].matched) {
    std::string digits = match[7].str();
    digits.append(9 - digits.size(), '0');
    fraction = std::chrono::nanoseconds(std::stoll(digits));
  }

  // Local time = UTC + offset
  std::chrono::minutes offset{0};
  if (match[9].matched) {
    int offset_hours = std::stoi(match[10]);
    int offset_minutes = std::stoi(match[11]);
    if (offset_hours > 23 || offset_minutes > 59) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Invalid UTC offset: " + str));
    }
    offset = std::chrono::minutes(offset_hours * 60 + offset_minutes);
    if (match[9].str() == "-") {
      offset = -offset;
    }
  }

  return std::chrono::system_clock::time_point{
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          since_epoch - offset + fraction)};
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

}  // namespace snip::util
