#include <adr/dates.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace adr {
namespace {

std::string Format(std::int64_t epoch_seconds, const char *pattern) {
  const auto seconds = static_cast<std::time_t>(epoch_seconds);
  std::tm utc{};
  if (gmtime_r(&seconds, &utc) == nullptr) {
    return std::to_string(epoch_seconds);
  }
  std::array<char, 32> buffer{};
  const auto length = std::strftime(buffer.data(), buffer.size(), pattern, &utc);
  return std::string(buffer.data(), length);
}

bool IsDigits(const std::string &value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

} // namespace

std::string FormatUtcDate(std::int64_t epoch_seconds) {
  return Format(epoch_seconds, "%Y-%m-%d");
}

std::string FormatUtcTimestamp(std::int64_t epoch_seconds) {
  return Format(epoch_seconds, "%Y-%m-%dT%H:%M:%SZ");
}

std::int64_t ParseDate(const std::string &value) {
  if (IsDigits(value)) {
    try {
      return std::stoll(value);
    } catch (const std::out_of_range &) {
      throw std::invalid_argument("date out of range: " + value);
    }
  }

  if (value.size() == 10 && value[4] == '-' && value[7] == '-' &&
      IsDigits(value.substr(0, 4)) && IsDigits(value.substr(5, 2)) &&
      IsDigits(value.substr(8, 2))) {
    std::tm utc{};
    utc.tm_year = std::stoi(value.substr(0, 4)) - 1900;
    utc.tm_mon = std::stoi(value.substr(5, 2)) - 1;
    utc.tm_mday = std::stoi(value.substr(8, 2));
    if (utc.tm_mon < 0 || utc.tm_mon > 11 || utc.tm_mday < 1 ||
        utc.tm_mday > 31) {
      throw std::invalid_argument("invalid date: " + value);
    }
    return static_cast<std::int64_t>(timegm(&utc));
  }
  throw std::invalid_argument(
      "expected epoch seconds or YYYY-MM-DD, got: " + value);
}

} // namespace adr
