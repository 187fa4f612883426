#pragma once

#include <cstdint>
#include <string>

namespace adr {

// YYYY-MM-DD in UTC.
std::string FormatUtcDate(std::int64_t epoch_seconds);
// YYYY-MM-DDTHH:MM:SSZ
std::string FormatUtcTimestamp(std::int64_t epoch_seconds);

// Accepts epoch seconds or YYYY-MM-DD (midnight UTC). Throws
// std::invalid_argument otherwise.
std::int64_t ParseDate(const std::string &value);

} // namespace adr
