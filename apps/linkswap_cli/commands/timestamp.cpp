#include "timestamp.h"

#include <ctime>
#include <iomanip>
#include <sstream>

std::string format_utc_iso8601(const std::int64_t unix_seconds) {
  const auto seconds = static_cast<std::time_t>(unix_seconds);
  std::tm utc{};
  if (gmtime_r(&seconds, &utc) == nullptr) {
    return std::to_string(unix_seconds);  // out of range for the calendar
  }

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}
