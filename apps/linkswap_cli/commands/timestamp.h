#pragma once

#include <cstdint>
#include <string>

// format_utc_iso8601 renders seconds since the epoch as "YYYY-MM-DDTHH:MM:SSZ".
std::string format_utc_iso8601(std::int64_t unix_seconds);
