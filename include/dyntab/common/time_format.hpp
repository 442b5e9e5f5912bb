#pragma once

#include <chrono>
#include <string>

namespace dyntab::common {

// Empty for the zero time point.
[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp);
// UTC calendar day as YYYY-MM-DD.
[[nodiscard]] std::string format_date_utc(std::chrono::system_clock::time_point tp);

}  // namespace dyntab::common
