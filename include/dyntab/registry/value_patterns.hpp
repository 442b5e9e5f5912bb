#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace dyntab::registry {

// Longest value handed to a module-declared regular expression.
inline constexpr std::size_t kMaxPatternInputLength = 4096U;

[[nodiscard]] bool is_valid_email(std::string_view value);
[[nodiscard]] bool is_valid_url(std::string_view value);
[[nodiscard]] bool is_valid_phone(std::string_view value, bool allow_extension = false);
[[nodiscard]] bool is_valid_time(std::string_view value);
[[nodiscard]] bool is_valid_datetime(std::string_view value);
[[nodiscard]] bool is_valid_color(std::string_view value);
[[nodiscard]] bool is_country_code(std::string_view value) noexcept;

// Accepts YYYY-MM-DD, MM/DD/YYYY, MM-DD-YYYY, YYYY/MM/DD and DD.MM.YYYY; returns YYYY-MM-DD.
[[nodiscard]] std::optional<std::string> parse_date(std::string_view value);
// Case-insensitive {true,yes,1,y,on} / {false,no,0,n,off}.
[[nodiscard]] std::optional<bool> parse_boolean(std::string_view value);

// Fixed-point rendering with optional thousands separator.
[[nodiscard]] std::string format_fixed(double value, int decimals, bool thousands_separator = false);

}  // namespace dyntab::registry
