#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace dyntab::schema {

inline constexpr std::size_t kMaxColumnNameLength = 100U;

struct ColumnNameValidation final {
    bool valid = false;
    std::string error{};
    std::string internal_name{};
};

// "Monthly Cost" -> "monthlyCost"
[[nodiscard]] std::string to_internal_name(std::string_view display_name);
// "monthlyCost" -> "Monthly Cost"
[[nodiscard]] std::string to_display_name(std::string_view internal_name);

// Latin letters and spaces only, at most 100 characters.
[[nodiscard]] ColumnNameValidation validate_column_name(std::string_view name);

}  // namespace dyntab::schema
