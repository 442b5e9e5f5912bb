#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace dyntab::common {

// Dates travel as canonical YYYY-MM-DD text.
using CellValue = std::variant<std::monostate, bool, double, std::string>;

// Rows are opaque to storage; typed only where the column directory is known.
using RowData = std::map<std::string, CellValue, std::less<>>;

[[nodiscard]] inline bool is_null(const CellValue& value) noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] std::optional<double> as_number(const CellValue& value) noexcept;

// Plain rendering without type knowledge. Integral numbers print without a fraction.
[[nodiscard]] std::string to_display_string(const CellValue& value);
[[nodiscard]] std::string format_number(double value);

[[nodiscard]] std::string_view cell_kind_name(const CellValue& value) noexcept;

[[nodiscard]] const CellValue* find_field(const RowData& data, std::string_view name) noexcept;

}  // namespace dyntab::common
