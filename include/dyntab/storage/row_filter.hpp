#pragma once

#include "dyntab/common/cell_value.hpp"
#include "dyntab/storage/storage_interfaces.hpp"

namespace dyntab::storage {

// Numbers and booleans compare on their rendered form; text compares case-insensitively.
[[nodiscard]] bool value_matches_filter(const common::CellValue& value, std::string_view expected);
[[nodiscard]] bool row_matches(const common::RowData& data, const RowFilter& filters);

}  // namespace dyntab::storage
