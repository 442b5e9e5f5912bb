#pragma once

#include "dyntab/catalog/table_model.hpp"

#include <string_view>
#include <vector>

namespace dyntab::schema {

// Commerce columns a purpose depends on. Empty for the default purpose.
[[nodiscard]] std::vector<std::string_view> protected_column_names(catalog::TablePurpose purpose);
[[nodiscard]] bool is_protected_column(catalog::TablePurpose purpose, std::string_view column_name);

// Default column set created for a purpose, in position order. Ids and table ids are unset.
[[nodiscard]] std::vector<catalog::ColumnDescriptor> default_columns(catalog::TablePurpose purpose);

}  // namespace dyntab::schema
