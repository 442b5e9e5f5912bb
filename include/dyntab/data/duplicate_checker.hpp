#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/storage/storage_interfaces.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dyntab::data {

struct DuplicateViolation final {
    std::string column_name{};
    std::string value{};

    [[nodiscard]] std::string message() const;
};

// Checks every column with allow_duplicates == false against stored rows, excluding `exclude`.
// Check-then-act: a concurrent writer can still insert the same value before this caller writes.
[[nodiscard]] std::vector<DuplicateViolation> find_duplicate_violations(const storage::RowStore& rows,
                                                                        common::TableId table,
                                                                        const std::vector<catalog::ColumnDescriptor>& columns,
                                                                        const common::RowData& data,
                                                                        std::optional<common::RowId> exclude);

}  // namespace dyntab::data
