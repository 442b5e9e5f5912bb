#include "dyntab/data/duplicate_checker.hpp"

namespace dyntab::data {

std::string DuplicateViolation::message() const
{
    return "Column \"" + column_name + "\" does not allow duplicate values. Value \"" + value + "\" already exists.";
}

std::vector<DuplicateViolation> find_duplicate_violations(const storage::RowStore& rows,
                                                          common::TableId table,
                                                          const std::vector<catalog::ColumnDescriptor>& columns,
                                                          const common::RowData& data,
                                                          std::optional<common::RowId> exclude)
{
    std::vector<DuplicateViolation> violations;
    for (const auto& column : columns) {
        if (column.allow_duplicates) {
            continue;
        }
        const auto* value = common::find_field(data, column.name);
        if (value == nullptr || common::is_null(*value)) {
            continue;
        }
        const auto matches = rows.find_rows_with_value(table, column.name, *value, exclude);
        if (!matches.empty()) {
            violations.push_back(DuplicateViolation{column.name, common::to_display_string(*value)});
        }
    }
    return violations;
}

}  // namespace dyntab::data
