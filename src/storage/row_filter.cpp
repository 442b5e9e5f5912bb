#include "dyntab/storage/row_filter.hpp"

#include "dyntab/common/string_utils.hpp"

namespace dyntab::storage {

bool value_matches_filter(const common::CellValue& value, std::string_view expected)
{
    const auto wanted = common::trim_copy(expected);
    if (common::is_null(value)) {
        return wanted.empty();
    }
    if (const auto* number = std::get_if<double>(&value)) {
        const auto parsed = common::as_number(common::CellValue{wanted});
        return parsed.has_value() && *parsed == *number;
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return common::iequals(wanted, *flag ? "true" : "false");
    }
    return common::iequals(common::to_display_string(value), wanted);
}

bool row_matches(const common::RowData& data, const RowFilter& filters)
{
    for (const auto& [column, expected] : filters) {
        const auto* value = common::find_field(data, column);
        if (value == nullptr) {
            if (!common::trim_copy(expected).empty()) {
                return false;
            }
            continue;
        }
        if (!value_matches_filter(*value, expected)) {
            return false;
        }
    }
    return true;
}

}  // namespace dyntab::storage
