#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/common/cell_value.hpp"
#include "dyntab/common/operation_response.hpp"
#include "dyntab/registry/capability_registry.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dyntab::data {

// Longer text input is rejected before any pattern runs.
inline constexpr std::size_t kMaxCellTextLength = 64U * 1024U;

struct CoercionResult final {
    common::CellValue value{};
    std::error_code error{};  // registry error, or CoercionFailed
    std::string reason{};
    std::string suggestion{};

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

// Converts raw input into the canonical stored representation of `type_id`.
// Null, empty and blank input always coerce to null.
[[nodiscard]] CoercionResult coerce(const common::CellValue& raw,
                                    std::string_view type_id,
                                    const registry::CapabilityView& view);

// Plain rendering when the type cannot be resolved.
[[nodiscard]] std::string format_cell(const common::CellValue& value,
                                      std::string_view type_id,
                                      const registry::CapabilityView& view);

struct ValueIssue final {
    std::string column_name{};
    std::string type_id{};
    std::string value{};
    std::string error{};
    std::string suggestion{};
};

struct RowValidationReport final {
    common::RowId row_id{};
    std::vector<ValueIssue> issues{};

    [[nodiscard]] bool is_valid() const noexcept { return issues.empty(); }
};

struct ColumnValidationSummary final {
    std::string column_name{};
    std::string type_id{};
    std::size_t invalid_count = 0U;
    std::size_t valid_count = 0U;
    std::vector<std::string> sample_errors{};  // at most three
};

struct DatasetValidationReport final {
    std::size_t total_rows = 0U;
    std::size_t valid_rows = 0U;
    std::size_t invalid_rows = 0U;
    std::size_t total_warnings = 0U;
    std::vector<RowValidationReport> rows{};
    std::vector<ColumnValidationSummary> summary{};
};

struct TypeChangeIssue final {
    common::RowId row_id{};
    std::string current_value{};
    std::string issue{};
};

struct TypeChangePreview final {
    std::string column_name{};
    std::string current_type{};
    std::string new_type{};
    std::size_t total_rows = 0U;
    std::size_t compatible_rows = 0U;
    std::size_t incompatible_rows = 0U;
    std::vector<TypeChangeIssue> sample_issues{};  // at most ten
};

// Soft validation over stored rows; reports issues without blocking writes.
[[nodiscard]] RowValidationReport validate_row(const catalog::RowRecord& row,
                                               const std::vector<catalog::ColumnDescriptor>& columns,
                                               const registry::CapabilityView& view);
[[nodiscard]] DatasetValidationReport validate_dataset(const std::vector<catalog::RowRecord>& rows,
                                                       const std::vector<catalog::ColumnDescriptor>& columns,
                                                       const registry::CapabilityView& view);

[[nodiscard]] common::OperationResponse<TypeChangePreview> preview_type_change(
    const std::vector<catalog::RowRecord>& rows,
    const catalog::ColumnDescriptor& column,
    std::string_view new_type,
    const registry::CapabilityView& view);

}  // namespace dyntab::data
