#include "dyntab/data/value_coercion.hpp"

#include "dyntab/common/engine_errors.hpp"
#include "dyntab/common/string_utils.hpp"
#include "dyntab/registry/value_patterns.hpp"

#include <cmath>
#include <utility>

namespace dyntab::data {

namespace {

constexpr std::size_t kMaxColumnSampleErrors = 3U;
constexpr std::size_t kMaxTypeChangeSamples = 10U;

CoercionResult coerced(common::CellValue value)
{
    CoercionResult result{};
    result.value = std::move(value);
    return result;
}

CoercionResult rejected(std::string reason, std::string suggestion = {})
{
    CoercionResult result{};
    result.error = make_error_code(common::EngineErrc::CoercionFailed);
    result.reason = std::move(reason);
    result.suggestion = std::move(suggestion);
    return result;
}

CoercionResult apply_validator(const registry::ColumnTypeHandler& handler, std::string_view text, common::CellValue value)
{
    auto outcome = handler.validate(text);
    if (!outcome.valid) {
        return rejected(std::move(outcome.reason), std::move(outcome.suggestion));
    }
    return coerced(std::move(value));
}

CoercionResult coerce_number(const common::CellValue& raw, const registry::ColumnTypeHandler& handler)
{
    if (std::holds_alternative<bool>(raw)) {
        return rejected("Must be a valid number", "Remove non-numeric characters");
    }

    std::optional<double> number;
    std::string text;
    if (const auto* numeric = std::get_if<double>(&raw)) {
        number = *numeric;
        text = common::format_number(*numeric);
    } else {
        text = common::trim_copy(std::get<std::string>(raw));
        number = common::as_number(common::CellValue{text});
    }
    if (!number.has_value() || !std::isfinite(*number)) {
        return rejected("Must be a valid number", "Remove non-numeric characters");
    }
    return apply_validator(handler, text, *number);
}

CoercionResult coerce_boolean(const common::CellValue& raw)
{
    if (const auto* flag = std::get_if<bool>(&raw)) {
        return coerced(*flag);
    }
    if (const auto* numeric = std::get_if<double>(&raw)) {
        if (*numeric == 1.0 || *numeric == 0.0) {
            return coerced(*numeric == 1.0);
        }
        return rejected("Must be true/false, yes/no, or 1/0");
    }
    const auto parsed = registry::parse_boolean(common::trim_copy(std::get<std::string>(raw)));
    if (!parsed.has_value()) {
        return rejected("Must be true/false, yes/no, or 1/0");
    }
    return coerced(*parsed);
}

CoercionResult coerce_date(const common::CellValue& raw)
{
    const auto text = common::trim_copy(common::to_display_string(raw));
    auto canonical = registry::parse_date(text);
    if (!canonical.has_value()) {
        return rejected("Invalid date format", "Use format: YYYY-MM-DD (e.g., 2024-01-15)");
    }
    return coerced(std::move(*canonical));
}

CoercionResult coerce_text(const common::CellValue& raw, const registry::ColumnTypeHandler& handler)
{
    auto normalized = handler.normalize(common::trim_copy(common::to_display_string(raw)));
    if (common::is_null(normalized)) {
        return coerced(std::monostate{});
    }
    const auto text = common::to_display_string(normalized);
    return apply_validator(handler, text, std::move(normalized));
}

bool exceeds_length_limit(const common::CellValue& value)
{
    const auto* text = std::get_if<std::string>(&value);
    return text != nullptr && text->size() > kMaxCellTextLength;
}

bool is_empty_value(const common::CellValue& value)
{
    if (common::is_null(value)) {
        return true;
    }
    const auto* text = std::get_if<std::string>(&value);
    return text != nullptr && common::is_blank(*text);
}

}  // namespace

CoercionResult coerce(const common::CellValue& raw, std::string_view type_id, const registry::CapabilityView& view)
{
    if (is_empty_value(raw)) {
        return coerced(std::monostate{});
    }

    std::shared_ptr<const registry::ColumnTypeHandler> handler;
    if (auto error = view.resolve(type_id, handler); error) {
        CoercionResult result{};
        result.error = error;
        result.reason = error.message();
        return result;
    }

    if (exceeds_length_limit(raw)) {
        return rejected("Value is too long",
                        "Keep values under " + std::to_string(kMaxCellTextLength) + " characters");
    }

    switch (handler->value_kind()) {
    case registry::ValueKind::Number:
        return coerce_number(raw, *handler);
    case registry::ValueKind::Boolean:
        return coerce_boolean(raw);
    case registry::ValueKind::Date:
        return coerce_date(raw);
    case registry::ValueKind::Text:
    case registry::ValueKind::Json:
    default:
        return coerce_text(raw, *handler);
    }
}

std::string format_cell(const common::CellValue& value, std::string_view type_id, const registry::CapabilityView& view)
{
    if (common::is_null(value)) {
        return {};
    }
    const auto handler = view.find(type_id);
    if (!handler) {
        return common::to_display_string(value);
    }
    return handler->format(value);
}

RowValidationReport validate_row(const catalog::RowRecord& row,
                                 const std::vector<catalog::ColumnDescriptor>& columns,
                                 const registry::CapabilityView& view)
{
    RowValidationReport report{};
    report.row_id = row.id;

    for (const auto& column : columns) {
        const auto* value = common::find_field(row.data, column.name);
        const auto empty = value == nullptr || is_empty_value(*value);
        if (empty) {
            if (column.required) {
                report.issues.push_back(ValueIssue{column.name, column.type_id, {}, "Required field is empty", {}});
            }
            continue;
        }

        auto result = coerce(*value, column.type_id, view);
        if (result.error == common::EngineErrc::CoercionFailed) {
            report.issues.push_back(ValueIssue{column.name,
                                               column.type_id,
                                               common::to_display_string(*value),
                                               std::move(result.reason),
                                               std::move(result.suggestion)});
        }
    }
    return report;
}

DatasetValidationReport validate_dataset(const std::vector<catalog::RowRecord>& rows,
                                         const std::vector<catalog::ColumnDescriptor>& columns,
                                         const registry::CapabilityView& view)
{
    DatasetValidationReport report{};
    report.total_rows = rows.size();
    report.summary.reserve(columns.size());
    for (const auto& column : columns) {
        ColumnValidationSummary summary{};
        summary.column_name = column.name;
        summary.type_id = column.type_id;
        report.summary.push_back(std::move(summary));
    }

    for (const auto& row : rows) {
        auto row_report = validate_row(row, columns, view);
        for (auto& summary : report.summary) {
            const ValueIssue* issue = nullptr;
            for (const auto& candidate : row_report.issues) {
                if (candidate.column_name == summary.column_name) {
                    issue = &candidate;
                    break;
                }
            }
            if (issue == nullptr) {
                ++summary.valid_count;
                continue;
            }
            ++summary.invalid_count;
            if (summary.sample_errors.size() < kMaxColumnSampleErrors) {
                summary.sample_errors.push_back(issue->value + ": " + issue->error);
            }
        }

        report.total_warnings += row_report.issues.size();
        if (row_report.is_valid()) {
            ++report.valid_rows;
        } else {
            ++report.invalid_rows;
        }
        report.rows.push_back(std::move(row_report));
    }
    return report;
}

common::OperationResponse<TypeChangePreview> preview_type_change(const std::vector<catalog::RowRecord>& rows,
                                                                 const catalog::ColumnDescriptor& column,
                                                                 std::string_view new_type,
                                                                 const registry::CapabilityView& view)
{
    std::shared_ptr<const registry::ColumnTypeHandler> handler;
    if (auto error = view.resolve(new_type, handler); error) {
        return common::make_failure<TypeChangePreview>(error, "Unknown column type: " + std::string{new_type});
    }

    TypeChangePreview preview{};
    preview.column_name = column.name;
    preview.current_type = column.type_id;
    preview.new_type = std::string{new_type};
    preview.total_rows = rows.size();

    for (const auto& row : rows) {
        const auto* value = common::find_field(row.data, column.name);
        if (value == nullptr || is_empty_value(*value)) {
            continue;
        }
        auto result = coerce(*value, new_type, view);
        if (result.ok()) {
            continue;
        }
        ++preview.incompatible_rows;
        if (preview.sample_issues.size() < kMaxTypeChangeSamples) {
            preview.sample_issues.push_back(TypeChangeIssue{
                row.id,
                common::to_display_string(*value),
                result.reason.empty() ? std::string{"Incompatible with new type"} : std::move(result.reason)});
        }
    }
    preview.compatible_rows = preview.total_rows - preview.incompatible_rows;
    return common::make_success(std::move(preview));
}

}  // namespace dyntab::data
