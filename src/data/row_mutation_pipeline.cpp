#include "dyntab/data/row_mutation_pipeline.hpp"

#include "dyntab/common/engine_errors.hpp"
#include "dyntab/common/string_utils.hpp"
#include "dyntab/data/duplicate_checker.hpp"
#include "dyntab/schema/column_names.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

namespace dyntab::data {

namespace {

using common::EngineErrc;
using common::OperationResponse;

constexpr std::string_view kPriceField = "price";
constexpr std::string_view kQuantityField = "qty";

template <typename Payload>
OperationResponse<Payload> fail(EngineErrc code, std::string message = {}, std::vector<common::FieldError> fields = {})
{
    return common::make_failure<Payload>(make_error_code(code), std::move(message), std::move(fields));
}

std::optional<double> quantity_of(const common::RowData& data)
{
    const auto* value = common::find_field(data, kQuantityField);
    return value != nullptr ? common::as_number(*value) : std::nullopt;
}

const catalog::ColumnDescriptor* find_column(const std::vector<catalog::ColumnDescriptor>& columns, std::string_view name)
{
    auto it = std::find_if(columns.begin(), columns.end(), [&](const auto& column) { return column.name == name; });
    return it == columns.end() ? nullptr : &(*it);
}

// Header text -> column, by exact internal name, camelCase conversion, then display name.
const catalog::ColumnDescriptor* match_header(const std::vector<catalog::ColumnDescriptor>& columns,
                                              std::string_view header)
{
    const auto trimmed = common::trim_copy(header);
    if (const auto* exact = find_column(columns, trimmed); exact != nullptr) {
        return exact;
    }
    if (const auto* converted = find_column(columns, schema::to_internal_name(trimmed)); converted != nullptr) {
        return converted;
    }
    auto it = std::find_if(columns.begin(), columns.end(), [&](const auto& column) {
        return common::iequals(schema::to_display_name(column.name), trimmed) || common::iequals(column.name, trimmed);
    });
    return it == columns.end() ? nullptr : &(*it);
}

void append_warnings(std::vector<std::string>& target, std::vector<std::string>& source)
{
    target.insert(target.end(), std::make_move_iterator(source.begin()), std::make_move_iterator(source.end()));
    source.clear();
}

}  // namespace

std::string_view to_string(RowMassAction action) noexcept
{
    switch (action) {
    case RowMassAction::Delete:
        return "delete";
    case RowMassAction::SetFieldValue:
        return "set_field_value";
    case RowMassAction::Export:
        return "export";
    default:
        return "unknown";
    }
}

std::optional<RowMassAction> parse_row_mass_action(std::string_view text) noexcept
{
    for (const auto action : {RowMassAction::Delete, RowMassAction::SetFieldValue, RowMassAction::Export}) {
        if (common::iequals(text, to_string(action))) {
            return action;
        }
    }
    return std::nullopt;
}

RowMutationPipeline::RowMutationPipeline(Config config)
    : config_{std::move(config)}
{
    if (config_.tables == nullptr || config_.rows == nullptr || config_.access == nullptr) {
        throw std::invalid_argument{"RowMutationPipeline requires table, row and access collaborators"};
    }
    if (config_.ledger == nullptr) {
        throw std::invalid_argument{"RowMutationPipeline requires an inventory ledger"};
    }
    if (config_.telemetry_registry != nullptr && !config_.telemetry_identifier.empty()) {
        config_.telemetry_registry->register_sampler(config_.telemetry_identifier, [this] {
            return telemetry_.snapshot();
        });
    }
}

RowMutationPipeline::~RowMutationPipeline()
{
    if (config_.telemetry_registry != nullptr && !config_.telemetry_identifier.empty()) {
        config_.telemetry_registry->unregister_sampler(config_.telemetry_identifier);
    }
}

std::chrono::system_clock::time_point RowMutationPipeline::now() const
{
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

template <typename Payload>
OperationResponse<Payload> RowMutationPipeline::finish(MutationKind kind, OperationResponse<Payload> response)
{
    if (response.success) {
        telemetry_.record_success(kind);
    } else {
        telemetry_.record_failure(kind, response.error);
    }
    return response;
}

OperationResponse<RowMutationPipeline::TableContext> RowMutationPipeline::load(common::TableId table,
                                                                               std::string_view actor,
                                                                               AccessMode mode) const
{
    auto descriptor = config_.tables->find_table(table);
    if (!descriptor) {
        return fail<TableContext>(EngineErrc::TableNotFound, "Table not found");
    }
    const auto allowed = mode == AccessMode::Read ? config_.access->has_read_access(*descriptor, actor)
                                                  : config_.access->has_write_access(*descriptor, actor);
    if (!allowed) {
        return fail<TableContext>(EngineErrc::AccessDenied, "Access denied");
    }

    TableContext context{};
    context.columns = config_.tables->list_columns(descriptor->id);
    context.table = std::move(*descriptor);
    return common::make_success(std::move(context));
}

OperationResponse<common::RowData> RowMutationPipeline::prepare(const TableContext& context,
                                                                const common::RowData& input,
                                                                const catalog::RowRecord* previous,
                                                                const registry::CapabilityView& view,
                                                                std::vector<std::string>& warnings) const
{
    for (const auto& [name, value] : input) {
        if (find_column(context.columns, name) == nullptr) {
            warnings.push_back("Ignored unknown field \"" + name + "\"");
        }
    }

    const auto is_sale = context.table.purpose == catalog::TablePurpose::Sale;
    common::RowData prepared;
    std::vector<common::FieldError> invalid;
    std::vector<common::FieldError> unresolved;
    std::error_code resolution_error{};

    for (const auto& column : context.columns) {
        const auto* raw = common::find_field(input, column.name);

        if (previous != nullptr && raw != nullptr) {
            const auto* stored = common::find_field(previous->data, column.name);
            if (stored != nullptr && !common::is_null(*stored) && *stored == *raw) {
                prepared[column.name] = *stored;
                continue;
            }
        }

        common::CellValue candidate{};
        if (raw != nullptr) {
            candidate = *raw;
        } else if (previous == nullptr) {
            if (column.default_value.has_value()) {
                candidate = *column.default_value;
            } else if (is_sale && column.name == kPriceField) {
                candidate = 0.0;
            } else if (is_sale && column.name == kQuantityField) {
                candidate = 1.0;
            }
        }

        auto result = coerce(candidate, column.type_id, view);
        if (!result.ok()) {
            common::FieldError field_error{column.name, common::to_display_string(candidate), std::move(result.reason)};
            if (result.error == make_error_code(EngineErrc::CoercionFailed)) {
                invalid.push_back(std::move(field_error));
            } else {
                if (!resolution_error) {
                    resolution_error = result.error;
                }
                unresolved.push_back(std::move(field_error));
            }
            continue;
        }
        if (column.required && common::is_null(result.value)) {
            invalid.push_back(common::FieldError{column.name, {}, "This field is required"});
            continue;
        }
        prepared[column.name] = std::move(result.value);
    }

    if (!unresolved.empty()) {
        return common::make_failure<common::RowData>(resolution_error,
                                                     "Column type could not be resolved for " + unresolved.front().field,
                                                     std::move(unresolved));
    }
    if (!invalid.empty()) {
        std::vector<std::string> names;
        for (const auto& error : invalid) {
            names.push_back(error.field);
        }
        return fail<common::RowData>(EngineErrc::ValidationFailed,
                                     "Validation failed for " + common::join(names, ", "),
                                     std::move(invalid));
    }
    return common::make_success(std::move(prepared));
}

void RowMutationPipeline::track(const TableContext& context,
                                inventory::LedgerEntry entry,
                                std::vector<std::string>& warnings)
{
    if (context.table.purpose != catalog::TablePurpose::Sale) {
        return;
    }
    entry.table_id = context.table.id;
    entry.table_name = context.table.name;

    const auto item = entry.item_id;
    auto recorded = config_.ledger->record(std::move(entry));
    telemetry_.record_ledger_append(recorded.success);
    if (recorded.success) {
        return;
    }

    auto warning = "Inventory tracking failed for item " + std::to_string(item.value) + ": " + recorded.message;
    common::emit_diagnostic(config_.diagnostics, common::DiagnosticSeverity::Warning, "inventory", warning, recorded.error);
    warnings.push_back(std::move(warning));
}

OperationResponse<catalog::RowRecord> RowMutationPipeline::apply_create(const TableContext& context,
                                                                        const common::RowData& input,
                                                                        std::string_view actor,
                                                                        const registry::CapabilityView& view)
{
    std::vector<std::string> warnings;
    auto prepared = prepare(context, input, nullptr, view, warnings);
    if (!prepared.success) {
        append_warnings(prepared.warnings, warnings);
        return common::forward_failure<catalog::RowRecord>(std::move(prepared));
    }

    const auto duplicates = find_duplicate_violations(*config_.rows, context.table.id, context.columns, prepared.payload, std::nullopt);
    if (!duplicates.empty()) {
        std::vector<common::FieldError> fields;
        for (const auto& violation : duplicates) {
            fields.push_back(common::FieldError{violation.column_name, violation.value, violation.message()});
        }
        return fail<catalog::RowRecord>(EngineErrc::DuplicateValue, duplicates.front().message(), std::move(fields));
    }

    catalog::RowRecord row{};
    row.table_id = context.table.id;
    row.data = std::move(prepared.payload);
    row.created_by = std::string{actor};
    row.created_at = now();
    row.updated_at = row.created_at;
    if (const auto error = config_.rows->insert_row(row); error) {
        return common::make_failure<catalog::RowRecord>(error, "Failed to create row");
    }

    inventory::LedgerEntry entry{};
    entry.item_id = row.id;
    entry.type = inventory::TransactionType::Add;
    entry.quantity_change = quantity_of(row.data).value_or(1.0);
    entry.new_data = row.data;
    entry.actor = std::string{actor};
    track(context, std::move(entry), warnings);

    auto response = common::make_success(std::move(row), common::StatusCategory::Created);
    response.warnings = std::move(warnings);
    return response;
}

OperationResponse<catalog::RowRecord> RowMutationPipeline::apply_update(const TableContext& context,
                                                                        common::RowId row,
                                                                        const common::RowData& input,
                                                                        std::string_view actor,
                                                                        const registry::CapabilityView& view,
                                                                        const std::optional<LedgerAnnotation>& annotation)
{
    const auto existing = config_.rows->find_row(context.table.id, row);
    if (!existing) {
        return fail<catalog::RowRecord>(EngineErrc::RowNotFound, "Row not found");
    }

    std::vector<std::string> warnings;
    auto prepared = prepare(context, input, &*existing, view, warnings);
    if (!prepared.success) {
        append_warnings(prepared.warnings, warnings);
        return common::forward_failure<catalog::RowRecord>(std::move(prepared));
    }

    const auto duplicates = find_duplicate_violations(*config_.rows, context.table.id, context.columns, prepared.payload, row);
    if (!duplicates.empty()) {
        std::vector<common::FieldError> fields;
        for (const auto& violation : duplicates) {
            fields.push_back(common::FieldError{violation.column_name, violation.value, violation.message()});
        }
        return fail<catalog::RowRecord>(EngineErrc::DuplicateValue, duplicates.front().message(), std::move(fields));
    }

    auto updated = *existing;
    updated.data = std::move(prepared.payload);
    updated.updated_at = now();
    if (const auto error = config_.rows->update_row(updated); error) {
        return common::make_failure<catalog::RowRecord>(error, "Failed to update row");
    }

    inventory::LedgerEntry entry{};
    entry.item_id = updated.id;
    entry.type = annotation ? annotation->type : inventory::TransactionType::Update;
    const auto before = quantity_of(existing->data);
    const auto after = quantity_of(updated.data);
    if (before && after) {
        entry.quantity_change = *after - *before;
    }
    entry.previous_data = existing->data;
    entry.new_data = updated.data;
    if (annotation) {
        entry.reference_id = annotation->reference_id;
        entry.note = annotation->note;
    }
    entry.actor = std::string{actor};
    track(context, std::move(entry), warnings);

    auto response = common::make_success(std::move(updated));
    response.warnings = std::move(warnings);
    return response;
}

OperationResponse<catalog::RowRecord> RowMutationPipeline::apply_delete(const TableContext& context,
                                                                        common::RowId row,
                                                                        std::string_view actor)
{
    auto existing = config_.rows->find_row(context.table.id, row);
    if (!existing) {
        return fail<catalog::RowRecord>(EngineErrc::RowNotFound, "Row not found");
    }
    if (const auto error = config_.rows->delete_row(context.table.id, row); error) {
        return common::make_failure<catalog::RowRecord>(error, "Failed to delete row");
    }

    std::vector<std::string> warnings;
    inventory::LedgerEntry entry{};
    entry.item_id = existing->id;
    entry.type = inventory::TransactionType::Remove;
    entry.quantity_change = -quantity_of(existing->data).value_or(1.0);
    entry.previous_data = existing->data;
    entry.actor = std::string{actor};
    track(context, std::move(entry), warnings);

    auto response = common::make_success(std::move(*existing));
    response.warnings = std::move(warnings);
    return response;
}

OperationResponse<catalog::RowRecord> RowMutationPipeline::create_row(common::TableId table,
                                                                      const common::RowData& input,
                                                                      std::string_view actor,
                                                                      const registry::CapabilityView& view)
{
    constexpr auto kind = MutationKind::Create;
    telemetry_.record_attempt(kind);
    MutationLatencyScope latency{telemetry_, kind};

    auto context = load(table, actor, AccessMode::Write);
    if (!context.success) {
        return finish(kind, common::forward_failure<catalog::RowRecord>(std::move(context)));
    }
    return finish(kind, apply_create(context.payload, input, actor, view));
}

OperationResponse<catalog::RowRecord> RowMutationPipeline::update_row(common::TableId table,
                                                                      common::RowId row,
                                                                      const common::RowData& input,
                                                                      std::string_view actor,
                                                                      const registry::CapabilityView& view,
                                                                      const std::optional<LedgerAnnotation>& annotation)
{
    constexpr auto kind = MutationKind::Update;
    telemetry_.record_attempt(kind);
    MutationLatencyScope latency{telemetry_, kind};

    auto context = load(table, actor, AccessMode::Write);
    if (!context.success) {
        return finish(kind, common::forward_failure<catalog::RowRecord>(std::move(context)));
    }
    return finish(kind, apply_update(context.payload, row, input, actor, view, annotation));
}

OperationResponse<catalog::RowRecord> RowMutationPipeline::delete_row(common::TableId table,
                                                                      common::RowId row,
                                                                      std::string_view actor)
{
    constexpr auto kind = MutationKind::Delete;
    telemetry_.record_attempt(kind);
    MutationLatencyScope latency{telemetry_, kind};

    auto context = load(table, actor, AccessMode::Write);
    if (!context.success) {
        return finish(kind, common::forward_failure<catalog::RowRecord>(std::move(context)));
    }
    return finish(kind, apply_delete(context.payload, row, actor));
}

OperationResponse<MassActionResult> RowMutationPipeline::execute_mass_action(common::TableId table,
                                                                             const MassActionRequest& request,
                                                                             std::string_view actor,
                                                                             const registry::CapabilityView& view)
{
    constexpr auto kind = MutationKind::MassAction;
    telemetry_.record_attempt(kind);
    MutationLatencyScope latency{telemetry_, kind};

    const auto mode = request.action == RowMassAction::Export ? AccessMode::Read : AccessMode::Write;
    auto context = load(table, actor, mode);
    if (!context.success) {
        return finish(kind, common::forward_failure<MassActionResult>(std::move(context)));
    }

    if (request.action == RowMassAction::SetFieldValue && find_column(context.payload.columns, request.field) == nullptr) {
        return finish(kind, fail<MassActionResult>(EngineErrc::ColumnNotFound, "Column not found"));
    }

    std::vector<common::RowId> targets;
    if (request.select_all) {
        targets = config_.rows->find_row_ids(table, request.filters);
    } else if (request.row_ids.empty()) {
        return finish(kind, fail<MassActionResult>(EngineErrc::InvalidArgument, "No rows selected"));
    } else {
        targets = request.row_ids;
    }

    MassActionResult result{};
    result.action = request.action;
    result.targeted = targets.size();
    std::vector<std::string> warnings;

    for (const auto id : targets) {
        MassActionItemResult item{};
        item.row_id = id;
        switch (request.action) {
        case RowMassAction::Delete: {
            auto deleted = apply_delete(context.payload, id, actor);
            item.success = deleted.success;
            item.error = deleted.error;
            item.message = std::move(deleted.message);
            append_warnings(warnings, deleted.warnings);
            break;
        }
        case RowMassAction::SetFieldValue: {
            const auto existing = config_.rows->find_row(table, id);
            if (!existing) {
                item.error = make_error_code(EngineErrc::RowNotFound);
                item.message = "Row not found";
                break;
            }
            auto data = existing->data;
            data[request.field] = request.value;
            auto updated = apply_update(context.payload, id, data, actor, view, std::nullopt);
            item.success = updated.success;
            item.error = updated.error;
            item.message = std::move(updated.message);
            append_warnings(warnings, updated.warnings);
            break;
        }
        case RowMassAction::Export: {
            auto existing = config_.rows->find_row(table, id);
            if (!existing) {
                item.error = make_error_code(EngineErrc::RowNotFound);
                item.message = "Row not found";
                break;
            }
            result.exported_rows.push_back(std::move(*existing));
            item.success = true;
            break;
        }
        default:
            item.error = make_error_code(EngineErrc::InvalidArgument);
            item.message = "Unsupported mass action";
            break;
        }

        if (item.success) {
            result.succeeded += 1U;
        } else {
            result.failed += 1U;
        }
        result.results.push_back(std::move(item));
    }

    if (result.failed > 0U) {
        warnings.push_back(std::to_string(result.failed) + " of " + std::to_string(result.targeted) +
                           " items failed to " + std::string{to_string(request.action)});
    }
    auto response = common::make_success(std::move(result));
    response.warnings = std::move(warnings);
    return finish(kind, std::move(response));
}

OperationResponse<ImportResult> RowMutationPipeline::import_rows(common::TableId table,
                                                                 const ImportRequest& request,
                                                                 std::string_view actor,
                                                                 const registry::CapabilityView& view)
{
    constexpr auto kind = MutationKind::Import;
    telemetry_.record_attempt(kind);
    MutationLatencyScope latency{telemetry_, kind};

    auto loaded = load(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return finish(kind, common::forward_failure<ImportResult>(std::move(loaded)));
    }
    const auto& context = loaded.payload;

    if (request.rows.empty()) {
        return finish(kind, fail<ImportResult>(EngineErrc::InvalidArgument, "No rows to import"));
    }
    if (request.rows.size() > config_.import_batch_limit) {
        return finish(kind,
                      fail<ImportResult>(EngineErrc::InvalidArgument,
                                         "Import exceeds the batch limit of " +
                                             std::to_string(config_.import_batch_limit) + " rows"));
    }
    if (request.has_headers && request.headers.empty()) {
        return finish(kind, fail<ImportResult>(EngineErrc::InvalidArgument, "Headers are required"));
    }

    ImportResult result{};
    result.total_rows = request.rows.size();

    std::vector<const catalog::ColumnDescriptor*> binding;
    if (request.has_headers) {
        for (const auto& header : request.headers) {
            const catalog::ColumnDescriptor* column = nullptr;
            if (auto mapped = request.column_mapping.find(header); mapped != request.column_mapping.end()) {
                column = match_header(context.columns, mapped->second);
            } else {
                column = match_header(context.columns, header);
            }
            if (column == nullptr) {
                result.unmapped_headers.push_back(header);
            }
            binding.push_back(column);
        }
    } else {
        std::size_t width = 0U;
        for (const auto& cells : request.rows) {
            width = std::max(width, cells.size());
        }
        for (std::size_t index = 0U; index < width; ++index) {
            binding.push_back(index < context.columns.size() ? &context.columns[index] : nullptr);
        }
    }

    struct StagedRow final {
        std::size_t number = 0U;
        common::RowData data{};
    };

    std::vector<StagedRow> staged;
    std::map<std::string, std::set<std::string>, std::less<>> seen;
    std::vector<std::string> warnings;

    for (std::size_t index = 0U; index < request.rows.size(); ++index) {
        const auto& cells = request.rows[index];
        ImportRowResult row_result{};
        row_result.row_number = index + 1U;

        common::RowData input;
        for (std::size_t cell = 0U; cell < cells.size() && cell < binding.size(); ++cell) {
            if (binding[cell] != nullptr && !common::is_blank(cells[cell])) {
                input[binding[cell]->name] = cells[cell];
            }
        }

        std::vector<std::string> ignored;
        auto prepared = prepare(context, input, nullptr, view, ignored);
        if (!prepared.success) {
            row_result.error = prepared.error;
            row_result.message = std::move(prepared.message);
            row_result.field_errors = std::move(prepared.field_errors);
            result.results.push_back(std::move(row_result));
            result.failed_rows += 1U;
            continue;
        }

        std::vector<common::FieldError> conflicts;
        if (request.mode == ImportMode::Append) {
            for (const auto& violation :
                 find_duplicate_violations(*config_.rows, context.table.id, context.columns, prepared.payload, std::nullopt)) {
                conflicts.push_back(common::FieldError{violation.column_name, violation.value, violation.message()});
            }
        }
        for (const auto& column : context.columns) {
            if (column.allow_duplicates) {
                continue;
            }
            const auto* value = common::find_field(prepared.payload, column.name);
            if (value == nullptr || common::is_null(*value)) {
                continue;
            }
            const auto rendered = common::to_display_string(*value);
            auto it = seen.find(column.name);
            if (it != seen.end() && it->second.count(rendered) > 0U) {
                conflicts.push_back(common::FieldError{column.name, rendered, "Duplicate value in import batch"});
            }
        }
        if (!conflicts.empty()) {
            row_result.error = make_error_code(EngineErrc::DuplicateValue);
            row_result.message = conflicts.front().reason;
            row_result.field_errors = std::move(conflicts);
            result.results.push_back(std::move(row_result));
            result.failed_rows += 1U;
            continue;
        }

        for (const auto& column : context.columns) {
            const auto* value = common::find_field(prepared.payload, column.name);
            if (!column.allow_duplicates && value != nullptr && !common::is_null(*value)) {
                seen[column.name].insert(common::to_display_string(*value));
            }
        }
        staged.push_back(StagedRow{row_result.row_number, std::move(prepared.payload)});
    }

    // Nothing is cleared or written unless every row passed.
    if (result.failed_rows > 0U) {
        std::vector<common::FieldError> errors;
        for (const auto& failed : result.results) {
            const auto prefix = "Row " + std::to_string(failed.row_number) + ": ";
            if (failed.field_errors.empty()) {
                errors.push_back(common::FieldError{{}, {}, prefix + failed.message});
            }
            for (const auto& field : failed.field_errors) {
                errors.push_back(common::FieldError{field.field, field.value, prefix + field.reason});
            }
        }
        const auto message = "Import failed: " + std::to_string(result.failed_rows) + " of " +
                             std::to_string(result.total_rows) + " rows did not validate";
        auto response = fail<ImportResult>(EngineErrc::ValidationFailed, message, std::move(errors));
        response.payload = std::move(result);
        return finish(kind, std::move(response));
    }

    if (request.mode == ImportMode::Replace) {
        const auto existing = config_.rows->list_rows(table);
        std::size_t removed = 0U;
        if (const auto error = config_.rows->delete_rows(table, removed); error) {
            return finish(kind, common::make_failure<ImportResult>(error, "Failed to clear existing rows"));
        }
        result.replaced_rows = removed;
        for (const auto& row : existing) {
            inventory::LedgerEntry entry{};
            entry.item_id = row.id;
            entry.type = inventory::TransactionType::Remove;
            entry.quantity_change = -quantity_of(row.data).value_or(1.0);
            entry.previous_data = row.data;
            entry.note = "import replace";
            entry.actor = std::string{actor};
            track(context, std::move(entry), warnings);
        }
    }

    for (auto& staged_row : staged) {
        ImportRowResult row_result{};
        row_result.row_number = staged_row.number;

        catalog::RowRecord row{};
        row.table_id = context.table.id;
        row.data = std::move(staged_row.data);
        row.created_by = std::string{actor};
        row.created_at = now();
        row.updated_at = row.created_at;
        if (const auto error = config_.rows->insert_row(row); error) {
            row_result.error = error;
            row_result.message = "Failed to store row";
            result.results.push_back(std::move(row_result));
            result.failed_rows += 1U;
            continue;
        }

        inventory::LedgerEntry entry{};
        entry.item_id = row.id;
        entry.type = inventory::TransactionType::Add;
        entry.quantity_change = quantity_of(row.data).value_or(1.0);
        entry.new_data = row.data;
        entry.note = "import";
        entry.actor = std::string{actor};
        track(context, std::move(entry), warnings);

        row_result.success = true;
        row_result.row_id = row.id;
        result.results.push_back(std::move(row_result));
        result.imported_rows += 1U;
    }

    std::sort(result.results.begin(), result.results.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.row_number < rhs.row_number;
    });
    for (const auto& header : result.unmapped_headers) {
        warnings.push_back("Header \"" + header + "\" does not match any column and was ignored");
    }
    if (result.failed_rows > 0U) {
        warnings.push_back(std::to_string(result.failed_rows) + " of " + std::to_string(result.total_rows) +
                           " rows failed to import");
    }

    const auto status = result.imported_rows > 0U ? common::StatusCategory::Created : common::StatusCategory::Ok;
    auto response = common::make_success(std::move(result), status);
    response.warnings = std::move(warnings);
    return finish(kind, std::move(response));
}

OperationResponse<catalog::RowRecord> RowMutationPipeline::get_row(common::TableId table,
                                                                   common::RowId row,
                                                                   std::string_view actor) const
{
    auto context = load(table, actor, AccessMode::Read);
    if (!context.success) {
        return common::forward_failure<catalog::RowRecord>(std::move(context));
    }
    auto record = config_.rows->find_row(table, row);
    if (!record) {
        return fail<catalog::RowRecord>(EngineErrc::RowNotFound, "Row not found");
    }
    return common::make_success(std::move(*record));
}

OperationResponse<std::vector<catalog::RowRecord>> RowMutationPipeline::read_rows(common::TableId table,
                                                                                  const storage::RowFilter& filters,
                                                                                  std::string_view actor) const
{
    auto context = load(table, actor, AccessMode::Read);
    if (!context.success) {
        return common::forward_failure<std::vector<catalog::RowRecord>>(std::move(context));
    }
    if (filters.empty()) {
        return common::make_success(config_.rows->list_rows(table));
    }

    std::vector<catalog::RowRecord> rows;
    for (const auto id : config_.rows->find_row_ids(table, filters)) {
        if (auto record = config_.rows->find_row(table, id)) {
            rows.push_back(std::move(*record));
        }
    }
    return common::make_success(std::move(rows));
}

OperationResponse<DatasetValidationReport> RowMutationPipeline::validate_rows(common::TableId table,
                                                                              std::string_view actor,
                                                                              const registry::CapabilityView& view) const
{
    auto context = load(table, actor, AccessMode::Read);
    if (!context.success) {
        return common::forward_failure<DatasetValidationReport>(std::move(context));
    }
    return common::make_success(validate_dataset(config_.rows->list_rows(table), context.payload.columns, view));
}

OperationResponse<TypeChangePreview> RowMutationPipeline::preview_type_change(common::TableId table,
                                                                              common::ColumnId column,
                                                                              std::string_view new_type,
                                                                              std::string_view actor,
                                                                              const registry::CapabilityView& view) const
{
    auto context = load(table, actor, AccessMode::Read);
    if (!context.success) {
        return common::forward_failure<TypeChangePreview>(std::move(context));
    }
    const auto& columns = context.payload.columns;
    auto it = std::find_if(columns.begin(), columns.end(), [&](const auto& entry) { return entry.id == column; });
    if (it == columns.end()) {
        return fail<TypeChangePreview>(EngineErrc::ColumnNotFound, "Column not found");
    }
    return data::preview_type_change(config_.rows->list_rows(table), *it, new_type, view);
}

}  // namespace dyntab::data
