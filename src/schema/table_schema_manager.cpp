#include "dyntab/schema/table_schema_manager.hpp"

#include "dyntab/common/engine_errors.hpp"
#include "dyntab/common/string_utils.hpp"
#include "dyntab/data/value_coercion.hpp"
#include "dyntab/schema/column_names.hpp"
#include "dyntab/schema/protected_columns.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dyntab::schema {

namespace {

using common::EngineErrc;
using common::OperationResponse;

constexpr std::size_t kMaxTableNameLength = 255U;

template <typename Payload>
OperationResponse<Payload> fail(EngineErrc code, std::string message = {}, std::vector<common::FieldError> fields = {})
{
    return common::make_failure<Payload>(make_error_code(code), std::move(message), std::move(fields));
}

std::string protection_message(catalog::TablePurpose purpose)
{
    return "These columns are protected because the table purpose is " + std::string{catalog::to_string(purpose)} +
           ". Change the table purpose to default first.";
}

const catalog::ColumnDescriptor* find_by_name(const std::vector<catalog::ColumnDescriptor>& columns, std::string_view name)
{
    auto it = std::find_if(columns.begin(), columns.end(), [&](const auto& column) { return column.name == name; });
    return it == columns.end() ? nullptr : &(*it);
}

// Moves `column` to `target` within the ordered list; positions are rewritten by the caller.
void move_column(std::vector<catalog::ColumnDescriptor>& columns, common::ColumnId column, std::size_t target)
{
    auto it = std::find_if(columns.begin(), columns.end(), [&](const auto& entry) { return entry.id == column; });
    if (it == columns.end()) {
        return;
    }
    auto moved = std::move(*it);
    columns.erase(it);
    target = std::min(target, columns.size());
    columns.insert(columns.begin() + static_cast<std::ptrdiff_t>(target), std::move(moved));
}

std::optional<common::FieldError> check_default_value(const std::optional<std::string>& default_value,
                                                      std::string_view type_id,
                                                      const registry::CapabilityView& view)
{
    if (!default_value.has_value() || common::is_blank(*default_value)) {
        return std::nullopt;
    }
    auto result = data::coerce(common::CellValue{*default_value}, type_id, view);
    if (result.ok()) {
        return std::nullopt;
    }
    return common::FieldError{"defaultValue", *default_value, std::move(result.reason)};
}

}  // namespace

std::string_view to_string(ColumnMassAction action) noexcept
{
    switch (action) {
    case ColumnMassAction::MakeRequired:
        return "make_required";
    case ColumnMassAction::MakeOptional:
        return "make_optional";
    case ColumnMassAction::Delete:
    default:
        return "delete";
    }
}

std::optional<ColumnMassAction> parse_column_mass_action(std::string_view text) noexcept
{
    if (common::iequals(text, "delete")) {
        return ColumnMassAction::Delete;
    }
    if (common::iequals(text, "make_required")) {
        return ColumnMassAction::MakeRequired;
    }
    if (common::iequals(text, "make_optional")) {
        return ColumnMassAction::MakeOptional;
    }
    return std::nullopt;
}

TableSchemaManager::TableSchemaManager(Config config)
    : config_{std::move(config)}
{
    if (config_.tables == nullptr || config_.rows == nullptr || config_.access == nullptr) {
        throw std::invalid_argument{"TableSchemaManager requires table, row and access collaborators"};
    }
}

std::chrono::system_clock::time_point TableSchemaManager::now() const
{
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

OperationResponse<catalog::TableDescriptor> TableSchemaManager::load_table(common::TableId table,
                                                                           std::string_view actor,
                                                                           AccessMode mode) const
{
    auto descriptor = config_.tables->find_table(table);
    if (!descriptor) {
        return fail<catalog::TableDescriptor>(EngineErrc::TableNotFound, "Table not found");
    }
    const auto allowed = mode == AccessMode::Read ? config_.access->has_read_access(*descriptor, actor)
                                                  : config_.access->has_write_access(*descriptor, actor);
    if (!allowed) {
        return fail<catalog::TableDescriptor>(EngineErrc::AccessDenied, "Access denied");
    }
    return common::make_success(std::move(*descriptor));
}

OperationResponse<catalog::ColumnDescriptor> TableSchemaManager::insert_column(const catalog::TableDescriptor& table,
                                                                               catalog::ColumnDescriptor column)
{
    column.table_id = table.id;
    if (auto error = config_.tables->insert_column(column); error) {
        return common::make_failure<catalog::ColumnDescriptor>(error, "Failed to create column \"" + column.name + "\"");
    }
    return common::make_success(std::move(column), common::StatusCategory::Created);
}

std::error_code TableSchemaManager::renumber(std::vector<catalog::ColumnDescriptor>& columns)
{
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        const auto position = static_cast<std::uint32_t>(index);
        if (columns[index].position == position) {
            continue;
        }
        columns[index].position = position;
        if (auto error = config_.tables->update_column(columns[index]); error) {
            return error;
        }
    }
    return {};
}

OperationResponse<TableCreated> TableSchemaManager::create_table(const CreateTableRequest& request,
                                                                 std::string_view actor,
                                                                 const registry::CapabilityView& view)
{
    const auto name = common::trim_copy(request.name);
    if (name.empty()) {
        return fail<TableCreated>(EngineErrc::InvalidArgument,
                                  "Table name is required",
                                  {common::FieldError{"name", request.name, "Table name is required"}});
    }
    if (name.size() > kMaxTableNameLength) {
        return fail<TableCreated>(EngineErrc::InvalidArgument,
                                  "Table name must be 255 characters or less",
                                  {common::FieldError{"name", request.name, "Table name must be 255 characters or less"}});
    }

    const auto defaults = default_columns(request.purpose);
    std::vector<catalog::ColumnDescriptor> user_columns;
    std::vector<std::string> skipped;
    std::vector<common::FieldError> field_errors;
    for (const auto& draft : request.columns) {
        const auto validation = validate_column_name(draft.name);
        if (!validation.valid) {
            field_errors.push_back(common::FieldError{"columns", draft.name, validation.error});
            continue;
        }
        if (find_by_name(defaults, validation.internal_name) != nullptr) {
            skipped.push_back(validation.internal_name);
            continue;
        }
        if (find_by_name(user_columns, validation.internal_name) != nullptr) {
            return fail<TableCreated>(EngineErrc::DuplicateColumnName,
                                      "A column with the name \"" + validation.internal_name +
                                          "\" is defined more than once.");
        }

        std::shared_ptr<const registry::ColumnTypeHandler> handler;
        if (auto error = view.resolve(draft.type_id, handler); error) {
            return common::make_failure<TableCreated>(error, "Unknown column type: " + draft.type_id);
        }
        if (auto issue = check_default_value(draft.default_value, draft.type_id, view)) {
            issue->field = validation.internal_name + ".defaultValue";
            field_errors.push_back(std::move(*issue));
            continue;
        }

        catalog::ColumnDescriptor column{};
        column.name = validation.internal_name;
        column.type_id = draft.type_id;
        column.required = draft.required;
        column.allow_duplicates = draft.allow_duplicates;
        column.default_value = draft.default_value;
        user_columns.push_back(std::move(column));
    }
    if (!field_errors.empty()) {
        return fail<TableCreated>(EngineErrc::InvalidColumnName, "Invalid column definitions", std::move(field_errors));
    }

    TableCreated created{};
    created.table.name = name;
    created.table.description = request.description;
    created.table.visibility = request.visibility;
    created.table.purpose = request.purpose;
    created.table.owner = std::string{actor};
    created.table.created_at = now();
    created.table.updated_at = created.table.created_at;
    if (auto error = config_.tables->insert_table(created.table); error) {
        return common::make_failure<TableCreated>(error, "Failed to create table");
    }

    std::vector<catalog::ColumnDescriptor> pending = defaults;
    pending.insert(pending.end(), user_columns.begin(), user_columns.end());
    for (std::size_t index = 0U; index < pending.size(); ++index) {
        pending[index].position = static_cast<std::uint32_t>(index);
        auto inserted = insert_column(created.table, pending[index]);
        if (!inserted.success) {
            if (auto rollback = config_.tables->delete_table(created.table.id); rollback) {
                common::emit_diagnostic(config_.diagnostics,
                                        common::DiagnosticSeverity::Error,
                                        "schema",
                                        "Failed to remove partially created table " + created.table.name,
                                        rollback);
            }
            return common::forward_failure<TableCreated>(std::move(inserted));
        }
        created.columns.push_back(std::move(inserted.payload));
    }

    created.skipped_columns = std::move(skipped);
    auto response = common::make_success(std::move(created), common::StatusCategory::Created);
    for (const auto& column : response.payload.skipped_columns) {
        response.warnings.push_back("Column \"" + column + "\" is provided by the table purpose and was skipped");
    }
    response.message = "Table created successfully";
    return response;
}

// base, "base Copy", "base Copy 2", ... compared case-insensitively with the owner's tables.
std::string TableSchemaManager::unique_table_name(const std::string& base, std::string_view owner) const
{
    std::vector<std::string> taken;
    for (const auto& table : config_.tables->list_tables()) {
        if (table.owner == owner) {
            taken.push_back(common::to_lower_copy(table.name));
        }
    }
    const auto is_free = [&](const std::string& candidate) {
        return std::find(taken.begin(), taken.end(), common::to_lower_copy(candidate)) == taken.end();
    };

    if (is_free(base)) {
        return base;
    }
    auto candidate = base + " Copy";
    for (std::size_t counter = 2U; !is_free(candidate); ++counter) {
        candidate = base + " Copy " + std::to_string(counter);
    }
    return candidate;
}

OperationResponse<TableCreated> TableSchemaManager::clone_table(const CloneTableRequest& request, std::string_view actor)
{
    auto source = load_table(request.source, actor, AccessMode::Read);
    if (!source.success) {
        if (source.error == EngineErrc::TableNotFound) {
            source.message = "Source table not found";
        } else if (source.error == EngineErrc::AccessDenied) {
            source.message = "You do not have access to the source table";
        }
        return common::forward_failure<TableCreated>(std::move(source));
    }

    auto base = common::trim_copy(request.name);
    if (base.empty()) {
        base = source.payload.name;
    }
    const auto name = unique_table_name(base, actor);
    if (name.size() > kMaxTableNameLength) {
        return fail<TableCreated>(EngineErrc::InvalidArgument,
                                  "Table name must be 255 characters or less",
                                  {common::FieldError{"name", name, "Table name must be 255 characters or less"}});
    }

    TableCreated created{};
    created.table.name = name;
    created.table.description = request.description.value_or("Clone of " + source.payload.name);
    created.table.visibility = request.visibility;
    created.table.purpose = request.purpose.value_or(source.payload.purpose);
    created.table.owner = std::string{actor};
    created.table.created_at = now();
    created.table.updated_at = created.table.created_at;

    auto pending = config_.tables->list_columns(source.payload.id);
    for (const auto& column : default_columns(created.table.purpose)) {
        if (find_by_name(pending, column.name) == nullptr) {
            pending.push_back(column);
        }
    }

    if (auto error = config_.tables->insert_table(created.table); error) {
        return common::make_failure<TableCreated>(error, "Failed to clone table");
    }
    for (std::size_t index = 0U; index < pending.size(); ++index) {
        auto column = pending[index];
        column.id = common::ColumnId{};
        column.position = static_cast<std::uint32_t>(index);
        auto inserted = insert_column(created.table, std::move(column));
        if (!inserted.success) {
            if (auto rollback = config_.tables->delete_table(created.table.id); rollback) {
                common::emit_diagnostic(config_.diagnostics,
                                        common::DiagnosticSeverity::Error,
                                        "schema",
                                        "Failed to remove partially cloned table " + created.table.name,
                                        rollback);
            }
            return common::forward_failure<TableCreated>(std::move(inserted));
        }
        created.columns.push_back(std::move(inserted.payload));
    }

    auto response = common::make_success(std::move(created), common::StatusCategory::Created);
    response.message = "Table cloned successfully";
    return response;
}

OperationResponse<std::vector<catalog::TableDescriptor>> TableSchemaManager::list_tables(std::string_view actor) const
{
    std::vector<catalog::TableDescriptor> visible;
    for (auto& table : config_.tables->list_tables()) {
        if (config_.access->has_read_access(table, actor)) {
            visible.push_back(std::move(table));
        }
    }
    return common::make_success(std::move(visible));
}

OperationResponse<catalog::TableDescriptor> TableSchemaManager::get_table(common::TableId table,
                                                                         std::string_view actor) const
{
    return load_table(table, actor, AccessMode::Read);
}

OperationResponse<catalog::TableDescriptor> TableSchemaManager::update_table_settings(common::TableId table,
                                                                                     const TableSettingsUpdate& update,
                                                                                     std::string_view actor)
{
    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return loaded;
    }
    auto descriptor = std::move(loaded.payload);

    if (update.name.has_value()) {
        auto name = common::trim_copy(*update.name);
        if (name.empty() || name.size() > kMaxTableNameLength) {
            return fail<catalog::TableDescriptor>(EngineErrc::InvalidArgument,
                                                  "Table name must be between 1 and 255 characters",
                                                  {common::FieldError{"name", *update.name, "Invalid table name"}});
        }
        descriptor.name = std::move(name);
    }
    if (update.description.has_value()) {
        descriptor.description = *update.description;
    }
    if (update.visibility.has_value()) {
        descriptor.visibility = *update.visibility;
    }
    descriptor.updated_at = now();

    if (auto error = config_.tables->update_table(descriptor); error) {
        return common::make_failure<catalog::TableDescriptor>(error, "Failed to update table");
    }
    return common::make_success(std::move(descriptor));
}

OperationResponse<PurposeChanged> TableSchemaManager::change_purpose(common::TableId table,
                                                                     catalog::TablePurpose purpose,
                                                                     std::string_view actor)
{
    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return common::forward_failure<PurposeChanged>(std::move(loaded));
    }

    PurposeChanged changed{};
    changed.table = std::move(loaded.payload);
    if (changed.table.purpose == purpose) {
        return common::make_success(std::move(changed));
    }

    changed.table.purpose = purpose;
    changed.table.updated_at = now();
    if (auto error = config_.tables->update_table(changed.table); error) {
        return common::make_failure<PurposeChanged>(error, "Failed to update table purpose");
    }

    auto existing = config_.tables->list_columns(table);
    auto next_position = static_cast<std::uint32_t>(existing.size());
    for (auto column : default_columns(purpose)) {
        if (find_by_name(existing, column.name) != nullptr) {
            continue;
        }
        column.position = next_position++;
        auto inserted = insert_column(changed.table, std::move(column));
        if (!inserted.success) {
            return common::forward_failure<PurposeChanged>(std::move(inserted));
        }
        changed.added_columns.push_back(std::move(inserted.payload));
    }
    return common::make_success(std::move(changed));
}

OperationResponse<TableDeleted> TableSchemaManager::delete_table(common::TableId table, std::string_view actor)
{
    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return common::forward_failure<TableDeleted>(std::move(loaded));
    }

    TableDeleted deleted{};
    deleted.table_id = table;
    deleted.columns_removed = config_.tables->list_columns(table).size();
    if (auto error = config_.rows->delete_rows(table, deleted.rows_removed); error) {
        return common::make_failure<TableDeleted>(error, "Failed to delete table rows");
    }
    if (auto error = config_.tables->delete_table(table); error) {
        return common::make_failure<TableDeleted>(error, "Failed to delete table");
    }

    auto response = common::make_success(std::move(deleted));
    response.message = "Table deleted successfully";
    if (auto error = config_.access->remove_table_references(table); error) {
        auto warning = "Table deleted, but removing it from access lists failed: " + error.message();
        common::emit_diagnostic(config_.diagnostics, common::DiagnosticSeverity::Warning, "schema", warning, error);
        response.warnings.push_back(std::move(warning));
    }
    return response;
}

OperationResponse<std::vector<catalog::ColumnDescriptor>> TableSchemaManager::list_columns(common::TableId table,
                                                                                           std::string_view actor) const
{
    auto loaded = load_table(table, actor, AccessMode::Read);
    if (!loaded.success) {
        return common::forward_failure<std::vector<catalog::ColumnDescriptor>>(std::move(loaded));
    }
    return common::make_success(config_.tables->list_columns(table));
}

OperationResponse<catalog::ColumnDescriptor> TableSchemaManager::add_column(common::TableId table,
                                                                            const ColumnDraft& draft,
                                                                            std::string_view actor,
                                                                            const registry::CapabilityView& view)
{
    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return common::forward_failure<catalog::ColumnDescriptor>(std::move(loaded));
    }

    const auto validation = validate_column_name(draft.name);
    if (!validation.valid) {
        return fail<catalog::ColumnDescriptor>(EngineErrc::InvalidColumnName,
                                               validation.error,
                                               {common::FieldError{"name", draft.name, validation.error}});
    }

    auto columns = config_.tables->list_columns(table);
    if (find_by_name(columns, validation.internal_name) != nullptr) {
        return fail<catalog::ColumnDescriptor>(EngineErrc::DuplicateColumnName,
                                               "A column with the name \"" + validation.internal_name +
                                                   "\" already exists in this table. Please choose a different name.");
    }

    std::shared_ptr<const registry::ColumnTypeHandler> handler;
    if (auto error = view.resolve(draft.type_id, handler); error) {
        return common::make_failure<catalog::ColumnDescriptor>(error, "Unknown column type: " + draft.type_id);
    }
    if (auto issue = check_default_value(draft.default_value, draft.type_id, view)) {
        return fail<catalog::ColumnDescriptor>(EngineErrc::ValidationFailed,
                                               "Default value is not valid for the column type",
                                               {std::move(*issue)});
    }

    catalog::ColumnDescriptor column{};
    column.name = validation.internal_name;
    column.type_id = draft.type_id;
    column.required = draft.required;
    column.allow_duplicates = draft.allow_duplicates;
    column.default_value = draft.default_value;
    column.position = static_cast<std::uint32_t>(columns.size());

    auto inserted = insert_column(loaded.payload, std::move(column));
    if (!inserted.success || !draft.position.has_value() || *draft.position >= columns.size()) {
        return inserted;
    }

    columns.push_back(inserted.payload);
    move_column(columns, inserted.payload.id, *draft.position);
    if (auto error = renumber(columns); error) {
        return common::make_failure<catalog::ColumnDescriptor>(error, "Failed to position column");
    }
    inserted.payload.position = *draft.position;
    return inserted;
}

OperationResponse<catalog::ColumnDescriptor> TableSchemaManager::update_column(common::TableId table,
                                                                               common::ColumnId column,
                                                                               const ColumnUpdate& update,
                                                                               std::string_view actor,
                                                                               const registry::CapabilityView& view)
{
    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return common::forward_failure<catalog::ColumnDescriptor>(std::move(loaded));
    }
    const auto& descriptor = loaded.payload;

    auto existing = config_.tables->find_column(table, column);
    if (!existing) {
        return fail<catalog::ColumnDescriptor>(EngineErrc::ColumnNotFound, "Column not found");
    }
    const auto original_name = existing->name;
    const auto is_protected = is_protected_column(descriptor.purpose, original_name);
    auto updated = *existing;

    if (update.name.has_value()) {
        const auto validation = validate_column_name(*update.name);
        if (!validation.valid) {
            return fail<catalog::ColumnDescriptor>(EngineErrc::InvalidColumnName,
                                                   validation.error,
                                                   {common::FieldError{"name", *update.name, validation.error}});
        }
        if (validation.internal_name != original_name) {
            if (is_protected) {
                return fail<catalog::ColumnDescriptor>(
                    EngineErrc::ProtectedColumn,
                    "Cannot rename protected column \"" + original_name + "\". " + protection_message(descriptor.purpose));
            }
            const auto columns = config_.tables->list_columns(table);
            if (find_by_name(columns, validation.internal_name) != nullptr) {
                return fail<catalog::ColumnDescriptor>(EngineErrc::DuplicateColumnName,
                                                       "A column with the name \"" + validation.internal_name +
                                                           "\" already exists in this table. Please choose a different name.");
            }
            updated.name = validation.internal_name;
        }
    }

    if (is_protected) {
        const auto required_changed = update.required.has_value() && *update.required != existing->required;
        const auto duplicates_changed =
            update.allow_duplicates.has_value() && *update.allow_duplicates != existing->allow_duplicates;
        if (required_changed || duplicates_changed) {
            return fail<catalog::ColumnDescriptor>(
                EngineErrc::ProtectedColumn,
                "Cannot change constraints of protected column \"" + original_name + "\". " +
                    protection_message(descriptor.purpose));
        }
    }

    if (update.type_id.has_value()) {
        std::shared_ptr<const registry::ColumnTypeHandler> handler;
        if (auto error = view.resolve(*update.type_id, handler); error) {
            return common::make_failure<catalog::ColumnDescriptor>(error, "Unknown column type: " + *update.type_id);
        }
        updated.type_id = *update.type_id;
    }
    if (update.required.has_value()) {
        updated.required = *update.required;
    }
    if (update.allow_duplicates.has_value()) {
        updated.allow_duplicates = *update.allow_duplicates;
    }
    if (update.clear_default) {
        updated.default_value.reset();
    } else if (update.default_value.has_value()) {
        if (auto issue = check_default_value(update.default_value, updated.type_id, view)) {
            return fail<catalog::ColumnDescriptor>(EngineErrc::ValidationFailed,
                                                   "Default value is not valid for the column type",
                                                   {std::move(*issue)});
        }
        updated.default_value = update.default_value;
    }

    const auto renamed = updated.name != original_name;
    if (renamed) {
        if (auto error = config_.rows->rename_field(table, original_name, updated.name); error) {
            return common::make_failure<catalog::ColumnDescriptor>(error, "Failed to rename column data");
        }
    }
    if (auto error = config_.tables->update_column(updated); error) {
        if (renamed) {
            if (auto revert = config_.rows->rename_field(table, updated.name, original_name); revert) {
                common::emit_diagnostic(config_.diagnostics,
                                        common::DiagnosticSeverity::Error,
                                        "schema",
                                        "Failed to restore row field \"" + original_name + "\" after column update failure",
                                        revert);
            }
        }
        return common::make_failure<catalog::ColumnDescriptor>(error, "Failed to update column");
    }

    if (update.position.has_value() && *update.position != updated.position) {
        auto columns = config_.tables->list_columns(table);
        move_column(columns, column, *update.position);
        if (auto error = renumber(columns); error) {
            return common::make_failure<catalog::ColumnDescriptor>(error, "Failed to reposition column");
        }
    }

    auto stored = config_.tables->find_column(table, column);
    if (!stored) {
        return fail<catalog::ColumnDescriptor>(EngineErrc::ColumnNotFound, "Column not found");
    }
    auto response = common::make_success(std::move(*stored));
    response.message = "Column updated successfully";
    return response;
}

OperationResponse<ColumnsDeleted> TableSchemaManager::delete_column(common::TableId table,
                                                                    common::ColumnId column,
                                                                    std::string_view actor)
{
    return delete_columns(table, {column}, actor);
}

OperationResponse<ColumnsDeleted> TableSchemaManager::delete_columns(common::TableId table,
                                                                     const std::vector<common::ColumnId>& columns,
                                                                     std::string_view actor)
{
    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return common::forward_failure<ColumnsDeleted>(std::move(loaded));
    }
    const auto purpose = loaded.payload.purpose;

    std::vector<catalog::ColumnDescriptor> targets;
    std::vector<std::string> blocked;
    std::vector<common::FieldError> field_errors;
    for (const auto id : columns) {
        auto column = config_.tables->find_column(table, id);
        if (!column) {
            return fail<ColumnsDeleted>(EngineErrc::ColumnNotFound,
                                        "Column " + std::to_string(id.value) + " does not exist");
        }
        if (is_protected_column(purpose, column->name)) {
            blocked.push_back(column->name);
            field_errors.push_back(common::FieldError{column->name, {}, "Protected column"});
            continue;
        }
        targets.push_back(std::move(*column));
    }
    if (!blocked.empty()) {
        return fail<ColumnsDeleted>(EngineErrc::ProtectedColumn,
                                    "Cannot delete protected columns: " + common::join(blocked, ", ") + ". " +
                                        protection_message(purpose),
                                    std::move(field_errors));
    }

    ColumnsDeleted deleted{};
    for (const auto& column : targets) {
        if (auto error = config_.tables->delete_column(table, column.id); error) {
            auto response = common::make_failure<ColumnsDeleted>(error, "Failed to delete column \"" + column.name + "\"");
            response.payload = std::move(deleted);
            return response;
        }
        if (auto error = config_.rows->remove_field(table, column.name); error) {
            common::emit_diagnostic(config_.diagnostics,
                                    common::DiagnosticSeverity::Warning,
                                    "schema",
                                    "Column \"" + column.name + "\" deleted but row data cleanup failed",
                                    error);
        }
        deleted.deleted.push_back(column.id);
    }
    auto response = common::make_success(std::move(deleted));
    response.message = "Columns deleted successfully";
    return response;
}

OperationResponse<ColumnMassActionResult> TableSchemaManager::execute_column_mass_action(
    common::TableId table,
    ColumnMassAction action,
    const std::vector<common::ColumnId>& columns,
    std::string_view actor)
{
    ColumnMassActionResult result{};
    result.action = action;

    if (action == ColumnMassAction::Delete) {
        auto deleted = delete_columns(table, columns, actor);
        if (!deleted.success) {
            return common::forward_failure<ColumnMassActionResult>(std::move(deleted));
        }
        for (const auto id : deleted.payload.deleted) {
            result.results.push_back(ColumnActionResult{id, true, {}, "Column deleted"});
        }
        return common::make_success(std::move(result));
    }

    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return common::forward_failure<ColumnMassActionResult>(std::move(loaded));
    }
    const auto required = action == ColumnMassAction::MakeRequired;
    for (const auto id : columns) {
        ColumnActionResult item{};
        item.column_id = id;
        auto column = config_.tables->find_column(table, id);
        if (!column) {
            item.error = make_error_code(EngineErrc::ColumnNotFound);
            item.message = "Column not found";
        } else if (is_protected_column(loaded.payload.purpose, column->name) && column->required != required) {
            item.error = make_error_code(EngineErrc::ProtectedColumn);
            item.message = "Cannot change constraints of protected column \"" + column->name + "\"";
        } else {
            column->required = required;
            item.error = config_.tables->update_column(*column);
            item.success = !item.error;
            item.message = item.success ? "Column updated" : item.error.message();
        }
        result.results.push_back(std::move(item));
    }
    return common::make_success(std::move(result));
}

OperationResponse<std::vector<catalog::ColumnDescriptor>> TableSchemaManager::recount_positions(common::TableId table,
                                                                                                std::string_view actor)
{
    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return common::forward_failure<std::vector<catalog::ColumnDescriptor>>(std::move(loaded));
    }
    auto columns = config_.tables->list_columns(table);
    if (auto error = renumber(columns); error) {
        return common::make_failure<std::vector<catalog::ColumnDescriptor>>(error, "Failed to recount column positions");
    }
    return common::make_success(std::move(columns));
}

OperationResponse<std::vector<catalog::ColumnDescriptor>> TableSchemaManager::swap_positions(common::TableId table,
                                                                                             common::ColumnId first,
                                                                                             common::ColumnId second,
                                                                                             std::string_view actor)
{
    if (first == second) {
        return fail<std::vector<catalog::ColumnDescriptor>>(EngineErrc::InvalidArgument,
                                                            "Cannot swap a column with itself");
    }
    auto loaded = load_table(table, actor, AccessMode::Write);
    if (!loaded.success) {
        return common::forward_failure<std::vector<catalog::ColumnDescriptor>>(std::move(loaded));
    }

    auto lhs = config_.tables->find_column(table, first);
    auto rhs = config_.tables->find_column(table, second);
    if (!lhs || !rhs) {
        return fail<std::vector<catalog::ColumnDescriptor>>(EngineErrc::ColumnNotFound, "Column not found");
    }

    const auto lhs_position = lhs->position;
    lhs->position = rhs->position;
    rhs->position = lhs_position;
    if (auto error = config_.tables->update_column(*lhs); error) {
        return common::make_failure<std::vector<catalog::ColumnDescriptor>>(error, "Failed to swap column positions");
    }
    if (auto error = config_.tables->update_column(*rhs); error) {
        lhs->position = lhs_position;
        if (auto revert = config_.tables->update_column(*lhs); revert) {
            common::emit_diagnostic(config_.diagnostics,
                                    common::DiagnosticSeverity::Error,
                                    "schema",
                                    "Failed to restore column position after swap failure",
                                    revert);
        }
        return common::make_failure<std::vector<catalog::ColumnDescriptor>>(error, "Failed to swap column positions");
    }
    return common::make_success(config_.tables->list_columns(table));
}

}  // namespace dyntab::schema
