#include "dyntab/shell/shell_engine.hpp"

#include "dyntab/common/string_utils.hpp"
#include "dyntab/data/value_coercion.hpp"
#include "dyntab/shell/shell_backend.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace dyntab::shell {

namespace {

using common::OperationResponse;

[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows)
{
    const std::size_t column_count = headers.size();
    std::vector<std::size_t> widths(column_count, 0U);
    for (std::size_t i = 0U; i < column_count; ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < column_count && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto make_line = [&](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0U; i < column_count; ++i) {
            if (i > 0U) {
                line.append(" | ");
            }
            const std::string& field = (i < fields.size()) ? fields[i] : std::string{};
            line.append(field);
            if (field.size() < widths[i]) {
                line.append(widths[i] - field.size(), ' ');
            }
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 3U);
    lines.push_back(make_line(headers));

    std::string separator;
    for (std::size_t i = 0U; i < column_count; ++i) {
        if (i > 0U) {
            separator.append("-+-");
        }
        separator.append(widths[i], '-');
    }
    lines.push_back(std::move(separator));

    if (rows.empty()) {
        lines.push_back("(no rows)");
        return lines;
    }

    for (const auto& row : rows) {
        lines.push_back(make_line(row));
    }
    return lines;
}

std::string plural(std::size_t count, std::string_view noun)
{
    std::string text = std::to_string(count) + " " + std::string{noun};
    if (count != 1U) {
        text.push_back('s');
    }
    return text;
}

std::string format_change(const std::optional<double>& change)
{
    if (!change) {
        return "-";
    }
    auto text = common::format_number(*change);
    if (*change > 0.0) {
        text.insert(text.begin(), '+');
    }
    return text;
}

storage::RowFilter to_filter(const std::vector<FieldAssignment>& filters)
{
    storage::RowFilter result;
    for (const auto& filter : filters) {
        result.insert_or_assign(filter.field, common::to_display_string(filter.value));
    }
    return result;
}

void add_warnings(CommandMetrics& metrics, const std::vector<std::string>& warnings)
{
    for (const auto& warning : warnings) {
        CommandDiagnostic diagnostic{};
        diagnostic.severity = common::DiagnosticSeverity::Warning;
        diagnostic.message = warning;
        metrics.diagnostics.push_back(std::move(diagnostic));
    }
}

// Copies warnings; on failure also the error, its field errors and remediation hints.
template <typename Payload>
bool absorb(CommandMetrics& metrics, const OperationResponse<Payload>& response)
{
    add_warnings(metrics, response.warnings);
    if (response.success) {
        return true;
    }

    metrics.success = false;
    metrics.summary = std::string{common::status_category_name(response.status)} + ": " + response.message;

    CommandDiagnostic diagnostic{};
    diagnostic.severity = response.severity;
    diagnostic.message = response.message;
    diagnostic.remediation_hints = response.remediation_hints;
    metrics.diagnostics.push_back(std::move(diagnostic));

    for (const auto& field_error : response.field_errors) {
        CommandDiagnostic field{};
        field.severity = response.severity;
        field.message = field_error.field + ": " + field_error.reason;
        if (!field_error.value.empty()) {
            field.message += " (value '" + field_error.value + "')";
        }
        metrics.diagnostics.push_back(std::move(field));
    }
    return false;
}

CommandMetrics make_failure(std::string summary, std::string hint = {})
{
    CommandMetrics metrics{};
    metrics.success = false;
    metrics.summary = summary;
    CommandDiagnostic diagnostic{};
    diagnostic.message = std::move(summary);
    if (!hint.empty()) {
        diagnostic.remediation_hints.push_back(std::move(hint));
    }
    metrics.diagnostics.push_back(std::move(diagnostic));
    return metrics;
}

}  // namespace

ShellEngine::ShellEngine() = default;

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
{
}

std::vector<std::string> ShellEngine::help_lines()
{
    return {"tables                                   List visible tables",
            "columns <table>                          List the columns of a table",
            "types                                    List resolvable column types",
            "modules                                  List known modules",
            "create table <name> [purpose p] [visibility v]",
            "add column <table> <name> <type> [required] [unique] [default <value>]",
            "insert <table> field=value[, ...]",
            "update <table> <row> field=value[, ...]",
            "delete <table> <row>",
            "delete <table> where field=value[, ...]",
            "select <table> [where field=value[, ...]]",
            "purchase <table> <row> [quantity <n>]",
            "ledger <table> [<row>]                   Inventory summary",
            "stock [threshold <n>]                    Low stock report",
            "swap <table> <column> <column>           Exchange two column positions",
            "recount <table>                          Renumber column positions",
            "module install|activate|deactivate <id>",
            "generate <generator> [tables <n>] [rows <n>]",
            "rent <table> <row>                       Rent an available item",
            "release <table> <row>                    Return a rented item",
            "clone <table> [as <name>]                Copy a table's columns",
            "sales [<table>]                          Sales totals and recent sales"};
}

CommandMetrics ShellEngine::execute(const std::string& text)
{
    const auto start = std::chrono::steady_clock::now();
    const auto started_at = std::chrono::system_clock::now();
    const auto trimmed = common::trim_copy(text);
    const auto ledger_before = ledger_size();

    CommandMetrics metrics{};
    if (trimmed.empty()) {
        metrics.success = true;
        metrics.summary = "Empty command.";
        metrics.command_category = "empty";
    } else if (config_.backend == nullptr) {
        metrics = make_failure("No engine backend is configured.");
        metrics.command_category = "unavailable";
    } else {
        auto parsed = parse_command(trimmed);
        if (!parsed.command) {
            metrics.success = false;
            metrics.summary = parsed.diagnostics.empty() ? "Invalid command." : parsed.diagnostics.front().message;
            metrics.diagnostics = std::move(parsed.diagnostics);
            metrics.command_category = "invalid";
        } else {
            metrics = dispatch(*parsed.command);
            metrics.command_category = std::string{to_string(parsed.command->verb)};
        }
    }

    metrics.command_text = trimmed;
    metrics.correlation_id = "cmd-" + std::to_string(correlation_counter_.fetch_add(1U));
    metrics.started_at = started_at;
    metrics.finished_at = std::chrono::system_clock::now();
    metrics.ledger_entries = ledger_size() - ledger_before;
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;

    if (config_.command_logger) {
        config_.command_logger(metrics);
    }
    return metrics;
}

std::uint64_t ShellEngine::ledger_size() const
{
    return config_.backend != nullptr ? static_cast<std::uint64_t>(config_.backend->store().ledger_size()) : 0U;
}

CommandMetrics ShellEngine::dispatch(const ShellCommand& command)
{
    switch (command.verb) {
    case CommandVerb::Help: {
        CommandMetrics metrics{};
        metrics.success = true;
        metrics.summary = "Available commands";
        metrics.detail_lines = help_lines();
        return metrics;
    }
    case CommandVerb::Tables:
        return list_tables();
    case CommandVerb::Columns:
        return list_columns(command);
    case CommandVerb::Types:
        return list_types();
    case CommandVerb::Modules:
        return list_modules();
    case CommandVerb::CreateTable:
        return create_table(command);
    case CommandVerb::AddColumn:
        return add_column(command);
    case CommandVerb::Insert:
        return insert_row(command);
    case CommandVerb::Update:
        return update_row(command);
    case CommandVerb::Delete:
        return delete_row(command);
    case CommandVerb::DeleteWhere:
        return delete_where(command);
    case CommandVerb::Select:
        return select_rows(command);
    case CommandVerb::Purchase:
        return purchase(command);
    case CommandVerb::Ledger:
        return ledger_summary(command);
    case CommandVerb::Stock:
        return stock_report(command);
    case CommandVerb::Swap:
        return swap_columns(command);
    case CommandVerb::Recount:
        return recount_columns(command);
    case CommandVerb::ModuleInstall:
    case CommandVerb::ModuleActivate:
    case CommandVerb::ModuleDeactivate:
        return change_module(command);
    case CommandVerb::Generate:
        return generate(command);
    case CommandVerb::Rent:
        return rent(command);
    case CommandVerb::Release:
        return release(command);
    case CommandVerb::Clone:
        return clone_table(command);
    case CommandVerb::Sales:
        return sales_report(command);
    default:
        return make_failure("Unsupported command.", "Type 'help' to list the available commands.");
    }
}

CommandMetrics ShellEngine::list_tables()
{
    CommandMetrics metrics{};
    auto tables = config_.backend->schema().list_tables(config_.actor);
    if (!absorb(metrics, tables)) {
        return metrics;
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(tables.payload.size());
    for (const auto& table : tables.payload) {
        rows.push_back({std::to_string(table.id.value),
                        table.name,
                        std::string{catalog::to_string(table.purpose)},
                        std::string{catalog::to_string(table.visibility)},
                        table.owner});
    }
    metrics.detail_lines = format_table({"id", "name", "purpose", "visibility", "owner"}, rows);
    metrics.summary = "Listed " + plural(rows.size(), "table");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::list_columns(const ShellCommand& command)
{
    CommandMetrics metrics{};
    auto columns = config_.backend->schema().list_columns(common::TableId{command.table_id}, config_.actor);
    if (!absorb(metrics, columns)) {
        return metrics;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& column : columns.payload) {
        rows.push_back({std::to_string(column.id.value),
                        std::to_string(column.position),
                        column.name,
                        column.type_id,
                        column.required ? "yes" : "no",
                        column.allow_duplicates ? "no" : "yes",
                        column.default_value.value_or("")});
    }
    metrics.detail_lines = format_table({"id", "position", "name", "type", "required", "unique", "default"}, rows);
    metrics.summary = "Listed " + plural(rows.size(), "column");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::list_types()
{
    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    std::vector<std::vector<std::string>> rows;
    for (const auto& handler : view.list_column_types()) {
        rows.push_back({std::string{handler->type_id()},
                        std::string{handler->display_name()},
                        std::string{registry::to_string(handler->value_kind())}});
    }
    metrics.detail_lines = format_table({"type", "display name", "kind"}, rows);
    metrics.summary = "Listed " + plural(rows.size(), "column type");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::list_modules()
{
    CommandMetrics metrics{};
    auto& backend = *config_.backend;
    const auto active = backend.lifecycle().list_active_modules();
    std::vector<std::vector<std::string>> rows;
    for (const auto& module_id : backend.lifecycle().list_modules()) {
        const bool is_active = std::find(active.begin(), active.end(), module_id) != active.end();
        rows.push_back({module_id, backend.registry().is_installed(module_id) ? "yes" : "no", is_active ? "yes" : "no"});
    }
    metrics.detail_lines = format_table({"module", "installed", "active"}, rows);
    metrics.summary = "Listed " + plural(rows.size(), "module");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::create_table(const ShellCommand& command)
{
    schema::CreateTableRequest request{};
    request.name = command.name;
    if (command.purpose) {
        const auto purpose = catalog::parse_table_purpose(*command.purpose);
        if (!purpose) {
            return make_failure("Unknown table purpose '" + *command.purpose + "'.", "Use default, sale or rent.");
        }
        request.purpose = *purpose;
    }
    if (command.visibility) {
        const auto visibility = catalog::parse_table_visibility(*command.visibility);
        if (!visibility) {
            return make_failure("Unknown table visibility '" + *command.visibility + "'.",
                                "Use private, public or shared.");
        }
        request.visibility = *visibility;
    }

    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    auto created = config_.backend->schema().create_table(request, config_.actor, view);
    if (!absorb(metrics, created)) {
        return metrics;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& column : created.payload.columns) {
        rows.push_back({std::to_string(column.id.value), column.name, column.type_id});
    }
    metrics.detail_lines = format_table({"id", "column", "type"}, rows);
    metrics.summary = "Created table " + std::to_string(created.payload.table.id.value) + " '" +
                      created.payload.table.name + "' with " + plural(rows.size(), "column");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::add_column(const ShellCommand& command)
{
    schema::ColumnDraft draft{};
    draft.name = command.name;
    draft.type_id = command.type_id;
    draft.required = command.required;
    draft.allow_duplicates = !command.unique;
    draft.default_value = command.default_value;

    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    auto added = config_.backend->schema().add_column(common::TableId{command.table_id}, draft, config_.actor, view);
    if (!absorb(metrics, added)) {
        return metrics;
    }
    metrics.summary = "Added column " + std::to_string(added.payload.id.value) + " '" + added.payload.name + "' (" +
                      added.payload.type_id + ")";
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::insert_row(const ShellCommand& command)
{
    common::RowData input;
    for (const auto& assignment : command.assignments) {
        input.insert_or_assign(assignment.field, assignment.value);
    }

    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    auto created = config_.backend->pipeline().create_row(common::TableId{command.table_id}, input, config_.actor, view);
    if (!absorb(metrics, created)) {
        return metrics;
    }
    metrics.summary = "Inserted row " + std::to_string(created.payload.id.value);
    metrics.rows_touched = 1U;
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::update_row(const ShellCommand& command)
{
    auto& pipeline = config_.backend->pipeline();
    const common::TableId table{command.table_id};
    const common::RowId row{command.row_id};

    CommandMetrics metrics{};
    auto current = pipeline.get_row(table, row, config_.actor);
    if (!absorb(metrics, current)) {
        return metrics;
    }

    // Fields not named in the command keep their stored values.
    auto input = current.payload.data;
    for (const auto& assignment : command.assignments) {
        input.insert_or_assign(assignment.field, assignment.value);
    }

    const auto view = config_.backend->capability_view();
    auto updated = pipeline.update_row(table, row, input, config_.actor, view);
    if (!absorb(metrics, updated)) {
        return metrics;
    }
    metrics.summary = "Updated row " + std::to_string(row.value);
    metrics.rows_touched = 1U;
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::delete_row(const ShellCommand& command)
{
    CommandMetrics metrics{};
    auto deleted = config_.backend->pipeline().delete_row(common::TableId{command.table_id},
                                                          common::RowId{command.row_id},
                                                          config_.actor);
    if (!absorb(metrics, deleted)) {
        return metrics;
    }
    metrics.summary = "Deleted row " + std::to_string(command.row_id);
    metrics.rows_touched = 1U;
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::delete_where(const ShellCommand& command)
{
    data::MassActionRequest request{};
    request.action = data::RowMassAction::Delete;
    request.select_all = true;
    request.filters = to_filter(command.filters);

    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    auto result = config_.backend->pipeline().execute_mass_action(common::TableId{command.table_id},
                                                                  request,
                                                                  config_.actor,
                                                                  view);
    if (!absorb(metrics, result)) {
        return metrics;
    }
    metrics.rows_touched = result.payload.succeeded;
    metrics.summary = "Deleted " + plural(result.payload.succeeded, "row") + " of " +
                      std::to_string(result.payload.targeted) + " matched";
    metrics.success = result.payload.failed == 0U;
    return metrics;
}

CommandMetrics ShellEngine::select_rows(const ShellCommand& command)
{
    const common::TableId table{command.table_id};
    auto& backend = *config_.backend;

    CommandMetrics metrics{};
    auto columns = backend.schema().list_columns(table, config_.actor);
    if (!absorb(metrics, columns)) {
        return metrics;
    }
    auto rows = backend.pipeline().read_rows(table, to_filter(command.filters), config_.actor);
    if (!absorb(metrics, rows)) {
        return metrics;
    }

    const auto view = backend.capability_view();
    std::vector<std::string> headers{"id"};
    for (const auto& column : columns.payload) {
        headers.push_back(column.name);
    }

    std::vector<std::vector<std::string>> lines;
    lines.reserve(rows.payload.size());
    for (const auto& row : rows.payload) {
        std::vector<std::string> fields{std::to_string(row.id.value)};
        for (const auto& column : columns.payload) {
            const auto* value = common::find_field(row.data, column.name);
            fields.push_back(value != nullptr ? data::format_cell(*value, column.type_id, view) : std::string{});
        }
        lines.push_back(std::move(fields));
    }

    metrics.detail_lines = format_table(headers, lines);
    metrics.rows_touched = lines.size();
    metrics.summary = "Selected " + plural(lines.size(), "row");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::purchase(const ShellCommand& command)
{
    sales::PurchaseRequest request{};
    request.table_id = common::TableId{command.table_id};
    request.item_id = common::RowId{command.row_id};
    request.quantity = command.quantity.value_or(1);
    request.customer_id = config_.actor;
    request.customer_name = config_.actor;

    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    auto receipt = config_.backend->purchases().purchase(request, view);
    if (!absorb(metrics, receipt)) {
        return metrics;
    }

    const auto& sale = receipt.payload.sale;
    std::ostringstream summary;
    summary << "Sale " << sale.id.value << ": " << sale.quantity << " x " << common::format_number(sale.unit_price)
            << " = " << common::format_number(sale.total_amount) << "; remaining "
            << common::format_number(receipt.payload.remaining_quantity);
    metrics.summary = summary.str();
    metrics.rows_touched = receipt.payload.quantity_updated ? 1U : 0U;
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::rent(const ShellCommand& command)
{
    rentals::RentRequest request{};
    request.table_id = common::TableId{command.table_id};
    request.item_id = common::RowId{command.row_id};
    request.customer_id = config_.actor;

    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    auto receipt = config_.backend->rentals().rent(request, view);
    if (!absorb(metrics, receipt)) {
        return metrics;
    }

    const auto& rental = receipt.payload.rental;
    metrics.summary = rental.rental_number + ": item " + std::to_string(rental.item_id.value) + " rented at " +
                      common::format_number(rental.unit_price);
    metrics.rows_touched = receipt.payload.state_updated ? 1U : 0U;
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::release(const ShellCommand& command)
{
    rentals::ReleaseRequest request{};
    request.table_id = common::TableId{command.table_id};
    request.item_id = common::RowId{command.row_id};
    request.actor = config_.actor;

    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    auto receipt = config_.backend->rentals().release(request, view);
    if (!absorb(metrics, receipt)) {
        return metrics;
    }

    metrics.summary = receipt.payload.rental.rental_number + ": " + receipt.message;
    metrics.rows_touched = receipt.payload.state_updated ? 1U : 0U;
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::clone_table(const ShellCommand& command)
{
    schema::CloneTableRequest request{};
    request.source = common::TableId{command.table_id};
    request.name = command.name;

    CommandMetrics metrics{};
    auto cloned = config_.backend->schema().clone_table(request, config_.actor);
    if (!absorb(metrics, cloned)) {
        return metrics;
    }

    const auto& table = cloned.payload.table;
    metrics.summary = "Cloned table " + std::to_string(command.table_id) + " as " + std::to_string(table.id.value) +
                      " \"" + table.name + "\" with " + plural(cloned.payload.columns.size(), "column");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::sales_report(const ShellCommand& command)
{
    auto& report = config_.backend->sales_report();
    std::optional<common::TableId> table;
    if (command.table_id != 0U) {
        table = common::TableId{command.table_id};
    }

    CommandMetrics metrics{};
    sales::SalesAnalyticsQuery totals_query{};
    totals_query.table_id = table;
    auto totals = report.analytics(totals_query);
    if (!absorb(metrics, totals)) {
        return metrics;
    }

    sales::SaleQuery query{};
    query.table_id = table;
    auto page = report.list_sales(query);
    if (!absorb(metrics, page)) {
        return metrics;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& sale : page.payload.sales) {
        rows.push_back({std::to_string(sale.id.value),
                        sale.item_name,
                        std::to_string(sale.quantity),
                        common::format_number(sale.total_amount),
                        sale.customer_id});
    }
    metrics.detail_lines = format_table({"sale", "item", "qty", "total", "customer"}, rows);

    const auto& figures = totals.payload;
    metrics.summary = plural(figures.total_sales, "sale") + ", " + std::to_string(figures.total_items_sold) +
                      " sold, revenue " + common::format_number(figures.total_revenue);
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::ledger_summary(const ShellCommand& command)
{
    auto& ledger = config_.backend->ledger();
    const common::TableId table{command.table_id};

    CommandMetrics metrics{};
    if (command.row_id == 0U) {
        auto summary = ledger.summary_for_table(table);
        if (!absorb(metrics, summary)) {
            return metrics;
        }
        std::vector<std::vector<std::string>> rows;
        for (const auto& item : summary.payload.items) {
            rows.push_back({std::to_string(item.item_id.value),
                            item.item_name,
                            format_change(item.net_change),
                            std::to_string(item.transaction_count)});
        }
        metrics.detail_lines = format_table({"item", "name", "net", "transactions"}, rows);
        metrics.summary = summary.payload.table_name + ": " + plural(summary.payload.total_transactions, "transaction") +
                          " across " + plural(summary.payload.total_items, "item") + ", net " +
                          format_change(summary.payload.net_change);
        metrics.success = true;
        return metrics;
    }

    const common::RowId item{command.row_id};
    auto summary = ledger.summary_for_item(table, item);
    if (!absorb(metrics, summary)) {
        return metrics;
    }

    inventory::TransactionQuery query{};
    query.table_id = table;
    query.item_id = item;
    query.limit = inventory::kDefaultTransactionPageSize;
    auto page = ledger.list_transactions(query);
    if (!absorb(metrics, page)) {
        return metrics;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& transaction : page.payload.transactions) {
        rows.push_back({std::to_string(transaction.id.value),
                        std::string{inventory::to_string(transaction.type)},
                        format_change(transaction.quantity_change),
                        transaction.reference_id,
                        transaction.actor});
    }
    metrics.detail_lines = format_table({"id", "type", "change", "reference", "actor"}, rows);

    const auto& totals = summary.payload;
    std::ostringstream text;
    text << totals.item_name << ": net " << format_change(totals.net_change) << ", added "
         << common::format_number(totals.total_added) << ", removed " << common::format_number(totals.total_removed)
         << ", sold " << common::format_number(totals.total_sold) << " (" << plural(totals.transaction_count, "transaction")
         << ")";
    metrics.summary = text.str();
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::stock_report(const ShellCommand& command)
{
    CommandMetrics metrics{};
    auto report = config_.backend->ledger().check_stock_levels(command.threshold);
    if (!absorb(metrics, report)) {
        return metrics;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& alert : report.payload.alerts) {
        rows.push_back({alert.table_name,
                        std::to_string(alert.item_id.value),
                        alert.item_name,
                        common::format_number(alert.current_quantity),
                        std::string{inventory::to_string(alert.type)}});
    }
    metrics.detail_lines = format_table({"table", "item", "name", "qty", "alert"}, rows);
    metrics.summary = "Checked " + plural(report.payload.items_checked, "item") + " at threshold " +
                      common::format_number(report.payload.threshold) + ": " + plural(rows.size(), "alert");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::swap_columns(const ShellCommand& command)
{
    CommandMetrics metrics{};
    auto swapped = config_.backend->schema().swap_positions(common::TableId{command.table_id},
                                                            common::ColumnId{command.column_a},
                                                            common::ColumnId{command.column_b},
                                                            config_.actor);
    if (!absorb(metrics, swapped)) {
        return metrics;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& column : swapped.payload) {
        rows.push_back({std::to_string(column.position), column.name});
    }
    metrics.detail_lines = format_table({"position", "column"}, rows);
    metrics.summary = "Swapped columns " + std::to_string(command.column_a) + " and " + std::to_string(command.column_b);
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::recount_columns(const ShellCommand& command)
{
    CommandMetrics metrics{};
    auto recounted = config_.backend->schema().recount_positions(common::TableId{command.table_id}, config_.actor);
    if (!absorb(metrics, recounted)) {
        return metrics;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& column : recounted.payload) {
        rows.push_back({std::to_string(column.position), column.name});
    }
    metrics.detail_lines = format_table({"position", "column"}, rows);
    metrics.summary = "Renumbered " + plural(rows.size(), "column");
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::change_module(const ShellCommand& command)
{
    auto& backend = *config_.backend;
    std::error_code error;
    std::string action;
    switch (command.verb) {
    case CommandVerb::ModuleInstall:
        error = backend.install_module(command.name);
        action = "Installed";
        break;
    case CommandVerb::ModuleActivate:
        error = backend.set_module_active(command.name, true);
        action = "Activated";
        break;
    default:
        error = backend.set_module_active(command.name, false);
        action = "Deactivated";
        break;
    }

    if (error) {
        auto metrics = make_failure(error.message() + ": " + command.name);
        metrics.diagnostics.front().remediation_hints = common::default_remediation_hints(error);
        return metrics;
    }
    CommandMetrics metrics{};
    metrics.summary = action + " module " + command.name;
    metrics.success = true;
    return metrics;
}

CommandMetrics ShellEngine::generate(const ShellCommand& command)
{
    generator::GenerateTablesRequest request{};
    request.generator_id = command.name;
    request.table_count = command.table_count;
    request.rows_per_table = command.row_count;
    request.seed = config_.seed + correlation_counter_.load();

    CommandMetrics metrics{};
    const auto view = config_.backend->capability_view();
    auto generated = config_.backend->generator().generate_tables(request, config_.actor, view);
    if (!absorb(metrics, generated)) {
        return metrics;
    }

    std::vector<std::string> ids;
    for (const auto& table : generated.payload.tables) {
        ids.push_back(std::to_string(table.value));
    }
    metrics.rows_touched = generated.payload.rows_created;
    metrics.summary = "Generated " + plural(ids.size(), "table") + " (" + common::join(ids, ", ") + ") with " +
                      plural(generated.payload.rows_created, "row");
    metrics.success = true;
    return metrics;
}

}  // namespace dyntab::shell
