#include "dyntab/generator/table_generator.hpp"

#include "dyntab/common/engine_errors.hpp"
#include "dyntab/schema/column_names.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <utility>

namespace dyntab::generator {

namespace {

using common::EngineErrc;
using common::OperationResponse;

constexpr double kOptionalSkipProbability = 0.2;
constexpr std::size_t kMaxReportedFailures = 5U;

template <typename Payload>
OperationResponse<Payload> fail(EngineErrc code, std::string message)
{
    return common::make_failure<Payload>(make_error_code(code), std::move(message));
}

double random_money(std::mt19937_64& engine, double min, double max)
{
    std::uniform_real_distribution<double> distribution{min, max};
    return std::round(distribution(engine) * 100.0) / 100.0;
}

// Commerce columns get plausible values instead of their type's generic generator.
std::optional<common::CellValue> commerce_value(catalog::TablePurpose purpose,
                                                std::string_view column,
                                                std::mt19937_64& engine)
{
    if (purpose == catalog::TablePurpose::Sale) {
        if (column == "price") {
            return random_money(engine, 0.99, 999.99);
        }
        if (column == "qty") {
            std::uniform_int_distribution<int> quantity{1, 100};
            return static_cast<double>(quantity(engine));
        }
    }
    if (purpose == catalog::TablePurpose::Rent) {
        if (column == "price") {
            return random_money(engine, 5.0, 500.0);
        }
        if (column == "fee") {
            return random_money(engine, 5.0, 50.0);
        }
        if (column == "used") {
            return false;
        }
        if (column == "available") {
            return true;
        }
    }
    return std::nullopt;
}

}  // namespace

TableGenerator::TableGenerator(Config config)
    : config_{config}
{
    if (config_.schema == nullptr || config_.pipeline == nullptr) {
        throw std::invalid_argument{"TableGenerator requires a schema manager and a mutation pipeline"};
    }
}

OperationResponse<GeneratedTables> TableGenerator::generate_tables(const GenerateTablesRequest& request,
                                                                   std::string_view actor,
                                                                   const registry::CapabilityView& view)
{
    const auto* generator = view.find_table_generator(request.generator_id);
    if (generator == nullptr) {
        return fail<GeneratedTables>(EngineErrc::GeneratorNotFound, "Table generator not found");
    }
    const auto& definition = generator->definition;

    const auto table_count = request.table_count.value_or(definition.default_table_count);
    const auto row_count = request.rows_per_table.value_or(definition.default_row_count);
    if (table_count < 1U || table_count > kMaxGeneratedTables) {
        return fail<GeneratedTables>(EngineErrc::InvalidArgument, "Table count must be between 1 and 500");
    }
    if (row_count < 1U || row_count > kMaxGeneratedRows) {
        return fail<GeneratedTables>(EngineErrc::InvalidArgument, "Rows per table must be between 1 and 1000");
    }

    RuleMap rules;
    schema::CreateTableRequest create{};
    create.description = definition.description;
    create.visibility = request.visibility;
    create.purpose = definition.purpose;
    for (const auto& column : definition.columns) {
        schema::ColumnDraft draft{};
        draft.name = column.name;
        draft.type_id = column.type_id;
        draft.required = column.required;
        draft.allow_duplicates = column.allow_duplicates;
        draft.default_value = column.default_value;
        create.columns.push_back(std::move(draft));
        if (column.generate) {
            rules.emplace(schema::to_internal_name(column.name), *column.generate);
        }
    }

    GeneratedTables result{};
    result.generator_id = request.generator_id;
    std::vector<std::string> warnings;

    for (std::size_t index = 0U; index < table_count; ++index) {
        create.name = definition.display_name + " #" + std::to_string(index + 1U);
        auto created = config_.schema->create_table(create, actor, view);
        if (!created.success) {
            if (result.tables.empty()) {
                return common::forward_failure<GeneratedTables>(std::move(created));
            }
            warnings.push_back("Stopped after " + std::to_string(result.tables.size()) + " tables: " + created.message);
            break;
        }

        const auto table_id = created.payload.table.id;
        result.tables.push_back(table_id);
        auto filled = fill(table_id, row_count, rules, request.seed + index, actor, view);
        if (!filled.success) {
            warnings.push_back("Table " + created.payload.table.name + " was created without rows: " + filled.message);
            continue;
        }
        result.rows_created += filled.payload.rows_created;
        result.rows_failed += filled.payload.rows_failed;
        warnings.insert(warnings.end(), filled.warnings.begin(), filled.warnings.end());
    }

    auto response = common::make_success(std::move(result), common::StatusCategory::Created);
    response.warnings = std::move(warnings);
    return response;
}

OperationResponse<GeneratedRows> TableGenerator::generate_rows(common::TableId table,
                                                               const GenerateRowsRequest& request,
                                                               std::string_view actor,
                                                               const registry::CapabilityView& view)
{
    if (request.row_count < 1U || request.row_count > kMaxGeneratedRows) {
        return fail<GeneratedRows>(EngineErrc::InvalidArgument, "Row count must be between 1 and 1000");
    }

    RuleMap rules;
    for (const auto& [column, generator_id] : request.column_generators) {
        const auto* generator = view.find_generator(generator_id);
        if (generator == nullptr) {
            return fail<GeneratedRows>(EngineErrc::GeneratorNotFound, "Generator not found: " + generator_id);
        }
        rules.emplace(column, generator->definition.rule);
    }
    return fill(table, request.row_count, rules, request.seed, actor, view);
}

OperationResponse<GeneratedRows> TableGenerator::fill(common::TableId table,
                                                      std::size_t row_count,
                                                      const RuleMap& rules,
                                                      std::uint64_t seed,
                                                      std::string_view actor,
                                                      const registry::CapabilityView& view)
{
    auto descriptor = config_.schema->get_table(table, actor);
    if (!descriptor.success) {
        return common::forward_failure<GeneratedRows>(std::move(descriptor));
    }
    auto columns = config_.schema->list_columns(table, actor);
    if (!columns.success) {
        return common::forward_failure<GeneratedRows>(std::move(columns));
    }

    GeneratedRows result{};
    result.table_id = table;
    std::vector<std::string> warnings;

    registry::GenerationContext context{seed};
    context.total = row_count;
    std::bernoulli_distribution skip_optional{kOptionalSkipProbability};

    for (std::size_t index = 0U; index < row_count; ++index) {
        common::RowData row;
        context.index = index;
        context.row = &row;

        for (const auto& column : columns.payload) {
            if (!column.required && skip_optional(context.engine)) {
                continue;
            }
            if (auto value = commerce_value(descriptor.payload.purpose, column.name, context.engine)) {
                row[column.name] = std::move(*value);
                continue;
            }
            if (auto rule = rules.find(column.name); rule != rules.end()) {
                row[column.name] = registry::apply_generation_rule(rule->second, context);
                continue;
            }
            const auto handler = view.find(column.type_id);
            if (!handler) {
                continue;
            }
            if (auto value = handler->generate(context)) {
                row[column.name] = std::move(*value);
            }
        }
        context.row = nullptr;

        auto created = config_.pipeline->create_row(table, row, actor, view);
        if (created.success) {
            result.rows_created += 1U;
            continue;
        }
        result.rows_failed += 1U;
        if (result.rows_failed <= kMaxReportedFailures) {
            warnings.push_back("Row " + std::to_string(index + 1U) + ": " + created.message);
        }
    }

    auto response = common::make_success(std::move(result), common::StatusCategory::Created);
    response.warnings = std::move(warnings);
    return response;
}

}  // namespace dyntab::generator
