#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/common/operation_response.hpp"
#include "dyntab/data/row_mutation_pipeline.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/schema/table_schema_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dyntab::generator {

inline constexpr std::size_t kMaxGeneratedTables = 500U;
inline constexpr std::size_t kMaxGeneratedRows = 1000U;

struct GenerateTablesRequest final {
    std::string generator_id{};
    std::optional<std::size_t> table_count{};
    std::optional<std::size_t> rows_per_table{};
    catalog::TableVisibility visibility = catalog::TableVisibility::Private;
    std::uint64_t seed = 0x5eedU;
};

struct GenerateRowsRequest final {
    std::size_t row_count = 10U;
    // Column name -> registered value generator id ("module:tag").
    std::map<std::string, std::string, std::less<>> column_generators{};
    std::uint64_t seed = 0x5eedU;
};

struct GeneratedRows final {
    common::TableId table_id{};
    std::size_t rows_created = 0U;
    std::size_t rows_failed = 0U;
};

struct GeneratedTables final {
    std::string generator_id{};
    std::vector<common::TableId> tables{};
    std::size_t rows_created = 0U;
    std::size_t rows_failed = 0U;
};

// Creates dummy tables from registered table generators and fills tables with generated rows.
class TableGenerator final {
public:
    struct Config final {
        schema::TableSchemaManager* schema = nullptr;
        data::RowMutationPipeline* pipeline = nullptr;
    };

    explicit TableGenerator(Config config);

    [[nodiscard]] common::OperationResponse<GeneratedTables> generate_tables(const GenerateTablesRequest& request,
                                                                             std::string_view actor,
                                                                             const registry::CapabilityView& view);
    [[nodiscard]] common::OperationResponse<GeneratedRows> generate_rows(common::TableId table,
                                                                         const GenerateRowsRequest& request,
                                                                         std::string_view actor,
                                                                         const registry::CapabilityView& view);

private:
    using RuleMap = std::map<std::string, registry::GenerationRule, std::less<>>;

    common::OperationResponse<GeneratedRows> fill(common::TableId table,
                                                  std::size_t row_count,
                                                  const RuleMap& rules,
                                                  std::uint64_t seed,
                                                  std::string_view actor,
                                                  const registry::CapabilityView& view);

    Config config_{};
};

}  // namespace dyntab::generator
