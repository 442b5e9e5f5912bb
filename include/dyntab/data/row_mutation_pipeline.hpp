#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/common/diagnostics.hpp"
#include "dyntab/common/operation_response.hpp"
#include "dyntab/data/mutation_telemetry.hpp"
#include "dyntab/data/value_coercion.hpp"
#include "dyntab/inventory/inventory_ledger.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/storage/storage_interfaces.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dyntab::data {

inline constexpr std::size_t kDefaultImportBatchLimit = 10000U;

// Overrides the ledger classification of an update (purchases record a sale against their sale id).
struct LedgerAnnotation final {
    inventory::TransactionType type = inventory::TransactionType::Sale;
    std::string reference_id{};
    std::string note{};
};

enum class RowMassAction : std::uint8_t {
    Delete = 0,
    SetFieldValue,
    Export
};

[[nodiscard]] std::string_view to_string(RowMassAction action) noexcept;
[[nodiscard]] std::optional<RowMassAction> parse_row_mass_action(std::string_view text) noexcept;

struct MassActionRequest final {
    RowMassAction action = RowMassAction::Delete;
    std::vector<common::RowId> row_ids{};
    // Targets are resolved from `filters` instead of `row_ids`.
    bool select_all = false;
    storage::RowFilter filters{};
    std::string field{};
    common::CellValue value{};
};

struct MassActionItemResult final {
    common::RowId row_id{};
    bool success = false;
    std::error_code error{};
    std::string message{};
};

struct MassActionResult final {
    RowMassAction action = RowMassAction::Delete;
    std::size_t targeted = 0U;
    std::size_t succeeded = 0U;
    std::size_t failed = 0U;
    std::vector<MassActionItemResult> results{};
    std::vector<catalog::RowRecord> exported_rows{};
};

enum class ImportMode : std::uint8_t {
    Append = 0,
    Replace
};

struct ImportRequest final {
    std::vector<std::string> headers{};
    std::vector<std::vector<std::string>> rows{};
    bool has_headers = true;
    // Header text -> column name. Headers without an entry are matched by name.
    std::map<std::string, std::string, std::less<>> column_mapping{};
    ImportMode mode = ImportMode::Append;
};

struct ImportRowResult final {
    std::size_t row_number = 0U;  // 1-based within the data rows
    bool success = false;
    std::optional<common::RowId> row_id{};
    std::error_code error{};
    std::string message{};
    std::vector<common::FieldError> field_errors{};
};

struct ImportResult final {
    std::size_t total_rows = 0U;
    std::size_t imported_rows = 0U;
    std::size_t failed_rows = 0U;
    std::size_t replaced_rows = 0U;
    std::vector<std::string> unmapped_headers{};
    std::vector<ImportRowResult> results{};
};

// Every row write goes through here: coercion, requiredness, duplicates, storage, ledger.
class RowMutationPipeline final {
public:
    struct Config final {
        storage::TableStore* tables = nullptr;
        storage::RowStore* rows = nullptr;
        storage::AccessPolicy* access = nullptr;
        inventory::InventoryLedger* ledger = nullptr;
        MutationTelemetryRegistry* telemetry_registry = nullptr;
        std::string telemetry_identifier{};
        common::DiagnosticSink diagnostics{};
        std::function<std::chrono::system_clock::time_point()> clock{};
        std::size_t import_batch_limit = kDefaultImportBatchLimit;
    };

    explicit RowMutationPipeline(Config config);
    ~RowMutationPipeline();

    RowMutationPipeline(const RowMutationPipeline&) = delete;
    RowMutationPipeline& operator=(const RowMutationPipeline&) = delete;
    RowMutationPipeline(RowMutationPipeline&&) = delete;
    RowMutationPipeline& operator=(RowMutationPipeline&&) = delete;

    [[nodiscard]] common::OperationResponse<catalog::RowRecord> create_row(common::TableId table,
                                                                           const common::RowData& input,
                                                                           std::string_view actor,
                                                                           const registry::CapabilityView& view);
    // Replaces the stored field set. Values identical to the stored ones are kept without re-resolving their type.
    [[nodiscard]] common::OperationResponse<catalog::RowRecord> update_row(
        common::TableId table,
        common::RowId row,
        const common::RowData& input,
        std::string_view actor,
        const registry::CapabilityView& view,
        const std::optional<LedgerAnnotation>& annotation = std::nullopt);
    // Returns the removed row.
    [[nodiscard]] common::OperationResponse<catalog::RowRecord> delete_row(common::TableId table,
                                                                           common::RowId row,
                                                                           std::string_view actor);

    // Items run one by one; earlier items stay committed when a later one fails.
    [[nodiscard]] common::OperationResponse<MassActionResult> execute_mass_action(common::TableId table,
                                                                                  const MassActionRequest& request,
                                                                                  std::string_view actor,
                                                                                  const registry::CapabilityView& view);
    [[nodiscard]] common::OperationResponse<ImportResult> import_rows(common::TableId table,
                                                                      const ImportRequest& request,
                                                                      std::string_view actor,
                                                                      const registry::CapabilityView& view);

    [[nodiscard]] common::OperationResponse<catalog::RowRecord> get_row(common::TableId table,
                                                                        common::RowId row,
                                                                        std::string_view actor) const;
    [[nodiscard]] common::OperationResponse<std::vector<catalog::RowRecord>> read_rows(
        common::TableId table,
        const storage::RowFilter& filters,
        std::string_view actor) const;
    [[nodiscard]] common::OperationResponse<DatasetValidationReport> validate_rows(
        common::TableId table,
        std::string_view actor,
        const registry::CapabilityView& view) const;
    [[nodiscard]] common::OperationResponse<TypeChangePreview> preview_type_change(
        common::TableId table,
        common::ColumnId column,
        std::string_view new_type,
        std::string_view actor,
        const registry::CapabilityView& view) const;

    [[nodiscard]] MutationTelemetrySnapshot telemetry_snapshot() const noexcept { return telemetry_.snapshot(); }
    // Shared with flows that compose the pipeline (purchases).
    MutationTelemetry& telemetry() noexcept { return telemetry_; }

private:
    enum class AccessMode : std::uint8_t { Read, Write };

    struct TableContext final {
        catalog::TableDescriptor table{};
        std::vector<catalog::ColumnDescriptor> columns{};
    };

    common::OperationResponse<TableContext> load(common::TableId table, std::string_view actor, AccessMode mode) const;
    common::OperationResponse<common::RowData> prepare(const TableContext& context,
                                                       const common::RowData& input,
                                                       const catalog::RowRecord* previous,
                                                       const registry::CapabilityView& view,
                                                       std::vector<std::string>& warnings) const;

    common::OperationResponse<catalog::RowRecord> apply_create(const TableContext& context,
                                                               const common::RowData& input,
                                                               std::string_view actor,
                                                               const registry::CapabilityView& view);
    common::OperationResponse<catalog::RowRecord> apply_update(const TableContext& context,
                                                               common::RowId row,
                                                               const common::RowData& input,
                                                               std::string_view actor,
                                                               const registry::CapabilityView& view,
                                                               const std::optional<LedgerAnnotation>& annotation);
    common::OperationResponse<catalog::RowRecord> apply_delete(const TableContext& context,
                                                               common::RowId row,
                                                               std::string_view actor);

    // Appends the audit record for a sale table write. Failures degrade to a warning.
    void track(const TableContext& context, inventory::LedgerEntry entry, std::vector<std::string>& warnings);

    template <typename Payload>
    common::OperationResponse<Payload> finish(MutationKind kind, common::OperationResponse<Payload> response);

    std::chrono::system_clock::time_point now() const;

    Config config_{};
    MutationTelemetry telemetry_{};
};

}  // namespace dyntab::data
