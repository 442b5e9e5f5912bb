#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/common/diagnostics.hpp"
#include "dyntab/common/operation_response.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/storage/storage_interfaces.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dyntab::schema {

struct ColumnDraft final {
    std::string name{};  // display form; converted to camelCase
    std::string type_id = "text";
    bool required = false;
    bool allow_duplicates = true;
    std::optional<std::string> default_value{};
    std::optional<std::uint32_t> position{};
};

struct CreateTableRequest final {
    std::string name{};
    std::string description{};
    catalog::TableVisibility visibility = catalog::TableVisibility::Private;
    catalog::TablePurpose purpose = catalog::TablePurpose::Default;
    std::vector<ColumnDraft> columns{};
};

// Copies the column definitions of `source`; rows are not copied.
struct CloneTableRequest final {
    common::TableId source{};
    std::string name{};  // defaults to the source name; made unique among the caller's tables
    std::optional<std::string> description{};
    catalog::TableVisibility visibility = catalog::TableVisibility::Private;
    std::optional<catalog::TablePurpose> purpose{};  // defaults to the source purpose
};

struct TableCreated final {
    catalog::TableDescriptor table{};
    std::vector<catalog::ColumnDescriptor> columns{};
    std::vector<std::string> skipped_columns{};  // collided with purpose defaults
};

struct ColumnUpdate final {
    std::optional<std::string> name{};
    std::optional<std::string> type_id{};
    std::optional<bool> required{};
    std::optional<bool> allow_duplicates{};
    std::optional<std::string> default_value{};
    bool clear_default = false;
    std::optional<std::uint32_t> position{};
};

struct TableSettingsUpdate final {
    std::optional<std::string> name{};
    std::optional<std::string> description{};
    std::optional<catalog::TableVisibility> visibility{};
};

struct ColumnsDeleted final {
    std::vector<common::ColumnId> deleted{};
};

struct PurposeChanged final {
    catalog::TableDescriptor table{};
    std::vector<catalog::ColumnDescriptor> added_columns{};
};

struct TableDeleted final {
    common::TableId table_id{};
    std::size_t rows_removed = 0U;
    std::size_t columns_removed = 0U;
};

enum class ColumnMassAction : std::uint8_t {
    Delete = 0,
    MakeRequired,
    MakeOptional
};

struct ColumnActionResult final {
    common::ColumnId column_id{};
    bool success = false;
    std::error_code error{};
    std::string message{};
};

struct ColumnMassActionResult final {
    ColumnMassAction action = ColumnMassAction::Delete;
    std::vector<ColumnActionResult> results{};
};

[[nodiscard]] std::string_view to_string(ColumnMassAction action) noexcept;
[[nodiscard]] std::optional<ColumnMassAction> parse_column_mass_action(std::string_view text) noexcept;

// Owns table and column definitions: naming, positions, protection and purpose defaults.
class TableSchemaManager final {
public:
    struct Config final {
        storage::TableStore* tables = nullptr;
        storage::RowStore* rows = nullptr;
        storage::AccessPolicy* access = nullptr;
        common::DiagnosticSink diagnostics{};
        std::function<std::chrono::system_clock::time_point()> clock{};
    };

    explicit TableSchemaManager(Config config);

    TableSchemaManager(const TableSchemaManager&) = delete;
    TableSchemaManager& operator=(const TableSchemaManager&) = delete;

    [[nodiscard]] common::OperationResponse<TableCreated> create_table(const CreateTableRequest& request,
                                                                       std::string_view actor,
                                                                       const registry::CapabilityView& view);
    [[nodiscard]] common::OperationResponse<TableCreated> clone_table(const CloneTableRequest& request,
                                                                      std::string_view actor);
    [[nodiscard]] common::OperationResponse<std::vector<catalog::TableDescriptor>> list_tables(std::string_view actor) const;
    [[nodiscard]] common::OperationResponse<catalog::TableDescriptor> get_table(common::TableId table,
                                                                               std::string_view actor) const;
    [[nodiscard]] common::OperationResponse<catalog::TableDescriptor> update_table_settings(common::TableId table,
                                                                                           const TableSettingsUpdate& update,
                                                                                           std::string_view actor);
    [[nodiscard]] common::OperationResponse<PurposeChanged> change_purpose(common::TableId table,
                                                                           catalog::TablePurpose purpose,
                                                                           std::string_view actor);
    [[nodiscard]] common::OperationResponse<TableDeleted> delete_table(common::TableId table, std::string_view actor);

    [[nodiscard]] common::OperationResponse<std::vector<catalog::ColumnDescriptor>> list_columns(common::TableId table,
                                                                                                 std::string_view actor) const;
    [[nodiscard]] common::OperationResponse<catalog::ColumnDescriptor> add_column(common::TableId table,
                                                                                  const ColumnDraft& draft,
                                                                                  std::string_view actor,
                                                                                  const registry::CapabilityView& view);
    [[nodiscard]] common::OperationResponse<catalog::ColumnDescriptor> update_column(common::TableId table,
                                                                                     common::ColumnId column,
                                                                                     const ColumnUpdate& update,
                                                                                     std::string_view actor,
                                                                                     const registry::CapabilityView& view);
    [[nodiscard]] common::OperationResponse<ColumnsDeleted> delete_column(common::TableId table,
                                                                          common::ColumnId column,
                                                                          std::string_view actor);
    // Fails without deleting anything when any target is protected.
    [[nodiscard]] common::OperationResponse<ColumnsDeleted> delete_columns(common::TableId table,
                                                                           const std::vector<common::ColumnId>& columns,
                                                                           std::string_view actor);
    [[nodiscard]] common::OperationResponse<ColumnMassActionResult> execute_column_mass_action(
        common::TableId table,
        ColumnMassAction action,
        const std::vector<common::ColumnId>& columns,
        std::string_view actor);

    // Renumbers 0..n-1 preserving relative order. Idempotent.
    [[nodiscard]] common::OperationResponse<std::vector<catalog::ColumnDescriptor>> recount_positions(
        common::TableId table,
        std::string_view actor);
    [[nodiscard]] common::OperationResponse<std::vector<catalog::ColumnDescriptor>> swap_positions(common::TableId table,
                                                                                                   common::ColumnId first,
                                                                                                   common::ColumnId second,
                                                                                                   std::string_view actor);

private:
    enum class AccessMode : std::uint8_t { Read, Write };

    common::OperationResponse<catalog::TableDescriptor> load_table(common::TableId table,
                                                                   std::string_view actor,
                                                                   AccessMode mode) const;
    common::OperationResponse<catalog::ColumnDescriptor> insert_column(const catalog::TableDescriptor& table,
                                                                       catalog::ColumnDescriptor column);
    std::error_code renumber(std::vector<catalog::ColumnDescriptor>& columns);
    std::string unique_table_name(const std::string& base, std::string_view owner) const;
    std::chrono::system_clock::time_point now() const;

    Config config_{};
};

}  // namespace dyntab::schema
