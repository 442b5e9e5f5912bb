#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/inventory/inventory_transaction.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dyntab::storage {

// Column name -> expected rendered value. Every entry must match.
using RowFilter = std::map<std::string, std::string, std::less<>>;

class TableStore {
public:
    virtual ~TableStore() = default;

    [[nodiscard]] virtual std::optional<catalog::TableDescriptor> find_table(common::TableId id) const = 0;
    [[nodiscard]] virtual std::vector<catalog::TableDescriptor> list_tables() const = 0;
    virtual std::error_code insert_table(catalog::TableDescriptor& table) = 0;
    virtual std::error_code update_table(const catalog::TableDescriptor& table) = 0;
    // Cascades to the table's columns.
    virtual std::error_code delete_table(common::TableId id) = 0;

    // Ordered by position, then by id.
    [[nodiscard]] virtual std::vector<catalog::ColumnDescriptor> list_columns(common::TableId table) const = 0;
    [[nodiscard]] virtual std::optional<catalog::ColumnDescriptor> find_column(common::TableId table,
                                                                               common::ColumnId column) const = 0;
    virtual std::error_code insert_column(catalog::ColumnDescriptor& column) = 0;
    virtual std::error_code update_column(const catalog::ColumnDescriptor& column) = 0;
    virtual std::error_code delete_column(common::TableId table, common::ColumnId column) = 0;
};

class RowStore {
public:
    virtual ~RowStore() = default;

    [[nodiscard]] virtual std::optional<catalog::RowRecord> find_row(common::TableId table, common::RowId row) const = 0;
    [[nodiscard]] virtual std::vector<catalog::RowRecord> list_rows(common::TableId table) const = 0;
    [[nodiscard]] virtual std::vector<common::RowId> find_row_ids(common::TableId table, const RowFilter& filters) const = 0;
    [[nodiscard]] virtual std::vector<common::RowId> find_rows_with_value(common::TableId table,
                                                                          std::string_view column,
                                                                          const common::CellValue& value,
                                                                          std::optional<common::RowId> exclude) const = 0;

    virtual std::error_code insert_row(catalog::RowRecord& row) = 0;
    virtual std::error_code update_row(const catalog::RowRecord& row) = 0;
    virtual std::error_code delete_row(common::TableId table, common::RowId row) = 0;
    virtual std::error_code delete_rows(common::TableId table, std::size_t& removed) = 0;
    virtual std::error_code rename_field(common::TableId table, std::string_view from, std::string_view to) = 0;
    virtual std::error_code remove_field(common::TableId table, std::string_view name) = 0;
};

class LedgerStore {
public:
    using Visitor = std::function<void(const inventory::InventoryTransaction&)>;

    virtual ~LedgerStore() = default;

    // Assigns the transaction id. Records are never updated afterwards.
    virtual std::error_code append(inventory::InventoryTransaction& transaction) = 0;
    virtual void scan(const Visitor& visitor) const = 0;
};

class AccessPolicy {
public:
    virtual ~AccessPolicy() = default;

    [[nodiscard]] virtual bool has_read_access(const catalog::TableDescriptor& table, std::string_view actor) const = 0;
    [[nodiscard]] virtual bool has_write_access(const catalog::TableDescriptor& table, std::string_view actor) const = 0;
    // Drops references to a deleted table held by access lists.
    virtual std::error_code remove_table_references(common::TableId table) = 0;
};

}  // namespace dyntab::storage
