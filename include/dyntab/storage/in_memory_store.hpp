#pragma once

#include "dyntab/rentals/rental_recorder.hpp"
#include "dyntab/sales/sales_recorder.hpp"
#include "dyntab/storage/storage_interfaces.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dyntab::storage {

// Reference collaborator used by the shell tool and tests. Guards its own state only;
// check-then-act sequences of callers are not serialized.
class InMemoryStore final : public TableStore,
                            public RowStore,
                            public LedgerStore,
                            public AccessPolicy,
                            public sales::SalesRecorder,
                            public rentals::RentalRecorder {
public:
    InMemoryStore() = default;

    InMemoryStore(const InMemoryStore&) = delete;
    InMemoryStore& operator=(const InMemoryStore&) = delete;
    InMemoryStore(InMemoryStore&&) = delete;
    InMemoryStore& operator=(InMemoryStore&&) = delete;

    [[nodiscard]] std::optional<catalog::TableDescriptor> find_table(common::TableId id) const override;
    [[nodiscard]] std::vector<catalog::TableDescriptor> list_tables() const override;
    std::error_code insert_table(catalog::TableDescriptor& table) override;
    std::error_code update_table(const catalog::TableDescriptor& table) override;
    std::error_code delete_table(common::TableId id) override;

    [[nodiscard]] std::vector<catalog::ColumnDescriptor> list_columns(common::TableId table) const override;
    [[nodiscard]] std::optional<catalog::ColumnDescriptor> find_column(common::TableId table,
                                                                       common::ColumnId column) const override;
    std::error_code insert_column(catalog::ColumnDescriptor& column) override;
    std::error_code update_column(const catalog::ColumnDescriptor& column) override;
    std::error_code delete_column(common::TableId table, common::ColumnId column) override;

    [[nodiscard]] std::optional<catalog::RowRecord> find_row(common::TableId table, common::RowId row) const override;
    [[nodiscard]] std::vector<catalog::RowRecord> list_rows(common::TableId table) const override;
    [[nodiscard]] std::vector<common::RowId> find_row_ids(common::TableId table, const RowFilter& filters) const override;
    [[nodiscard]] std::vector<common::RowId> find_rows_with_value(common::TableId table,
                                                                  std::string_view column,
                                                                  const common::CellValue& value,
                                                                  std::optional<common::RowId> exclude) const override;
    std::error_code insert_row(catalog::RowRecord& row) override;
    std::error_code update_row(const catalog::RowRecord& row) override;
    std::error_code delete_row(common::TableId table, common::RowId row) override;
    std::error_code delete_rows(common::TableId table, std::size_t& removed) override;
    std::error_code rename_field(common::TableId table, std::string_view from, std::string_view to) override;
    std::error_code remove_field(common::TableId table, std::string_view name) override;

    std::error_code append(inventory::InventoryTransaction& transaction) override;
    void scan(const Visitor& visitor) const override;

    [[nodiscard]] bool has_read_access(const catalog::TableDescriptor& table, std::string_view actor) const override;
    [[nodiscard]] bool has_write_access(const catalog::TableDescriptor& table, std::string_view actor) const override;
    std::error_code remove_table_references(common::TableId table) override;

    std::error_code record_sale(const sales::SaleRecord& draft, sales::SaleRecord& stored) override;
    [[nodiscard]] std::vector<sales::SaleRecord> list_sales() const override;

    std::error_code record_rental(const rentals::RentalRecord& draft, rentals::RentalRecord& stored) override;
    std::error_code update_rental(const rentals::RentalRecord& rental) override;
    [[nodiscard]] std::optional<rentals::RentalRecord> find_rental(common::RentalId id) const override;
    [[nodiscard]] std::optional<rentals::RentalRecord> find_active_rental(common::TableId table,
                                                                          common::RowId item) const override;
    [[nodiscard]] std::vector<rentals::RentalRecord> list_rentals() const override;

    void grant_access(common::TableId table, std::string actor, bool write);
    [[nodiscard]] std::size_t ledger_size() const;

private:
    struct Grant final {
        std::string actor{};
        bool write = false;
    };

    mutable std::mutex mutex_{};
    std::map<std::uint64_t, catalog::TableDescriptor> tables_{};
    std::map<std::uint64_t, catalog::ColumnDescriptor> columns_{};
    std::map<std::uint64_t, catalog::RowRecord> rows_{};
    std::vector<inventory::InventoryTransaction> ledger_{};
    std::vector<sales::SaleRecord> sales_{};
    std::map<std::uint64_t, rentals::RentalRecord> rentals_{};
    std::multimap<std::uint64_t, Grant> grants_{};

    std::uint64_t next_table_id_ = 1U;
    std::uint64_t next_column_id_ = 1U;
    std::uint64_t next_row_id_ = 1U;
    std::uint64_t next_transaction_id_ = 1U;
    std::uint64_t next_sale_id_ = 1U;
    std::uint64_t next_rental_id_ = 1U;
};

}  // namespace dyntab::storage
