#include "dyntab/storage/in_memory_store.hpp"

#include "dyntab/common/engine_errors.hpp"
#include "dyntab/storage/row_filter.hpp"

#include <algorithm>

namespace dyntab::storage {

using common::EngineErrc;
using common::make_error_code;

std::optional<catalog::TableDescriptor> InMemoryStore::find_table(common::TableId id) const
{
    std::scoped_lock lock(mutex_);
    const auto it = tables_.find(id.value);
    if (it == tables_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<catalog::TableDescriptor> InMemoryStore::list_tables() const
{
    std::scoped_lock lock(mutex_);
    std::vector<catalog::TableDescriptor> result;
    result.reserve(tables_.size());
    for (const auto& [id, table] : tables_) {
        result.push_back(table);
    }
    return result;
}

std::error_code InMemoryStore::insert_table(catalog::TableDescriptor& table)
{
    std::scoped_lock lock(mutex_);
    table.id = common::TableId{next_table_id_++};
    tables_.emplace(table.id.value, table);
    return {};
}

std::error_code InMemoryStore::update_table(const catalog::TableDescriptor& table)
{
    std::scoped_lock lock(mutex_);
    auto it = tables_.find(table.id.value);
    if (it == tables_.end()) {
        return make_error_code(EngineErrc::TableNotFound);
    }
    it->second = table;
    return {};
}

std::error_code InMemoryStore::delete_table(common::TableId id)
{
    std::scoped_lock lock(mutex_);
    if (tables_.erase(id.value) == 0U) {
        return make_error_code(EngineErrc::TableNotFound);
    }
    std::erase_if(columns_, [&](const auto& entry) { return entry.second.table_id == id; });
    return {};
}

std::vector<catalog::ColumnDescriptor> InMemoryStore::list_columns(common::TableId table) const
{
    std::scoped_lock lock(mutex_);
    std::vector<catalog::ColumnDescriptor> result;
    for (const auto& [id, column] : columns_) {
        if (column.table_id == table) {
            result.push_back(column);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.position != rhs.position) {
            return lhs.position < rhs.position;
        }
        return lhs.id < rhs.id;
    });
    return result;
}

std::optional<catalog::ColumnDescriptor> InMemoryStore::find_column(common::TableId table, common::ColumnId column) const
{
    std::scoped_lock lock(mutex_);
    const auto it = columns_.find(column.value);
    if (it == columns_.end() || it->second.table_id != table) {
        return std::nullopt;
    }
    return it->second;
}

std::error_code InMemoryStore::insert_column(catalog::ColumnDescriptor& column)
{
    std::scoped_lock lock(mutex_);
    if (tables_.find(column.table_id.value) == tables_.end()) {
        return make_error_code(EngineErrc::TableNotFound);
    }
    column.id = common::ColumnId{next_column_id_++};
    columns_.emplace(column.id.value, column);
    return {};
}

std::error_code InMemoryStore::update_column(const catalog::ColumnDescriptor& column)
{
    std::scoped_lock lock(mutex_);
    auto it = columns_.find(column.id.value);
    if (it == columns_.end() || it->second.table_id != column.table_id) {
        return make_error_code(EngineErrc::ColumnNotFound);
    }
    it->second = column;
    return {};
}

std::error_code InMemoryStore::delete_column(common::TableId table, common::ColumnId column)
{
    std::scoped_lock lock(mutex_);
    auto it = columns_.find(column.value);
    if (it == columns_.end() || it->second.table_id != table) {
        return make_error_code(EngineErrc::ColumnNotFound);
    }
    columns_.erase(it);
    return {};
}

std::optional<catalog::RowRecord> InMemoryStore::find_row(common::TableId table, common::RowId row) const
{
    std::scoped_lock lock(mutex_);
    const auto it = rows_.find(row.value);
    if (it == rows_.end() || it->second.table_id != table) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<catalog::RowRecord> InMemoryStore::list_rows(common::TableId table) const
{
    std::scoped_lock lock(mutex_);
    std::vector<catalog::RowRecord> result;
    for (const auto& [id, row] : rows_) {
        if (row.table_id == table) {
            result.push_back(row);
        }
    }
    return result;
}

std::vector<common::RowId> InMemoryStore::find_row_ids(common::TableId table, const RowFilter& filters) const
{
    std::scoped_lock lock(mutex_);
    std::vector<common::RowId> result;
    for (const auto& [id, row] : rows_) {
        if (row.table_id == table && row_matches(row.data, filters)) {
            result.push_back(row.id);
        }
    }
    return result;
}

std::vector<common::RowId> InMemoryStore::find_rows_with_value(common::TableId table,
                                                               std::string_view column,
                                                               const common::CellValue& value,
                                                               std::optional<common::RowId> exclude) const
{
    std::scoped_lock lock(mutex_);
    std::vector<common::RowId> result;
    for (const auto& [id, row] : rows_) {
        if (row.table_id != table) {
            continue;
        }
        if (exclude.has_value() && row.id == *exclude) {
            continue;
        }
        const auto* stored = common::find_field(row.data, column);
        if (stored != nullptr && *stored == value) {
            result.push_back(row.id);
        }
    }
    return result;
}

std::error_code InMemoryStore::insert_row(catalog::RowRecord& row)
{
    std::scoped_lock lock(mutex_);
    if (tables_.find(row.table_id.value) == tables_.end()) {
        return make_error_code(EngineErrc::TableNotFound);
    }
    row.id = common::RowId{next_row_id_++};
    rows_.emplace(row.id.value, row);
    return {};
}

std::error_code InMemoryStore::update_row(const catalog::RowRecord& row)
{
    std::scoped_lock lock(mutex_);
    auto it = rows_.find(row.id.value);
    if (it == rows_.end() || it->second.table_id != row.table_id) {
        return make_error_code(EngineErrc::RowNotFound);
    }
    it->second = row;
    return {};
}

std::error_code InMemoryStore::delete_row(common::TableId table, common::RowId row)
{
    std::scoped_lock lock(mutex_);
    auto it = rows_.find(row.value);
    if (it == rows_.end() || it->second.table_id != table) {
        return make_error_code(EngineErrc::RowNotFound);
    }
    rows_.erase(it);
    return {};
}

std::error_code InMemoryStore::delete_rows(common::TableId table, std::size_t& removed)
{
    std::scoped_lock lock(mutex_);
    removed = std::erase_if(rows_, [&](const auto& entry) { return entry.second.table_id == table; });
    return {};
}

std::error_code InMemoryStore::rename_field(common::TableId table, std::string_view from, std::string_view to)
{
    std::scoped_lock lock(mutex_);
    for (auto& [id, row] : rows_) {
        if (row.table_id != table) {
            continue;
        }
        auto node = row.data.extract(std::string{from});
        if (node.empty()) {
            continue;
        }
        row.data.insert_or_assign(std::string{to}, std::move(node.mapped()));
    }
    return {};
}

std::error_code InMemoryStore::remove_field(common::TableId table, std::string_view name)
{
    std::scoped_lock lock(mutex_);
    for (auto& [id, row] : rows_) {
        if (row.table_id != table) {
            continue;
        }
        const auto it = row.data.find(name);
        if (it != row.data.end()) {
            row.data.erase(it);
        }
    }
    return {};
}

std::error_code InMemoryStore::append(inventory::InventoryTransaction& transaction)
{
    std::scoped_lock lock(mutex_);
    transaction.id = common::TransactionId{next_transaction_id_++};
    ledger_.push_back(transaction);
    return {};
}

void InMemoryStore::scan(const Visitor& visitor) const
{
    std::vector<inventory::InventoryTransaction> copy;
    {
        std::scoped_lock lock(mutex_);
        copy = ledger_;
    }
    for (const auto& transaction : copy) {
        visitor(transaction);
    }
}

bool InMemoryStore::has_read_access(const catalog::TableDescriptor& table, std::string_view actor) const
{
    if (table.owner == actor || catalog::is_publicly_visible(table.visibility)) {
        return true;
    }
    std::scoped_lock lock(mutex_);
    const auto [begin, end] = grants_.equal_range(table.id.value);
    return std::any_of(begin, end, [&](const auto& entry) { return entry.second.actor == actor; });
}

bool InMemoryStore::has_write_access(const catalog::TableDescriptor& table, std::string_view actor) const
{
    if (table.owner == actor) {
        return true;
    }
    std::scoped_lock lock(mutex_);
    const auto [begin, end] = grants_.equal_range(table.id.value);
    return std::any_of(begin, end, [&](const auto& entry) {
        return entry.second.actor == actor && entry.second.write;
    });
}

std::error_code InMemoryStore::remove_table_references(common::TableId table)
{
    std::scoped_lock lock(mutex_);
    grants_.erase(table.value);
    return {};
}

std::error_code InMemoryStore::record_sale(const sales::SaleRecord& draft, sales::SaleRecord& stored)
{
    std::scoped_lock lock(mutex_);
    stored = draft;
    stored.id = common::SaleId{next_sale_id_++};
    sales_.push_back(stored);
    return {};
}

std::error_code InMemoryStore::record_rental(const rentals::RentalRecord& draft, rentals::RentalRecord& stored)
{
    std::scoped_lock lock(mutex_);
    stored = draft;
    stored.id = common::RentalId{next_rental_id_++};
    rentals_.emplace(stored.id.value, stored);
    return {};
}

std::error_code InMemoryStore::update_rental(const rentals::RentalRecord& rental)
{
    std::scoped_lock lock(mutex_);
    auto it = rentals_.find(rental.id.value);
    if (it == rentals_.end()) {
        return make_error_code(EngineErrc::RentalNotFound);
    }
    it->second = rental;
    return {};
}

std::optional<rentals::RentalRecord> InMemoryStore::find_rental(common::RentalId id) const
{
    std::scoped_lock lock(mutex_);
    const auto it = rentals_.find(id.value);
    if (it == rentals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<rentals::RentalRecord> InMemoryStore::find_active_rental(common::TableId table, common::RowId item) const
{
    std::scoped_lock lock(mutex_);
    for (const auto& [id, rental] : rentals_) {
        if (rental.table_id == table && rental.item_id == item && rental.status == rentals::RentalStatus::Active) {
            return rental;
        }
    }
    return std::nullopt;
}

std::vector<rentals::RentalRecord> InMemoryStore::list_rentals() const
{
    std::scoped_lock lock(mutex_);
    std::vector<rentals::RentalRecord> rentals;
    rentals.reserve(rentals_.size());
    for (const auto& [id, rental] : rentals_) {
        rentals.push_back(rental);
    }
    return rentals;
}

void InMemoryStore::grant_access(common::TableId table, std::string actor, bool write)
{
    std::scoped_lock lock(mutex_);
    grants_.emplace(table.value, Grant{std::move(actor), write});
}

std::size_t InMemoryStore::ledger_size() const
{
    std::scoped_lock lock(mutex_);
    return ledger_.size();
}

std::vector<sales::SaleRecord> InMemoryStore::list_sales() const
{
    std::scoped_lock lock(mutex_);
    return sales_;
}

}  // namespace dyntab::storage
