#include "dyntab/inventory/inventory_ledger.hpp"

#include "dyntab/common/string_utils.hpp"
#include "dyntab/common/time_format.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace dyntab::inventory {

namespace {

constexpr std::size_t kTopActivityCount = 10U;
constexpr auto kActivityWindow = std::chrono::hours{24 * 30};
constexpr std::string_view kUnknownItemName = "Unknown Item";
constexpr std::string_view kQuantityField = "qty";

std::size_t type_index(TransactionType type) noexcept
{
    return static_cast<std::size_t>(type);
}

bool within_dates(const InventoryTransaction& transaction,
                  const std::optional<std::string>& from,
                  const std::optional<std::string>& to)
{
    if (!from && !to) {
        return true;
    }
    const auto day = common::format_date_utc(transaction.created_at);
    if (from && day < *from) {
        return false;
    }
    if (to && day > *to) {
        return false;
    }
    return true;
}

void fold_into(ItemSummary& summary, const InventoryTransaction& transaction)
{
    summary.transaction_count += 1U;
    if (transaction.created_at > summary.last_activity) {
        summary.last_activity = transaction.created_at;
    }
    if (!transaction.quantity_change) {
        return;
    }
    const auto change = *transaction.quantity_change;
    summary.net_change += change;
    switch (transaction.type) {
    case TransactionType::Add:
        summary.total_added += change;
        break;
    case TransactionType::Remove:
        summary.total_removed += std::abs(change);
        break;
    case TransactionType::Sale:
        summary.total_sold += std::abs(change);
        break;
    case TransactionType::Adjust:
        summary.total_adjustments += std::abs(change);
        if (change > 0.0) {
            summary.total_added += change;
        } else {
            summary.total_removed += std::abs(change);
        }
        break;
    case TransactionType::Update:
    case TransactionType::Rent:
    case TransactionType::Release:
    case TransactionType::Count:
    default:
        break;
    }
}

StockAlertType classify(double quantity) noexcept
{
    if (quantity < 0.0) {
        return StockAlertType::NegativeStock;
    }
    if (quantity == 0.0) {
        return StockAlertType::OutOfStock;
    }
    return StockAlertType::LowStock;
}

bool transaction_less(const InventoryTransaction& lhs, const InventoryTransaction& rhs, TransactionSortField field)
{
    switch (field) {
    case TransactionSortField::Type:
        return std::tuple{type_index(lhs.type), lhs.id.value} < std::tuple{type_index(rhs.type), rhs.id.value};
    case TransactionSortField::QuantityChange:
        return std::tuple{lhs.quantity_change.value_or(0.0), lhs.id.value}
               < std::tuple{rhs.quantity_change.value_or(0.0), rhs.id.value};
    case TransactionSortField::CreatedAt:
    default:
        return std::tuple{lhs.created_at, lhs.id.value} < std::tuple{rhs.created_at, rhs.id.value};
    }
}

}  // namespace

std::string_view to_string(StockAlertType type) noexcept
{
    switch (type) {
    case StockAlertType::LowStock:
        return "low_stock";
    case StockAlertType::OutOfStock:
        return "out_of_stock";
    case StockAlertType::NegativeStock:
        return "negative_stock";
    default:
        return "unknown";
    }
}

std::string_view to_string(TransactionSortField field) noexcept
{
    switch (field) {
    case TransactionSortField::CreatedAt:
        return "created_at";
    case TransactionSortField::Type:
        return "transaction_type";
    case TransactionSortField::QuantityChange:
        return "quantity_change";
    default:
        return "unknown";
    }
}

std::optional<TransactionSortField> parse_transaction_sort_field(std::string_view text) noexcept
{
    for (const auto field : {TransactionSortField::CreatedAt,
                             TransactionSortField::Type,
                             TransactionSortField::QuantityChange}) {
        if (common::iequals(text, to_string(field))) {
            return field;
        }
    }
    return std::nullopt;
}

std::string extract_item_name(const common::RowData& data)
{
    for (const std::string_view key : {"name", "productName", "itemName", "title", "description"}) {
        const auto* value = common::find_field(data, key);
        if (value == nullptr) {
            continue;
        }
        if (const auto* text = std::get_if<std::string>(value); text != nullptr && !common::is_blank(*text)) {
            return common::trim_copy(*text);
        }
    }
    return {};
}

std::string item_name_of(const InventoryTransaction& transaction)
{
    for (const auto* snapshot : {&transaction.new_data, &transaction.previous_data}) {
        if (!snapshot->has_value()) {
            continue;
        }
        auto name = extract_item_name(**snapshot);
        if (!name.empty()) {
            return name;
        }
    }
    return std::string{kUnknownItemName};
}

InventoryLedger::InventoryLedger(Config config)
    : config_{std::move(config)}
{
    if (config_.ledger == nullptr) {
        throw std::invalid_argument{"InventoryLedger requires a ledger store"};
    }
    if (config_.tables == nullptr || config_.rows == nullptr) {
        throw std::invalid_argument{"InventoryLedger requires table and row stores"};
    }
    if (config_.page_size_cap == 0U) {
        config_.page_size_cap = kMaxTransactionPageSize;
    }
}

common::OperationResponse<InventoryTransaction> InventoryLedger::record(LedgerEntry entry)
{
    if (!entry.table_id.is_valid() || !entry.item_id.is_valid()) {
        return common::make_failure<InventoryTransaction>(common::EngineErrc::InvalidArgument,
                                                          "Ledger entries require a table and an item");
    }

    InventoryTransaction transaction{};
    transaction.table_id = entry.table_id;
    transaction.table_name = std::move(entry.table_name);
    transaction.item_id = entry.item_id;
    transaction.type = entry.type;
    transaction.quantity_change = entry.quantity_change;
    transaction.previous_data = std::move(entry.previous_data);
    transaction.new_data = std::move(entry.new_data);
    transaction.reference_id = std::move(entry.reference_id);
    transaction.note = std::move(entry.note);
    transaction.actor = std::move(entry.actor);
    transaction.created_at = now();

    if (const auto error = config_.ledger->append(transaction); error) {
        return common::make_failure<InventoryTransaction>(error, "Failed to append inventory transaction");
    }
    return common::make_success(std::move(transaction), common::StatusCategory::Created);
}

common::OperationResponse<ItemSummary> InventoryLedger::summary_for_item(common::TableId table,
                                                                         common::RowId item) const
{
    const auto transactions = collect([&](const InventoryTransaction& transaction) {
        return transaction.table_id == table && transaction.item_id == item;
    });
    if (transactions.empty()) {
        return common::make_failure<ItemSummary>(common::EngineErrc::TransactionsNotFound,
                                                 "No inventory transactions found for this item");
    }

    ItemSummary summary{};
    summary.table_id = table;
    summary.item_id = item;
    for (const auto& transaction : transactions) {
        fold_into(summary, transaction);
    }
    const auto& newest = *std::max_element(transactions.begin(), transactions.end(), [](const auto& lhs, const auto& rhs) {
        return transaction_less(lhs, rhs, TransactionSortField::CreatedAt);
    });
    summary.table_name = newest.table_name;
    summary.item_name = item_name_of(newest);
    return common::make_success(std::move(summary));
}

common::OperationResponse<TableSummary> InventoryLedger::summary_for_table(common::TableId table) const
{
    const auto transactions = collect([&](const InventoryTransaction& transaction) {
        return transaction.table_id == table;
    });
    if (transactions.empty()) {
        return common::make_failure<TableSummary>(common::EngineErrc::TransactionsNotFound,
                                                  "No inventory transactions found for this table");
    }

    std::map<common::RowId, ItemSummary> items;
    for (const auto& transaction : transactions) {
        auto& item = items[transaction.item_id];
        if (item.transaction_count == 0U || transaction.created_at >= item.last_activity) {
            item.table_id = transaction.table_id;
            item.table_name = transaction.table_name;
            item.item_id = transaction.item_id;
            item.item_name = item_name_of(transaction);
        }
        fold_into(item, transaction);
    }

    TableSummary summary{};
    summary.table_id = table;
    summary.total_transactions = transactions.size();
    summary.total_items = items.size();
    for (auto& [id, item] : items) {
        summary.net_change += item.net_change;
        if (item.last_activity >= summary.last_activity) {
            summary.last_activity = item.last_activity;
            summary.table_name = item.table_name;
        }
        summary.items.push_back(std::move(item));
    }
    std::stable_sort(summary.items.begin(), summary.items.end(), [](const ItemSummary& lhs, const ItemSummary& rhs) {
        return lhs.transaction_count > rhs.transaction_count;
    });
    return common::make_success(std::move(summary));
}

common::OperationResponse<StockReport> InventoryLedger::check_stock_levels(std::optional<double> threshold,
                                                                           std::optional<common::TableId> table) const
{
    StockReport report{};
    report.threshold = threshold.value_or(config_.default_low_stock_threshold);
    if (!std::isfinite(report.threshold)) {
        return common::make_failure<StockReport>(common::EngineErrc::InvalidArgument,
                                                 "Stock threshold must be a finite number");
    }

    std::vector<catalog::TableDescriptor> tables;
    if (table) {
        auto descriptor = config_.tables->find_table(*table);
        if (!descriptor) {
            return common::make_failure<StockReport>(common::EngineErrc::TableNotFound, "Table not found");
        }
        tables.push_back(std::move(*descriptor));
    } else {
        tables = config_.tables->list_tables();
    }

    for (const auto& descriptor : tables) {
        if (descriptor.purpose != catalog::TablePurpose::Sale) {
            continue;
        }
        for (const auto& row : config_.rows->list_rows(descriptor.id)) {
            const auto* cell = common::find_field(row.data, kQuantityField);
            const auto quantity = cell != nullptr ? common::as_number(*cell) : std::nullopt;
            if (!quantity) {
                continue;
            }
            report.items_checked += 1U;
            if (*quantity > report.threshold) {
                continue;
            }

            StockAlert alert{};
            alert.table_id = descriptor.id;
            alert.table_name = descriptor.name;
            alert.item_id = row.id;
            alert.item_name = extract_item_name(row.data);
            if (alert.item_name.empty()) {
                alert.item_name = std::string{kUnknownItemName};
            }
            alert.current_quantity = *quantity;
            alert.threshold = report.threshold;
            alert.type = classify(*quantity);
            switch (alert.type) {
            case StockAlertType::NegativeStock:
                report.negative_stock_count += 1U;
                break;
            case StockAlertType::OutOfStock:
                report.out_of_stock_count += 1U;
                break;
            case StockAlertType::LowStock:
            default:
                report.low_stock_count += 1U;
                break;
            }
            report.alerts.push_back(std::move(alert));
        }
    }

    std::stable_sort(report.alerts.begin(), report.alerts.end(), [](const StockAlert& lhs, const StockAlert& rhs) {
        return lhs.current_quantity < rhs.current_quantity;
    });
    return common::make_success(std::move(report));
}

common::OperationResponse<TransactionPage> InventoryLedger::list_transactions(const TransactionQuery& query) const
{
    if (query.page == 0U) {
        return common::make_failure<TransactionPage>(common::EngineErrc::InvalidArgument, "Page numbers start at 1");
    }

    auto matches = collect([&](const InventoryTransaction& transaction) {
        if (query.table_id && transaction.table_id != *query.table_id) {
            return false;
        }
        if (query.item_id && transaction.item_id != *query.item_id) {
            return false;
        }
        if (query.type && transaction.type != *query.type) {
            return false;
        }
        if (query.actor && transaction.actor != *query.actor) {
            return false;
        }
        if (query.reference_id && transaction.reference_id != *query.reference_id) {
            return false;
        }
        if (query.table_name_contains
            && common::to_lower_copy(transaction.table_name).find(common::to_lower_copy(*query.table_name_contains))
                   == std::string::npos) {
            return false;
        }
        return within_dates(transaction, query.date_from, query.date_to);
    });

    std::sort(matches.begin(), matches.end(), [&](const InventoryTransaction& lhs, const InventoryTransaction& rhs) {
        return query.descending ? transaction_less(rhs, lhs, query.sort_by) : transaction_less(lhs, rhs, query.sort_by);
    });

    TransactionPage page{};
    page.page = query.page;
    page.limit = std::clamp<std::size_t>(query.limit, 1U, config_.page_size_cap);
    page.total = matches.size();
    page.total_pages = (page.total + page.limit - 1U) / page.limit;

    // Pages past the end stay empty; compared before multiplying so huge page numbers cannot wrap.
    if (page.page - 1U < page.total_pages) {
        const auto offset = (page.page - 1U) * page.limit;
        const auto end = std::min(matches.size(), offset + page.limit);
        page.transactions.assign(std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(offset)),
                                 std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(end)));
    }
    return common::make_success(std::move(page));
}

common::OperationResponse<LedgerAnalytics> InventoryLedger::analytics(const AnalyticsQuery& query) const
{
    const auto transactions = collect([&](const InventoryTransaction& transaction) {
        if (query.table_id && transaction.table_id != *query.table_id) {
            return false;
        }
        return within_dates(transaction, query.date_from, query.date_to);
    });

    LedgerAnalytics analytics{};
    analytics.total_transactions = transactions.size();

    std::map<common::TableId, TableActivity> tables;
    std::map<std::pair<common::TableId, common::RowId>, ItemActivity> items;
    std::map<std::string, DailyActivity, std::greater<>> days;
    const auto window_start = common::format_date_utc(now() - kActivityWindow);

    for (const auto& transaction : transactions) {
        const auto index = type_index(transaction.type);
        if (index < kTransactionTypeCount) {
            analytics.count_by_type[index] += 1U;
            analytics.net_change_by_type[index] += transaction.quantity_change.value_or(0.0);
        }

        auto& table = tables[transaction.table_id];
        table.table_id = transaction.table_id;
        table.table_name = transaction.table_name;
        table.transaction_count += 1U;

        auto& item = items[{transaction.table_id, transaction.item_id}];
        item.table_id = transaction.table_id;
        item.item_id = transaction.item_id;
        if (item.item_name.empty() || item.item_name == kUnknownItemName) {
            item.item_name = item_name_of(transaction);
        }
        item.transaction_count += 1U;

        auto date = common::format_date_utc(transaction.created_at);
        if (date >= window_start) {
            auto& day = days[date];
            day.date = std::move(date);
            day.transaction_count += 1U;
            day.net_change += transaction.quantity_change.value_or(0.0);
        }
    }

    for (auto& [id, table] : tables) {
        analytics.most_active_tables.push_back(std::move(table));
    }
    std::stable_sort(analytics.most_active_tables.begin(),
                     analytics.most_active_tables.end(),
                     [](const TableActivity& lhs, const TableActivity& rhs) {
                         return lhs.transaction_count > rhs.transaction_count;
                     });
    if (analytics.most_active_tables.size() > kTopActivityCount) {
        analytics.most_active_tables.resize(kTopActivityCount);
    }

    for (auto& [key, item] : items) {
        analytics.most_active_items.push_back(std::move(item));
    }
    std::stable_sort(analytics.most_active_items.begin(),
                     analytics.most_active_items.end(),
                     [](const ItemActivity& lhs, const ItemActivity& rhs) {
                         return lhs.transaction_count > rhs.transaction_count;
                     });
    if (analytics.most_active_items.size() > kTopActivityCount) {
        analytics.most_active_items.resize(kTopActivityCount);
    }

    for (auto& [date, day] : days) {
        analytics.activity_by_date.push_back(std::move(day));
    }
    return common::make_success(std::move(analytics));
}

common::OperationResponse<std::vector<InventoryTransaction>> InventoryLedger::transactions_for_reference(
    std::string_view reference_id) const
{
    if (reference_id.empty()) {
        return common::make_failure<std::vector<InventoryTransaction>>(common::EngineErrc::InvalidArgument,
                                                                       "Reference id is required");
    }
    auto transactions = collect([&](const InventoryTransaction& transaction) {
        return transaction.reference_id == reference_id;
    });
    std::sort(transactions.begin(), transactions.end(), [](const auto& lhs, const auto& rhs) {
        return transaction_less(lhs, rhs, TransactionSortField::CreatedAt);
    });
    return common::make_success(std::move(transactions));
}

common::OperationResponse<BulkAdjustmentResult> InventoryLedger::process_bulk_adjustments(
    const BulkAdjustmentRequest& request)
{
    if (request.adjustments.empty()) {
        return common::make_failure<BulkAdjustmentResult>(common::EngineErrc::InvalidArgument,
                                                          "At least one adjustment is required");
    }

    BulkAdjustmentResult result{};
    auto reject = [&](const BulkAdjustment& adjustment, std::error_code error, std::string message) {
        result.errors.push_back(AdjustmentError{adjustment.table_id, adjustment.item_id, error, std::move(message)});
    };

    for (const auto& adjustment : request.adjustments) {
        if (!std::isfinite(adjustment.quantity_change) || adjustment.quantity_change == 0.0) {
            reject(adjustment, common::EngineErrc::InvalidArgument, "Adjustment quantity must be a non-zero number");
            continue;
        }
        const auto table = config_.tables->find_table(adjustment.table_id);
        if (!table) {
            reject(adjustment, common::EngineErrc::TableNotFound, "Table not found");
            continue;
        }
        const auto row = config_.rows->find_row(adjustment.table_id, adjustment.item_id);
        if (!row) {
            reject(adjustment, common::EngineErrc::RowNotFound, "Item not found");
            continue;
        }

        LedgerEntry entry{};
        entry.table_id = table->id;
        entry.table_name = table->name;
        entry.item_id = row->id;
        entry.type = TransactionType::Adjust;
        entry.quantity_change = adjustment.quantity_change;
        entry.previous_data = row->data;
        entry.note = adjustment.reason;
        entry.actor = request.actor;

        auto recorded = record(std::move(entry));
        if (!recorded.success) {
            reject(adjustment, recorded.error, recorded.message);
            continue;
        }
        result.transaction_ids.push_back(recorded.payload.id);
        result.processed_count += 1U;
    }

    auto response = common::make_success(std::move(result));
    for (const auto& error : response.payload.errors) {
        response.warnings.push_back("Item " + std::to_string(error.item_id.value) + ": " + error.message);
    }
    return response;
}

std::vector<InventoryTransaction> InventoryLedger::collect(
    const std::function<bool(const InventoryTransaction&)>& predicate) const
{
    std::vector<InventoryTransaction> matches;
    config_.ledger->scan([&](const InventoryTransaction& transaction) {
        if (predicate(transaction)) {
            matches.push_back(transaction);
        }
    });
    return matches;
}

std::chrono::system_clock::time_point InventoryLedger::now() const
{
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

}  // namespace dyntab::inventory
