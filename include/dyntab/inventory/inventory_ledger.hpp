#pragma once

#include "dyntab/common/diagnostics.hpp"
#include "dyntab/common/operation_response.hpp"
#include "dyntab/inventory/inventory_transaction.hpp"
#include "dyntab/storage/storage_interfaces.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dyntab::inventory {

inline constexpr double kDefaultLowStockThreshold = 5.0;
inline constexpr std::size_t kDefaultTransactionPageSize = 50U;
inline constexpr std::size_t kMaxTransactionPageSize = 100U;

inline constexpr std::size_t kTransactionTypeCount = static_cast<std::size_t>(TransactionType::Count);

struct LedgerEntry final {
    common::TableId table_id{};
    std::string table_name{};
    common::RowId item_id{};
    TransactionType type = TransactionType::Update;
    std::optional<double> quantity_change{};
    std::optional<common::RowData> previous_data{};
    std::optional<common::RowData> new_data{};
    std::string reference_id{};
    std::string note{};
    std::string actor{};
};

struct ItemSummary final {
    common::TableId table_id{};
    std::string table_name{};
    common::RowId item_id{};
    std::string item_name{};
    double net_change = 0.0;
    double total_added = 0.0;
    double total_removed = 0.0;
    double total_sold = 0.0;
    double total_adjustments = 0.0;
    std::size_t transaction_count = 0U;
    std::chrono::system_clock::time_point last_activity{};
};

struct TableSummary final {
    common::TableId table_id{};
    std::string table_name{};
    std::size_t total_items = 0U;
    double net_change = 0.0;
    std::size_t total_transactions = 0U;
    std::chrono::system_clock::time_point last_activity{};
    std::vector<ItemSummary> items{};  // busiest first
};

enum class StockAlertType : std::uint8_t {
    LowStock = 0,
    OutOfStock,
    NegativeStock
};

struct StockAlert final {
    common::TableId table_id{};
    std::string table_name{};
    common::RowId item_id{};
    std::string item_name{};
    double current_quantity = 0.0;
    double threshold = 0.0;
    StockAlertType type = StockAlertType::LowStock;
};

struct StockReport final {
    double threshold = kDefaultLowStockThreshold;
    std::size_t items_checked = 0U;
    std::size_t low_stock_count = 0U;
    std::size_t out_of_stock_count = 0U;
    std::size_t negative_stock_count = 0U;
    std::vector<StockAlert> alerts{};
};

enum class TransactionSortField : std::uint8_t {
    CreatedAt = 0,
    Type,
    QuantityChange
};

struct TransactionQuery final {
    std::optional<common::TableId> table_id{};
    std::optional<common::RowId> item_id{};
    std::optional<TransactionType> type{};
    std::optional<std::string> actor{};
    std::optional<std::string> reference_id{};
    std::optional<std::string> table_name_contains{};
    std::optional<std::string> date_from{};  // YYYY-MM-DD, inclusive
    std::optional<std::string> date_to{};    // YYYY-MM-DD, inclusive
    TransactionSortField sort_by = TransactionSortField::CreatedAt;
    bool descending = true;
    std::size_t page = 1U;
    std::size_t limit = kDefaultTransactionPageSize;
};

struct TransactionPage final {
    std::vector<InventoryTransaction> transactions{};
    std::size_t page = 1U;
    std::size_t limit = kDefaultTransactionPageSize;
    std::size_t total = 0U;
    std::size_t total_pages = 0U;
};

struct TableActivity final {
    common::TableId table_id{};
    std::string table_name{};
    std::size_t transaction_count = 0U;
};

struct ItemActivity final {
    common::TableId table_id{};
    common::RowId item_id{};
    std::string item_name{};
    std::size_t transaction_count = 0U;
};

struct DailyActivity final {
    std::string date{};
    std::size_t transaction_count = 0U;
    double net_change = 0.0;
};

struct AnalyticsQuery final {
    std::optional<common::TableId> table_id{};
    std::optional<std::string> date_from{};
    std::optional<std::string> date_to{};
};

struct LedgerAnalytics final {
    std::size_t total_transactions = 0U;
    std::array<std::size_t, kTransactionTypeCount> count_by_type{};
    std::array<double, kTransactionTypeCount> net_change_by_type{};
    std::vector<TableActivity> most_active_tables{};  // at most 10
    std::vector<ItemActivity> most_active_items{};    // at most 10
    std::vector<DailyActivity> activity_by_date{};    // newest first, at most 30 days
};

struct BulkAdjustment final {
    common::TableId table_id{};
    common::RowId item_id{};
    double quantity_change = 0.0;
    std::string reason{};
};

struct BulkAdjustmentRequest final {
    std::vector<BulkAdjustment> adjustments{};
    std::string actor{};
};

struct AdjustmentError final {
    common::TableId table_id{};
    common::RowId item_id{};
    std::error_code error{};
    std::string message{};
};

struct BulkAdjustmentResult final {
    std::size_t processed_count = 0U;
    std::vector<common::TransactionId> transaction_ids{};
    std::vector<AdjustmentError> errors{};

    [[nodiscard]] bool all_succeeded() const noexcept { return errors.empty(); }
};

[[nodiscard]] std::string_view to_string(StockAlertType type) noexcept;
[[nodiscard]] std::string_view to_string(TransactionSortField field) noexcept;
[[nodiscard]] std::optional<TransactionSortField> parse_transaction_sort_field(std::string_view text) noexcept;

// First non-empty text among name, productName, itemName, title and description.
[[nodiscard]] std::string extract_item_name(const common::RowData& data);
// Name from the newest snapshot of a transaction, "Unknown Item" when none carries one.
[[nodiscard]] std::string item_name_of(const InventoryTransaction& transaction);

// Append-only audit of quantity changes. Summaries are folded on demand; current stock is
// always read from live rows.
class InventoryLedger final {
public:
    struct Config final {
        storage::LedgerStore* ledger = nullptr;
        storage::TableStore* tables = nullptr;
        storage::RowStore* rows = nullptr;
        common::DiagnosticSink diagnostics{};
        std::function<std::chrono::system_clock::time_point()> clock{};
        std::size_t page_size_cap = kMaxTransactionPageSize;
        double default_low_stock_threshold = kDefaultLowStockThreshold;
    };

    explicit InventoryLedger(Config config);

    InventoryLedger(const InventoryLedger&) = delete;
    InventoryLedger& operator=(const InventoryLedger&) = delete;

    [[nodiscard]] common::OperationResponse<InventoryTransaction> record(LedgerEntry entry);

    [[nodiscard]] common::OperationResponse<ItemSummary> summary_for_item(common::TableId table,
                                                                          common::RowId item) const;
    [[nodiscard]] common::OperationResponse<TableSummary> summary_for_table(common::TableId table) const;

    // Reads the qty field of live rows in sale tables. Most critical first.
    [[nodiscard]] common::OperationResponse<StockReport> check_stock_levels(
        std::optional<double> threshold = std::nullopt,
        std::optional<common::TableId> table = std::nullopt) const;

    [[nodiscard]] common::OperationResponse<TransactionPage> list_transactions(const TransactionQuery& query) const;
    [[nodiscard]] common::OperationResponse<LedgerAnalytics> analytics(const AnalyticsQuery& query) const;
    [[nodiscard]] common::OperationResponse<std::vector<InventoryTransaction>> transactions_for_reference(
        std::string_view reference_id) const;

    // One adjust transaction per entry; rows are not modified.
    [[nodiscard]] common::OperationResponse<BulkAdjustmentResult> process_bulk_adjustments(
        const BulkAdjustmentRequest& request);

    [[nodiscard]] double default_low_stock_threshold() const noexcept { return config_.default_low_stock_threshold; }

private:
    std::vector<InventoryTransaction> collect(const std::function<bool(const InventoryTransaction&)>& predicate) const;
    std::chrono::system_clock::time_point now() const;

    Config config_{};
};

}  // namespace dyntab::inventory
