#pragma once

#include "dyntab/common/operation_response.hpp"
#include "dyntab/sales/sales_recorder.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dyntab::sales {

inline constexpr std::size_t kDefaultSalePageSize = 50U;
inline constexpr std::size_t kMaxSalePageSize = 100U;

enum class SaleSortField : std::uint8_t {
    SoldAt = 0,
    TotalAmount,
    Quantity
};

[[nodiscard]] std::string_view to_string(SaleSortField field) noexcept;
[[nodiscard]] std::optional<SaleSortField> parse_sale_sort_field(std::string_view text) noexcept;

struct SaleQuery final {
    std::optional<common::TableId> table_id{};
    std::optional<std::string> customer_id{};
    std::optional<std::string> date_from{};  // YYYY-MM-DD, inclusive
    std::optional<std::string> date_to{};    // YYYY-MM-DD, inclusive
    // Case-insensitive match against customer, item name and notes.
    std::optional<std::string> search{};
    SaleSortField sort_by = SaleSortField::SoldAt;
    bool descending = true;
    std::size_t page = 1U;
    std::size_t limit = kDefaultSalePageSize;
};

struct SalePage final {
    std::vector<SaleRecord> sales{};
    std::size_t page = 1U;
    std::size_t limit = kDefaultSalePageSize;
    std::size_t total = 0U;
    std::size_t total_pages = 0U;
};

struct SalesAnalyticsQuery final {
    std::optional<common::TableId> table_id{};
    std::optional<std::string> date_from{};
    std::optional<std::string> date_to{};
};

struct TopSellingItem final {
    common::TableId table_id{};
    std::string table_name{};
    common::RowId item_id{};
    std::string item_name{};
    std::int64_t quantity_sold = 0;
    double revenue = 0.0;
};

struct DailySales final {
    std::string date{};
    std::size_t sales_count = 0U;
    double revenue = 0.0;
};

struct SalesAnalytics final {
    std::size_t total_sales = 0U;
    double total_revenue = 0.0;
    std::int64_t total_items_sold = 0;
    double average_sale_amount = 0.0;
    std::vector<TopSellingItem> top_selling_items{};  // most units first, at most 10
    std::vector<DailySales> sales_by_date{};           // newest first, at most 30 days
};

// Read side of recorded sales: filtered pages and aggregate figures.
class SalesReport final {
public:
    struct Config final {
        SalesRecorder* sales = nullptr;
        std::size_t page_size_cap = kMaxSalePageSize;
    };

    explicit SalesReport(Config config);

    SalesReport(const SalesReport&) = delete;
    SalesReport& operator=(const SalesReport&) = delete;

    [[nodiscard]] common::OperationResponse<SalePage> list_sales(const SaleQuery& query) const;
    [[nodiscard]] common::OperationResponse<SalesAnalytics> analytics(const SalesAnalyticsQuery& query) const;

private:
    Config config_{};
};

}  // namespace dyntab::sales
