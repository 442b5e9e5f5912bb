#include "dyntab/sales/sales_report.hpp"

#include "dyntab/common/engine_errors.hpp"
#include "dyntab/common/string_utils.hpp"
#include "dyntab/common/time_format.hpp"
#include "dyntab/registry/value_patterns.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace dyntab::sales {

namespace {

using common::EngineErrc;
using common::OperationResponse;

constexpr std::size_t kTopSellingCount = 10U;
constexpr std::size_t kDailySalesCount = 30U;
constexpr std::string_view kUnknownItemName = "Unknown Item";

template <typename Payload>
OperationResponse<Payload> invalid_date(std::string_view field, const std::string& value)
{
    auto message = "Invalid " + std::string{field} + " format. Use YYYY-MM-DD";
    return common::make_failure<Payload>(make_error_code(EngineErrc::InvalidArgument),
                                         message,
                                         {common::FieldError{std::string{field}, value, "Use YYYY-MM-DD"}});
}

// Only the canonical form is accepted; other spellings parse_date understands are rejected.
bool is_iso_day(const std::string& value)
{
    const auto parsed = registry::parse_date(value);
    return parsed && *parsed == value;
}

template <typename Payload>
std::optional<OperationResponse<Payload>> check_dates(const std::optional<std::string>& from,
                                                      const std::optional<std::string>& to)
{
    if (from && !is_iso_day(*from)) {
        return invalid_date<Payload>("date_from", *from);
    }
    if (to && !is_iso_day(*to)) {
        return invalid_date<Payload>("date_to", *to);
    }
    return std::nullopt;
}

bool within_dates(const SaleRecord& sale, const std::optional<std::string>& from, const std::optional<std::string>& to)
{
    if (!from && !to) {
        return true;
    }
    const auto day = common::format_date_utc(sale.sold_at);
    return (!from || day >= *from) && (!to || day <= *to);
}

bool contains_folded(std::string_view haystack, const std::string& folded_needle)
{
    return common::to_lower_copy(haystack).find(folded_needle) != std::string::npos;
}

bool sale_less(const SaleRecord& lhs, const SaleRecord& rhs, SaleSortField field)
{
    switch (field) {
    case SaleSortField::TotalAmount:
        return std::tuple{lhs.total_amount, lhs.id.value} < std::tuple{rhs.total_amount, rhs.id.value};
    case SaleSortField::Quantity:
        return std::tuple{lhs.quantity, lhs.id.value} < std::tuple{rhs.quantity, rhs.id.value};
    case SaleSortField::SoldAt:
    default:
        return std::tuple{lhs.sold_at, lhs.id.value} < std::tuple{rhs.sold_at, rhs.id.value};
    }
}

}  // namespace

std::string_view to_string(SaleSortField field) noexcept
{
    switch (field) {
    case SaleSortField::TotalAmount:
        return "totalAmount";
    case SaleSortField::Quantity:
        return "quantity";
    case SaleSortField::SoldAt:
    default:
        return "soldAt";
    }
}

std::optional<SaleSortField> parse_sale_sort_field(std::string_view text) noexcept
{
    for (const auto field : {SaleSortField::SoldAt, SaleSortField::TotalAmount, SaleSortField::Quantity}) {
        if (common::iequals(text, to_string(field))) {
            return field;
        }
    }
    return std::nullopt;
}

SalesReport::SalesReport(Config config)
    : config_{std::move(config)}
{
    if (config_.sales == nullptr) {
        throw std::invalid_argument{"SalesReport requires a sales recorder"};
    }
    if (config_.page_size_cap == 0U) {
        config_.page_size_cap = kMaxSalePageSize;
    }
}

OperationResponse<SalePage> SalesReport::list_sales(const SaleQuery& query) const
{
    if (query.page == 0U) {
        return common::make_failure<SalePage>(EngineErrc::InvalidArgument, "Page numbers start at 1");
    }
    if (auto invalid = check_dates<SalePage>(query.date_from, query.date_to)) {
        return std::move(*invalid);
    }

    const auto needle = query.search ? common::to_lower_copy(common::trim_copy(*query.search)) : std::string{};
    std::vector<SaleRecord> matches;
    for (auto& sale : config_.sales->list_sales()) {
        if (query.table_id && sale.table_id != *query.table_id) {
            continue;
        }
        if (query.customer_id && sale.customer_id != *query.customer_id) {
            continue;
        }
        if (!within_dates(sale, query.date_from, query.date_to)) {
            continue;
        }
        if (!needle.empty() && !contains_folded(sale.customer_id, needle) && !contains_folded(sale.customer_name, needle)
            && !contains_folded(sale.item_name, needle) && !contains_folded(sale.notes, needle)) {
            continue;
        }
        matches.push_back(std::move(sale));
    }

    std::stable_sort(matches.begin(), matches.end(), [&](const SaleRecord& lhs, const SaleRecord& rhs) {
        return query.descending ? sale_less(rhs, lhs, query.sort_by) : sale_less(lhs, rhs, query.sort_by);
    });

    SalePage page{};
    page.page = query.page;
    page.limit = std::clamp<std::size_t>(query.limit, 1U, config_.page_size_cap);
    page.total = matches.size();
    page.total_pages = (page.total + page.limit - 1U) / page.limit;
    if (page.page - 1U < page.total_pages) {
        const auto offset = (page.page - 1U) * page.limit;
        const auto end = std::min(matches.size(), offset + page.limit);
        page.sales.assign(std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(offset)),
                          std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(end)));
    }
    return common::make_success(std::move(page));
}

OperationResponse<SalesAnalytics> SalesReport::analytics(const SalesAnalyticsQuery& query) const
{
    if (auto invalid = check_dates<SalesAnalytics>(query.date_from, query.date_to)) {
        return std::move(*invalid);
    }

    SalesAnalytics analytics{};
    std::map<std::pair<common::TableId, common::RowId>, TopSellingItem> items;
    std::map<std::string, DailySales, std::greater<>> days;

    for (const auto& sale : config_.sales->list_sales()) {
        if (query.table_id && sale.table_id != *query.table_id) {
            continue;
        }
        if (!within_dates(sale, query.date_from, query.date_to)) {
            continue;
        }

        analytics.total_sales += 1U;
        analytics.total_revenue += sale.total_amount;
        analytics.total_items_sold += sale.quantity;

        auto& item = items[{sale.table_id, sale.item_id}];
        item.table_id = sale.table_id;
        item.item_id = sale.item_id;
        item.table_name = sale.table_name;
        if (!sale.item_name.empty()) {
            item.item_name = sale.item_name;
        }
        item.quantity_sold += sale.quantity;
        item.revenue += sale.total_amount;

        auto date = common::format_date_utc(sale.sold_at);
        auto& day = days[date];
        day.date = std::move(date);
        day.sales_count += 1U;
        day.revenue += sale.total_amount;
    }

    if (analytics.total_sales > 0U) {
        analytics.average_sale_amount = analytics.total_revenue / static_cast<double>(analytics.total_sales);
    }

    for (auto& [key, item] : items) {
        if (item.item_name.empty()) {
            item.item_name = std::string{kUnknownItemName};
        }
        analytics.top_selling_items.push_back(std::move(item));
    }
    std::stable_sort(analytics.top_selling_items.begin(),
                     analytics.top_selling_items.end(),
                     [](const TopSellingItem& lhs, const TopSellingItem& rhs) {
                         return lhs.quantity_sold > rhs.quantity_sold;
                     });
    if (analytics.top_selling_items.size() > kTopSellingCount) {
        analytics.top_selling_items.resize(kTopSellingCount);
    }

    for (auto& [date, day] : days) {
        if (analytics.sales_by_date.size() == kDailySalesCount) {
            break;
        }
        analytics.sales_by_date.push_back(std::move(day));
    }
    return common::make_success(std::move(analytics));
}

}  // namespace dyntab::sales
