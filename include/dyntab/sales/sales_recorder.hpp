#pragma once

#include "dyntab/common/engine_ids.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace dyntab::sales {

struct SaleRecord final {
    common::SaleId id{};
    common::TableId table_id{};
    std::string table_name{};
    common::RowId item_id{};
    std::string item_name{};  // snapshot at sale time
    std::string seller{};
    std::string customer_id{};
    std::string customer_name{};
    std::string customer_email{};
    std::string notes{};
    std::int64_t quantity = 0;
    double unit_price = 0.0;
    double total_amount = 0.0;
    std::chrono::system_clock::time_point sold_at{};
};

class SalesRecorder {
public:
    virtual ~SalesRecorder() = default;

    // Persists the draft and returns the stored record (with its id) through `stored`.
    virtual std::error_code record_sale(const SaleRecord& draft, SaleRecord& stored) = 0;
    // In recording order.
    [[nodiscard]] virtual std::vector<SaleRecord> list_sales() const = 0;
};

}  // namespace dyntab::sales
