#pragma once

#include "dyntab/common/cell_value.hpp"
#include "dyntab/common/engine_ids.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dyntab::rentals {

enum class RentalStatus : std::uint8_t {
    Active = 0,
    Released,
    Cancelled
};

[[nodiscard]] std::string_view to_string(RentalStatus status) noexcept;

struct RentalRecord final {
    common::RentalId id{};
    std::string rental_number{};  // RENT-YYYY-NNN
    common::TableId table_id{};
    std::string table_name{};
    common::RowId item_id{};
    common::RowData item_snapshot{};
    std::string customer_id{};
    double unit_price = 0.0;
    RentalStatus status = RentalStatus::Active;
    std::chrono::system_clock::time_point rented_at{};
    std::optional<std::chrono::system_clock::time_point> released_at{};
    std::string notes{};
};

class RentalRecorder {
public:
    virtual ~RentalRecorder() = default;

    // Persists the draft and returns the stored record (with its id) through `stored`.
    virtual std::error_code record_rental(const RentalRecord& draft, RentalRecord& stored) = 0;
    virtual std::error_code update_rental(const RentalRecord& rental) = 0;
    [[nodiscard]] virtual std::optional<RentalRecord> find_rental(common::RentalId id) const = 0;
    [[nodiscard]] virtual std::optional<RentalRecord> find_active_rental(common::TableId table,
                                                                         common::RowId item) const = 0;
    [[nodiscard]] virtual std::vector<RentalRecord> list_rentals() const = 0;
};

}  // namespace dyntab::rentals
