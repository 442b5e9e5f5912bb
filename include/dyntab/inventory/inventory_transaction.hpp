#pragma once

#include "dyntab/common/cell_value.hpp"
#include "dyntab/common/engine_ids.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dyntab::inventory {

enum class TransactionType : std::uint8_t {
    Add = 0,
    Remove,
    Update,
    Adjust,
    Sale,
    Rent,
    Release,
    Count
};

// Append-only audit record. Never the source of truth for current stock.
struct InventoryTransaction final {
    common::TransactionId id{};
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
    std::chrono::system_clock::time_point created_at{};
};

[[nodiscard]] std::string_view to_string(TransactionType type) noexcept;
[[nodiscard]] std::optional<TransactionType> parse_transaction_type(std::string_view text) noexcept;

}  // namespace dyntab::inventory
