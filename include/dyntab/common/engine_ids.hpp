#pragma once

#include <cstdint>

namespace dyntab::common {

struct TableId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

struct ColumnId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

struct RowId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

struct TransactionId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

struct SaleId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

struct RentalId final {
    std::uint64_t value = 0U;
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0U; }
};

constexpr bool operator==(TableId lhs, TableId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(TableId lhs, TableId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator<(TableId lhs, TableId rhs) noexcept { return lhs.value < rhs.value; }
constexpr bool operator==(ColumnId lhs, ColumnId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(ColumnId lhs, ColumnId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator<(ColumnId lhs, ColumnId rhs) noexcept { return lhs.value < rhs.value; }
constexpr bool operator==(RowId lhs, RowId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(RowId lhs, RowId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator<(RowId lhs, RowId rhs) noexcept { return lhs.value < rhs.value; }
constexpr bool operator==(TransactionId lhs, TransactionId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(TransactionId lhs, TransactionId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator==(SaleId lhs, SaleId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(SaleId lhs, SaleId rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator==(RentalId lhs, RentalId rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(RentalId lhs, RentalId rhs) noexcept { return !(lhs == rhs); }

}  // namespace dyntab::common
