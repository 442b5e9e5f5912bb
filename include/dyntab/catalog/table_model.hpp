#pragma once

#include "dyntab/common/cell_value.hpp"
#include "dyntab/common/engine_ids.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dyntab::catalog {

enum class TableVisibility : std::uint8_t {
    Private = 0,
    Public,
    Shared
};

// Purpose decides which column names are protected.
enum class TablePurpose : std::uint8_t {
    Default = 0,
    Sale,
    Rent
};

struct TableDescriptor final {
    common::TableId id{};
    std::string name{};
    std::string description{};
    TableVisibility visibility = TableVisibility::Private;
    TablePurpose purpose = TablePurpose::Default;
    std::string owner{};
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point updated_at{};
};

struct ColumnDescriptor final {
    common::ColumnId id{};
    common::TableId table_id{};
    std::string name{};  // internal camelCase form
    std::string type_id = "text";
    bool required = false;
    bool allow_duplicates = true;
    std::optional<std::string> default_value{};
    std::uint32_t position = 0U;
};

struct RowRecord final {
    common::RowId id{};
    common::TableId table_id{};
    common::RowData data{};
    std::string created_by{};
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point updated_at{};
};

[[nodiscard]] std::string_view to_string(TablePurpose purpose) noexcept;
[[nodiscard]] std::string_view to_string(TableVisibility visibility) noexcept;
[[nodiscard]] std::optional<TablePurpose> parse_table_purpose(std::string_view text) noexcept;
[[nodiscard]] std::optional<TableVisibility> parse_table_visibility(std::string_view text) noexcept;

[[nodiscard]] inline bool is_publicly_visible(TableVisibility visibility) noexcept
{
    return visibility == TableVisibility::Public || visibility == TableVisibility::Shared;
}

}  // namespace dyntab::catalog
