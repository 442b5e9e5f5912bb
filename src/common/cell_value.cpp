#include "dyntab/common/cell_value.hpp"

#include "dyntab/common/string_utils.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>

namespace dyntab::common {

std::optional<double> as_number(const CellValue& value) noexcept
{
    if (const auto* number = std::get_if<double>(&value)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        std::string_view view{*text};
        while (!view.empty() && view.front() == ' ') {
            view.remove_prefix(1U);
        }
        while (!view.empty() && view.back() == ' ') {
            view.remove_suffix(1U);
        }
        if (!view.empty() && view.front() == '+') {
            view.remove_prefix(1U);
        }
        if (view.empty()) {
            return std::nullopt;
        }
        double parsed = 0.0;
        const auto [end, ec] = std::from_chars(view.data(), view.data() + view.size(), parsed);
        if (ec != std::errc{} || end != view.data() + view.size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

std::string format_number(double value)
{
    if (!std::isfinite(value)) {
        return "NaN";
    }
    if (std::trunc(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<std::int64_t>(value));
    }
    std::array<char, 64> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buffer.data(), end);
}

std::string to_display_string(const CellValue& value)
{
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    if (const auto* number = std::get_if<double>(&value)) {
        return format_number(*number);
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return {};
}

std::string_view cell_kind_name(const CellValue& value) noexcept
{
    switch (value.index()) {
    case 1U:
        return "boolean";
    case 2U:
        return "number";
    case 3U:
        return "text";
    default:
        return "null";
    }
}

const CellValue* find_field(const RowData& data, std::string_view name) noexcept
{
    const auto it = data.find(name);
    if (it == data.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace dyntab::common
