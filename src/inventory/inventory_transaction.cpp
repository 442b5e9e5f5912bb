#include "dyntab/inventory/inventory_transaction.hpp"

#include "dyntab/common/string_utils.hpp"

#include <array>

namespace dyntab::inventory {

namespace {

constexpr std::array<std::string_view, static_cast<std::size_t>(TransactionType::Count)> kTypeNames{
    "add",
    "remove",
    "update",
    "adjust",
    "sale",
    "rent",
    "release"
};

}  // namespace

std::string_view to_string(TransactionType type) noexcept
{
    const auto index = static_cast<std::size_t>(type);
    if (index >= kTypeNames.size()) {
        return "unknown";
    }
    return kTypeNames[index];
}

std::optional<TransactionType> parse_transaction_type(std::string_view text) noexcept
{
    for (std::size_t index = 0U; index < kTypeNames.size(); ++index) {
        if (common::iequals(text, kTypeNames[index])) {
            return static_cast<TransactionType>(index);
        }
    }
    return std::nullopt;
}

}  // namespace dyntab::inventory
