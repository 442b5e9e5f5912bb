#include "dyntab/catalog/table_model.hpp"

#include "dyntab/common/string_utils.hpp"

namespace dyntab::catalog {

std::string_view to_string(TablePurpose purpose) noexcept
{
    switch (purpose) {
    case TablePurpose::Sale:
        return "sale";
    case TablePurpose::Rent:
        return "rent";
    case TablePurpose::Default:
    default:
        return "default";
    }
}

std::string_view to_string(TableVisibility visibility) noexcept
{
    switch (visibility) {
    case TableVisibility::Public:
        return "public";
    case TableVisibility::Shared:
        return "shared";
    case TableVisibility::Private:
    default:
        return "private";
    }
}

std::optional<TablePurpose> parse_table_purpose(std::string_view text) noexcept
{
    if (common::iequals(text, "default")) {
        return TablePurpose::Default;
    }
    if (common::iequals(text, "sale")) {
        return TablePurpose::Sale;
    }
    if (common::iequals(text, "rent")) {
        return TablePurpose::Rent;
    }
    return std::nullopt;
}

std::optional<TableVisibility> parse_table_visibility(std::string_view text) noexcept
{
    if (common::iequals(text, "private")) {
        return TableVisibility::Private;
    }
    if (common::iequals(text, "public")) {
        return TableVisibility::Public;
    }
    if (common::iequals(text, "shared")) {
        return TableVisibility::Shared;
    }
    return std::nullopt;
}

}  // namespace dyntab::catalog
