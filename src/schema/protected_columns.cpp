#include "dyntab/schema/protected_columns.hpp"

#include <algorithm>
#include <string>

namespace dyntab::schema {

namespace {

catalog::ColumnDescriptor make_default(std::string name,
                                       std::string type_id,
                                       bool required,
                                       std::optional<std::string> default_value)
{
    catalog::ColumnDescriptor column{};
    column.name = std::move(name);
    column.type_id = std::move(type_id);
    column.required = required;
    column.allow_duplicates = true;
    column.default_value = std::move(default_value);
    return column;
}

}  // namespace

std::vector<std::string_view> protected_column_names(catalog::TablePurpose purpose)
{
    switch (purpose) {
    case catalog::TablePurpose::Sale:
        return {"price", "qty"};
    case catalog::TablePurpose::Rent:
        return {"price", "fee", "used", "available"};
    case catalog::TablePurpose::Default:
    default:
        return {};
    }
}

bool is_protected_column(catalog::TablePurpose purpose, std::string_view column_name)
{
    const auto names = protected_column_names(purpose);
    return std::find(names.begin(), names.end(), column_name) != names.end();
}

std::vector<catalog::ColumnDescriptor> default_columns(catalog::TablePurpose purpose)
{
    std::vector<catalog::ColumnDescriptor> columns;
    switch (purpose) {
    case catalog::TablePurpose::Sale:
        columns.push_back(make_default("price", "number", true, std::nullopt));
        columns.push_back(make_default("qty", "integer", true, std::string{"1"}));
        break;
    case catalog::TablePurpose::Rent:
        columns.push_back(make_default("price", "number", true, std::nullopt));
        columns.push_back(make_default("fee", "number", true, std::string{"0"}));
        columns.push_back(make_default("used", "boolean", true, std::string{"false"}));
        columns.push_back(make_default("available", "boolean", true, std::string{"true"}));
        break;
    case catalog::TablePurpose::Default:
    default:
        break;
    }
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        columns[index].position = static_cast<std::uint32_t>(index);
    }
    return columns;
}

}  // namespace dyntab::schema
