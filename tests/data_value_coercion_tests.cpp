#include "dyntab/common/engine_errors.hpp"
#include "dyntab/data/value_coercion.hpp"
#include "dyntab/registry/capability_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>
#include <vector>

using dyntab::common::CellValue;
using dyntab::common::EngineErrc;
using dyntab::data::coerce;
using dyntab::data::format_cell;

namespace {

CellValue text(const char* value)
{
    return CellValue{std::string{value}};
}

dyntab::registry::ModuleCapabilities sku_module()
{
    using namespace dyntab::registry;
    ModuleCapabilities capabilities{};
    ModuleColumnTypeDefinition sku{};
    sku.tag = "sku";
    sku.display_name = "SKU";
    ValidationRule pattern{};
    pattern.kind = ValidationRuleKind::Regex;
    pattern.pattern = "^[A-Z]{3}-[0-9]{4}$";
    pattern.message = "SKU must look like ABC-1234";
    sku.validation.push_back(std::move(pattern));
    sku.format.kind = FormatRuleKind::Template;
    sku.format.template_text = "#{value}";
    capabilities.column_types.push_back(std::move(sku));
    return capabilities;
}

struct CoercionHarness final {
    CoercionHarness()
    {
        REQUIRE_FALSE(registry.install_module("catalog", sku_module()));
        view = registry.snapshot(dyntab::registry::ActiveModuleSet{"catalog"});
    }

    dyntab::registry::CapabilityRegistry registry;
    dyntab::registry::CapabilityView view;
};

dyntab::catalog::RowRecord make_row(std::uint64_t id, dyntab::common::RowData data)
{
    dyntab::catalog::RowRecord row{};
    row.id = dyntab::common::RowId{id};
    row.data = std::move(data);
    return row;
}

}  // namespace

TEST_CASE("Empty input coerces to null for every type")
{
    CoercionHarness harness;
    for (const auto* type : {"text", "number", "boolean", "date", "email", "catalog:sku", "never-registered"}) {
        CAPTURE(type);
        CHECK(std::holds_alternative<std::monostate>(coerce(CellValue{}, type, harness.view).value));
        CHECK(coerce(text("   "), type, harness.view).ok());
    }
}

TEST_CASE("Numeric types canonicalize to numbers")
{
    CoercionHarness harness;

    auto result = coerce(text(" 12.50 "), "number", harness.view);
    REQUIRE(result.ok());
    CHECK(std::get<double>(result.value) == 12.5);

    result = coerce(CellValue{3.0}, "integer", harness.view);
    REQUIRE(result.ok());
    CHECK(std::get<double>(result.value) == 3.0);

    result = coerce(text("3.5"), "integer", harness.view);
    CHECK(result.error == EngineErrc::CoercionFailed);
    CHECK(result.reason == "Must be a whole number");

    result = coerce(text("12abc"), "number", harness.view);
    CHECK(result.error == EngineErrc::CoercionFailed);
    CHECK(result.reason == "Must be a valid number");
    CHECK_FALSE(result.suggestion.empty());

    CHECK_FALSE(coerce(CellValue{true}, "number", harness.view).ok());
    CHECK_FALSE(coerce(text("19.999"), "currency", harness.view).ok());
    CHECK(coerce(text("19.99"), "currency", harness.view).ok());
    CHECK_FALSE(coerce(text("101"), "percentage", harness.view).ok());
    CHECK_FALSE(coerce(text("6"), "rating", harness.view).ok());
}

TEST_CASE("Booleans accept the usual tokens")
{
    CoercionHarness harness;

    CHECK(std::get<bool>(coerce(text("Yes"), "boolean", harness.view).value));
    CHECK_FALSE(std::get<bool>(coerce(text("off"), "boolean", harness.view).value));
    CHECK(std::get<bool>(coerce(CellValue{1.0}, "boolean", harness.view).value));
    CHECK(std::get<bool>(coerce(CellValue{true}, "boolean", harness.view).value));

    const auto rejected = coerce(CellValue{2.0}, "boolean", harness.view);
    CHECK(rejected.error == EngineErrc::CoercionFailed);
    CHECK(rejected.reason == "Must be true/false, yes/no, or 1/0");
}

TEST_CASE("Dates and countries normalize their text")
{
    CoercionHarness harness;

    CHECK(std::get<std::string>(coerce(text("1/15/2024"), "date", harness.view).value) == "2024-01-15");
    const auto bad_date = coerce(text("15/15/2024"), "date", harness.view);
    CHECK(bad_date.reason == "Invalid date format");
    CHECK(bad_date.suggestion == "Use format: YYYY-MM-DD (e.g., 2024-01-15)");

    CHECK(std::get<std::string>(coerce(text("us"), "country", harness.view).value) == "US");
    CHECK(std::holds_alternative<std::monostate>(coerce(text("N/A"), "country", harness.view).value));
    CHECK(std::holds_alternative<std::monostate>(coerce(text("none"), "country", harness.view).value));
    CHECK(coerce(text("Germany"), "country", harness.view).reason == "Must be 2-3 letter country code");
}

TEST_CASE("Formatted values coerce back to the stored value")
{
    CoercionHarness harness;

    const std::vector<std::pair<const char*, CellValue>> cases{
        {"number", CellValue{42.25}},
        {"number", CellValue{-3.0}},
        {"integer", CellValue{7.0}},
        {"float", CellValue{3.125}},
        {"currency", CellValue{19.5}},
        {"currency", CellValue{1234.0}},
        {"percentage", CellValue{45.0}},
        {"rating", CellValue{4.0}},
        {"boolean", CellValue{false}},
        {"boolean", CellValue{true}},
        {"date", text("2024-02-29")},
        {"country", text("DE")},
    };

    for (const auto& [type, value] : cases) {
        CAPTURE(type);
        const auto rendered = format_cell(value, type, harness.view);
        CAPTURE(rendered);
        const auto parsed = coerce(CellValue{rendered}, type, harness.view);
        REQUIRE(parsed.ok());
        CHECK(parsed.value == value);
    }
}

TEST_CASE("Oversized text is rejected before pattern checks")
{
    CoercionHarness harness;

    const std::string megabyte(1024U * 1024U, 'a');
    const std::vector<std::pair<const char*, std::string>> cases{
        {"email", megabyte + "@example.com"},
        {"url", "https://example.com/" + megabyte},
        {"datetime", "2024-01-15T10:30:00" + megabyte},
        {"catalog:sku", megabyte},
        {"text", megabyte},
    };

    for (const auto& [type, value] : cases) {
        CAPTURE(type);
        const auto result = coerce(CellValue{value}, type, harness.view);
        CHECK(result.error == EngineErrc::CoercionFailed);
        CHECK(result.reason == "Value is too long");
    }

    const std::string at_limit = std::string(dyntab::data::kMaxCellTextLength - 12U, 'b') + "@example.com";
    CHECK(coerce(CellValue{at_limit}, "email", harness.view).ok());
}

TEST_CASE("Text types apply module validation and trimming")
{
    CoercionHarness harness;

    const auto trimmed = coerce(text("  ABC-1234 "), "catalog:sku", harness.view);
    REQUIRE(trimmed.ok());
    CHECK(std::get<std::string>(trimmed.value) == "ABC-1234");

    const auto rejected = coerce(text("abc"), "catalog:sku", harness.view);
    CHECK(rejected.error == EngineErrc::CoercionFailed);
    CHECK(rejected.reason == "SKU must look like ABC-1234");

    CHECK(coerce(text("not an email"), "email", harness.view).reason == "Invalid email format");
    CHECK(std::get<std::string>(coerce(CellValue{5.0}, "text", harness.view).value) == "5");
}

TEST_CASE("Unresolvable types surface registry errors")
{
    CoercionHarness harness;

    const auto unknown = coerce(text("x"), "crm:phone", harness.view);
    CHECK(unknown.error == EngineErrc::UnknownColumnType);

    const auto inactive_view = harness.registry.snapshot({});
    const auto inactive = coerce(text("ABC-1234"), "catalog:sku", inactive_view);
    CHECK(inactive.error == EngineErrc::ModuleInactive);
}

TEST_CASE("Cells render through their column type")
{
    CoercionHarness harness;

    CHECK(format_cell(CellValue{19.5}, "currency", harness.view) == "19.50");
    CHECK(format_cell(text("ff8800"), "color", harness.view) == "#FF8800");
    CHECK(format_cell(text("ABC-1234"), "catalog:sku", harness.view) == "#ABC-1234");
    CHECK(format_cell(CellValue{}, "currency", harness.view).empty());
    CHECK(format_cell(CellValue{3.0}, "not-a-type", harness.view) == "3");
}

TEST_CASE("Dataset validation reports issues without blocking")
{
    CoercionHarness harness;

    dyntab::catalog::ColumnDescriptor name{};
    name.name = "name";
    name.required = true;
    dyntab::catalog::ColumnDescriptor email{};
    email.name = "email";
    email.type_id = "email";
    const std::vector<dyntab::catalog::ColumnDescriptor> columns{name, email};

    const std::vector<dyntab::catalog::RowRecord> rows{
        make_row(1U, {{"name", text("Ada")}, {"email", text("ada@example.com")}}),
        make_row(2U, {{"name", text("")}, {"email", text("broken")}}),
        make_row(3U, {{"name", text("Grace")}, {"email", text("still broken")}}),
    };

    const auto report = dyntab::data::validate_dataset(rows, columns, harness.view);
    CHECK(report.total_rows == 3U);
    CHECK(report.valid_rows == 1U);
    CHECK(report.invalid_rows == 2U);
    CHECK(report.total_warnings == 3U);
    REQUIRE(report.summary.size() == 2U);
    CHECK(report.summary[0].column_name == "name");
    CHECK(report.summary[0].invalid_count == 1U);
    CHECK(report.summary[1].invalid_count == 2U);
    CHECK(report.summary[1].valid_count == 1U);
    CHECK(report.summary[1].sample_errors.front() == "broken: Invalid email format");
    CHECK(report.rows[1].issues.front().error == "Required field is empty");
}

TEST_CASE("Type change previews count incompatible rows")
{
    CoercionHarness harness;

    dyntab::catalog::ColumnDescriptor column{};
    column.name = "amount";
    const std::vector<dyntab::catalog::RowRecord> rows{
        make_row(1U, {{"amount", text("12")}}),
        make_row(2U, {{"amount", text("twelve")}}),
        make_row(3U, {}),
        make_row(4U, {{"amount", text("7.5")}}),
    };

    auto preview = dyntab::data::preview_type_change(rows, column, "integer", harness.view);
    REQUIRE(preview.success);
    CHECK(preview.payload.total_rows == 4U);
    CHECK(preview.payload.incompatible_rows == 2U);
    CHECK(preview.payload.compatible_rows == 2U);
    REQUIRE(preview.payload.sample_issues.size() == 2U);
    CHECK(preview.payload.sample_issues[0].row_id == dyntab::common::RowId{2U});
    CHECK(preview.payload.sample_issues[0].current_value == "twelve");

    const auto unknown = dyntab::data::preview_type_change(rows, column, "nope", harness.view);
    CHECK_FALSE(unknown.success);
    CHECK(unknown.error == EngineErrc::UnknownColumnType);
}
