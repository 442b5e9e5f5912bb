#include "dyntab/common/engine_errors.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/schema/column_names.hpp"
#include "dyntab/schema/protected_columns.hpp"
#include "dyntab/schema/table_schema_manager.hpp"
#include "dyntab/storage/in_memory_store.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using dyntab::catalog::ColumnDescriptor;
using dyntab::catalog::TablePurpose;
using dyntab::common::EngineErrc;
using dyntab::common::StatusCategory;
using dyntab::schema::ColumnDraft;
using dyntab::schema::CreateTableRequest;
using dyntab::schema::TableSchemaManager;

namespace {

constexpr const char* kOwner = "owner";

struct SchemaHarness final {
    SchemaHarness()
        : manager{TableSchemaManager::Config{&store, &store, &store, {}, {}}}
        , view{registry.snapshot({})}
    {
    }

    dyntab::common::TableId create(TablePurpose purpose, std::vector<ColumnDraft> columns = {})
    {
        CreateTableRequest request{};
        request.name = "Inventory";
        request.purpose = purpose;
        request.columns = std::move(columns);
        auto created = manager.create_table(request, kOwner, view);
        REQUIRE(created.success);
        return created.payload.table.id;
    }

    std::vector<ColumnDescriptor> columns(dyntab::common::TableId table)
    {
        auto listed = manager.list_columns(table, kOwner);
        REQUIRE(listed.success);
        return listed.payload;
    }

    dyntab::storage::InMemoryStore store;
    dyntab::registry::CapabilityRegistry registry;
    TableSchemaManager manager;
    dyntab::registry::CapabilityView view;
};

ColumnDraft draft(std::string name, std::string type_id = "text")
{
    ColumnDraft column{};
    column.name = std::move(name);
    column.type_id = std::move(type_id);
    return column;
}

const ColumnDescriptor* find_named(const std::vector<ColumnDescriptor>& columns, std::string_view name)
{
    auto it = std::find_if(columns.begin(), columns.end(), [name](const auto& column) { return column.name == name; });
    return it == columns.end() ? nullptr : &(*it);
}

std::vector<std::string> names_in_order(std::vector<ColumnDescriptor> columns)
{
    std::sort(columns.begin(), columns.end(), [](const auto& lhs, const auto& rhs) { return lhs.position < rhs.position; });
    std::vector<std::string> names;
    for (const auto& column : columns) {
        names.push_back(column.name);
    }
    return names;
}

}  // namespace

TEST_CASE("Column names convert between display and camelCase")
{
    using namespace dyntab::schema;

    CHECK(to_internal_name("Monthly Cost") == "monthlyCost");
    CHECK(to_internal_name("  created   ON ") == "createdOn");
    CHECK(to_display_name("monthlyCost") == "Monthly Cost");

    const auto valid = validate_column_name("Unit Price");
    CHECK(valid.valid);
    CHECK(valid.internal_name == "unitPrice");

    CHECK(validate_column_name("").error == "Column name is required");
    CHECK_THAT(validate_column_name("price2").error, ContainsSubstring("Latin letters"));
    CHECK_THAT(validate_column_name("Prix \xC3\xA9t\xC3\xA9").error, ContainsSubstring("Latin letters"));
    CHECK(validate_column_name(std::string(101U, 'a')).error == "Column name must be 100 characters or less");
    CHECK(validate_column_name(std::string(100U, 'a')).valid);
}

TEST_CASE("Purposes protect their commerce columns")
{
    using dyntab::schema::is_protected_column;

    CHECK(is_protected_column(TablePurpose::Sale, "price"));
    CHECK(is_protected_column(TablePurpose::Sale, "qty"));
    CHECK_FALSE(is_protected_column(TablePurpose::Sale, "fee"));
    CHECK(is_protected_column(TablePurpose::Rent, "available"));
    CHECK_FALSE(is_protected_column(TablePurpose::Default, "price"));
    CHECK(dyntab::schema::default_columns(TablePurpose::Default).empty());
}

TEST_CASE("Sale tables start with price and quantity columns")
{
    SchemaHarness harness;

    CreateTableRequest request{};
    request.name = "  Shop  ";
    request.purpose = TablePurpose::Sale;
    request.columns = {draft("Name"), draft("Price", "number"), draft("Description", "textarea")};
    auto created = harness.manager.create_table(request, kOwner, harness.view);

    REQUIRE(created.success);
    CHECK(created.status == StatusCategory::Created);
    CHECK(created.payload.table.name == "Shop");
    CHECK(created.payload.table.owner == kOwner);
    CHECK(created.payload.skipped_columns == std::vector<std::string>{"price"});
    REQUIRE(created.warnings.size() == 1U);

    const auto columns = harness.columns(created.payload.table.id);
    CHECK(names_in_order(columns) == std::vector<std::string>{"price", "qty", "name", "description"});

    const auto* price = find_named(columns, "price");
    REQUIRE(price != nullptr);
    CHECK(price->type_id == "number");
    CHECK(price->required);
    CHECK_FALSE(price->default_value.has_value());

    const auto* qty = find_named(columns, "qty");
    REQUIRE(qty != nullptr);
    CHECK(qty->type_id == "integer");
    CHECK(qty->required);
    CHECK(qty->default_value == std::string{"1"});
}

TEST_CASE("Table creation rejects bad requests")
{
    SchemaHarness harness;

    SECTION("missing name")
    {
        CreateTableRequest request{};
        request.name = "   ";
        auto created = harness.manager.create_table(request, kOwner, harness.view);
        CHECK(created.error == EngineErrc::InvalidArgument);
        CHECK(created.message == "Table name is required");
        CHECK(created.status == StatusCategory::ValidationFailed);
    }

    SECTION("duplicate user columns")
    {
        CreateTableRequest request{};
        request.name = "Contacts";
        request.columns = {draft("Full Name"), draft("full name")};
        auto created = harness.manager.create_table(request, kOwner, harness.view);
        CHECK(created.error == EngineErrc::DuplicateColumnName);
        CHECK(created.status == StatusCategory::Conflict);
        CHECK(harness.store.list_tables().empty());
    }

    SECTION("unknown column type")
    {
        CreateTableRequest request{};
        request.name = "Contacts";
        request.columns = {draft("Phone", "crm:phone")};
        auto created = harness.manager.create_table(request, kOwner, harness.view);
        CHECK(created.error == EngineErrc::UnknownColumnType);
        CHECK(created.message == "Unknown column type: crm:phone");
    }

    SECTION("invalid column names are reported per field")
    {
        CreateTableRequest request{};
        request.name = "Contacts";
        request.columns = {draft("Name"), draft("Zip 5")};
        auto created = harness.manager.create_table(request, kOwner, harness.view);
        CHECK(created.error == EngineErrc::InvalidColumnName);
        REQUIRE(created.field_errors.size() == 1U);
        CHECK(created.field_errors.front().value == "Zip 5");
    }
}

TEST_CASE("Adding columns enforces unique names and valid defaults")
{
    SchemaHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Name")});

    auto added = harness.manager.add_column(table, draft("Unit Price", "currency"), kOwner, harness.view);
    REQUIRE(added.success);
    CHECK(added.status == StatusCategory::Created);
    CHECK(added.payload.name == "unitPrice");
    CHECK(added.payload.position == 1U);

    auto duplicate = harness.manager.add_column(table, draft("unit price"), kOwner, harness.view);
    CHECK(duplicate.error == EngineErrc::DuplicateColumnName);
    CHECK(duplicate.message ==
          "A column with the name \"unitPrice\" already exists in this table. Please choose a different name.");

    auto bad_default = draft("Stock", "integer");
    bad_default.default_value = "lots";
    auto rejected = harness.manager.add_column(table, bad_default, kOwner, harness.view);
    CHECK(rejected.error == EngineErrc::ValidationFailed);
    REQUIRE(rejected.field_errors.size() == 1U);
    CHECK(rejected.field_errors.front().field == "defaultValue");

    SECTION("explicit position shifts later columns")
    {
        auto first = draft("Sku");
        first.position = 0U;
        REQUIRE(harness.manager.add_column(table, first, kOwner, harness.view).success);
        CHECK(names_in_order(harness.columns(table)) == std::vector<std::string>{"sku", "name", "unitPrice"});
    }
}

TEST_CASE("Protected columns survive deletion until the purpose changes")
{
    SchemaHarness harness;
    const auto table = harness.create(TablePurpose::Sale, {draft("Name")});
    const auto columns = harness.columns(table);
    const auto price = find_named(columns, "price")->id;
    const auto name = find_named(columns, "name")->id;

    auto blocked = harness.manager.delete_columns(table, {name, price}, kOwner);
    CHECK(blocked.error == EngineErrc::ProtectedColumn);
    CHECK(blocked.status == StatusCategory::ValidationFailed);
    CHECK_THAT(blocked.message, StartsWith("Cannot delete protected columns: price."));
    CHECK(harness.columns(table).size() == 3U);

    dyntab::schema::ColumnUpdate rename{};
    rename.name = "Cost";
    auto renamed = harness.manager.update_column(table, price, rename, kOwner, harness.view);
    CHECK(renamed.error == EngineErrc::ProtectedColumn);

    auto changed = harness.manager.change_purpose(table, TablePurpose::Default, kOwner);
    REQUIRE(changed.success);
    CHECK(changed.payload.added_columns.empty());

    auto deleted = harness.manager.delete_columns(table, {name, price}, kOwner);
    REQUIRE(deleted.success);
    CHECK(deleted.payload.deleted.size() == 2U);
    CHECK(names_in_order(harness.columns(table)) == std::vector<std::string>{"qty"});
}

TEST_CASE("Switching to a commerce purpose adds the missing defaults")
{
    SchemaHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Name"), draft("Price", "number")});

    auto changed = harness.manager.change_purpose(table, TablePurpose::Rent, kOwner);
    REQUIRE(changed.success);
    CHECK(changed.payload.table.purpose == TablePurpose::Rent);

    std::vector<std::string> added;
    for (const auto& column : changed.payload.added_columns) {
        added.push_back(column.name);
    }
    CHECK(added == std::vector<std::string>{"fee", "used", "available"});
    CHECK(names_in_order(harness.columns(table)) ==
          std::vector<std::string>{"name", "price", "fee", "used", "available"});
}

TEST_CASE("Column positions can be swapped and recounted")
{
    SchemaHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Alpha"), draft("Beta"), draft("Gamma")});
    auto columns = harness.columns(table);
    const auto alpha = find_named(columns, "alpha")->id;
    const auto gamma = find_named(columns, "gamma")->id;

    auto swapped = harness.manager.swap_positions(table, alpha, gamma, kOwner);
    REQUIRE(swapped.success);
    CHECK(names_in_order(swapped.payload) == std::vector<std::string>{"gamma", "beta", "alpha"});

    auto self = harness.manager.swap_positions(table, alpha, alpha, kOwner);
    CHECK(self.error == EngineErrc::InvalidArgument);

    SECTION("recount closes gaps and is idempotent")
    {
        auto beta = *find_named(harness.columns(table), "beta");
        beta.position = 40U;
        REQUIRE_FALSE(harness.store.update_column(beta));

        auto first = harness.manager.recount_positions(table, kOwner);
        REQUIRE(first.success);
        auto second = harness.manager.recount_positions(table, kOwner);
        REQUIRE(second.success);

        CHECK(names_in_order(second.payload) == std::vector<std::string>{"gamma", "alpha", "beta"});
        for (std::size_t index = 0U; index < second.payload.size(); ++index) {
            CHECK(second.payload[index].position == index);
            CHECK(second.payload[index].id == first.payload[index].id);
        }
    }
}

TEST_CASE("Column mass actions report per-column outcomes")
{
    SchemaHarness harness;
    const auto table = harness.create(TablePurpose::Sale, {draft("Name")});
    const auto columns = harness.columns(table);
    const auto qty = find_named(columns, "qty")->id;
    const auto name = find_named(columns, "name")->id;

    auto result = harness.manager.execute_column_mass_action(
        table, dyntab::schema::ColumnMassAction::MakeOptional, {name, qty, dyntab::common::ColumnId{999U}}, kOwner);
    REQUIRE(result.success);
    REQUIRE(result.payload.results.size() == 3U);
    CHECK(result.payload.results[0].success);
    CHECK(result.payload.results[1].error == EngineErrc::ProtectedColumn);
    CHECK(result.payload.results[2].error == EngineErrc::ColumnNotFound);

    CHECK(dyntab::schema::parse_column_mass_action("MAKE_REQUIRED") == dyntab::schema::ColumnMassAction::MakeRequired);
    CHECK_FALSE(dyntab::schema::parse_column_mass_action("archive").has_value());
}

TEST_CASE("Schema changes require write access")
{
    SchemaHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Name")});

    auto denied = harness.manager.add_column(table, draft("Notes"), "stranger", harness.view);
    CHECK(denied.error == EngineErrc::AccessDenied);
    CHECK(denied.status == StatusCategory::AccessDenied);

    harness.store.grant_access(table, "reader", false);
    CHECK(harness.manager.list_columns(table, "reader").success);
    CHECK(harness.manager.delete_table(table, "reader").error == EngineErrc::AccessDenied);

    auto missing = harness.manager.get_table(dyntab::common::TableId{404U}, kOwner);
    CHECK(missing.error == EngineErrc::TableNotFound);

    dyntab::schema::TableSettingsUpdate publish{};
    publish.visibility = dyntab::catalog::TableVisibility::Public;
    REQUIRE(harness.manager.update_table_settings(table, publish, kOwner).success);
    CHECK(harness.manager.get_table(table, "stranger").success);
    CHECK(harness.manager.list_tables("stranger").payload.size() == 1U);

    auto removed = harness.manager.delete_table(table, kOwner);
    REQUIRE(removed.success);
    CHECK(removed.payload.columns_removed == 1U);
    CHECK(harness.store.list_tables().empty());
}

TEST_CASE("Cloning copies column definitions without rows")
{
    SchemaHarness harness;
    auto sku = draft("SKU");
    sku.required = true;
    sku.allow_duplicates = false;
    auto shelf = draft("Shelf");
    shelf.default_value = "A1";
    const auto source = harness.create(TablePurpose::Sale, {draft("Name"), sku, shelf});

    dyntab::catalog::RowRecord row{};
    row.table_id = source;
    row.data = {{"name", dyntab::common::CellValue{std::string{"Mug"}}}};
    REQUIRE_FALSE(harness.store.insert_row(row));

    dyntab::schema::CloneTableRequest request{};
    request.source = source;

    auto cloned = harness.manager.clone_table(request, kOwner);
    REQUIRE(cloned.success);
    CHECK(cloned.status == StatusCategory::Created);
    const auto& table = cloned.payload.table;
    CHECK(table.id != source);
    CHECK(table.name == "Inventory Copy");
    CHECK(table.description == "Clone of Inventory");
    CHECK(table.purpose == TablePurpose::Sale);
    CHECK(table.visibility == dyntab::catalog::TableVisibility::Private);
    CHECK(table.owner == kOwner);

    const auto copied = harness.columns(table.id);
    CHECK(names_in_order(copied) == names_in_order(harness.columns(source)));
    const auto* copied_sku = find_named(copied, "sku");
    REQUIRE(copied_sku != nullptr);
    CHECK(copied_sku->required);
    CHECK_FALSE(copied_sku->allow_duplicates);
    CHECK(copied_sku->table_id == table.id);
    REQUIRE(find_named(copied, "shelf") != nullptr);
    CHECK(find_named(copied, "shelf")->default_value == std::optional<std::string>{"A1"});
    CHECK(harness.store.list_rows(table.id).empty());
    CHECK(harness.store.list_rows(source).size() == 1U);

    SECTION("repeated clones get numbered copy names")
    {
        auto again = harness.manager.clone_table(request, kOwner);
        REQUIRE(again.success);
        CHECK(again.payload.table.name == "Inventory Copy 2");
    }

    SECTION("a new purpose adds its missing default columns")
    {
        request.name = "Rentals";
        request.description = "Gear for hire";
        request.purpose = TablePurpose::Rent;
        auto rent = harness.manager.clone_table(request, kOwner);
        REQUIRE(rent.success);
        CHECK(rent.payload.table.name == "Rentals");
        CHECK(rent.payload.table.description == "Gear for hire");
        const auto names = names_in_order(harness.columns(rent.payload.table.id));
        CHECK(names == std::vector<std::string>{"price", "qty", "name", "sku", "shelf", "fee", "used", "available"});
    }
}

TEST_CASE("Cloning requires read access to the source")
{
    SchemaHarness harness;
    const auto source = harness.create(TablePurpose::Default, {draft("Name")});

    dyntab::schema::CloneTableRequest request{};
    request.source = source;

    auto denied = harness.manager.clone_table(request, "stranger");
    CHECK(denied.error == EngineErrc::AccessDenied);
    CHECK(denied.message == "You do not have access to the source table");

    request.source = dyntab::common::TableId{404U};
    auto missing = harness.manager.clone_table(request, kOwner);
    CHECK(missing.error == EngineErrc::TableNotFound);
    CHECK(missing.message == "Source table not found");

    dyntab::schema::TableSettingsUpdate publish{};
    publish.visibility = dyntab::catalog::TableVisibility::Public;
    REQUIRE(harness.manager.update_table_settings(source, publish, kOwner).success);

    request.source = source;
    auto copied = harness.manager.clone_table(request, "stranger");
    REQUIRE(copied.success);
    CHECK(copied.payload.table.name == "Inventory");
    CHECK(copied.payload.table.owner == "stranger");
    CHECK(harness.store.list_tables().size() == 2U);
}
