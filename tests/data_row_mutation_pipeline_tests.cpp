#include "dyntab/common/engine_errors.hpp"
#include "dyntab/data/row_mutation_pipeline.hpp"
#include "dyntab/inventory/inventory_ledger.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/schema/table_schema_manager.hpp"
#include "dyntab/storage/in_memory_store.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <variant>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using dyntab::catalog::TablePurpose;
using dyntab::common::CellValue;
using dyntab::common::EngineErrc;
using dyntab::common::RowData;
using dyntab::common::StatusCategory;
using dyntab::data::RowMassAction;
using dyntab::inventory::TransactionType;

namespace {

constexpr const char* kOwner = "owner";

CellValue text(const char* value)
{
    return CellValue{std::string{value}};
}

dyntab::schema::ColumnDraft draft(std::string name, std::string type_id = "text", bool required = false)
{
    dyntab::schema::ColumnDraft column{};
    column.name = std::move(name);
    column.type_id = std::move(type_id);
    column.required = required;
    return column;
}

struct PipelineHarness final {
    PipelineHarness()
        : ledger{dyntab::inventory::InventoryLedger::Config{&store, &store, &store}}
        , schema{dyntab::schema::TableSchemaManager::Config{&store, &store, &store}}
        , pipeline{make_config()}
        , view{registry.snapshot({})}
    {
    }

    dyntab::data::RowMutationPipeline::Config make_config()
    {
        dyntab::data::RowMutationPipeline::Config config{};
        config.tables = &store;
        config.rows = &store;
        config.access = &store;
        config.ledger = &ledger;
        config.telemetry_registry = &telemetry;
        config.telemetry_identifier = "rows";
        return config;
    }

    dyntab::common::TableId create(TablePurpose purpose, std::vector<dyntab::schema::ColumnDraft> columns)
    {
        dyntab::schema::CreateTableRequest request{};
        request.name = "Items";
        request.purpose = purpose;
        request.columns = std::move(columns);
        auto created = schema.create_table(request, kOwner, view);
        REQUIRE(created.success);
        return created.payload.table.id;
    }

    std::vector<dyntab::inventory::InventoryTransaction> ledger_entries() const
    {
        std::vector<dyntab::inventory::InventoryTransaction> entries;
        store.scan([&entries](const auto& transaction) { entries.push_back(transaction); });
        return entries;
    }

    dyntab::storage::InMemoryStore store;
    dyntab::registry::CapabilityRegistry registry;
    dyntab::data::MutationTelemetryRegistry telemetry;
    dyntab::inventory::InventoryLedger ledger;
    dyntab::schema::TableSchemaManager schema;
    dyntab::data::RowMutationPipeline pipeline;
    dyntab::registry::CapabilityView view;
};

}  // namespace

TEST_CASE("Rows are coerced to their column types on create")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Default,
                                      {draft("Name", "text", true), draft("Rating", "rating"), draft("Active", "boolean")});

    auto created = harness.pipeline.create_row(table,
                                               {{"name", text("  Widget ")}, {"rating", text("4")}, {"active", text("yes")},
                                                {"colour", text("red")}},
                                               kOwner,
                                               harness.view);
    REQUIRE(created.success);
    CHECK(created.status == StatusCategory::Created);
    CHECK(created.payload.created_by == kOwner);
    CHECK(std::get<std::string>(created.payload.data.at("name")) == "Widget");
    CHECK(std::get<double>(created.payload.data.at("rating")) == 4.0);
    CHECK(std::get<bool>(created.payload.data.at("active")));
    CHECK(created.payload.data.count("colour") == 0U);
    CHECK(created.warnings == std::vector<std::string>{"Ignored unknown field \"colour\""});

    // Default tables keep no ledger.
    CHECK(harness.store.ledger_size() == 0U);
}

TEST_CASE("Invalid and missing values block the write")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Name", "text", true), draft("Email", "email")});

    auto rejected = harness.pipeline.create_row(table, {{"email", text("nope")}}, kOwner, harness.view);
    CHECK_FALSE(rejected.success);
    CHECK(rejected.error == EngineErrc::ValidationFailed);
    CHECK(rejected.status == StatusCategory::ValidationFailed);
    CHECK(rejected.message == "Validation failed for name, email");
    REQUIRE(rejected.field_errors.size() == 2U);
    CHECK(rejected.field_errors[0].reason == "This field is required");
    CHECK(rejected.field_errors[1].reason == "Invalid email format");
    CHECK(harness.store.list_rows(table).empty());

    const auto snapshot = harness.pipeline.telemetry_snapshot();
    const auto& create = snapshot.kinds[static_cast<std::size_t>(dyntab::data::MutationKind::Create)];
    CHECK(create.attempts == 1U);
    CHECK(create.failures == 1U);
    CHECK(snapshot.failures.validation_failures == 1U);
}

TEST_CASE("Unique columns reject duplicate values")
{
    PipelineHarness harness;
    auto sku = draft("Sku");
    sku.allow_duplicates = false;
    const auto table = harness.create(TablePurpose::Default, {sku, draft("Label")});

    auto first = harness.pipeline.create_row(table, {{"sku", text("A-1")}}, kOwner, harness.view);
    REQUIRE(first.success);

    auto second = harness.pipeline.create_row(table, {{"sku", text("A-1")}}, kOwner, harness.view);
    CHECK(second.error == EngineErrc::DuplicateValue);
    CHECK(second.status == StatusCategory::Conflict);
    CHECK(second.message == "Column \"sku\" does not allow duplicate values. Value \"A-1\" already exists.");

    // Re-saving a row with its own value is not a duplicate.
    auto resaved = harness.pipeline.update_row(table,
                                               first.payload.id,
                                               {{"sku", text("A-1")}, {"label", text("first")}},
                                               kOwner,
                                               harness.view);
    CHECK(resaved.success);
}

TEST_CASE("Updates replace the stored field set")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Name"), draft("Notes")});
    auto created = harness.pipeline.create_row(table, {{"name", text("Lamp")}, {"notes", text("old")}}, kOwner, harness.view);
    REQUIRE(created.success);

    auto updated = harness.pipeline.update_row(table, created.payload.id, {{"name", text("Lamp")}}, kOwner, harness.view);
    REQUIRE(updated.success);
    CHECK(updated.status == StatusCategory::Ok);
    CHECK(dyntab::common::is_null(updated.payload.data.at("notes")));

    auto missing = harness.pipeline.update_row(table, dyntab::common::RowId{99U}, {}, kOwner, harness.view);
    CHECK(missing.error == EngineErrc::RowNotFound);

    auto removed = harness.pipeline.delete_row(table, created.payload.id, kOwner);
    REQUIRE(removed.success);
    CHECK(std::get<std::string>(removed.payload.data.at("name")) == "Lamp");
    CHECK(harness.pipeline.get_row(table, created.payload.id, kOwner).error == EngineErrc::RowNotFound);
}

TEST_CASE("Sale tables record every row write in the ledger")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Sale, {draft("Name")});

    auto created = harness.pipeline.create_row(table, {{"name", text("Mug")}, {"qty", text("10")}}, kOwner, harness.view);
    REQUIRE(created.success);
    CHECK(std::get<double>(created.payload.data.at("price")) == 0.0);

    auto defaults = harness.pipeline.create_row(table, {{"name", text("Bowl")}}, kOwner, harness.view);
    REQUIRE(defaults.success);
    CHECK(std::get<double>(defaults.payload.data.at("qty")) == 1.0);

    auto updated = harness.pipeline.update_row(table,
                                               created.payload.id,
                                               {{"name", text("Mug")}, {"price", CellValue{4.5}}, {"qty", CellValue{7.0}}},
                                               kOwner,
                                               harness.view);
    REQUIRE(updated.success);
    REQUIRE(harness.pipeline.delete_row(table, defaults.payload.id, kOwner).success);

    const auto entries = harness.ledger_entries();
    REQUIRE(entries.size() == 4U);
    CHECK(entries[0].type == TransactionType::Add);
    CHECK(entries[0].quantity_change == 10.0);
    CHECK(entries[0].table_name == "Items");
    CHECK(entries[1].quantity_change == 1.0);
    CHECK(entries[2].type == TransactionType::Update);
    CHECK(entries[2].quantity_change == -3.0);
    REQUIRE(entries[2].previous_data.has_value());
    CHECK(entries[2].previous_data->at("qty") == CellValue{10.0});
    CHECK(entries[3].type == TransactionType::Remove);
    CHECK(entries[3].quantity_change == -1.0);
    CHECK(entries[3].actor == kOwner);

    CHECK(harness.pipeline.telemetry_snapshot().ledger_appends == 4U);
}

TEST_CASE("Select-all mass actions resolve targets from filters")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Name"), draft("Status")});
    for (int index = 0; index < 50; ++index) {
        const auto* status = index % 5 == 0 ? "Archived" : "active";
        auto created = harness.pipeline.create_row(
            table, {{"name", CellValue{"row " + std::to_string(index)}}, {"status", text(status)}}, kOwner, harness.view);
        REQUIRE(created.success);
    }

    dyntab::data::MassActionRequest request{};
    request.action = RowMassAction::Delete;
    request.select_all = true;
    request.filters = {{"status", "archived"}};

    auto result = harness.pipeline.execute_mass_action(table, request, kOwner, harness.view);
    REQUIRE(result.success);
    CHECK(result.payload.targeted == 10U);
    CHECK(result.payload.succeeded == 10U);
    CHECK(result.payload.failed == 0U);
    CHECK(harness.store.list_rows(table).size() == 40U);

    auto remaining = harness.pipeline.read_rows(table, {{"status", "ARCHIVED"}}, kOwner);
    REQUIRE(remaining.success);
    CHECK(remaining.payload.empty());
}

TEST_CASE("Mass actions validate their request")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Name"), draft("Score", "integer")});
    auto first = harness.pipeline.create_row(table, {{"name", text("a")}}, kOwner, harness.view);
    auto second = harness.pipeline.create_row(table, {{"name", text("b")}}, kOwner, harness.view);
    REQUIRE(first.success);
    REQUIRE(second.success);

    dyntab::data::MassActionRequest request{};
    request.action = RowMassAction::SetFieldValue;
    request.field = "score";

    SECTION("nothing selected")
    {
        auto result = harness.pipeline.execute_mass_action(table, request, kOwner, harness.view);
        CHECK(result.error == EngineErrc::InvalidArgument);
        CHECK(result.message == "No rows selected");
    }

    SECTION("unknown field")
    {
        request.field = "missing";
        request.row_ids = {first.payload.id};
        auto result = harness.pipeline.execute_mass_action(table, request, kOwner, harness.view);
        CHECK(result.error == EngineErrc::ColumnNotFound);
    }

    SECTION("per-row outcomes")
    {
        request.row_ids = {first.payload.id, dyntab::common::RowId{404U}, second.payload.id};
        request.value = text("12");
        auto result = harness.pipeline.execute_mass_action(table, request, kOwner, harness.view);
        REQUIRE(result.success);
        CHECK(result.payload.succeeded == 2U);
        CHECK(result.payload.failed == 1U);
        CHECK(result.payload.results[1].error == EngineErrc::RowNotFound);
        REQUIRE(result.warnings.size() == 1U);
        CHECK(result.warnings.front() == "1 of 3 items failed to set_field_value");
        CHECK(std::get<double>(harness.store.find_row(table, second.payload.id)->data.at("score")) == 12.0);
    }

    SECTION("export reads without writing")
    {
        request.action = RowMassAction::Export;
        request.select_all = true;
        auto result = harness.pipeline.execute_mass_action(table, request, kOwner, harness.view);
        REQUIRE(result.success);
        CHECK(result.payload.exported_rows.size() == 2U);
    }
}

TEST_CASE("Imports map headers and insert every validated row")
{
    PipelineHarness harness;
    auto email = draft("Email Address", "email");
    email.allow_duplicates = false;
    const auto table = harness.create(TablePurpose::Default, {draft("Full Name", "text", true), email});

    dyntab::data::ImportRequest request{};
    request.headers = {"Full Name", "E-mail", "Shoe Size"};
    request.column_mapping = {{"E-mail", "emailAddress"}};
    request.rows = {
        {"Ada", "ada@example.com", "7"},
        {"Linus", "linus@example.com", ""},
    };

    auto imported = harness.pipeline.import_rows(table, request, kOwner, harness.view);
    REQUIRE(imported.success);
    CHECK(imported.status == StatusCategory::Created);
    CHECK(imported.payload.imported_rows == 2U);
    CHECK(imported.payload.failed_rows == 0U);
    CHECK(imported.payload.unmapped_headers == std::vector<std::string>{"Shoe Size"});
    REQUIRE(imported.payload.results.size() == 2U);
    CHECK(imported.payload.results[1].row_id.has_value());
    CHECK_THAT(imported.warnings.back(), ContainsSubstring("Shoe Size"));

    SECTION("replace mode clears existing rows first")
    {
        dyntab::data::ImportRequest replace{};
        replace.mode = dyntab::data::ImportMode::Replace;
        replace.has_headers = false;
        replace.rows = {{"Ada", "ada@example.com"}};
        auto replaced = harness.pipeline.import_rows(table, replace, kOwner, harness.view);
        REQUIRE(replaced.success);
        CHECK(replaced.payload.replaced_rows == 2U);
        CHECK(replaced.payload.imported_rows == 1U);
        CHECK(harness.store.list_rows(table).size() == 1U);
    }

    SECTION("empty requests are rejected")
    {
        dyntab::data::ImportRequest empty{};
        CHECK(harness.pipeline.import_rows(table, empty, kOwner, harness.view).message == "No rows to import");
        empty.rows = {{"x"}};
        CHECK(harness.pipeline.import_rows(table, empty, kOwner, harness.view).message == "Headers are required");
    }
}

TEST_CASE("Imports with any invalid row write nothing")
{
    PipelineHarness harness;
    auto email = draft("Email Address", "email");
    email.allow_duplicates = false;
    const auto table = harness.create(TablePurpose::Default, {draft("Full Name", "text", true), email});
    REQUIRE(harness.pipeline.create_row(table, {{"fullName", text("Kept")}, {"emailAddress", text("kept@example.com")}},
                                        kOwner, harness.view)
                .success);

    dyntab::data::ImportRequest request{};
    request.headers = {"Full Name", "Email Address"};
    request.rows = {
        {"Ada", "ada@example.com"},
        {"", "nobody@example.com"},
        {"Grace", "ada@example.com"},
        {"Linus", "linus@example.com"},
    };

    auto rejected = harness.pipeline.import_rows(table, request, kOwner, harness.view);
    REQUIRE_FALSE(rejected.success);
    CHECK(rejected.error == EngineErrc::ValidationFailed);
    CHECK(rejected.status == StatusCategory::ValidationFailed);
    CHECK(rejected.message == "Import failed: 2 of 4 rows did not validate");
    CHECK(rejected.payload.imported_rows == 0U);
    CHECK(rejected.payload.failed_rows == 2U);
    REQUIRE(rejected.payload.results.size() == 2U);
    CHECK(rejected.payload.results[0].row_number == 2U);
    CHECK(rejected.payload.results[0].error == EngineErrc::ValidationFailed);
    CHECK(rejected.payload.results[1].error == EngineErrc::DuplicateValue);
    REQUIRE_FALSE(rejected.field_errors.empty());
    CHECK_THAT(rejected.field_errors.front().reason, ContainsSubstring("Row 2: "));
    CHECK_THAT(rejected.field_errors.back().reason, ContainsSubstring("Row 3: "));
    CHECK(harness.store.list_rows(table).size() == 1U);

    const auto snapshot = harness.pipeline.telemetry_snapshot();
    CHECK(snapshot.kinds[static_cast<std::size_t>(dyntab::data::MutationKind::Import)].failures == 1U);
}

TEST_CASE("Replace imports keep existing rows when the batch does not validate")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Sale, {draft("Contact", "email", true)});
    for (const auto* address : {"a@example.com", "b@example.com", "c@example.com"}) {
        REQUIRE(harness.pipeline.create_row(table, {{"contact", text(address)}, {"qty", CellValue{2.0}}}, kOwner,
                                            harness.view)
                    .success);
    }
    const auto ledger_before = harness.ledger_entries().size();
    REQUIRE(ledger_before == 3U);

    dyntab::data::ImportRequest replace{};
    replace.mode = dyntab::data::ImportMode::Replace;
    replace.headers = {"Contact"};
    replace.rows = {{"not-an-email"}, {""}};

    auto rejected = harness.pipeline.import_rows(table, replace, kOwner, harness.view);
    REQUIRE_FALSE(rejected.success);
    CHECK(rejected.error == EngineErrc::ValidationFailed);
    CHECK(rejected.payload.replaced_rows == 0U);
    CHECK(rejected.payload.failed_rows == 2U);
    CHECK(harness.store.list_rows(table).size() == 3U);
    CHECK(harness.ledger_entries().size() == ledger_before);
}

TEST_CASE("Row writes require write access")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Name")});
    auto created = harness.pipeline.create_row(table, {{"name", text("mine")}}, kOwner, harness.view);
    REQUIRE(created.success);

    auto denied = harness.pipeline.create_row(table, {{"name", text("theirs")}}, "intruder", harness.view);
    CHECK(denied.error == EngineErrc::AccessDenied);
    CHECK(denied.status_code() == 403U);
    CHECK(harness.pipeline.get_row(table, created.payload.id, "intruder").error == EngineErrc::AccessDenied);

    harness.store.grant_access(table, "editor", true);
    CHECK(harness.pipeline.update_row(table, created.payload.id, {{"name", text("edited")}}, "editor", harness.view).success);

    auto missing = harness.pipeline.delete_row(dyntab::common::TableId{77U}, created.payload.id, kOwner);
    CHECK(missing.error == EngineErrc::TableNotFound);

    CHECK(harness.telemetry.aggregate().failures.access_denied == 1U);
}

TEST_CASE("Stored rows can be revalidated and previewed for a type change")
{
    PipelineHarness harness;
    const auto table = harness.create(TablePurpose::Default, {draft("Amount")});
    for (const auto* amount : {"10", "eleven", "12.5"}) {
        REQUIRE(harness.pipeline.create_row(table, {{"amount", text(amount)}}, kOwner, harness.view).success);
    }
    const auto column = harness.store.list_columns(table).front().id;

    auto preview = harness.pipeline.preview_type_change(table, column, "number", kOwner, harness.view);
    REQUIRE(preview.success);
    CHECK(preview.payload.incompatible_rows == 1U);
    CHECK(preview.payload.sample_issues.front().current_value == "eleven");

    auto report = harness.pipeline.validate_rows(table, kOwner, harness.view);
    REQUIRE(report.success);
    CHECK(report.payload.valid_rows == 3U);

    CHECK(harness.pipeline.preview_type_change(table, dyntab::common::ColumnId{999U}, "number", kOwner, harness.view).error ==
          EngineErrc::ColumnNotFound);
}
