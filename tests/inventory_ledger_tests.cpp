#include "dyntab/common/engine_errors.hpp"
#include "dyntab/common/time_format.hpp"
#include "dyntab/inventory/inventory_ledger.hpp"
#include "dyntab/storage/in_memory_store.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <limits>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using dyntab::common::CellValue;
using dyntab::common::EngineErrc;
using dyntab::common::RowId;
using dyntab::common::TableId;
using dyntab::inventory::InventoryLedger;
using dyntab::inventory::LedgerEntry;
using dyntab::inventory::StockAlertType;
using dyntab::inventory::TransactionType;

namespace {

struct LedgerHarness final {
    LedgerHarness()
        : ledger{make_config()}
    {
    }

    InventoryLedger::Config make_config()
    {
        InventoryLedger::Config config{};
        config.ledger = &store;
        config.tables = &store;
        config.rows = &store;
        config.page_size_cap = 5U;
        config.clock = [this] {
            now += std::chrono::minutes{1};
            return now;
        };
        return config;
    }

    TableId add_table(std::string name, dyntab::catalog::TablePurpose purpose = dyntab::catalog::TablePurpose::Sale)
    {
        dyntab::catalog::TableDescriptor table{};
        table.name = std::move(name);
        table.purpose = purpose;
        table.owner = "seller";
        REQUIRE_FALSE(store.insert_table(table));
        return table.id;
    }

    RowId add_item(TableId table, std::string name, double qty)
    {
        dyntab::catalog::RowRecord row{};
        row.table_id = table;
        row.data = {{"name", CellValue{std::move(name)}}, {"qty", CellValue{qty}}};
        REQUIRE_FALSE(store.insert_row(row));
        return row.id;
    }

    void record(TableId table, RowId item, TransactionType type, double change, std::string reference = {})
    {
        LedgerEntry entry{};
        entry.table_id = table;
        entry.table_name = "Shop";
        entry.item_id = item;
        entry.type = type;
        entry.quantity_change = change;
        entry.new_data = store.find_row(table, item)->data;
        entry.reference_id = std::move(reference);
        entry.actor = "seller";
        REQUIRE(ledger.record(std::move(entry)).success);
    }

    // 2024-01-15T00:00:00Z
    std::chrono::system_clock::time_point now = std::chrono::system_clock::time_point{} + std::chrono::hours{24 * 19737};
    dyntab::storage::InMemoryStore store;
    InventoryLedger ledger;
};

}  // namespace

TEST_CASE("Ledger entries need a table and an item")
{
    LedgerHarness harness;

    auto rejected = harness.ledger.record(LedgerEntry{});
    CHECK(rejected.error == EngineErrc::InvalidArgument);
    CHECK(rejected.message == "Ledger entries require a table and an item");
    CHECK(harness.store.ledger_size() == 0U);

    const auto table = harness.add_table("Shop");
    const auto item = harness.add_item(table, "Mug", 3.0);
    LedgerEntry entry{};
    entry.table_id = table;
    entry.item_id = item;
    entry.type = TransactionType::Add;
    entry.quantity_change = 3.0;
    auto recorded = harness.ledger.record(entry);
    REQUIRE(recorded.success);
    CHECK(recorded.status == dyntab::common::StatusCategory::Created);
    CHECK(recorded.payload.id.is_valid());
    CHECK(dyntab::common::format_date_utc(recorded.payload.created_at) == "2024-01-15");
}

TEST_CASE("Item summaries fold every transaction type")
{
    LedgerHarness harness;
    const auto table = harness.add_table("Shop");
    const auto mug = harness.add_item(table, "Mug", 10.0);

    harness.record(table, mug, TransactionType::Add, 12.0);
    harness.record(table, mug, TransactionType::Sale, -3.0);
    harness.record(table, mug, TransactionType::Adjust, 2.0);
    harness.record(table, mug, TransactionType::Adjust, -1.0);
    harness.record(table, mug, TransactionType::Update, -4.0);

    auto summary = harness.ledger.summary_for_item(table, mug);
    REQUIRE(summary.success);
    CHECK(summary.payload.item_name == "Mug");
    CHECK(summary.payload.table_name == "Shop");
    CHECK(summary.payload.transaction_count == 5U);
    CHECK(summary.payload.total_added == 14.0);
    CHECK(summary.payload.total_removed == 1.0);
    CHECK(summary.payload.total_sold == 3.0);
    CHECK(summary.payload.total_adjustments == 3.0);
    CHECK(summary.payload.net_change == 6.0);

    auto missing = harness.ledger.summary_for_item(table, RowId{42U});
    CHECK(missing.error == EngineErrc::TransactionsNotFound);
    CHECK(missing.status == dyntab::common::StatusCategory::NotFound);
}

TEST_CASE("Table summaries list the busiest items first")
{
    LedgerHarness harness;
    const auto table = harness.add_table("Shop");
    const auto mug = harness.add_item(table, "Mug", 5.0);
    const auto bowl = harness.add_item(table, "Bowl", 5.0);

    harness.record(table, mug, TransactionType::Add, 5.0);
    harness.record(table, bowl, TransactionType::Add, 5.0);
    harness.record(table, bowl, TransactionType::Sale, -2.0);

    auto summary = harness.ledger.summary_for_table(table);
    REQUIRE(summary.success);
    CHECK(summary.payload.total_items == 2U);
    CHECK(summary.payload.total_transactions == 3U);
    CHECK(summary.payload.net_change == 8.0);
    REQUIRE(summary.payload.items.size() == 2U);
    CHECK(summary.payload.items.front().item_name == "Bowl");

    CHECK(harness.ledger.summary_for_table(TableId{99U}).error == EngineErrc::TransactionsNotFound);
}

TEST_CASE("Stock checks read live quantities of sale tables")
{
    LedgerHarness harness;
    const auto shop = harness.add_table("Shop");
    const auto notes = harness.add_table("Notes", dyntab::catalog::TablePurpose::Default);
    harness.add_item(shop, "Plenty", 50.0);
    harness.add_item(shop, "Few", 3.0);
    harness.add_item(shop, "None", 0.0);
    harness.add_item(shop, "Oversold", -2.0);
    harness.add_item(notes, "Ignored", 0.0);

    auto report = harness.ledger.check_stock_levels();
    REQUIRE(report.success);
    CHECK(report.payload.threshold == dyntab::inventory::kDefaultLowStockThreshold);
    CHECK(report.payload.items_checked == 4U);
    CHECK(report.payload.low_stock_count == 1U);
    CHECK(report.payload.out_of_stock_count == 1U);
    CHECK(report.payload.negative_stock_count == 1U);
    REQUIRE(report.payload.alerts.size() == 3U);
    CHECK(report.payload.alerts[0].item_name == "Oversold");
    CHECK(report.payload.alerts[0].type == StockAlertType::NegativeStock);
    CHECK(report.payload.alerts[1].type == StockAlertType::OutOfStock);
    CHECK(report.payload.alerts[2].current_quantity == 3.0);
    CHECK(dyntab::inventory::to_string(report.payload.alerts[2].type) == "low_stock");

    SECTION("threshold is inclusive")
    {
        auto inclusive = harness.ledger.check_stock_levels(50.0, shop);
        REQUIRE(inclusive.success);
        CHECK(inclusive.payload.alerts.size() == 4U);
    }

    SECTION("bad arguments")
    {
        CHECK(harness.ledger.check_stock_levels(std::numeric_limits<double>::quiet_NaN()).error ==
              EngineErrc::InvalidArgument);
        CHECK(harness.ledger.check_stock_levels(std::nullopt, TableId{404U}).error == EngineErrc::TableNotFound);
    }
}

TEST_CASE("Transaction listings filter, sort and paginate")
{
    LedgerHarness harness;
    const auto table = harness.add_table("Shop");
    const auto mug = harness.add_item(table, "Mug", 5.0);
    for (int index = 0; index < 7; ++index) {
        harness.record(table, mug, index % 2 == 0 ? TransactionType::Add : TransactionType::Sale, index + 1.0);
    }

    dyntab::inventory::TransactionQuery query{};
    auto first = harness.ledger.list_transactions(query);
    REQUIRE(first.success);
    CHECK(first.payload.limit == 5U);
    CHECK(first.payload.total == 7U);
    CHECK(first.payload.total_pages == 2U);
    REQUIRE(first.payload.transactions.size() == 5U);
    CHECK(first.payload.transactions.front().quantity_change == 7.0);

    query.page = 2U;
    CHECK(harness.ledger.list_transactions(query).payload.transactions.size() == 2U);
    query.page = 3U;
    CHECK(harness.ledger.list_transactions(query).payload.transactions.empty());
    // (page - 1) * limit would wrap around to offset 4 here.
    query.page = std::numeric_limits<std::size_t>::max() / 5U + 2U;
    const auto far_page = harness.ledger.list_transactions(query);
    REQUIRE(far_page.success);
    CHECK(far_page.payload.transactions.empty());
    CHECK(far_page.payload.total == 7U);

    query.page = 1U;
    query.type = TransactionType::Sale;
    query.sort_by = dyntab::inventory::TransactionSortField::QuantityChange;
    query.descending = false;
    auto sales = harness.ledger.list_transactions(query);
    REQUIRE(sales.success);
    REQUIRE(sales.payload.transactions.size() == 3U);
    CHECK(sales.payload.transactions.front().quantity_change == 2.0);

    query = {};
    query.limit = 0U;
    CHECK(harness.ledger.list_transactions(query).payload.limit == 1U);
    query.date_from = "2024-01-16";
    CHECK(harness.ledger.list_transactions(query).payload.total == 0U);

    query = {};
    query.page = 0U;
    auto rejected = harness.ledger.list_transactions(query);
    CHECK(rejected.error == EngineErrc::InvalidArgument);
    CHECK(rejected.message == "Page numbers start at 1");

    CHECK(dyntab::inventory::parse_transaction_sort_field("QUANTITY_CHANGE") ==
          dyntab::inventory::TransactionSortField::QuantityChange);
}

TEST_CASE("Reference lookups return every linked transaction")
{
    LedgerHarness harness;
    const auto table = harness.add_table("Shop");
    const auto mug = harness.add_item(table, "Mug", 5.0);
    harness.record(table, mug, TransactionType::Sale, -1.0, "sale-1");
    harness.record(table, mug, TransactionType::Sale, -2.0, "sale-2");

    auto linked = harness.ledger.transactions_for_reference("sale-2");
    REQUIRE(linked.success);
    REQUIRE(linked.payload.size() == 1U);
    CHECK(linked.payload.front().quantity_change == -2.0);

    CHECK(harness.ledger.transactions_for_reference("").error == EngineErrc::InvalidArgument);
}

TEST_CASE("Bulk adjustments record one entry per accepted item")
{
    LedgerHarness harness;
    const auto table = harness.add_table("Shop");
    const auto mug = harness.add_item(table, "Mug", 5.0);

    dyntab::inventory::BulkAdjustmentRequest request{};
    request.actor = "auditor";
    request.adjustments = {
        {table, mug, -2.0, "breakage"},
        {table, mug, 0.0, "noop"},
        {TableId{99U}, mug, 1.0, "wrong table"},
        {table, RowId{99U}, 1.0, "wrong item"},
    };

    auto result = harness.ledger.process_bulk_adjustments(request);
    REQUIRE(result.success);
    CHECK(result.payload.processed_count == 1U);
    CHECK_FALSE(result.payload.all_succeeded());
    REQUIRE(result.payload.errors.size() == 3U);
    CHECK(result.payload.errors[0].message == "Adjustment quantity must be a non-zero number");
    CHECK(result.payload.errors[1].message == "Table not found");
    CHECK(result.payload.errors[2].message == "Item not found");
    CHECK_THAT(result.warnings.back(), ContainsSubstring("Item not found"));

    // The row keeps its quantity; only the audit trail changes.
    CHECK(harness.store.find_row(table, mug)->data.at("qty") == CellValue{5.0});

    auto entries = harness.ledger.list_transactions({});
    REQUIRE(entries.payload.transactions.size() == 1U);
    const auto& adjust = entries.payload.transactions.front();
    CHECK(adjust.type == TransactionType::Adjust);
    CHECK(adjust.note == "breakage");
    CHECK(adjust.actor == "auditor");
    CHECK(adjust.table_name == "Shop");

    request.adjustments.clear();
    CHECK(harness.ledger.process_bulk_adjustments(request).message == "At least one adjustment is required");
}

TEST_CASE("Analytics group activity by type, table and day")
{
    LedgerHarness harness;
    const auto table = harness.add_table("Shop");
    const auto mug = harness.add_item(table, "Mug", 5.0);
    harness.record(table, mug, TransactionType::Add, 5.0);
    harness.record(table, mug, TransactionType::Sale, -2.0);

    auto analytics = harness.ledger.analytics({});
    REQUIRE(analytics.success);
    CHECK(analytics.payload.total_transactions == 2U);
    CHECK(analytics.payload.count_by_type[static_cast<std::size_t>(TransactionType::Sale)] == 1U);
    CHECK(analytics.payload.net_change_by_type[static_cast<std::size_t>(TransactionType::Sale)] == -2.0);
    REQUIRE(analytics.payload.most_active_items.size() == 1U);
    CHECK(analytics.payload.most_active_items.front().item_name == "Mug");
    REQUIRE(analytics.payload.activity_by_date.size() == 1U);
    CHECK(analytics.payload.activity_by_date.front().date == "2024-01-15");
    CHECK(analytics.payload.activity_by_date.front().net_change == 3.0);
}

TEST_CASE("Item names come from the first descriptive field")
{
    using dyntab::inventory::extract_item_name;

    CHECK(extract_item_name({{"title", CellValue{std::string{"Lamp"}}}}) == "Lamp");
    CHECK(extract_item_name({{"name", CellValue{std::string{"  "}}}, {"itemName", CellValue{std::string{"Desk"}}}}) == "Desk");
    CHECK(extract_item_name({{"qty", CellValue{1.0}}}).empty());

    dyntab::inventory::InventoryTransaction transaction{};
    CHECK(dyntab::inventory::item_name_of(transaction) == "Unknown Item");
}
