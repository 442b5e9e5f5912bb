#include "dyntab/common/engine_errors.hpp"
#include "dyntab/data/row_mutation_pipeline.hpp"
#include "dyntab/inventory/inventory_ledger.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/rentals/rental_flow.hpp"
#include "dyntab/schema/table_schema_manager.hpp"
#include "dyntab/storage/in_memory_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

using dyntab::catalog::TablePurpose;
using dyntab::catalog::TableVisibility;
using dyntab::common::CellValue;
using dyntab::common::EngineErrc;
using dyntab::common::RowId;
using dyntab::common::StatusCategory;
using dyntab::common::TableId;
using dyntab::inventory::TransactionType;
using dyntab::rentals::ItemRentalState;
using dyntab::rentals::ReleaseRequest;
using dyntab::rentals::RentalFlow;
using dyntab::rentals::RentalStatus;
using dyntab::rentals::RentRequest;

namespace {

constexpr const char* kOwner = "lender";

struct RentalHarness final {
    RentalHarness()
        : ledger{dyntab::inventory::InventoryLedger::Config{&store, &store, &store}}
        , schema{dyntab::schema::TableSchemaManager::Config{&store, &store, &store}}
        , pipeline{dyntab::data::RowMutationPipeline::Config{&store, &store, &store, &ledger}}
        , flow{make_config()}
        , view{registry.snapshot({})}
    {
    }

    RentalFlow::Config make_config()
    {
        RentalFlow::Config config{};
        config.tables = &store;
        config.rows = &store;
        config.pipeline = &pipeline;
        config.ledger = &ledger;
        config.rentals = &store;
        config.clock = [] {
            return std::chrono::system_clock::time_point{} + std::chrono::hours{24 * 19737};  // 2024-01-15
        };
        return config;
    }

    TableId create_table(TableVisibility visibility = TableVisibility::Public, TablePurpose purpose = TablePurpose::Rent)
    {
        dyntab::schema::CreateTableRequest request{};
        request.name = "Gear";
        request.visibility = visibility;
        request.purpose = purpose;
        dyntab::schema::ColumnDraft name{};
        name.name = "Name";
        request.columns.push_back(name);
        auto created = schema.create_table(request, kOwner, view);
        REQUIRE(created.success);
        return created.payload.table.id;
    }

    RowId add_item(TableId table, double price)
    {
        auto created = pipeline.create_row(
            table, {{"name", CellValue{std::string{"Kayak"}}}, {"price", CellValue{price}}}, kOwner, view);
        REQUIRE(created.success);
        return created.payload.id;
    }

    RentRequest rent_request(TableId table, RowId item) const
    {
        RentRequest request{};
        request.table_id = table;
        request.item_id = item;
        request.customer_id = "renter";
        return request;
    }

    ReleaseRequest release_request(TableId table, RowId item) const
    {
        ReleaseRequest request{};
        request.table_id = table;
        request.item_id = item;
        return request;
    }

    ItemRentalState state_of(TableId table, RowId item) const
    {
        const auto row = store.find_row(table, item);
        REQUIRE(row.has_value());
        return dyntab::rentals::read_rental_state(row->data);
    }

    std::size_t entries_of(TransactionType type) const
    {
        std::size_t count = 0U;
        store.scan([&](const auto& transaction) {
            if (transaction.type == type) {
                ++count;
            }
        });
        return count;
    }

    dyntab::storage::InMemoryStore store;
    dyntab::registry::CapabilityRegistry registry;
    dyntab::inventory::InventoryLedger ledger;
    dyntab::schema::TableSchemaManager schema;
    dyntab::data::RowMutationPipeline pipeline;
    RentalFlow flow;
    dyntab::registry::CapabilityView view;
};

}  // namespace

TEST_CASE("Rental state machine allows one rent and one release")
{
    using dyntab::rentals::can_release;
    using dyntab::rentals::can_rent;

    CHECK(can_rent(ItemRentalState{false, true}));
    CHECK_FALSE(can_rent(ItemRentalState{false, false}));
    CHECK_FALSE(can_rent(ItemRentalState{true, false}));
    CHECK_FALSE(can_rent(ItemRentalState{true, true}));

    CHECK(can_release(ItemRentalState{false, false}));
    CHECK_FALSE(can_release(ItemRentalState{false, true}));
    CHECK_FALSE(can_release(ItemRentalState{true, false}));

    const auto from_text = dyntab::rentals::read_rental_state(
        {{"used", CellValue{std::string{"true"}}}, {"available", CellValue{std::string{"false"}}}});
    CHECK(from_text.used);
    CHECK_FALSE(from_text.available);
    const auto missing = dyntab::rentals::read_rental_state({});
    CHECK_FALSE(missing.used);
    CHECK_FALSE(missing.available);
}

TEST_CASE("Rental numbers restart each year")
{
    using dyntab::rentals::format_rental_number;
    using dyntab::rentals::rental_sequence;

    CHECK(format_rental_number(2024, 7U) == "RENT-2024-007");
    CHECK(format_rental_number(2024, 1234U) == "RENT-2024-1234");
    CHECK(rental_sequence("RENT-2024-007", 2024) == std::optional<std::uint32_t>{7U});
    CHECK_FALSE(rental_sequence("RENT-2023-007", 2024).has_value());
    CHECK_FALSE(rental_sequence("SALE-2024-007", 2024).has_value());
    CHECK_FALSE(rental_sequence("RENT-2024-x", 2024).has_value());
}

TEST_CASE("Renting marks the item unavailable and records the rental")
{
    RentalHarness harness;
    const auto table = harness.create_table();
    const auto kayak = harness.add_item(table, 25.0);
    CHECK(harness.state_of(table, kayak).available);

    auto rented = harness.flow.rent(harness.rent_request(table, kayak), harness.view);
    REQUIRE(rented.success);
    CHECK(rented.status == StatusCategory::Created);
    CHECK(rented.payload.state_updated);

    const auto& rental = rented.payload.rental;
    CHECK(rental.id.is_valid());
    CHECK(rental.rental_number == "RENT-2024-001");
    CHECK(rental.table_name == "Gear");
    CHECK(rental.customer_id == "renter");
    CHECK(rental.unit_price == 25.0);
    CHECK(rental.status == RentalStatus::Active);
    CHECK(std::get<bool>(rental.item_snapshot.at("available")));

    const auto state = harness.state_of(table, kayak);
    CHECK_FALSE(state.used);
    CHECK_FALSE(state.available);

    auto linked = harness.ledger.transactions_for_reference(std::to_string(rental.id.value));
    REQUIRE(linked.success);
    REQUIRE(linked.payload.size() == 1U);
    CHECK(linked.payload.front().type == TransactionType::Rent);
    CHECK(linked.payload.front().note == "RENT-2024-001");
    CHECK(linked.payload.front().actor == "renter");
    CHECK_FALSE(linked.payload.front().quantity_change.has_value());
    CHECK(std::get<bool>(linked.payload.front().previous_data->at("available")));
    CHECK_FALSE(std::get<bool>(linked.payload.front().new_data->at("available")));

    SECTION("a rented item cannot be rented again")
    {
        auto again = harness.flow.rent(harness.rent_request(table, kayak), harness.view);
        CHECK(again.error == EngineErrc::InvalidRentalState);
        CHECK(again.status == StatusCategory::ValidationFailed);
        CHECK(again.message == "Item is currently rented and not available");
        CHECK(harness.store.list_rentals().size() == 1U);
    }

    SECTION("a second item gets the next number")
    {
        const auto canoe = harness.add_item(table, 15.0);
        auto second = harness.flow.rent(harness.rent_request(table, canoe), harness.view);
        REQUIRE(second.success);
        CHECK(second.payload.rental.rental_number == "RENT-2024-002");
    }

    SECTION("availability reports the active rental")
    {
        auto availability = harness.flow.check_availability(table, kayak);
        REQUIRE(availability.success);
        CHECK_FALSE(availability.payload.can_rent);
        CHECK(availability.payload.currently_rented);
        REQUIRE(availability.payload.active_rental.has_value());
        CHECK(*availability.payload.active_rental == rental.id);
    }
}

TEST_CASE("Releasing marks the item used for good")
{
    RentalHarness harness;
    const auto table = harness.create_table();
    const auto kayak = harness.add_item(table, 25.0);
    auto rented = harness.flow.rent(harness.rent_request(table, kayak), harness.view);
    REQUIRE(rented.success);

    SECTION("by table and item")
    {
        auto released = harness.flow.release(harness.release_request(table, kayak), harness.view);
        REQUIRE(released.success);
        CHECK(released.status == StatusCategory::Ok);
        CHECK(released.payload.state_updated);
        CHECK(released.payload.rental.status == RentalStatus::Released);
        CHECK(released.payload.rental.released_at.has_value());
        CHECK(released.message == "Item released successfully. Item is now marked as used and cannot be rented again.");

        const auto state = harness.state_of(table, kayak);
        CHECK(state.used);
        CHECK_FALSE(state.available);
        CHECK(harness.store.find_rental(rented.payload.rental.id)->status == RentalStatus::Released);
        CHECK(harness.entries_of(TransactionType::Release) == 1U);

        auto rent_again = harness.flow.rent(harness.rent_request(table, kayak), harness.view);
        CHECK(rent_again.error == EngineErrc::InvalidRentalState);
        CHECK(rent_again.message == "Item has already been used and cannot be rented again");

        auto release_again = harness.flow.release(harness.release_request(table, kayak), harness.view);
        CHECK(release_again.error == EngineErrc::RentalNotFound);
        CHECK(release_again.message == "No active rental found for this item");
    }

    SECTION("by rental id with notes")
    {
        ReleaseRequest request{};
        request.rental_id = rented.payload.rental.id;
        request.actor = kOwner;
        request.notes = "returned dry";
        auto released = harness.flow.release(request, harness.view);
        REQUIRE(released.success);
        CHECK(released.payload.rental.notes == "returned dry");

        auto linked = harness.ledger.transactions_for_reference(std::to_string(rented.payload.rental.id.value));
        REQUIRE(linked.success);
        REQUIRE(linked.payload.size() == 2U);
        CHECK(linked.payload.back().type == TransactionType::Release);
        CHECK(linked.payload.back().actor == kOwner);

        auto twice = harness.flow.release(request, harness.view);
        CHECK(twice.error == EngineErrc::InvalidRentalState);
        CHECK(twice.message == "Rental is already released");
    }

    CHECK(harness.entries_of(TransactionType::Rent) == 1U);
}

TEST_CASE("Rentals are limited to public rent tables with priced items")
{
    RentalHarness harness;

    SECTION("private rent table")
    {
        const auto table = harness.create_table(TableVisibility::Private);
        const auto kayak = harness.add_item(table, 25.0);
        auto refused = harness.flow.rent(harness.rent_request(table, kayak), harness.view);
        CHECK(refused.error == EngineErrc::NotForRent);
        CHECK(refused.status == StatusCategory::AccessDenied);
        CHECK(refused.message == "Table is not available for public rentals");
    }

    SECTION("sale table")
    {
        const auto table = harness.create_table(TableVisibility::Public, TablePurpose::Sale);
        auto refused = harness.flow.rent(harness.rent_request(table, RowId{1U}), harness.view);
        CHECK(refused.error == EngineErrc::NotForRent);
    }

    SECTION("unpriced item")
    {
        const auto table = harness.create_table();
        const auto free_item = harness.add_item(table, 0.0);
        auto refused = harness.flow.rent(harness.rent_request(table, free_item), harness.view);
        CHECK(refused.error == EngineErrc::NotForRent);
        CHECK(refused.message == "Item is not available for rent");
        CHECK_FALSE(harness.flow.check_availability(table, free_item).payload.can_rent);
    }

    SECTION("missing table, item and customer")
    {
        const auto table = harness.create_table();
        CHECK(harness.flow.rent(harness.rent_request(TableId{99U}, RowId{1U}), harness.view).error
              == EngineErrc::TableNotFound);
        CHECK(harness.flow.rent(harness.rent_request(table, RowId{99U}), harness.view).error == EngineErrc::RowNotFound);

        auto anonymous = harness.rent_request(table, harness.add_item(table, 5.0));
        anonymous.customer_id.clear();
        CHECK(harness.flow.rent(anonymous, harness.view).error == EngineErrc::InvalidArgument);
    }

    SECTION("release needs a rental reference")
    {
        auto refused = harness.flow.release(ReleaseRequest{}, harness.view);
        CHECK(refused.error == EngineErrc::InvalidArgument);
        CHECK(refused.message == "Either rentalId or both itemId and tableId are required");

        ReleaseRequest unknown{};
        unknown.rental_id = dyntab::common::RentalId{42U};
        CHECK(harness.flow.release(unknown, harness.view).error == EngineErrc::RentalNotFound);
    }

    CHECK(harness.store.list_rentals().empty());
    CHECK(harness.entries_of(TransactionType::Rent) == 0U);
}

TEST_CASE("Rental telemetry is shared with the pipeline")
{
    RentalHarness harness;
    const auto table = harness.create_table();
    const auto kayak = harness.add_item(table, 10.0);

    REQUIRE(harness.flow.rent(harness.rent_request(table, kayak), harness.view).success);
    CHECK_FALSE(harness.flow.rent(harness.rent_request(table, kayak), harness.view).success);
    REQUIRE(harness.flow.release(harness.release_request(table, kayak), harness.view).success);

    const auto snapshot = harness.pipeline.telemetry_snapshot();
    const auto& rents = snapshot.kinds[static_cast<std::size_t>(dyntab::data::MutationKind::Rent)];
    CHECK(rents.attempts == 2U);
    CHECK(rents.successes == 1U);
    CHECK(rents.failures == 1U);
    const auto& releases = snapshot.kinds[static_cast<std::size_t>(dyntab::data::MutationKind::Release)];
    CHECK(releases.successes == 1U);

    auto history = harness.flow.rentals_for_item(table, kayak);
    REQUIRE(history.success);
    REQUIRE(history.payload.size() == 1U);
    CHECK(history.payload.front().status == RentalStatus::Released);
}
