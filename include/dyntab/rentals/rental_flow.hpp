#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/common/diagnostics.hpp"
#include "dyntab/common/operation_response.hpp"
#include "dyntab/data/row_mutation_pipeline.hpp"
#include "dyntab/inventory/inventory_ledger.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/rentals/rental_recorder.hpp"
#include "dyntab/storage/storage_interfaces.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dyntab::rentals {

// Item lifecycle on rent tables, kept in the row's `used` and `available` fields:
// (used=false, available=true) -rent-> (false, false) -release-> (true, false). Released items stay used.
struct ItemRentalState final {
    bool used = false;
    bool available = true;
};

[[nodiscard]] constexpr bool can_rent(ItemRentalState state) noexcept
{
    return !state.used && state.available;
}

[[nodiscard]] constexpr bool can_release(ItemRentalState state) noexcept
{
    return !state.used && !state.available;
}

[[nodiscard]] ItemRentalState read_rental_state(const common::RowData& data) noexcept;
[[nodiscard]] std::string format_rental_number(int year, std::uint32_t sequence);
// Sequence of a RENT-YYYY-NNN number issued in `year`; nullopt for other years or malformed text.
[[nodiscard]] std::optional<std::uint32_t> rental_sequence(std::string_view rental_number, int year);

struct RentRequest final {
    common::TableId table_id{};
    common::RowId item_id{};
    std::string customer_id{};
    std::string notes{};
};

// Identify the rental by id, or by the table and item of its active rental.
struct ReleaseRequest final {
    std::optional<common::RentalId> rental_id{};
    std::optional<common::TableId> table_id{};
    std::optional<common::RowId> item_id{};
    std::string actor{};
    std::string notes{};
};

struct RentalReceipt final {
    RentalRecord rental{};
    catalog::RowRecord item{};
    // False when the rental record was written but the item state was not.
    bool state_updated = false;
};

struct RentalAvailability final {
    bool can_rent = false;
    bool used = false;
    bool currently_rented = false;
    double price = 0.0;
    std::optional<common::RentalId> active_rental{};
};

// Rents and releases single items of public rent tables. Item state changes go through the
// mutation pipeline as the table owner; each step appends one rent or release ledger entry.
class RentalFlow final {
public:
    struct Config final {
        storage::TableStore* tables = nullptr;
        storage::RowStore* rows = nullptr;
        data::RowMutationPipeline* pipeline = nullptr;
        inventory::InventoryLedger* ledger = nullptr;
        RentalRecorder* rentals = nullptr;
        common::DiagnosticSink diagnostics{};
        std::function<std::chrono::system_clock::time_point()> clock{};
    };

    explicit RentalFlow(Config config);

    RentalFlow(const RentalFlow&) = delete;
    RentalFlow& operator=(const RentalFlow&) = delete;

    [[nodiscard]] common::OperationResponse<RentalReceipt> rent(const RentRequest& request,
                                                                const registry::CapabilityView& view);
    [[nodiscard]] common::OperationResponse<RentalReceipt> release(const ReleaseRequest& request,
                                                                   const registry::CapabilityView& view);
    [[nodiscard]] common::OperationResponse<RentalAvailability> check_availability(common::TableId table,
                                                                                   common::RowId item) const;
    [[nodiscard]] common::OperationResponse<std::vector<RentalRecord>> rentals_for_item(common::TableId table,
                                                                                        common::RowId item) const;

private:
    common::OperationResponse<RentalReceipt> run_rent(const RentRequest& request, const registry::CapabilityView& view);
    common::OperationResponse<RentalReceipt> run_release(const ReleaseRequest& request,
                                                         const registry::CapabilityView& view);
    common::OperationResponse<RentalRecord> locate(const ReleaseRequest& request) const;
    // Writes the new item state and the ledger entry; failures become warnings on `response`.
    void apply_state(const catalog::TableDescriptor& table,
                     const catalog::RowRecord& item,
                     ItemRentalState state,
                     inventory::TransactionType type,
                     const RentalRecord& rental,
                     const std::string& actor,
                     const registry::CapabilityView& view,
                     common::OperationResponse<RentalReceipt>& response);
    std::string next_rental_number() const;
    std::chrono::system_clock::time_point now() const;

    Config config_{};
};

}  // namespace dyntab::rentals
