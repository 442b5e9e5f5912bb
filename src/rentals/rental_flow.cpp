#include "dyntab/rentals/rental_flow.hpp"

#include "dyntab/common/engine_errors.hpp"
#include "dyntab/common/time_format.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace dyntab::rentals {

namespace {

using common::EngineErrc;
using common::OperationResponse;

constexpr std::string_view kPriceField = "price";
constexpr std::string_view kUsedField = "used";
constexpr std::string_view kAvailableField = "available";
constexpr std::string_view kNumberPrefix = "RENT-";

template <typename Payload>
OperationResponse<Payload> fail(EngineErrc code, std::string message = {})
{
    return common::make_failure<Payload>(make_error_code(code), std::move(message));
}

bool flag_of(const common::RowData& data, std::string_view name) noexcept
{
    const auto* value = common::find_field(data, name);
    if (value == nullptr) {
        return false;
    }
    if (const auto* flag = std::get_if<bool>(value)) {
        return *flag;
    }
    if (const auto* text = std::get_if<std::string>(value)) {
        return *text == "true";
    }
    return false;
}

double price_of(const common::RowData& data)
{
    const auto* value = common::find_field(data, kPriceField);
    return value != nullptr ? common::as_number(*value).value_or(0.0) : 0.0;
}

std::optional<int> parse_int(std::string_view text)
{
    int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string_view to_string(RentalStatus status) noexcept
{
    switch (status) {
    case RentalStatus::Active:
        return "active";
    case RentalStatus::Released:
        return "released";
    case RentalStatus::Cancelled:
        return "cancelled";
    default:
        return "unknown";
    }
}

ItemRentalState read_rental_state(const common::RowData& data) noexcept
{
    return ItemRentalState{flag_of(data, kUsedField), flag_of(data, kAvailableField)};
}

std::string format_rental_number(int year, std::uint32_t sequence)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "RENT-%04d-%03u", year, static_cast<unsigned>(sequence));
    return buffer;
}

std::optional<std::uint32_t> rental_sequence(std::string_view rental_number, int year)
{
    if (rental_number.substr(0U, kNumberPrefix.size()) != kNumberPrefix) {
        return std::nullopt;
    }
    const auto rest = rental_number.substr(kNumberPrefix.size());
    const auto dash = rest.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    const auto issued = parse_int(rest.substr(0U, dash));
    const auto sequence = parse_int(rest.substr(dash + 1U));
    if (!issued || *issued != year || !sequence || *sequence < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(*sequence);
}

RentalFlow::RentalFlow(Config config)
    : config_{std::move(config)}
{
    if (config_.tables == nullptr || config_.rows == nullptr) {
        throw std::invalid_argument{"RentalFlow requires table and row stores"};
    }
    if (config_.pipeline == nullptr || config_.ledger == nullptr || config_.rentals == nullptr) {
        throw std::invalid_argument{"RentalFlow requires a mutation pipeline, a ledger and a rental recorder"};
    }
}

std::chrono::system_clock::time_point RentalFlow::now() const
{
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

// Numbers restart every calendar year (UTC) and continue from the highest issued one.
std::string RentalFlow::next_rental_number() const
{
    const auto year = parse_int(std::string_view{common::format_date_utc(now())}.substr(0U, 4U)).value_or(0);
    std::uint32_t highest = 0U;
    for (const auto& rental : config_.rentals->list_rentals()) {
        if (const auto sequence = rental_sequence(rental.rental_number, year)) {
            highest = std::max(highest, *sequence);
        }
    }
    return format_rental_number(year, highest + 1U);
}

OperationResponse<RentalReceipt> RentalFlow::rent(const RentRequest& request, const registry::CapabilityView& view)
{
    auto& telemetry = config_.pipeline->telemetry();
    telemetry.record_attempt(data::MutationKind::Rent);
    data::MutationLatencyScope latency{telemetry, data::MutationKind::Rent};

    auto response = run_rent(request, view);
    if (response.success) {
        telemetry.record_success(data::MutationKind::Rent);
    } else {
        telemetry.record_failure(data::MutationKind::Rent, response.error);
    }
    return response;
}

OperationResponse<RentalReceipt> RentalFlow::release(const ReleaseRequest& request,
                                                     const registry::CapabilityView& view)
{
    auto& telemetry = config_.pipeline->telemetry();
    telemetry.record_attempt(data::MutationKind::Release);
    data::MutationLatencyScope latency{telemetry, data::MutationKind::Release};

    auto response = run_release(request, view);
    if (response.success) {
        telemetry.record_success(data::MutationKind::Release);
    } else {
        telemetry.record_failure(data::MutationKind::Release, response.error);
    }
    return response;
}

OperationResponse<RentalReceipt> RentalFlow::run_rent(const RentRequest& request, const registry::CapabilityView& view)
{
    if (request.customer_id.empty()) {
        return fail<RentalReceipt>(EngineErrc::InvalidArgument, "Customer id is required");
    }

    const auto table = config_.tables->find_table(request.table_id);
    if (!table) {
        return fail<RentalReceipt>(EngineErrc::TableNotFound, "Table not found");
    }
    if (table->purpose != catalog::TablePurpose::Rent || !catalog::is_publicly_visible(table->visibility)) {
        return fail<RentalReceipt>(EngineErrc::NotForRent, "Table is not available for public rentals");
    }

    const auto item = config_.rows->find_row(table->id, request.item_id);
    if (!item) {
        return fail<RentalReceipt>(EngineErrc::RowNotFound, "Item not found");
    }

    const auto price = price_of(item->data);
    if (price <= 0.0) {
        return fail<RentalReceipt>(EngineErrc::NotForRent, "Item is not available for rent");
    }

    const auto state = read_rental_state(item->data);
    if (!can_rent(state)) {
        if (state.used) {
            return fail<RentalReceipt>(EngineErrc::InvalidRentalState,
                                       "Item has already been used and cannot be rented again");
        }
        return fail<RentalReceipt>(EngineErrc::InvalidRentalState, "Item is currently rented and not available");
    }

    RentalRecord draft{};
    draft.rental_number = next_rental_number();
    draft.table_id = table->id;
    draft.table_name = table->name;
    draft.item_id = item->id;
    draft.item_snapshot = item->data;
    draft.customer_id = request.customer_id;
    draft.unit_price = price;
    draft.status = RentalStatus::Active;
    draft.rented_at = now();
    draft.notes = request.notes;

    RentalReceipt receipt{};
    if (const auto error = config_.rentals->record_rental(draft, receipt.rental); error) {
        common::emit_diagnostic(config_.diagnostics,
                                common::DiagnosticSeverity::Error,
                                "rentals",
                                "Failed to record rental for item " + std::to_string(item->id.value),
                                error);
        return fail<RentalReceipt>(EngineErrc::RentalRecordFailed, "Failed to record rental");
    }

    auto response = common::make_success(std::move(receipt), common::StatusCategory::Created);
    const auto rental = response.payload.rental;
    apply_state(*table, *item, ItemRentalState{false, false}, inventory::TransactionType::Rent, rental,
                request.customer_id, view, response);
    response.message = "Rental " + rental.rental_number + " created";
    return response;
}

OperationResponse<RentalRecord> RentalFlow::locate(const ReleaseRequest& request) const
{
    if (request.rental_id) {
        auto rental = config_.rentals->find_rental(*request.rental_id);
        if (!rental) {
            return fail<RentalRecord>(EngineErrc::RentalNotFound, "Rental not found");
        }
        return common::make_success(std::move(*rental));
    }
    if (request.table_id && request.item_id) {
        auto rental = config_.rentals->find_active_rental(*request.table_id, *request.item_id);
        if (!rental) {
            return fail<RentalRecord>(EngineErrc::RentalNotFound, "No active rental found for this item");
        }
        return common::make_success(std::move(*rental));
    }
    return fail<RentalRecord>(EngineErrc::InvalidArgument, "Either rentalId or both itemId and tableId are required");
}

OperationResponse<RentalReceipt> RentalFlow::run_release(const ReleaseRequest& request,
                                                         const registry::CapabilityView& view)
{
    auto located = locate(request);
    if (!located.success) {
        return common::forward_failure<RentalReceipt>(std::move(located));
    }
    auto rental = std::move(located.payload);
    if (rental.status != RentalStatus::Active) {
        return fail<RentalReceipt>(EngineErrc::InvalidRentalState,
                                   "Rental is already " + std::string{to_string(rental.status)});
    }

    const auto table = config_.tables->find_table(rental.table_id);
    if (!table) {
        return fail<RentalReceipt>(EngineErrc::TableNotFound, "Table not found");
    }
    if (table->purpose != catalog::TablePurpose::Rent) {
        return fail<RentalReceipt>(EngineErrc::NotForRent, "Table is not a rental table");
    }

    const auto item = config_.rows->find_row(table->id, rental.item_id);
    if (!item) {
        return fail<RentalReceipt>(EngineErrc::RowNotFound, "Item not found");
    }

    const auto state = read_rental_state(item->data);
    if (!can_release(state)) {
        if (state.used) {
            return fail<RentalReceipt>(EngineErrc::InvalidRentalState,
                                       "Item has already been released and marked as used");
        }
        return fail<RentalReceipt>(EngineErrc::InvalidRentalState, "Item is not currently rented (it is available)");
    }

    rental.status = RentalStatus::Released;
    rental.released_at = now();
    if (!request.notes.empty()) {
        rental.notes = request.notes;
    }
    if (const auto error = config_.rentals->update_rental(rental); error) {
        common::emit_diagnostic(config_.diagnostics,
                                common::DiagnosticSeverity::Error,
                                "rentals",
                                "Failed to release rental " + rental.rental_number,
                                error);
        return fail<RentalReceipt>(EngineErrc::RentalRecordFailed, "Failed to release rental");
    }

    RentalReceipt receipt{};
    receipt.rental = rental;
    auto response = common::make_success(std::move(receipt));
    const auto actor = request.actor.empty() ? rental.customer_id : request.actor;
    apply_state(*table, *item, ItemRentalState{true, false}, inventory::TransactionType::Release, rental, actor, view,
                response);
    response.message = "Item released successfully. Item is now marked as used and cannot be rented again.";
    return response;
}

void RentalFlow::apply_state(const catalog::TableDescriptor& table,
                             const catalog::RowRecord& item,
                             ItemRentalState state,
                             inventory::TransactionType type,
                             const RentalRecord& rental,
                             const std::string& actor,
                             const registry::CapabilityView& view,
                             OperationResponse<RentalReceipt>& response)
{
    auto data = item.data;
    data[std::string{kUsedField}] = state.used;
    data[std::string{kAvailableField}] = state.available;

    // Renters have no write access; the state change runs as the table owner.
    auto updated = config_.pipeline->update_row(table.id, item.id, data, table.owner, view);
    if (updated.success) {
        response.payload.item = std::move(updated.payload);
        response.payload.state_updated = true;
        response.warnings.insert(response.warnings.end(), updated.warnings.begin(), updated.warnings.end());
    } else {
        response.payload.item = item;
        auto warning = "Rental " + rental.rental_number + " was recorded but the item state was not updated: " +
                       updated.message;
        common::emit_diagnostic(config_.diagnostics, common::DiagnosticSeverity::Error, "rentals", warning, updated.error);
        response.warnings.push_back(std::move(warning));
    }

    inventory::LedgerEntry entry{};
    entry.table_id = table.id;
    entry.table_name = table.name;
    entry.item_id = item.id;
    entry.type = type;
    entry.previous_data = item.data;
    entry.new_data = response.payload.item.data;
    entry.reference_id = std::to_string(rental.id.value);
    entry.note = rental.rental_number;
    entry.actor = actor;
    auto recorded = config_.ledger->record(std::move(entry));
    config_.pipeline->telemetry().record_ledger_append(recorded.success);
    if (!recorded.success) {
        auto warning = "Inventory tracking failed for rental " + rental.rental_number + ": " + recorded.message;
        common::emit_diagnostic(config_.diagnostics,
                                common::DiagnosticSeverity::Warning,
                                "inventory",
                                warning,
                                recorded.error);
        response.warnings.push_back(std::move(warning));
    }
}

OperationResponse<RentalAvailability> RentalFlow::check_availability(common::TableId table, common::RowId item) const
{
    const auto descriptor = config_.tables->find_table(table);
    if (!descriptor) {
        return fail<RentalAvailability>(EngineErrc::TableNotFound, "Table not found");
    }
    if (descriptor->purpose != catalog::TablePurpose::Rent) {
        return fail<RentalAvailability>(EngineErrc::NotForRent, "Table is not a rental table");
    }
    const auto row = config_.rows->find_row(table, item);
    if (!row) {
        return fail<RentalAvailability>(EngineErrc::RowNotFound, "Item not found");
    }

    const auto state = read_rental_state(row->data);
    RentalAvailability availability{};
    availability.used = state.used;
    availability.currently_rented = can_release(state);
    availability.price = price_of(row->data);
    availability.can_rent = can_rent(state) && availability.price > 0.0;
    if (const auto active = config_.rentals->find_active_rental(table, item)) {
        availability.active_rental = active->id;
    }
    return common::make_success(std::move(availability));
}

OperationResponse<std::vector<RentalRecord>> RentalFlow::rentals_for_item(common::TableId table,
                                                                          common::RowId item) const
{
    std::vector<RentalRecord> rentals;
    for (auto& rental : config_.rentals->list_rentals()) {
        if (rental.table_id == table && rental.item_id == item) {
            rentals.push_back(std::move(rental));
        }
    }
    return common::make_success(std::move(rentals));
}

}  // namespace dyntab::rentals
