#include "dyntab/sales/purchase_flow.hpp"

#include "dyntab/common/engine_errors.hpp"

#include <stdexcept>
#include <utility>

namespace dyntab::sales {

namespace {

using common::EngineErrc;
using common::OperationResponse;

constexpr std::string_view kPriceField = "price";
constexpr std::string_view kQuantityField = "qty";

template <typename Payload>
OperationResponse<Payload> fail(EngineErrc code, std::string message = {})
{
    return common::make_failure<Payload>(make_error_code(code), std::move(message));
}

std::optional<double> numeric_field(const common::RowData& data, std::string_view name)
{
    const auto* value = common::find_field(data, name);
    return value != nullptr ? common::as_number(*value) : std::nullopt;
}

}  // namespace

PurchaseFlow::PurchaseFlow(Config config)
    : config_{std::move(config)}
{
    if (config_.tables == nullptr || config_.rows == nullptr) {
        throw std::invalid_argument{"PurchaseFlow requires table and row stores"};
    }
    if (config_.pipeline == nullptr || config_.sales == nullptr) {
        throw std::invalid_argument{"PurchaseFlow requires a mutation pipeline and a sales recorder"};
    }
}

std::chrono::system_clock::time_point PurchaseFlow::now() const
{
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

OperationResponse<PurchaseFlow::Offer> PurchaseFlow::load_offer(common::TableId table,
                                                                common::RowId item,
                                                                std::int64_t quantity) const
{
    if (quantity < 1) {
        return fail<Offer>(EngineErrc::InvalidArgument, "Quantity must be at least 1");
    }

    auto descriptor = config_.tables->find_table(table);
    if (!descriptor) {
        return fail<Offer>(EngineErrc::TableNotFound, "Table not found");
    }
    if (descriptor->purpose != catalog::TablePurpose::Sale || !catalog::is_publicly_visible(descriptor->visibility)) {
        return fail<Offer>(EngineErrc::NotForSale, "Table is not available for public sales");
    }

    auto row = config_.rows->find_row(table, item);
    if (!row) {
        return fail<Offer>(EngineErrc::RowNotFound, "Item not found");
    }

    const auto price = numeric_field(row->data, kPriceField);
    if (!price || *price <= 0.0) {
        return fail<Offer>(EngineErrc::NotForSale, "item is not available for sale");
    }

    const auto available = numeric_field(row->data, kQuantityField).value_or(0.0);
    if (available < static_cast<double>(quantity)) {
        return fail<Offer>(EngineErrc::InsufficientQuantity,
                           "insufficient quantity: available " + common::format_number(available) + ", requested " +
                               std::to_string(quantity));
    }

    Offer offer{};
    offer.table = std::move(*descriptor);
    offer.item = std::move(*row);
    offer.unit_price = *price;
    offer.available = available;
    return common::make_success(std::move(offer));
}

OperationResponse<PurchaseReceipt> PurchaseFlow::purchase(const PurchaseRequest& request,
                                                          const registry::CapabilityView& view)
{
    auto& telemetry = config_.pipeline->telemetry();
    telemetry.record_attempt(data::MutationKind::Purchase);
    data::MutationLatencyScope latency{telemetry, data::MutationKind::Purchase};

    auto response = run(request, view);
    if (response.success) {
        telemetry.record_success(data::MutationKind::Purchase);
    } else {
        telemetry.record_failure(data::MutationKind::Purchase, response.error);
    }
    return response;
}

OperationResponse<PurchaseReceipt> PurchaseFlow::run(const PurchaseRequest& request, const registry::CapabilityView& view)
{
    auto offer = load_offer(request.table_id, request.item_id, request.quantity);
    if (!offer.success) {
        return common::forward_failure<PurchaseReceipt>(std::move(offer));
    }
    const auto& table = offer.payload.table;
    const auto& item = offer.payload.item;

    SaleRecord draft{};
    draft.table_id = table.id;
    draft.table_name = table.name;
    draft.item_id = item.id;
    draft.item_name = inventory::extract_item_name(item.data);
    draft.seller = table.owner;
    draft.customer_id = request.customer_id;
    draft.customer_name = request.customer_name;
    draft.customer_email = request.customer_email;
    draft.notes = request.notes;
    draft.quantity = request.quantity;
    draft.unit_price = offer.payload.unit_price;
    draft.total_amount = offer.payload.unit_price * static_cast<double>(request.quantity);
    draft.sold_at = now();

    PurchaseReceipt receipt{};
    if (const auto error = config_.sales->record_sale(draft, receipt.sale); error) {
        common::emit_diagnostic(config_.diagnostics,
                                common::DiagnosticSeverity::Error,
                                "sales",
                                "Failed to record sale for item " + std::to_string(item.id.value),
                                error);
        return fail<PurchaseReceipt>(EngineErrc::SaleRecordFailed, "Failed to record sale");
    }

    receipt.remaining_quantity = offer.payload.available - static_cast<double>(request.quantity);
    auto data = item.data;
    data[std::string{kQuantityField}] = receipt.remaining_quantity;

    data::LedgerAnnotation annotation{};
    annotation.type = inventory::TransactionType::Sale;
    annotation.reference_id = std::to_string(receipt.sale.id.value);
    annotation.note = "purchase";

    // Stock is decremented as the table owner; the buyer has no write access to the table.
    auto updated = config_.pipeline->update_row(table.id, item.id, data, table.owner, view, annotation);
    auto response = common::make_success(PurchaseReceipt{}, common::StatusCategory::Created);
    if (updated.success) {
        receipt.item = std::move(updated.payload);
        receipt.quantity_updated = true;
        response.warnings = std::move(updated.warnings);
    } else {
        receipt.item = item;
        receipt.remaining_quantity = offer.payload.available;
        auto warning = "Sale " + annotation.reference_id + " was recorded but the item quantity was not updated: " +
                       updated.message;
        common::emit_diagnostic(config_.diagnostics, common::DiagnosticSeverity::Error, "sales", warning, updated.error);
        response.warnings.push_back(std::move(warning));
    }
    response.payload = std::move(receipt);
    return response;
}

OperationResponse<Availability> PurchaseFlow::check_availability(common::TableId table,
                                                                 common::RowId item,
                                                                 std::int64_t quantity) const
{
    auto offer = load_offer(table, item, quantity);
    Availability availability{};
    availability.requested = quantity;
    if (offer.success) {
        availability.available = true;
        availability.unit_price = offer.payload.unit_price;
        availability.quantity_available = offer.payload.available;
        return common::make_success(std::move(availability));
    }

    const auto category = offer.status;
    if (category == common::StatusCategory::NotFound) {
        return common::forward_failure<Availability>(std::move(offer));
    }
    if (offer.error == make_error_code(EngineErrc::InsufficientQuantity)) {
        if (const auto row = config_.rows->find_row(table, item)) {
            availability.quantity_available = numeric_field(row->data, kQuantityField).value_or(0.0);
            availability.unit_price = numeric_field(row->data, kPriceField).value_or(0.0);
        }
    }
    availability.reason = std::move(offer.message);
    return common::make_success(std::move(availability));
}

}  // namespace dyntab::sales
