#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/common/diagnostics.hpp"
#include "dyntab/common/operation_response.hpp"
#include "dyntab/data/row_mutation_pipeline.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/sales/sales_recorder.hpp"
#include "dyntab/storage/storage_interfaces.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace dyntab::sales {

struct PurchaseRequest final {
    common::TableId table_id{};
    common::RowId item_id{};
    std::int64_t quantity = 1;
    std::string customer_id{};
    std::string customer_name{};
    std::string customer_email{};
    std::string notes{};
};

struct PurchaseReceipt final {
    SaleRecord sale{};
    catalog::RowRecord item{};
    double remaining_quantity = 0.0;
    // False when the sale was recorded but the stock update failed.
    bool quantity_updated = false;
};

struct Availability final {
    bool available = false;
    double unit_price = 0.0;
    double quantity_available = 0.0;
    std::int64_t requested = 0;
    std::string reason{};
};

// Sells items of public sale tables: validates stock, records the sale, then decrements qty
// through the mutation pipeline so the ledger sees exactly one sale transaction.
class PurchaseFlow final {
public:
    struct Config final {
        storage::TableStore* tables = nullptr;
        storage::RowStore* rows = nullptr;
        data::RowMutationPipeline* pipeline = nullptr;
        SalesRecorder* sales = nullptr;
        common::DiagnosticSink diagnostics{};
        std::function<std::chrono::system_clock::time_point()> clock{};
    };

    explicit PurchaseFlow(Config config);

    PurchaseFlow(const PurchaseFlow&) = delete;
    PurchaseFlow& operator=(const PurchaseFlow&) = delete;

    [[nodiscard]] common::OperationResponse<PurchaseReceipt> purchase(const PurchaseRequest& request,
                                                                      const registry::CapabilityView& view);
    // Runs the purchase checks without side effects. A refusal is reported in the payload.
    [[nodiscard]] common::OperationResponse<Availability> check_availability(common::TableId table,
                                                                             common::RowId item,
                                                                             std::int64_t quantity) const;

private:
    struct Offer final {
        catalog::TableDescriptor table{};
        catalog::RowRecord item{};
        double unit_price = 0.0;
        double available = 0.0;
    };

    common::OperationResponse<Offer> load_offer(common::TableId table, common::RowId item, std::int64_t quantity) const;
    common::OperationResponse<PurchaseReceipt> run(const PurchaseRequest& request, const registry::CapabilityView& view);
    std::chrono::system_clock::time_point now() const;

    Config config_{};
};

}  // namespace dyntab::sales
