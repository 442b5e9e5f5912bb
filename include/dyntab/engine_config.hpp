#pragma once

#include "dyntab/common/diagnostics.hpp"
#include "dyntab/data/row_mutation_pipeline.hpp"
#include "dyntab/inventory/inventory_ledger.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace dyntab {

struct EngineConfig final {
    double low_stock_threshold = inventory::kDefaultLowStockThreshold;
    std::size_t ledger_page_size_cap = inventory::kMaxTransactionPageSize;
    std::size_t import_batch_limit = data::kDefaultImportBatchLimit;
    std::string telemetry_identifier = "dyntab";
    common::DiagnosticSink diagnostics{};
    // Defaults to the system clock.
    std::function<std::chrono::system_clock::time_point()> clock{};
};

}  // namespace dyntab
