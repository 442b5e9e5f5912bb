#pragma once

#include "dyntab/data/mutation_telemetry.hpp"
#include "dyntab/data/row_mutation_pipeline.hpp"
#include "dyntab/engine_config.hpp"
#include "dyntab/generator/table_generator.hpp"
#include "dyntab/inventory/inventory_ledger.hpp"
#include "dyntab/registry/capability_registry.hpp"
#include "dyntab/registry/module_lifecycle.hpp"
#include "dyntab/rentals/rental_flow.hpp"
#include "dyntab/sales/purchase_flow.hpp"
#include "dyntab/sales/sales_report.hpp"
#include "dyntab/schema/table_schema_manager.hpp"
#include "dyntab/shell/shell_engine.hpp"
#include "dyntab/storage/in_memory_store.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace dyntab::shell {

// Owns one in-memory engine: reference store, registry, lifecycle and every engine component.
class ShellBackend final {
public:
    struct Config final {
        EngineConfig engine{};
        std::string actor = "operator";
    };

    ShellBackend();
    explicit ShellBackend(Config config);
    ~ShellBackend();

    ShellBackend(const ShellBackend&) = delete;
    ShellBackend& operator=(const ShellBackend&) = delete;
    ShellBackend(ShellBackend&&) = delete;
    ShellBackend& operator=(ShellBackend&&) = delete;

    [[nodiscard]] ShellEngine::Config make_config();

    // Makes a module known to the lifecycle; it still has to be installed before its types resolve.
    void add_module(std::string module_id, registry::ModuleCapabilities capabilities, bool active = false);
    std::error_code install_module(std::string_view module_id);
    std::error_code set_module_active(std::string_view module_id, bool active);

    [[nodiscard]] registry::CapabilityView capability_view();

    [[nodiscard]] const std::string& actor() const noexcept { return config_.actor; }
    [[nodiscard]] const EngineConfig& engine_config() const noexcept { return config_.engine; }

    [[nodiscard]] storage::InMemoryStore& store() noexcept { return store_; }
    [[nodiscard]] registry::CapabilityRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] registry::StaticModuleLifecycle& lifecycle() noexcept { return lifecycle_; }
    [[nodiscard]] data::MutationTelemetryRegistry& telemetry_registry() noexcept { return telemetry_registry_; }
    [[nodiscard]] schema::TableSchemaManager& schema() noexcept { return *schema_; }
    [[nodiscard]] inventory::InventoryLedger& ledger() noexcept { return *ledger_; }
    [[nodiscard]] data::RowMutationPipeline& pipeline() noexcept { return *pipeline_; }
    [[nodiscard]] sales::PurchaseFlow& purchases() noexcept { return *purchases_; }
    [[nodiscard]] sales::SalesReport& sales_report() noexcept { return *sales_report_; }
    [[nodiscard]] rentals::RentalFlow& rentals() noexcept { return *rentals_; }
    [[nodiscard]] generator::TableGenerator& generator() noexcept { return *generator_; }

private:
    Config config_{};
    storage::InMemoryStore store_{};
    registry::CapabilityRegistry registry_{};
    registry::StaticModuleLifecycle lifecycle_{};
    data::MutationTelemetryRegistry telemetry_registry_{};
    std::unique_ptr<schema::TableSchemaManager> schema_{};
    std::unique_ptr<inventory::InventoryLedger> ledger_{};
    std::unique_ptr<data::RowMutationPipeline> pipeline_{};
    std::unique_ptr<sales::PurchaseFlow> purchases_{};
    std::unique_ptr<sales::SalesReport> sales_report_{};
    std::unique_ptr<rentals::RentalFlow> rentals_{};
    std::unique_ptr<generator::TableGenerator> generator_{};
};

}  // namespace dyntab::shell
