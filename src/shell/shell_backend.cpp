#include "dyntab/shell/shell_backend.hpp"

#include "dyntab/common/engine_errors.hpp"

#include <utility>

namespace dyntab::shell {

ShellBackend::ShellBackend()
    : ShellBackend(Config{})
{
}

ShellBackend::ShellBackend(Config config)
    : config_{std::move(config)}
{
    const auto& engine = config_.engine;

    schema::TableSchemaManager::Config schema_cfg{};
    schema_cfg.tables = &store_;
    schema_cfg.rows = &store_;
    schema_cfg.access = &store_;
    schema_cfg.diagnostics = engine.diagnostics;
    schema_cfg.clock = engine.clock;
    schema_ = std::make_unique<schema::TableSchemaManager>(schema_cfg);

    inventory::InventoryLedger::Config ledger_cfg{};
    ledger_cfg.ledger = &store_;
    ledger_cfg.tables = &store_;
    ledger_cfg.rows = &store_;
    ledger_cfg.diagnostics = engine.diagnostics;
    ledger_cfg.clock = engine.clock;
    ledger_cfg.page_size_cap = engine.ledger_page_size_cap;
    ledger_cfg.default_low_stock_threshold = engine.low_stock_threshold;
    ledger_ = std::make_unique<inventory::InventoryLedger>(ledger_cfg);

    data::RowMutationPipeline::Config pipeline_cfg{};
    pipeline_cfg.tables = &store_;
    pipeline_cfg.rows = &store_;
    pipeline_cfg.access = &store_;
    pipeline_cfg.ledger = ledger_.get();
    pipeline_cfg.telemetry_registry = &telemetry_registry_;
    pipeline_cfg.telemetry_identifier = engine.telemetry_identifier;
    pipeline_cfg.diagnostics = engine.diagnostics;
    pipeline_cfg.clock = engine.clock;
    pipeline_cfg.import_batch_limit = engine.import_batch_limit;
    pipeline_ = std::make_unique<data::RowMutationPipeline>(pipeline_cfg);

    sales::PurchaseFlow::Config purchase_cfg{};
    purchase_cfg.tables = &store_;
    purchase_cfg.rows = &store_;
    purchase_cfg.pipeline = pipeline_.get();
    purchase_cfg.sales = &store_;
    purchase_cfg.diagnostics = engine.diagnostics;
    purchase_cfg.clock = engine.clock;
    purchases_ = std::make_unique<sales::PurchaseFlow>(purchase_cfg);

    sales::SalesReport::Config report_cfg{};
    report_cfg.sales = &store_;
    report_cfg.page_size_cap = engine.ledger_page_size_cap;
    sales_report_ = std::make_unique<sales::SalesReport>(report_cfg);

    rentals::RentalFlow::Config rental_cfg{};
    rental_cfg.tables = &store_;
    rental_cfg.rows = &store_;
    rental_cfg.pipeline = pipeline_.get();
    rental_cfg.ledger = ledger_.get();
    rental_cfg.rentals = &store_;
    rental_cfg.diagnostics = engine.diagnostics;
    rental_cfg.clock = engine.clock;
    rentals_ = std::make_unique<rentals::RentalFlow>(rental_cfg);

    generator::TableGenerator::Config generator_cfg{};
    generator_cfg.schema = schema_.get();
    generator_cfg.pipeline = pipeline_.get();
    generator_ = std::make_unique<generator::TableGenerator>(generator_cfg);
}

ShellBackend::~ShellBackend() = default;

ShellEngine::Config ShellBackend::make_config()
{
    ShellEngine::Config config{};
    config.backend = this;
    config.actor = config_.actor;
    return config;
}

void ShellBackend::add_module(std::string module_id, registry::ModuleCapabilities capabilities, bool active)
{
    lifecycle_.add_module(std::move(module_id), std::move(capabilities), active);
}

std::error_code ShellBackend::install_module(std::string_view module_id)
{
    auto capabilities = lifecycle_.get_module_capabilities(module_id);
    if (!capabilities) {
        return make_error_code(common::EngineErrc::ModuleNotFound);
    }
    return registry_.install_module(std::string{module_id}, *capabilities);
}

std::error_code ShellBackend::set_module_active(std::string_view module_id, bool active)
{
    return lifecycle_.set_active(module_id, active);
}

registry::CapabilityView ShellBackend::capability_view()
{
    return registry::make_capability_view(registry_, lifecycle_);
}

}  // namespace dyntab::shell
