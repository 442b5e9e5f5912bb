#include "dyntab/registry/capability_registry.hpp"

#include "dyntab/common/engine_errors.hpp"
#include "dyntab/registry/column_type_handlers.hpp"

#include <algorithm>
#include <utility>

namespace dyntab::registry {

namespace {

GenerationRule make_name_rule(std::string prefix)
{
    GenerationRule sequence{};
    sequence.kind = GenerationRuleKind::Sequence;

    GenerationRule rule{};
    rule.kind = GenerationRuleKind::Template;
    rule.template_text = std::move(prefix) + " {n}";
    rule.data.push_back(TemplateSlot{"n", sequence});
    return rule;
}

TableGeneratorColumn make_column(std::string name,
                                 std::string type_id,
                                 bool required = false,
                                 std::optional<GenerationRule> generate = std::nullopt)
{
    TableGeneratorColumn column{};
    column.name = std::move(name);
    column.type_id = std::move(type_id);
    column.required = required;
    column.generate = std::move(generate);
    return column;
}

TableGeneratorDefinition make_generator(std::string id,
                                        std::string display_name,
                                        std::string description,
                                        catalog::TablePurpose purpose,
                                        std::size_t table_count,
                                        std::size_t row_count)
{
    TableGeneratorDefinition definition{};
    definition.id = std::move(id);
    definition.display_name = std::move(display_name);
    definition.description = std::move(description);
    definition.purpose = purpose;
    definition.default_table_count = table_count;
    definition.default_row_count = row_count;
    return definition;
}

}  // namespace

std::vector<TableGeneratorDefinition> builtin_table_generators()
{
    auto test_tables = make_generator("test-tables",
                                      "Test Tables",
                                      "Generate random test tables with various column types and data",
                                      catalog::TablePurpose::Default,
                                      100U,
                                      200U);
    test_tables.columns = {
        make_column("name", "text", true, make_name_rule("Record")),
        make_column("email", "email"),
        make_column("rating", "rating"),
        make_column("Created On", "date"),
        make_column("active", "boolean"),
    };

    auto sale_tables = make_generator("sale-tables",
                                      "For Sale Tables",
                                      "Generate tables configured for selling items with price and quantity columns",
                                      catalog::TablePurpose::Sale,
                                      20U,
                                      50U);
    sale_tables.columns = {
        make_column("name", "text", true, make_name_rule("Product")),
        make_column("description", "textarea"),
        make_column("price", "number", true),
        make_column("qty", "integer", true),
    };

    auto rental_tables = make_generator("rental-tables",
                                        "Rental Tables",
                                        "Generate generic rental tables with pricing, availability, and usage tracking",
                                        catalog::TablePurpose::Rent,
                                        20U,
                                        50U);
    rental_tables.columns = {
        make_column("name", "text", true, make_name_rule("Rental")),
        make_column("price", "number", true),
        make_column("fee", "number"),
        make_column("used", "boolean"),
        make_column("available", "boolean"),
    };

    return {std::move(test_tables), std::move(sale_tables), std::move(rental_tables)};
}

std::error_code CapabilityView::resolve(std::string_view type_id,
                                        std::shared_ptr<const ColumnTypeHandler>& handler) const
{
    auto it = types_.find(type_id);
    if (it != types_.end()) {
        handler = it->second;
        return {};
    }
    handler.reset();
    if (inactive_types_.find(type_id) != inactive_types_.end()) {
        return make_error_code(common::EngineErrc::ModuleInactive);
    }
    return make_error_code(common::EngineErrc::UnknownColumnType);
}

std::shared_ptr<const ColumnTypeHandler> CapabilityView::find(std::string_view type_id) const
{
    auto it = types_.find(type_id);
    if (it == types_.end()) {
        return nullptr;
    }
    return it->second;
}

bool CapabilityView::is_active(std::string_view module_id) const
{
    return active_.find(module_id) != active_.end();
}

std::vector<std::shared_ptr<const ColumnTypeHandler>> CapabilityView::list_column_types() const
{
    std::vector<std::shared_ptr<const ColumnTypeHandler>> result;
    result.reserve(types_.size());
    for (const auto& [type_id, handler] : types_) {
        result.push_back(handler);
    }
    return result;
}

std::vector<RegisteredGenerator> CapabilityView::list_generators() const
{
    std::vector<RegisteredGenerator> result;
    result.reserve(generators_.size());
    for (const auto& [id, generator] : generators_) {
        result.push_back(generator);
    }
    return result;
}

std::vector<RegisteredTableGenerator> CapabilityView::list_table_generators() const
{
    std::vector<RegisteredTableGenerator> result;
    result.reserve(table_generators_.size());
    for (const auto& [id, generator] : table_generators_) {
        result.push_back(generator);
    }
    return result;
}

const RegisteredGenerator* CapabilityView::find_generator(std::string_view id) const
{
    auto it = generators_.find(id);
    return it == generators_.end() ? nullptr : &it->second;
}

const RegisteredTableGenerator* CapabilityView::find_table_generator(std::string_view id) const
{
    auto it = table_generators_.find(id);
    return it == table_generators_.end() ? nullptr : &it->second;
}

CapabilityRegistry::CapabilityRegistry()
{
    register_builtins();
}

void CapabilityRegistry::register_builtins()
{
    std::scoped_lock lock(mutex_);
    for (auto& entry : builtin_type_entries()) {
        auto id = entry.id;
        builtins_.emplace(std::move(id), std::make_shared<BuiltinColumnType>(std::move(entry)));
    }
    for (auto& definition : builtin_table_generators()) {
        auto id = definition.id;
        builtin_table_generators_.emplace(std::move(id), std::move(definition));
    }
}

std::error_code CapabilityRegistry::install_module(std::string module_id, const ModuleCapabilities& capabilities)
{
    if (module_id.empty() || module_id.find(':') != std::string::npos) {
        return make_error_code(common::EngineErrc::InvalidArgument);
    }

    InstalledModule module{};
    for (const auto& definition : capabilities.column_types) {
        if (definition.tag.empty()) {
            return make_error_code(common::EngineErrc::InvalidArgument);
        }
        module.column_types.push_back(std::make_shared<ModuleColumnType>(module_id, definition));
    }
    for (const auto& definition : capabilities.generators) {
        RegisteredGenerator generator{};
        generator.id = make_module_type_id(module_id, definition.tag);
        generator.module_id = module_id;
        generator.definition = definition;
        module.generators.push_back(std::move(generator));
    }
    module.table_generators = capabilities.table_generators;

    std::scoped_lock lock(mutex_);
    if (modules_.find(module_id) != modules_.end()) {
        return make_error_code(common::EngineErrc::ModuleAlreadyInstalled);
    }
    modules_.emplace(std::move(module_id), std::move(module));
    return {};
}

std::error_code CapabilityRegistry::uninstall_module(std::string_view module_id)
{
    std::scoped_lock lock(mutex_);
    auto it = modules_.find(module_id);
    if (it == modules_.end()) {
        return make_error_code(common::EngineErrc::ModuleNotFound);
    }
    modules_.erase(it);
    return {};
}

std::error_code CapabilityRegistry::register_table_generator(TableGeneratorDefinition definition)
{
    if (definition.id.empty()) {
        return make_error_code(common::EngineErrc::InvalidArgument);
    }
    std::scoped_lock lock(mutex_);
    if (builtin_table_generators_.find(definition.id) != builtin_table_generators_.end()) {
        return make_error_code(common::EngineErrc::DuplicateValue);
    }
    auto id = definition.id;
    builtin_table_generators_.emplace(std::move(id), std::move(definition));
    return {};
}

bool CapabilityRegistry::is_installed(std::string_view module_id) const
{
    std::scoped_lock lock(mutex_);
    return modules_.find(module_id) != modules_.end();
}

std::vector<std::string> CapabilityRegistry::installed_modules() const
{
    std::scoped_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(modules_.size());
    for (const auto& [module_id, module] : modules_) {
        result.push_back(module_id);
    }
    return result;
}

std::vector<std::string> CapabilityRegistry::builtin_type_ids() const
{
    std::scoped_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(builtins_.size());
    for (const auto& [type_id, handler] : builtins_) {
        result.push_back(type_id);
    }
    return result;
}

CapabilityView CapabilityRegistry::snapshot(const ActiveModuleSet& active) const
{
    CapabilityView view{};
    view.active_ = active;

    std::scoped_lock lock(mutex_);
    view.types_ = builtins_;
    for (const auto& [id, definition] : builtin_table_generators_) {
        view.table_generators_.emplace(id, RegisteredTableGenerator{std::string{}, definition});
    }

    for (const auto& [module_id, module] : modules_) {
        const auto module_active = active.find(module_id) != active.end();
        for (const auto& handler : module.column_types) {
            if (module_active) {
                view.types_.emplace(std::string{handler->type_id()}, handler);
            } else {
                view.inactive_types_.emplace(handler->type_id());
            }
        }
        if (!module_active) {
            continue;
        }
        for (const auto& generator : module.generators) {
            view.generators_.emplace(generator.id, generator);
        }
        for (const auto& definition : module.table_generators) {
            view.table_generators_.emplace(make_module_type_id(module_id, definition.id),
                                           RegisteredTableGenerator{module_id, definition});
        }
    }
    return view;
}

CapabilityView make_capability_view(CapabilityRegistry& registry, const ModuleLifecycle& lifecycle)
{
    ActiveModuleSet active{};
    for (auto& module_id : lifecycle.list_active_modules()) {
        if (!registry.is_installed(module_id)) {
            auto capabilities = lifecycle.get_module_capabilities(module_id);
            if (!capabilities) {
                continue;
            }
            const auto error = registry.install_module(module_id, *capabilities);
            if (error && error != common::EngineErrc::ModuleAlreadyInstalled) {
                continue;
            }
        }
        active.insert(std::move(module_id));
    }
    return registry.snapshot(active);
}

}  // namespace dyntab::registry
