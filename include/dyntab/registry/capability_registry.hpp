#pragma once

#include "dyntab/registry/column_type.hpp"
#include "dyntab/registry/module_lifecycle.hpp"
#include "dyntab/registry/module_rules.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dyntab::registry {

using ActiveModuleSet = std::set<std::string, std::less<>>;

struct RegisteredGenerator final {
    std::string id{};  // "<module>:<tag>"
    std::string module_id{};
    ModuleGeneratorDefinition definition{};
};

struct RegisteredTableGenerator final {
    std::string module_id{};  // empty for built-in generators
    TableGeneratorDefinition definition{};
};

// Immutable per-request view over built-ins plus the capabilities of active modules.
class CapabilityView final {
public:
    CapabilityView() = default;

    // UnknownColumnType when the id was never registered, ModuleInactive when its module is not active.
    std::error_code resolve(std::string_view type_id, std::shared_ptr<const ColumnTypeHandler>& handler) const;
    [[nodiscard]] std::shared_ptr<const ColumnTypeHandler> find(std::string_view type_id) const;

    [[nodiscard]] bool is_active(std::string_view module_id) const;
    [[nodiscard]] const ActiveModuleSet& active_modules() const noexcept { return active_; }

    [[nodiscard]] std::vector<std::shared_ptr<const ColumnTypeHandler>> list_column_types() const;
    [[nodiscard]] std::vector<RegisteredGenerator> list_generators() const;
    [[nodiscard]] std::vector<RegisteredTableGenerator> list_table_generators() const;
    [[nodiscard]] const RegisteredGenerator* find_generator(std::string_view id) const;
    [[nodiscard]] const RegisteredTableGenerator* find_table_generator(std::string_view id) const;

private:
    friend class CapabilityRegistry;

    ActiveModuleSet active_{};
    std::map<std::string, std::shared_ptr<const ColumnTypeHandler>, std::less<>> types_{};
    std::set<std::string, std::less<>> inactive_types_{};
    std::map<std::string, RegisteredGenerator, std::less<>> generators_{};
    std::map<std::string, RegisteredTableGenerator, std::less<>> table_generators_{};
};

class CapabilityRegistry final {
public:
    CapabilityRegistry();

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;
    CapabilityRegistry(CapabilityRegistry&&) = delete;
    CapabilityRegistry& operator=(CapabilityRegistry&&) = delete;

    std::error_code install_module(std::string module_id, const ModuleCapabilities& capabilities);
    std::error_code uninstall_module(std::string_view module_id);
    std::error_code register_table_generator(TableGeneratorDefinition definition);

    [[nodiscard]] bool is_installed(std::string_view module_id) const;
    [[nodiscard]] std::vector<std::string> installed_modules() const;
    [[nodiscard]] std::vector<std::string> builtin_type_ids() const;

    [[nodiscard]] CapabilityView snapshot(const ActiveModuleSet& active) const;

private:
    struct InstalledModule final {
        std::vector<std::shared_ptr<const ColumnTypeHandler>> column_types{};
        std::vector<RegisteredGenerator> generators{};
        std::vector<TableGeneratorDefinition> table_generators{};
    };

    void register_builtins();

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const ColumnTypeHandler>, std::less<>> builtins_{};
    std::map<std::string, TableGeneratorDefinition, std::less<>> builtin_table_generators_{};
    std::map<std::string, InstalledModule, std::less<>> modules_{};
};

[[nodiscard]] std::vector<TableGeneratorDefinition> builtin_table_generators();

// Installs any active module the registry has not seen yet, then snapshots the active set.
[[nodiscard]] CapabilityView make_capability_view(CapabilityRegistry& registry, const ModuleLifecycle& lifecycle);

}  // namespace dyntab::registry
