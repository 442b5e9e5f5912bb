#pragma once

#include "dyntab/registry/module_rules.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dyntab::registry {

// Installation and activation state of modules, owned outside the engine.
class ModuleLifecycle {
public:
    virtual ~ModuleLifecycle() = default;

    [[nodiscard]] virtual std::vector<std::string> list_active_modules() const = 0;
    [[nodiscard]] virtual std::optional<ModuleCapabilities> get_module_capabilities(std::string_view module_id) const = 0;
};

// Lifecycle over a fixed module catalogue; used by the shell tool and tests.
class StaticModuleLifecycle final : public ModuleLifecycle {
public:
    StaticModuleLifecycle() = default;

    StaticModuleLifecycle(const StaticModuleLifecycle&) = delete;
    StaticModuleLifecycle& operator=(const StaticModuleLifecycle&) = delete;

    void add_module(std::string module_id, ModuleCapabilities capabilities, bool active = true);
    std::error_code set_active(std::string_view module_id, bool active);
    [[nodiscard]] std::vector<std::string> list_modules() const;

    [[nodiscard]] std::vector<std::string> list_active_modules() const override;
    [[nodiscard]] std::optional<ModuleCapabilities> get_module_capabilities(std::string_view module_id) const override;

private:
    mutable std::mutex mutex_{};
    std::map<std::string, ModuleCapabilities, std::less<>> modules_{};
    std::set<std::string, std::less<>> active_{};
};

}  // namespace dyntab::registry
