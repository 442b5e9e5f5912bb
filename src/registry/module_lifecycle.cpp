#include "dyntab/registry/module_lifecycle.hpp"

#include "dyntab/common/engine_errors.hpp"

#include <utility>

namespace dyntab::registry {

void StaticModuleLifecycle::add_module(std::string module_id, ModuleCapabilities capabilities, bool active)
{
    std::scoped_lock lock(mutex_);
    if (active) {
        active_.insert(module_id);
    } else {
        active_.erase(module_id);
    }
    modules_.insert_or_assign(std::move(module_id), std::move(capabilities));
}

std::error_code StaticModuleLifecycle::set_active(std::string_view module_id, bool active)
{
    std::scoped_lock lock(mutex_);
    if (modules_.find(module_id) == modules_.end()) {
        return make_error_code(common::EngineErrc::ModuleNotFound);
    }
    if (active) {
        active_.emplace(module_id);
    } else if (auto it = active_.find(module_id); it != active_.end()) {
        active_.erase(it);
    }
    return {};
}

std::vector<std::string> StaticModuleLifecycle::list_modules() const
{
    std::scoped_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(modules_.size());
    for (const auto& [module_id, capabilities] : modules_) {
        result.push_back(module_id);
    }
    return result;
}

std::vector<std::string> StaticModuleLifecycle::list_active_modules() const
{
    std::scoped_lock lock(mutex_);
    return {active_.begin(), active_.end()};
}

std::optional<ModuleCapabilities> StaticModuleLifecycle::get_module_capabilities(std::string_view module_id) const
{
    std::scoped_lock lock(mutex_);
    auto it = modules_.find(module_id);
    if (it == modules_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace dyntab::registry
