/// @file component_registry.cpp
/// @brief ComponentHandle and ComponentRegistry implementation.

#include "intg/loader/component_registry.hpp"

#include "intg/foundation/logger.hpp"
#include "intg/loader/plugin_registry.hpp"

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;
using intg::foundation::LogCategory;

namespace intg::loader {

// ── ComponentHandle ─────────────────────────────────────────────────────

ComponentHandle::ComponentHandle(ModuleHandle module) : module_(std::move(module)) {}

LoaderResult<CapabilityFn> ComponentHandle::GetCapability(const std::string& name) {
    std::lock_guard lock(mutex_);
    if (auto it = resolved_.find(name); it != resolved_.end()) {
        return LoaderResult<CapabilityFn>::ok(it->second);
    }

    const auto* fn = module_->Capabilities().Find(name);
    if (fn == nullptr) {
        return LoaderResult<CapabilityFn>::err(LoaderError(
            ErrorCode::CapabilityNotFound,
            "Module " + module_->Name() + " has no capability '" + name + "'"));
    }
    resolved_.emplace(name, *fn);
    return LoaderResult<CapabilityFn>::ok(*fn);
}

LoaderResult<std::string> ComponentHandle::Invoke(const std::string& name,
                                                  const CapabilityArgs& args) {
    auto capability = GetCapability(name);
    if (capability.hasError()) {
        return LoaderResult<std::string>::err(std::move(capability).error());
    }
    return capability.value()(args);
}

// ── ComponentRegistry ───────────────────────────────────────────────────

ComponentRegistry::ComponentRegistry(PluginRegistry& plugins, ModuleLoader& modules)
    : plugins_(plugins), modules_(modules) {}

LoaderResult<ComponentHandlePtr> ComponentRegistry::GetComponent(const std::string& name) {
    {
        std::lock_guard lock(mutex_);
        if (auto it = components_.find(name); it != components_.end()) {
            return LoaderResult<ComponentHandlePtr>::ok(it->second);
        }
    }

    auto plugin = plugins_.GetCached(name);
    auto module = plugin ? modules_.LoadForPlugin(*plugin) : modules_.Load(name);
    if (module.hasError()) {
        INTG_LOG_DEBUG(LogCategory::Module, "Unable to load " + name + ": " +
                                                std::string(module.error().message()));
        return LoaderResult<ComponentHandlePtr>::err(std::move(module).error());
    }

    auto handle = std::make_shared<ComponentHandle>(std::move(module).value());
    std::lock_guard lock(mutex_);
    return LoaderResult<ComponentHandlePtr>::ok(
        components_.try_emplace(name, std::move(handle)).first->second);
}

LoaderResult<ComponentHandlePtr> ComponentRegistry::GetHelper(const std::string& name) {
    {
        std::lock_guard lock(mutex_);
        if (auto it = helpers_.find(name); it != helpers_.end()) {
            return LoaderResult<ComponentHandlePtr>::ok(it->second);
        }
    }

    auto module = modules_.LoadHelper(name);
    if (module.hasError()) {
        return LoaderResult<ComponentHandlePtr>::err(std::move(module).error());
    }

    auto handle = std::make_shared<ComponentHandle>(std::move(module).value());
    std::lock_guard lock(mutex_);
    return LoaderResult<ComponentHandlePtr>::ok(
        helpers_.try_emplace(name, std::move(handle)).first->second);
}

}  // namespace intg::loader
