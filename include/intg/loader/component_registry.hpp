#pragma once

/// @file component_registry.hpp
/// @brief Facade handing out memoized component and helper handles.

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "intg/foundation/loader_result.hpp"
#include "intg/loader/module.hpp"
#include "intg/loader/module_loader.hpp"

namespace intg::loader {

class PluginRegistry;

/// A loaded module as seen by callers.
///
/// Capabilities are looked up on first use and memoized on the handle.
class ComponentHandle {
public:
    explicit ComponentHandle(ModuleHandle module);

    ComponentHandle(const ComponentHandle&) = delete;
    ComponentHandle& operator=(const ComponentHandle&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept { return module_->Name(); }
    [[nodiscard]] const ModuleHandle& Module() const noexcept { return module_; }

    /// Resolve a capability by name.
    ///
    /// @return The callable, or CapabilityNotFound.
    [[nodiscard]] foundation::LoaderResult<CapabilityFn> GetCapability(const std::string& name);

    /// Resolve and call a capability.
    [[nodiscard]] foundation::LoaderResult<std::string> Invoke(const std::string& name,
                                                               const CapabilityArgs& args);

private:
    ModuleHandle module_;

    std::mutex mutex_;
    std::unordered_map<std::string, CapabilityFn> resolved_;
};

using ComponentHandlePtr = std::shared_ptr<ComponentHandle>;

/// Component and helper lookup by name.
///
/// A component whose plugin is already in the plugin cache is loaded from
/// that plugin's root; anything else goes through the legacy module search.
/// Handles are memoized per name for the registry's lifetime.
class ComponentRegistry {
public:
    ComponentRegistry(PluginRegistry& plugins, ModuleLoader& modules);

    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;

    /// @return The handle, or ModuleNotFound / ModuleLoadFailed.
    [[nodiscard]] foundation::LoaderResult<ComponentHandlePtr> GetComponent(
        const std::string& name);

    /// @return The handle, or ModuleNotFound / ModuleLoadFailed.
    [[nodiscard]] foundation::LoaderResult<ComponentHandlePtr> GetHelper(const std::string& name);

private:
    PluginRegistry& plugins_;
    ModuleLoader& modules_;

    std::mutex mutex_;
    std::unordered_map<std::string, ComponentHandlePtr> components_;
    std::unordered_map<std::string, ComponentHandlePtr> helpers_;
};

}  // namespace intg::loader
