#pragma once

/// @file host_context.hpp
/// @brief HostContext: owns every loader component of one host.

#include <memory>

#include "intg/foundation/config_manager.hpp"
#include "intg/foundation/job_scheduler.hpp"
#include "intg/foundation/loader_result.hpp"
#include "intg/loader/component_registry.hpp"
#include "intg/loader/dependency_resolver.hpp"
#include "intg/loader/discovery_aggregator.hpp"
#include "intg/loader/filesystem.hpp"
#include "intg/loader/host_config.hpp"
#include "intg/loader/module_loader.hpp"
#include "intg/loader/plugin_registry.hpp"

namespace intg::loader {

/// Typed state of one host.
///
/// Components hold references into the context, so it is neither copyable
/// nor movable; keep it behind a unique_ptr or on the stack.
///
/// Example:
/// @code
///   intg::foundation::ConfigManager config;
///   config.load("host.yaml");
///   auto host = HostContext::Create(config);
///   auto hue = host.value()->Plugins().Get("hue");
///   if (hue && host.value()->Dependencies().Resolve(*hue.value())) { ... }
/// @endcode
class HostContext {
public:
    explicit HostContext(HostConfig config,
                         std::unique_ptr<IPluginFilesystem> fs = std::make_unique<DiskFilesystem>(),
                         BuiltinDiscoveryTables builtinTables = {});
    ~HostContext();

    HostContext(const HostContext&) = delete;
    HostContext& operator=(const HostContext&) = delete;
    HostContext(HostContext&&) = delete;
    HostContext& operator=(HostContext&&) = delete;

    /// Build a context from host configuration, loading the built-in
    /// discovery tables when "loader.builtin_discovery_tables" is set.
    ///
    /// @param fs  Filesystem to use; the real disk when null.
    [[nodiscard]] static foundation::LoaderResult<std::unique_ptr<HostContext>> Create(
        const foundation::ConfigManager& config, std::unique_ptr<IPluginFilesystem> fs = nullptr);

    [[nodiscard]] const HostConfig& Config() const noexcept { return config_; }
    [[nodiscard]] const IPluginFilesystem& Filesystem() const noexcept { return *fs_; }
    [[nodiscard]] foundation::JobScheduler& Scheduler() noexcept { return scheduler_; }
    [[nodiscard]] PluginRegistry& Plugins() noexcept { return plugins_; }
    [[nodiscard]] DependencyResolver& Dependencies() noexcept { return dependencies_; }
    [[nodiscard]] DiscoveryAggregator& Discovery() noexcept { return discovery_; }
    [[nodiscard]] ModuleLoader& Modules() noexcept { return modules_; }
    [[nodiscard]] ComponentRegistry& Components() noexcept { return components_; }

private:
    HostConfig config_;
    std::unique_ptr<IPluginFilesystem> fs_;
    foundation::JobScheduler scheduler_;
    PluginRegistry plugins_;
    DependencyResolver dependencies_;
    DiscoveryAggregator discovery_;
    ModuleLoader modules_;
    ComponentRegistry components_;
};

}  // namespace intg::loader
