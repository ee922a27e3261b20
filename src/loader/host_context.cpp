/// @file host_context.cpp
/// @brief HostContext wiring.

#include "intg/loader/host_context.hpp"

#include "intg/foundation/logger.hpp"

using intg::foundation::LoaderResult;
using intg::foundation::LogCategory;

namespace intg::loader {

HostContext::HostContext(HostConfig config, std::unique_ptr<IPluginFilesystem> fs,
                         BuiltinDiscoveryTables builtinTables)
    : config_(std::move(config)),
      fs_(fs ? std::move(fs) : std::make_unique<DiskFilesystem>()),
      scheduler_(config_.maxLoadConcurrency),
      plugins_(*fs_, config_, scheduler_),
      dependencies_(plugins_),
      discovery_(plugins_, std::move(builtinTables)),
      modules_(*fs_, config_, *this),
      components_(plugins_, modules_) {
    INTG_LOG_DEBUG(LogCategory::Core,
                   "Host context ready (safe mode " +
                       std::string(config_.safeMode ? "on" : "off") + ", " +
                       std::to_string(scheduler_.workerCount()) + " load workers)");
}

HostContext::~HostContext() = default;

LoaderResult<std::unique_ptr<HostContext>> HostContext::Create(
    const foundation::ConfigManager& config, std::unique_ptr<IPluginFilesystem> fs) {
    auto hostConfig = HostConfig::FromConfig(config);
    if (hostConfig.hasError()) {
        return LoaderResult<std::unique_ptr<HostContext>>::err(std::move(hostConfig).error());
    }

    auto tablesPath = hostConfig.value().builtinDiscoveryTables;
    auto host = std::make_unique<HostContext>(std::move(hostConfig).value(), std::move(fs));
    if (tablesPath) {
        auto loaded = host->Discovery().LoadBuiltinDiscoveryTables(host->Filesystem(), *tablesPath);
        if (loaded.hasError()) {
            return LoaderResult<std::unique_ptr<HostContext>>::err(std::move(loaded).error());
        }
    }
    return LoaderResult<std::unique_ptr<HostContext>>::ok(std::move(host));
}

}  // namespace intg::loader
