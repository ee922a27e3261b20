/// @file dependency_resolver.cpp
/// @brief Depth-first dependency closure.

#include "intg/loader/dependency_resolver.hpp"

#include <algorithm>

#include "intg/foundation/logger.hpp"
#include "intg/loader/plugin_registry.hpp"

using intg::foundation::CircularDependencyInfo;
using intg::foundation::DomainErrorInfo;
using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;
using intg::foundation::LogCategory;

namespace intg::loader {

DependencyResolver::DependencyResolver(PluginRegistry& registry) : registry_(registry) {}

bool DependencyResolver::Resolve(const Plugin& plugin) {
    switch (plugin.GetDependencyState()) {
        case DependencyState::Resolved: return true;
        case DependencyState::Failed:   return false;
        case DependencyState::Unresolved: break;
    }

    auto closure = ComputeDependencies(plugin);
    if (closure.hasValue()) {
        plugin.commitDependencies(std::move(closure).value());
        return plugin.GetDependencyState() == DependencyState::Resolved;
    }

    const auto& error = closure.error();
    if (const auto* circular = error.context<CircularDependencyInfo>()) {
        INTG_LOG_ERROR(LogCategory::Dependency,
                       "Unable to resolve dependencies for " + plugin.Domain() +
                           ":  it contains a circular dependency: " + circular->fromDomain +
                           " -> " + circular->toDomain);
    } else if (const auto* missing = error.context<DomainErrorInfo>()) {
        INTG_LOG_ERROR(LogCategory::Dependency,
                       "Unable to resolve dependencies for " + plugin.Domain() +
                           ":  we are unable to resolve (sub)dependency " + missing->domain);
    } else {
        INTG_LOG_ERROR(LogCategory::Dependency,
                       "Unable to resolve dependencies for " + plugin.Domain() + ": " +
                           std::string(error.message()));
    }

    plugin.markDependenciesFailed();
    return plugin.GetDependencyState() == DependencyState::Resolved;
}

LoaderResult<std::set<std::string>> DependencyResolver::ComputeDependencies(const Plugin& plugin) {
    std::set<std::string> loaded;
    std::set<std::string> loading;
    auto walked = visit(plugin.Domain(), plugin, loaded, loading);
    if (walked.hasError()) {
        return LoaderResult<std::set<std::string>>::err(std::move(walked).error());
    }
    loaded.erase(plugin.Domain());
    return LoaderResult<std::set<std::string>>::ok(std::move(loaded));
}

LoaderResult<void> DependencyResolver::visit(const std::string& startDomain, const Plugin& plugin,
                                             std::set<std::string>& loaded,
                                             std::set<std::string>& loading) {
    const auto& domain = plugin.Domain();
    loading.insert(domain);

    for (const auto& dependency : plugin.Dependencies()) {
        if (loaded.count(dependency) != 0) {
            continue;
        }
        if (loading.count(dependency) != 0) {
            return LoaderResult<void>::err(foundation::circularDependencyError(domain, dependency));
        }

        loaded.insert(dependency);

        auto fetched = registry_.Get(dependency);
        if (fetched.hasError()) {
            const auto& error = fetched.error();
            if (error.code() == ErrorCode::IntegrationNotFound) {
                return LoaderResult<void>::err(std::move(fetched).error());
            }
            return LoaderResult<void>::err(
                foundation::notFoundError(dependency, std::string(error.message())));
        }
        const auto& depPlugin = *fetched.value();

        const auto& after = depPlugin.AfterDependencies();
        if (std::find(after.begin(), after.end(), startDomain) != after.end()) {
            return LoaderResult<void>::err(
                foundation::circularDependencyError(startDomain, dependency));
        }

        if (!depPlugin.Dependencies().empty()) {
            auto nested = visit(startDomain, depPlugin, loaded, loading);
            if (nested.hasError()) {
                return nested;
            }
        }
    }

    loaded.insert(domain);
    loading.erase(domain);
    return LoaderResult<void>::ok();
}

}  // namespace intg::loader
