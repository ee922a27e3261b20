#pragma once

/// @file dependency_resolver.hpp
/// @brief Transitive dependency closure with cycle detection.

#include <set>
#include <string>

#include "intg/foundation/loader_result.hpp"
#include "intg/loader/plugin.hpp"

namespace intg::loader {

class PluginRegistry;

/// Computes and memoizes each plugin's transitive dependency closure.
///
/// Depth-first traversal carrying a @c loaded set (already visited or
/// claimed) and a @c loading set (current path). A dependency found on the
/// current path closes a cycle. A dependency that lists the start domain in
/// its after_dependencies also counts as a cycle back to the start.
///
/// Concurrent first calls for the same plugin are not coalesced; each
/// computes the closure and the first commit wins.
class DependencyResolver {
public:
    explicit DependencyResolver(PluginRegistry& registry);

    /// Resolve and memoize the closure on @p plugin.
    ///
    /// @return true once Resolved, false once Failed. Failures are terminal
    ///         for the plugin object and logged with the offending domains.
    bool Resolve(const Plugin& plugin);

    /// Uncached traversal exposing the precise failure.
    ///
    /// @return The closure excluding the plugin's own domain, or
    ///         IntegrationNotFound naming the missing (sub)dependency, or
    ///         CircularDependency with the edge that closed the cycle.
    [[nodiscard]] foundation::LoaderResult<std::set<std::string>> ComputeDependencies(
        const Plugin& plugin);

private:
    foundation::LoaderResult<void> visit(const std::string& startDomain, const Plugin& plugin,
                                         std::set<std::string>& loaded,
                                         std::set<std::string>& loading);

    PluginRegistry& registry_;
};

}  // namespace intg::loader
