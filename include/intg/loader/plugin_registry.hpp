#pragma once

/// @file plugin_registry.hpp
/// @brief Process-wide plugin cache with coalesced concurrent resolution.

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "intg/foundation/job_scheduler.hpp"
#include "intg/foundation/loader_result.hpp"
#include "intg/loader/filesystem.hpp"
#include "intg/loader/host_config.hpp"
#include "intg/loader/plugin.hpp"
#include "intg/loader/plugin_source.hpp"

namespace intg::loader {

/// Custom plugins keyed by manifest domain.
using CustomPluginMap = std::map<std::string, PluginPtr>;

/// Resolves domains to Plugin objects and caches them for its lifetime.
///
/// Each cache entry is absent, pending or resolved. A missing domain is
/// marked pending before any filesystem work starts, so concurrent callers
/// asking for the same domain wait on the same shared future instead of
/// probing twice. Failures are never cached: the pending entry is removed
/// and the next request probes again.
///
/// Lookup order per domain: the custom plugin enumeration (itself cached
/// behind a pending marker), then the built-in root. Filesystem work runs on
/// the JobScheduler; only requesting threads mutate the cache.
///
/// Thread-safe.
class PluginRegistry {
public:
    PluginRegistry(const IPluginFilesystem& fs, const HostConfig& config,
                   foundation::JobScheduler& scheduler);
    ~PluginRegistry();

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /// Resolve a single domain.
    ///
    /// @return The plugin, InvalidDomain or IntegrationNotFound.
    [[nodiscard]] foundation::LoaderResult<PluginPtr> Get(const std::string& domain);

    /// Resolve several domains. Duplicates are coalesced.
    ///
    /// Every requested domain has an entry in the result. Not-found results
    /// keep the underlying failure in DomainErrorInfo::cause.
    [[nodiscard]] std::map<std::string, foundation::LoaderResult<PluginPtr>> GetMany(
        const std::vector<std::string>& domains);

    /// The cached custom plugin enumeration. Empty in safe mode, without a
    /// config directory, or when the custom root does not exist.
    ///
    /// @return The enumeration, or the error that stopped it. A failed
    ///         enumeration is logged and not cached; the next call retries.
    [[nodiscard]] foundation::LoaderResult<std::shared_ptr<const CustomPluginMap>>
    GetCustomPlugins();

    /// Non-blocking lookup of an already resolved plugin (nullptr otherwise).
    [[nodiscard]] PluginPtr GetCached(const std::string& domain) const;

    /// Domains with a resolved cache entry, sorted.
    [[nodiscard]] std::vector<std::string> CachedDomains() const;

    [[nodiscard]] const HostConfig& Config() const noexcept { return config_; }

private:
    struct Entry {
        PluginPtr plugin;
        std::shared_future<void> pending;
    };

    /// Pending markers owned by one GetMany call. Releases every marker it
    /// still holds on destruction, so waiters never block on an abandoned
    /// resolution.
    class PendingBatch;

    /// Resolve the domains this call marked pending and commit the results.
    void resolvePending(PendingBatch& batch,
                        std::map<std::string, foundation::LoaderResult<PluginPtr>>& results);

    /// Resolve built-in domains on the worker pool.
    std::map<std::string, foundation::LoaderResult<PluginPtr>> resolveBuiltin(
        const std::vector<std::string>& domains);

    /// Wait for another caller's resolution of @p domain and read the outcome.
    foundation::LoaderResult<PluginPtr> awaitPending(const std::string& domain,
                                                     std::shared_future<void> pending);

    /// Enumerate and resolve every custom plugin (runs on the worker pool).
    foundation::LoaderResult<CustomPluginMap> enumerateCustomPlugins();

    const IPluginFilesystem& fs_;
    const HostConfig& config_;
    foundation::JobScheduler& scheduler_;
    PluginSource builtinSource_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> cache_;
    std::shared_ptr<const CustomPluginMap> customPlugins_;
    std::optional<std::shared_future<void>> customPending_;
};

}  // namespace intg::loader
