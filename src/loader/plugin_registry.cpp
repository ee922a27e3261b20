/// @file plugin_registry.cpp
/// @brief PluginRegistry implementation: pending markers, custom plugin
///        enumeration and bounded built-in resolution.

#include "intg/loader/plugin_registry.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

#include "intg/foundation/logger.hpp"

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;
using intg::foundation::LogCategory;
using intg::foundation::LogContext;
using intg::foundation::LogLevel;
using intg::foundation::Logger;

namespace intg::loader {

namespace {

using ResultMap = std::map<std::string, LoaderResult<PluginPtr>>;

/// Convert a resolution failure into the caller-facing Not-Found error.
LoaderError toNotFound(const std::string& domain, const LoaderError& error) {
    if (error.code() == ErrorCode::IntegrationNotFound) {
        return error;
    }
    return foundation::notFoundError(domain, std::string(error.message()));
}

}  // namespace

// ── PendingBatch ────────────────────────────────────────────────────────

class PluginRegistry::PendingBatch {
public:
    explicit PendingBatch(PluginRegistry& registry) : registry_(registry) {}

    ~PendingBatch() {
        if (promises_.empty()) {
            return;
        }
        {
            std::lock_guard lock(registry_.mutex_);
            for (const auto& [domain, promise] : promises_) {
                auto it = registry_.cache_.find(domain);
                if (it != registry_.cache_.end() && !it->second.plugin) {
                    registry_.cache_.erase(it);
                }
            }
        }
        for (auto& [domain, promise] : promises_) {
            promise.set_value();
        }
    }

    PendingBatch(const PendingBatch&) = delete;
    PendingBatch& operator=(const PendingBatch&) = delete;

    /// Create the marker for @p domain. Caller holds the registry mutex.
    std::shared_future<void> Add(const std::string& domain) {
        auto it = promises_.try_emplace(domain).first;
        return it->second.get_future().share();
    }

    /// Wake everyone waiting on @p domain. Commit the cache entry first.
    void Release(const std::string& domain) {
        auto it = promises_.find(domain);
        if (it == promises_.end()) {
            return;
        }
        it->second.set_value();
        promises_.erase(it);
    }

    [[nodiscard]] bool Empty() const noexcept { return promises_.empty(); }

    [[nodiscard]] std::vector<std::string> Domains() const {
        std::vector<std::string> out;
        out.reserve(promises_.size());
        for (const auto& [domain, promise] : promises_) {
            out.push_back(domain);
        }
        return out;
    }

private:
    PluginRegistry& registry_;
    std::map<std::string, std::promise<void>> promises_;
};

// ── PluginRegistry ──────────────────────────────────────────────────────

PluginRegistry::PluginRegistry(const IPluginFilesystem& fs, const HostConfig& config,
                               foundation::JobScheduler& scheduler)
    : fs_(fs),
      config_(config),
      scheduler_(scheduler),
      builtinSource_(fs, config.builtinRoot, PluginRoot::BuiltIn) {}

PluginRegistry::~PluginRegistry() = default;

LoaderResult<PluginPtr> PluginRegistry::Get(const std::string& domain) {
    auto results = GetMany({domain});
    auto it = results.find(domain);
    if (it == results.end()) {
        return LoaderResult<PluginPtr>::err(foundation::notFoundError(domain));
    }
    return std::move(it->second);
}

ResultMap PluginRegistry::GetMany(const std::vector<std::string>& domains) {
    ResultMap results;

    if (!config_.configDir) {
        INTG_LOG_ERROR(LogCategory::Registry,
                       "Can't load integrations - configuration directory is not set");
        for (const auto& domain : domains) {
            results.insert_or_assign(
                domain, LoaderResult<PluginPtr>::err(foundation::notFoundError(
                            domain, "configuration directory is not set")));
        }
        return results;
    }

    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& domain : domains) {
        if (seen.insert(domain).second) {
            unique.push_back(domain);
        }
    }

    PendingBatch batch(*this);
    std::vector<std::pair<std::string, std::shared_future<void>>> waits;
    {
        std::lock_guard lock(mutex_);
        for (const auto& domain : unique) {
            if (!IsValidDomain(domain)) {
                results.insert_or_assign(
                    domain, LoaderResult<PluginPtr>::err(foundation::invalidDomainError(domain)));
                continue;
            }
            auto it = cache_.find(domain);
            if (it != cache_.end()) {
                if (it->second.plugin) {
                    results.insert_or_assign(domain,
                                             LoaderResult<PluginPtr>::ok(it->second.plugin));
                } else {
                    waits.emplace_back(domain, it->second.pending);
                }
                continue;
            }
            cache_.emplace(domain, Entry{nullptr, batch.Add(domain)});
        }
    }

    // Our own markers are released before waiting on anyone else's, so two
    // overlapping batches can never wait on each other.
    if (!batch.Empty()) {
        try {
            resolvePending(batch, results);
        } catch (const std::exception& e) {
            LogContext ctx;
            ctx.extra["exception"] = e.what();
            Logger::instance().logWithContext(LogLevel::Error, LogCategory::Registry,
                                              "Unexpected error resolving integrations", ctx);
            for (const auto& domain : batch.Domains()) {
                results.insert_or_assign(
                    domain, LoaderResult<PluginPtr>::err(foundation::notFoundError(domain, e.what())));
            }
        }
    }

    for (auto& [domain, pending] : waits) {
        results.insert_or_assign(domain, awaitPending(domain, std::move(pending)));
    }
    return results;
}

void PluginRegistry::resolvePending(PendingBatch& batch, ResultMap& results) {
    auto domains = batch.Domains();
    INTG_LOG_DEBUG(LogCategory::Registry,
                   "Resolving " + std::to_string(domains.size()) + " integration(s)");

    ResultMap outcomes;
    // Without an enumeration every domain falls back to the built-in root.
    auto enumerated = GetCustomPlugins();
    auto custom = enumerated.hasValue() ? enumerated.value()
                                        : std::make_shared<const CustomPluginMap>();
    std::vector<std::string> builtin;
    for (const auto& domain : domains) {
        auto it = custom->find(domain);
        if (it != custom->end()) {
            outcomes.insert_or_assign(domain, LoaderResult<PluginPtr>::ok(it->second));
        } else {
            builtin.push_back(domain);
        }
    }
    if (!builtin.empty()) {
        for (auto& [domain, outcome] : resolveBuiltin(builtin)) {
            outcomes.insert_or_assign(domain, std::move(outcome));
        }
    }

    {
        std::lock_guard lock(mutex_);
        for (const auto& [domain, outcome] : outcomes) {
            if (outcome.hasValue()) {
                cache_.insert_or_assign(domain, Entry{outcome.value(), {}});
            } else {
                cache_.erase(domain);
            }
        }
    }

    for (auto& [domain, outcome] : outcomes) {
        batch.Release(domain);
        if (outcome.hasValue()) {
            results.insert_or_assign(domain, std::move(outcome));
        } else {
            results.insert_or_assign(
                domain, LoaderResult<PluginPtr>::err(toNotFound(domain, outcome.error())));
        }
    }
}

ResultMap PluginRegistry::resolveBuiltin(const std::vector<std::string>& domains) {
    auto workers = std::max<std::size_t>(1, std::min(scheduler_.workerCount(), domains.size()));
    std::vector<std::vector<std::string>> buckets(workers);
    for (std::size_t i = 0; i < domains.size(); ++i) {
        buckets[i % workers].push_back(domains[i]);
    }

    struct Pending {
        std::vector<std::string> domains;
        std::shared_ptr<ResultMap> out;
        std::optional<foundation::JobScheduler::JobId> job;
        std::optional<LoaderError> failure;
    };
    std::vector<Pending> jobs;
    jobs.reserve(buckets.size());

    for (auto& bucket : buckets) {
        Pending pending{std::move(bucket), std::make_shared<ResultMap>(), std::nullopt,
                        std::nullopt};
        auto id = scheduler_.schedule(
            [source = &builtinSource_, work = pending.domains, out = pending.out] {
                *out = source->ResolveMany(work);
            });
        if (id.hasValue()) {
            pending.job = id.value();
        } else {
            pending.failure = std::move(id).error();
        }
        jobs.push_back(std::move(pending));
    }

    ResultMap results;
    for (auto& pending : jobs) {
        if (pending.job) {
            auto waited = scheduler_.wait(*pending.job);
            if (waited.hasError()) {
                pending.failure = std::move(waited).error();
            }
        }
        if (pending.failure) {
            INTG_LOG_ERROR(LogCategory::Registry,
                           "Built-in resolution job failed: " +
                               std::string(pending.failure->message()));
            for (const auto& domain : pending.domains) {
                results.insert_or_assign(domain, LoaderResult<PluginPtr>::err(*pending.failure));
            }
            continue;
        }
        for (auto& [domain, outcome] : *pending.out) {
            results.insert_or_assign(domain, std::move(outcome));
        }
    }
    return results;
}

LoaderResult<PluginPtr> PluginRegistry::awaitPending(const std::string& domain,
                                                     std::shared_future<void> pending) {
    while (true) {
        pending.wait();
        std::lock_guard lock(mutex_);
        auto it = cache_.find(domain);
        if (it == cache_.end()) {
            return LoaderResult<PluginPtr>::err(foundation::notFoundError(domain));
        }
        if (it->second.plugin) {
            return LoaderResult<PluginPtr>::ok(it->second.plugin);
        }
        // The previous attempt failed and a new one is already running.
        pending = it->second.pending;
    }
}

// ── Custom plugins ──────────────────────────────────────────────────────

LoaderResult<std::shared_ptr<const CustomPluginMap>> PluginRegistry::GetCustomPlugins() {
    using EnumerationResult = LoaderResult<std::shared_ptr<const CustomPluginMap>>;
    std::unique_lock lock(mutex_);
    while (!customPlugins_ && customPending_) {
        auto pending = *customPending_;
        lock.unlock();
        pending.wait();
        lock.lock();
    }
    if (customPlugins_) {
        return EnumerationResult::ok(customPlugins_);
    }

    std::promise<void> promise;
    customPending_ = promise.get_future().share();
    lock.unlock();

    LoaderResult<CustomPluginMap> enumerated = LoaderResult<CustomPluginMap>::ok({});
    try {
        enumerated = enumerateCustomPlugins();
    } catch (const std::exception& e) {
        enumerated = LoaderResult<CustomPluginMap>::err(
            LoaderError(ErrorCode::UnexpectedException, e.what()));
    }

    std::shared_ptr<const CustomPluginMap> out;
    lock.lock();
    customPending_.reset();
    if (enumerated.hasValue()) {
        customPlugins_ = std::make_shared<const CustomPluginMap>(std::move(enumerated).value());
        out = customPlugins_;
    }
    lock.unlock();
    promise.set_value();

    if (enumerated.hasError()) {
        LogContext ctx;
        ctx.path = config_.CustomRoot().string();
        ctx.extra["cause"] = std::string(enumerated.error().message());
        Logger::instance().logWithContext(LogLevel::Error, LogCategory::Registry,
                                          "Unable to enumerate custom integrations", ctx);
        return EnumerationResult::err(std::move(enumerated).error());
    }
    return EnumerationResult::ok(std::move(out));
}

LoaderResult<CustomPluginMap> PluginRegistry::enumerateCustomPlugins() {
    if (config_.safeMode || !config_.configDir) {
        return LoaderResult<CustomPluginMap>::ok({});
    }

    auto source = std::make_shared<const PluginSource>(fs_, config_.CustomRoot(),
                                                       PluginRoot::Custom);
    auto out = std::make_shared<LoaderResult<CustomPluginMap>>(
        LoaderResult<CustomPluginMap>::ok({}));

    auto id = scheduler_.schedule([source, out] {
        auto domains = source->ListDomains();
        if (domains.hasError()) {
            *out = LoaderResult<CustomPluginMap>::err(std::move(domains).error());
            return;
        }
        CustomPluginMap plugins;
        for (auto& [directory, result] : source->ResolveMany(domains.value())) {
            if (result.hasValue()) {
                plugins.insert_or_assign(result.value()->Domain(), result.value());
            }
        }
        *out = LoaderResult<CustomPluginMap>::ok(std::move(plugins));
    });
    if (id.hasError()) {
        return LoaderResult<CustomPluginMap>::err(std::move(id).error());
    }
    auto waited = scheduler_.wait(id.value());
    if (waited.hasError()) {
        return LoaderResult<CustomPluginMap>::err(std::move(waited).error());
    }
    return std::move(*out);
}

// ── Queries ─────────────────────────────────────────────────────────────

PluginPtr PluginRegistry::GetCached(const std::string& domain) const {
    std::lock_guard lock(mutex_);
    auto it = cache_.find(domain);
    if (it == cache_.end()) {
        return nullptr;
    }
    return it->second.plugin;
}

std::vector<std::string> PluginRegistry::CachedDomains() const {
    std::vector<std::string> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [domain, entry] : cache_) {
            if (entry.plugin) {
                out.push_back(domain);
            }
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace intg::loader
