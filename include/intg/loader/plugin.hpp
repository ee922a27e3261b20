#pragma once

/// @file plugin.hpp
/// @brief Plugin: a manifest bound to the directory and root it was found in.

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "intg/foundation/loader_result.hpp"
#include "intg/loader/manifest.hpp"

namespace intg::loader {

/// Which plugin root a plugin was resolved from.
enum class PluginRoot : uint8_t {
    Custom,  ///< <config dir>/<custom dir>, user supplied
    BuiltIn  ///< Shipped with the host
};

[[nodiscard]] std::string_view pluginRootName(PluginRoot root) noexcept;

/// True if @p domain can name a plugin directory: non-empty, and free of
/// '.' and path separators.
[[nodiscard]] bool IsValidDomain(std::string_view domain) noexcept;

/// Lifecycle of the transitive dependency closure.
enum class DependencyState : uint8_t {
    Unresolved,
    Resolved,
    Failed
};

/// Loaded plugin descriptor.
///
/// Created once per domain and cached by the PluginRegistry. Everything is
/// immutable except the dependency closure, which transitions exactly once
/// from Unresolved to Resolved or Failed. A plugin without dependencies is
/// constructed already Resolved with an empty closure.
class Plugin {
public:
    Plugin(Manifest manifest, std::filesystem::path directory, PluginRoot root);

    Plugin(const Plugin&) = delete;
    Plugin& operator=(const Plugin&) = delete;

    // ── Manifest accessors ─────────────────────────────────────────────

    [[nodiscard]] const Manifest& GetManifest() const noexcept { return manifest_; }
    [[nodiscard]] const std::string& Domain() const noexcept { return manifest_.domain; }
    [[nodiscard]] const std::string& Name() const noexcept { return manifest_.name; }

    [[nodiscard]] const std::vector<std::string>& Dependencies() const noexcept {
        return manifest_.dependencies;
    }

    [[nodiscard]] const std::vector<std::string>& AfterDependencies() const noexcept {
        return manifest_.afterDependencies;
    }

    [[nodiscard]] bool HasConfigFlow() const noexcept { return manifest_.configFlow; }

    [[nodiscard]] IntegrationType Type() const noexcept { return manifest_.integrationType; }

    [[nodiscard]] const std::optional<std::string>& Version() const noexcept {
        return manifest_.version;
    }

    /// Reason the plugin is disabled, if any.
    [[nodiscard]] const std::optional<std::string>& Disabled() const noexcept {
        return manifest_.disabled;
    }

    // ── Location ───────────────────────────────────────────────────────

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return directory_; }
    [[nodiscard]] PluginRoot Root() const noexcept { return root_; }
    [[nodiscard]] bool IsBuiltIn() const noexcept { return root_ == PluginRoot::BuiltIn; }

    // ── Dependency closure ─────────────────────────────────────────────

    [[nodiscard]] DependencyState GetDependencyState() const;

    /// True once the closure is either Resolved or Failed.
    [[nodiscard]] bool AllDependenciesResolved() const;

    /// The transitive dependency closure, excluding this plugin's domain.
    ///
    /// @return DependenciesNotResolved while Unresolved or after a failure.
    [[nodiscard]] foundation::LoaderResult<std::set<std::string>> AllDependencies() const;

    /// "<Plugin domain: directory>"
    [[nodiscard]] std::string ToString() const;

private:
    friend class DependencyResolver;

    /// Record a successful closure. No-op unless Unresolved.
    bool commitDependencies(std::set<std::string> closure) const;

    /// Record a terminal failure. No-op unless Unresolved.
    bool markDependenciesFailed() const;

    Manifest manifest_;
    std::filesystem::path directory_;
    PluginRoot root_;

    mutable std::mutex stateMutex_;
    mutable DependencyState state_ = DependencyState::Unresolved;
    mutable std::set<std::string> allDependencies_;
};

using PluginPtr = std::shared_ptr<const Plugin>;

}  // namespace intg::loader
