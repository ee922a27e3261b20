#pragma once

/// @file plugin_source.hpp
/// @brief Resolves plugins from one plugin root directory.

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "intg/foundation/loader_result.hpp"
#include "intg/loader/filesystem.hpp"
#include "intg/loader/plugin.hpp"

namespace intg::loader {

/// Remediation pointer appended to version gate errors.
inline constexpr std::string_view kVersionDocsHint =
    "Add a \"version\" key with a CalVer, SemVer, SimpleVer or PEP 440 release "
    "value to the integration's manifest.json";

/// Builds Plugin objects from `<root>/<domain>/manifest.json`.
///
/// Stateless apart from its configuration; safe to call from worker
/// threads. Never touches the registry cache.
///
/// Custom roots apply a version gate: a plugin without a "version" key, or
/// with one that matches none of the accepted strategies, is blocked. The
/// gate is skipped for the built-in root.
class PluginSource {
public:
    PluginSource(const IPluginFilesystem& fs, std::filesystem::path root, PluginRoot kind);

    [[nodiscard]] const std::filesystem::path& RootPath() const noexcept { return root_; }
    [[nodiscard]] PluginRoot Kind() const noexcept { return kind_; }

    /// Probe, parse and construct the plugin for @p domain.
    ///
    /// @return The plugin, or IntegrationNotFound (no manifest),
    ///         FilesystemError, ManifestParseFailed, ManifestInvalid,
    ///         VersionMissing, VersionInvalid.
    [[nodiscard]] foundation::LoaderResult<PluginPtr> ResolveFromRoot(
        const std::string& domain) const;

    /// Resolve every domain, isolating failures per domain.
    ///
    /// Unexpected exceptions are logged and reported as UnexpectedException
    /// for that domain only.
    [[nodiscard]] std::map<std::string, foundation::LoaderResult<PluginPtr>> ResolveMany(
        const std::vector<std::string>& domains) const;

    /// Subdirectory names of the root. Empty when the root does not exist.
    [[nodiscard]] foundation::LoaderResult<std::vector<std::string>> ListDomains() const;

private:
    [[nodiscard]] foundation::LoaderResult<void> checkVersionGate(const Manifest& manifest) const;

    const IPluginFilesystem& fs_;
    std::filesystem::path root_;
    PluginRoot kind_;
};

}  // namespace intg::loader
