#pragma once

/// @file host_config.hpp
/// @brief Typed host settings consumed by the loader components.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "intg/foundation/config_manager.hpp"
#include "intg/foundation/job_scheduler.hpp"
#include "intg/foundation/loader_result.hpp"

namespace intg::loader {

/// Host settings read from the "host" and "loader" config sections.
///
/// @code
///   host:
///     config_dir: /srv/config
///     safe_mode: false
///   loader:
///     builtin_root: /usr/share/intg/components
///     custom_dir: custom_components
///     max_load_concurrency: 4
///     builtin_discovery_tables: /usr/share/intg/discovery.json
/// @endcode
struct HostConfig {
    /// Required for any loading; unset means every lookup fails.
    std::optional<std::filesystem::path> configDir;
    /// Disables the custom root entirely.
    bool safeMode = false;
    std::filesystem::path builtinRoot = "./components";
    std::string customDir = "custom_components";
    std::size_t maxLoadConcurrency = foundation::kMaxLoadConcurrency;
    std::optional<std::filesystem::path> builtinDiscoveryTables;

    /// <config dir>/<custom dir>; empty path when the config dir is unset.
    [[nodiscard]] std::filesystem::path CustomRoot() const;

    /// Build from a loaded ConfigManager. Missing keys keep their defaults.
    ///
    /// @return ConfigTypeMismatch if a present key has the wrong type, or
    ///         InvalidArgument for a concurrency limit of zero or above
    ///         kMaxLoadConcurrency.
    [[nodiscard]] static foundation::LoaderResult<HostConfig> FromConfig(
        const foundation::ConfigManager& config);
};

}  // namespace intg::loader
