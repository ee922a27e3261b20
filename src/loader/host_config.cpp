/// @file host_config.cpp
/// @brief HostConfig construction from ConfigManager.

#include "intg/loader/host_config.hpp"

#include <string>

using intg::foundation::ConfigManager;
using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;

namespace intg::loader {

namespace {

/// Read @p key into @p out when present; propagate type mismatches.
template <typename T, typename Out>
LoaderResult<void> readOptional(const ConfigManager& config, std::string_view key, Out& out) {
    auto value = config.get<T>(key);
    if (value.hasValue()) {
        out = std::move(value).value();
        return LoaderResult<void>::ok();
    }
    if (value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return LoaderResult<void>::ok();
    }
    return LoaderResult<void>::err(std::move(value).error());
}

}  // namespace

std::filesystem::path HostConfig::CustomRoot() const {
    if (!configDir) {
        return {};
    }
    return *configDir / customDir;
}

LoaderResult<HostConfig> HostConfig::FromConfig(const ConfigManager& config) {
    HostConfig out;

    std::optional<std::string> configDir;
    std::string builtinRoot = out.builtinRoot.string();
    std::optional<std::string> tables;
    int concurrency = static_cast<int>(out.maxLoadConcurrency);

    for (auto result : {readOptional<std::string>(config, "host.config_dir", configDir),
                        readOptional<bool>(config, "host.safe_mode", out.safeMode),
                        readOptional<std::string>(config, "loader.builtin_root", builtinRoot),
                        readOptional<std::string>(config, "loader.custom_dir", out.customDir),
                        readOptional<int>(config, "loader.max_load_concurrency", concurrency),
                        readOptional<std::string>(config, "loader.builtin_discovery_tables",
                                                  tables)}) {
        if (result.hasError()) {
            return LoaderResult<HostConfig>::err(std::move(result).error());
        }
    }

    if (concurrency <= 0) {
        return LoaderResult<HostConfig>::err(LoaderError(
            ErrorCode::InvalidArgument, "loader.max_load_concurrency must be positive"));
    }
    if (static_cast<std::size_t>(concurrency) > foundation::kMaxLoadConcurrency) {
        return LoaderResult<HostConfig>::err(
            LoaderError(ErrorCode::InvalidArgument,
                        "loader.max_load_concurrency must not exceed " +
                            std::to_string(foundation::kMaxLoadConcurrency)));
    }
    if (configDir && !configDir->empty()) {
        out.configDir = std::filesystem::path(*configDir);
    }
    out.builtinRoot = builtinRoot;
    out.maxLoadConcurrency = static_cast<std::size_t>(concurrency);
    if (tables && !tables->empty()) {
        out.builtinDiscoveryTables = std::filesystem::path(*tables);
    }
    return LoaderResult<HostConfig>::ok(std::move(out));
}

}  // namespace intg::loader
