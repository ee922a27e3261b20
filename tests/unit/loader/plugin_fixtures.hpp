#pragma once

/// @file plugin_fixtures.hpp
/// @brief Manifest text builders and root layouts shared by the loader tests.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "intg/loader/host_config.hpp"

namespace intg::test {

inline const std::filesystem::path kConfigDir = "/config";
inline const std::filesystem::path kBuiltinRoot = "/builtin";
inline const std::filesystem::path kCustomRoot = "/config/custom_components";

inline std::string JsonList(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += "\"" + items[i] + "\"";
    }
    return out + "]";
}

/// Manifest JSON for @p domain. @p extra is appended verbatim as further
/// members (", \"config_flow\": true").
inline std::string ManifestJson(const std::string& domain,
                                const std::vector<std::string>& dependencies = {},
                                const std::optional<std::string>& version = std::nullopt,
                                const std::string& extra = {}) {
    std::string out = "{\"domain\": \"" + domain + "\", \"name\": \"" + domain + "\"";
    out += ", \"dependencies\": " + JsonList(dependencies);
    if (version) {
        out += ", \"version\": \"" + *version + "\"";
    }
    out += extra;
    return out + "}";
}

inline std::filesystem::path ManifestPath(const std::filesystem::path& root,
                                          const std::string& domain) {
    return root / domain / "manifest.json";
}

/// Host settings pointing at kConfigDir and kBuiltinRoot.
inline loader::HostConfig TestHostConfig() {
    loader::HostConfig config;
    config.configDir = kConfigDir;
    config.builtinRoot = kBuiltinRoot;
    config.maxLoadConcurrency = 2;
    return config;
}

}  // namespace intg::test
