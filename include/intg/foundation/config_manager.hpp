#pragma once

/// @file config_manager.hpp
/// @brief YAML-based host configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "intg/foundation/loader_result.hpp"

namespace intg::foundation {

/// YAML-based configuration store.
///
/// The YAML tree is flattened into dotted keys ("loader.builtin_root") so
/// lookups never walk yaml-cpp nodes that share state with the document.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    LoaderResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    LoaderResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    LoaderResult<T> get(std::string_view key) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void replaceWith(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
LoaderResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end() || it->second.IsNull()) {
        return LoaderResult<T>::err(
            LoaderError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return LoaderResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return LoaderResult<T>::err(
            LoaderError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace intg::foundation
