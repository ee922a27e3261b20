/// @file config_manager.cpp
/// @brief ConfigManager implementation: YAML loading and key flattening.

#include "intg/foundation/config_manager.hpp"

namespace intg::foundation {

LoaderResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        replaceWith(root);
        return LoaderResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return LoaderResult<void>::err(
            LoaderError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return LoaderResult<void>::err(
            LoaderError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

LoaderResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        auto root = YAML::Load(std::string(yaml));
        replaceWith(root);
        return LoaderResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return LoaderResult<void>::err(
            LoaderError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::replaceWith(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsMap()) {
        flatten("", root);
    }
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
        return;
    }
    // Leaf (scalar, sequence, null) stored under its dotted key.
    entries_[prefix] = YAML::Clone(node);
}

}  // namespace intg::foundation
