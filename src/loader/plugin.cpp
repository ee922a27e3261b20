/// @file plugin.cpp
/// @brief Plugin descriptor implementation.

#include "intg/loader/plugin.hpp"

#include "intg/foundation/logger.hpp"

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;
using intg::foundation::LogCategory;

namespace intg::loader {

std::string_view pluginRootName(PluginRoot root) noexcept {
    switch (root) {
        case PluginRoot::Custom:  return "custom";
        case PluginRoot::BuiltIn: return "built-in";
    }
    return "unknown";
}

bool IsValidDomain(std::string_view domain) noexcept {
    return !domain.empty() && domain.find_first_of("./\\") == std::string_view::npos &&
           domain.find('\0') == std::string_view::npos;
}

Plugin::Plugin(Manifest manifest, std::filesystem::path directory, PluginRoot root)
    : manifest_(std::move(manifest)), directory_(std::move(directory)), root_(root) {
    if (manifest_.dependencies.empty()) {
        state_ = DependencyState::Resolved;
    }
    INTG_LOG_INFO(LogCategory::Loader,
                  "Loaded " + manifest_.domain + " from " + directory_.string());
}

DependencyState Plugin::GetDependencyState() const {
    std::lock_guard lock(stateMutex_);
    return state_;
}

bool Plugin::AllDependenciesResolved() const {
    std::lock_guard lock(stateMutex_);
    return state_ != DependencyState::Unresolved;
}

LoaderResult<std::set<std::string>> Plugin::AllDependencies() const {
    std::lock_guard lock(stateMutex_);
    if (state_ != DependencyState::Resolved) {
        return LoaderResult<std::set<std::string>>::err(
            LoaderError(ErrorCode::DependenciesNotResolved,
                        "Dependencies not resolved for " + manifest_.domain));
    }
    return LoaderResult<std::set<std::string>>::ok(allDependencies_);
}

std::string Plugin::ToString() const {
    return "<Plugin " + manifest_.domain + ": " + directory_.string() + ">";
}

bool Plugin::commitDependencies(std::set<std::string> closure) const {
    std::lock_guard lock(stateMutex_);
    if (state_ != DependencyState::Unresolved) {
        return false;
    }
    allDependencies_ = std::move(closure);
    state_ = DependencyState::Resolved;
    return true;
}

bool Plugin::markDependenciesFailed() const {
    std::lock_guard lock(stateMutex_);
    if (state_ != DependencyState::Unresolved) {
        return false;
    }
    state_ = DependencyState::Failed;
    return true;
}

}  // namespace intg::loader
