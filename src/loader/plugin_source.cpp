/// @file plugin_source.cpp
/// @brief Manifest probing and custom plugin version gate.

#include "intg/loader/plugin_source.hpp"

#include <exception>

#include "intg/foundation/logger.hpp"
#include "intg/loader/version_strategy.hpp"

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;
using intg::foundation::LogCategory;
using intg::foundation::LogContext;
using intg::foundation::LogLevel;
using intg::foundation::Logger;

namespace intg::loader {

PluginSource::PluginSource(const IPluginFilesystem& fs, std::filesystem::path root,
                           PluginRoot kind)
    : fs_(fs), root_(std::move(root)), kind_(kind) {}

LoaderResult<PluginPtr> PluginSource::ResolveFromRoot(const std::string& domain) const {
    auto directory = root_ / domain;
    auto manifestPath = directory / std::string(kManifestFileName);

    if (!fs_.IsFile(manifestPath)) {
        return LoaderResult<PluginPtr>::err(foundation::notFoundError(domain));
    }

    auto text = fs_.ReadText(manifestPath);
    if (text.hasError()) {
        return LoaderResult<PluginPtr>::err(std::move(text).error());
    }

    auto manifest = ParseManifestText(text.value());
    if (manifest.hasError()) {
        LogContext ctx;
        ctx.domain = domain;
        ctx.path = manifestPath.string();
        Logger::instance().logWithContext(
            LogLevel::Error, LogCategory::Loader,
            "Error parsing manifest.json file at " + manifestPath.string() + ": " +
                std::string(manifest.error().message()),
            ctx);
        return LoaderResult<PluginPtr>::err(std::move(manifest).error());
    }

    if (kind_ == PluginRoot::Custom) {
        INTG_LOG_WARN(LogCategory::Loader,
                      "We found a custom integration " + manifest.value().domain +
                          " which has not been tested by the host. This component might "
                          "cause stability problems, be sure to disable it if you "
                          "experience issues");
        auto gate = checkVersionGate(manifest.value());
        if (gate.hasError()) {
            return LoaderResult<PluginPtr>::err(std::move(gate).error());
        }
    }

    return LoaderResult<PluginPtr>::ok(
        std::make_shared<const Plugin>(std::move(manifest).value(), directory, kind_));
}

LoaderResult<void> PluginSource::checkVersionGate(const Manifest& manifest) const {
    if (!manifest.version) {
        auto message = "The custom integration '" + manifest.domain +
                       "' does not have a version key in the manifest file and was "
                       "blocked from loading. " + std::string(kVersionDocsHint);
        INTG_LOG_ERROR(LogCategory::Loader, message);
        return LoaderResult<void>::err(LoaderError(ErrorCode::VersionMissing, message));
    }

    auto parsed = ParseVersion(*manifest.version);
    if (parsed.hasError()) {
        auto message = "The custom integration '" + manifest.domain +
                       "' does not have a valid version key (" + *manifest.version +
                       ") in the manifest file and was blocked from loading. " +
                       std::string(kVersionDocsHint);
        INTG_LOG_ERROR(LogCategory::Loader, message);
        return LoaderResult<void>::err(LoaderError(ErrorCode::VersionInvalid, message));
    }
    return LoaderResult<void>::ok();
}

std::map<std::string, LoaderResult<PluginPtr>> PluginSource::ResolveMany(
    const std::vector<std::string>& domains) const {
    std::map<std::string, LoaderResult<PluginPtr>> out;
    for (const auto& domain : domains) {
        try {
            out.insert_or_assign(domain, ResolveFromRoot(domain));
        } catch (const std::exception& e) {
            LogContext ctx;
            ctx.domain = domain;
            ctx.extra["exception"] = e.what();
            Logger::instance().logWithContext(LogLevel::Error, LogCategory::Loader,
                                              "Error loading integration: " + domain, ctx);
            out.insert_or_assign(domain, LoaderResult<PluginPtr>::err(LoaderError(
                                             ErrorCode::UnexpectedException, e.what())));
        }
    }
    return out;
}

LoaderResult<std::vector<std::string>> PluginSource::ListDomains() const {
    if (!fs_.IsDirectory(root_)) {
        return LoaderResult<std::vector<std::string>>::ok({});
    }
    return fs_.ListSubdirectories(root_);
}

}  // namespace intg::loader
