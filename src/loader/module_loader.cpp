/// @file module_loader.cpp
/// @brief ModuleLoader implementation: custom shared libraries and the
///        static module registry.

#include "intg/loader/module_loader.hpp"

#include <algorithm>
#include <exception>

#include "intg/foundation/logger.hpp"

// Platform-specific dynamic library loading.
#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;
using intg::foundation::LogCategory;
using intg::foundation::LogContext;
using intg::foundation::LogLevel;
using intg::foundation::Logger;

namespace intg::loader {

namespace {

void closeLibrary(void* handle) {
    if (handle == nullptr) {
        return;
    }
#if defined(_WIN32)
    FreeLibrary(static_cast<HMODULE>(handle));
#else
    dlclose(handle);
#endif
}

void* findSymbol(void* handle, const char* symbol) {
#if defined(_WIN32)
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(handle), symbol));
#else
    return dlsym(handle, symbol);
#endif
}

/// Dotted module name made of valid domains ("light", "hue.sensor").
bool isValidModuleName(const std::string& name) {
    std::string_view rest(name);
    while (true) {
        auto dot = rest.find('.');
        if (!IsValidDomain(rest.substr(0, dot))) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        rest.remove_prefix(dot + 1);
    }
}

/// Report a module that exists but could not be loaded.
void logLoadFailure(const std::string& name, const std::optional<std::filesystem::path>& path,
                    const std::string& cause) {
    LogContext ctx;
    ctx.path = path ? std::optional<std::string>(path->string()) : std::nullopt;
    ctx.extra["cause"] = cause;
    Logger::instance().logWithContext(
        LogLevel::Error, LogCategory::Module,
        "Error loading " + name + ". Make sure all dependencies are installed", ctx);
}

}  // namespace

// ── LoadedModule ────────────────────────────────────────────────────────

LoadedModule::LoadedModule(std::string name, std::unique_ptr<IModule> module, HostContext& host)
    : name_(std::move(name)),
      module_(module.release()),
      deleter_(nullptr),
      libraryHandle_(nullptr),
      capabilities_(host) {}

LoadedModule::LoadedModule(std::string name, IModule* module, Deleter deleter,
                           void* libraryHandle, std::filesystem::path libraryPath,
                           HostContext& host)
    : name_(std::move(name)),
      module_(module),
      deleter_(deleter),
      libraryHandle_(libraryHandle),
      libraryPath_(std::move(libraryPath)),
      capabilities_(host) {}

LoadedModule::~LoadedModule() {
    // Capability closures may live in the library's code.
    capabilities_.Clear();
    if (deleter_ != nullptr) {
        deleter_(module_);
    } else {
        delete module_;
    }
    closeLibrary(libraryHandle_);
}

// ── ModuleLoader ────────────────────────────────────────────────────────

ModuleLoader::ModuleLoader(const IPluginFilesystem& fs, const HostConfig& config,
                           HostContext& host)
    : fs_(fs), config_(config), host_(host) {}

ModuleLoader::~ModuleLoader() = default;

LoaderResult<ModuleHandle> ModuleLoader::Load(const std::string& name) {
    if (auto hit = cachedIn(components_, name)) {
        return LoaderResult<ModuleHandle>::ok(std::move(hit));
    }
    if (!ensureConfigDir()) {
        return LoaderResult<ModuleHandle>::err(LoaderError(
            ErrorCode::ConfigDirMissing, "configuration directory is not set"));
    }

    if (!config_.safeMode) {
        auto custom = loadCustom(name);
        if (custom.outcome == Outcome::Loaded) {
            return LoaderResult<ModuleHandle>::ok(
                remember(components_, name, std::move(custom.module)));
        }
    }

    auto builtin = loadStatic(name, ModuleKind::Component);
    if (builtin.outcome == Outcome::Loaded) {
        return LoaderResult<ModuleHandle>::ok(
            remember(components_, name, std::move(builtin.module)));
    }

    return LoaderResult<ModuleHandle>::err(
        LoaderError(ErrorCode::ModuleNotFound, "Unable to load " + name));
}

LoaderResult<ModuleHandle> ModuleLoader::LoadForPlugin(const Plugin& plugin) {
    const auto& domain = plugin.Domain();
    if (auto hit = cachedIn(components_, domain)) {
        return LoaderResult<ModuleHandle>::ok(std::move(hit));
    }

    Attempt attempt;
    if (plugin.IsBuiltIn()) {
        attempt = loadStatic(domain, ModuleKind::Component);
    } else {
        auto path = plugin.Directory() / std::string(kPackageLibraryName);
        if (fs_.IsFile(path)) {
            attempt = loadLibrary(domain, path);
        }
    }

    switch (attempt.outcome) {
        case Outcome::Loaded:
            return LoaderResult<ModuleHandle>::ok(
                remember(components_, domain, std::move(attempt.module)));
        case Outcome::Failed:
            return LoaderResult<ModuleHandle>::err(LoaderError(
                ErrorCode::ModuleLoadFailed, "Exception importing " + plugin.ToString()));
        case Outcome::Missing:
            break;
    }
    return LoaderResult<ModuleHandle>::err(
        LoaderError(ErrorCode::ModuleNotFound, "No module for " + plugin.ToString()));
}

LoaderResult<ModuleHandle> ModuleLoader::LoadHelper(const std::string& name) {
    if (auto hit = cachedIn(helpers_, name)) {
        return LoaderResult<ModuleHandle>::ok(std::move(hit));
    }

    auto attempt = loadStatic(name, ModuleKind::Helper);
    switch (attempt.outcome) {
        case Outcome::Loaded:
            return LoaderResult<ModuleHandle>::ok(
                remember(helpers_, name, std::move(attempt.module)));
        case Outcome::Failed:
            return LoaderResult<ModuleHandle>::err(
                LoaderError(ErrorCode::ModuleLoadFailed, "Exception importing helper " + name));
        case Outcome::Missing:
            break;
    }
    return LoaderResult<ModuleHandle>::err(
        LoaderError(ErrorCode::ModuleNotFound, "Unable to load helper " + name));
}

std::vector<std::string> ModuleLoader::LoadedModules() const {
    std::vector<std::string> out;
    {
        std::lock_guard lock(mutex_);
        out.reserve(components_.size());
        for (const auto& [name, module] : components_) {
            out.push_back(name);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

// ── Search ──────────────────────────────────────────────────────────────

ModuleLoader::Attempt ModuleLoader::loadCustom(const std::string& name) const {
    if (!isValidModuleName(name)) {
        return {};
    }
    auto relative = name;
    std::replace(relative.begin(), relative.end(), '.', '/');
    auto base = config_.CustomRoot() / relative;

    auto file = base;
    file += std::string(kModuleLibraryExtension);
    if (fs_.IsFile(file)) {
        return loadLibrary(name, file);
    }

    auto package = base / std::string(kPackageLibraryName);
    if (fs_.IsFile(package)) {
        return loadLibrary(name, package);
    }
    return {};
}

ModuleLoader::Attempt ModuleLoader::loadLibrary(const std::string& name,
                                                const std::filesystem::path& path) const {
#if defined(_WIN32)
    void* handle = static_cast<void*>(LoadLibraryW(path.c_str()));
#else
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif
    if (handle == nullptr) {
#if defined(_WIN32)
        auto cause = "LoadLibrary failed for: " + path.string();
#else
        const char* dlMessage = dlerror();
        auto cause = std::string(dlMessage != nullptr ? dlMessage : "dlopen failed");
#endif
        logLoadFailure(name, path, cause);
        return {Outcome::Failed, nullptr};
    }

    using CreateFunc = IModule* (*)();
    auto createFn = reinterpret_cast<CreateFunc>(findSymbol(handle, INTG_MODULE_CREATE_SYMBOL));
    if (createFn == nullptr) {
        closeLibrary(handle);
        logLoadFailure(name, path,
                       std::string("Symbol '") + INTG_MODULE_CREATE_SYMBOL + "' not found");
        return {Outcome::Failed, nullptr};
    }
    auto destroyFn = reinterpret_cast<LoadedModule::Deleter>(
        findSymbol(handle, INTG_MODULE_DESTROY_SYMBOL));

    IModule* raw = nullptr;
    try {
        raw = createFn();
    } catch (const std::exception& e) {
        closeLibrary(handle);
        logLoadFailure(name, path, e.what());
        return {Outcome::Failed, nullptr};
    }
    if (raw == nullptr) {
        closeLibrary(handle);
        logLoadFailure(name, path, std::string(INTG_MODULE_CREATE_SYMBOL) + " returned null");
        return {Outcome::Failed, nullptr};
    }

    auto module = std::make_shared<LoadedModule>(name, raw, destroyFn, handle, path, host_);
    if (!registerCapabilities(*module)) {
        return {Outcome::Failed, nullptr};
    }
    INTG_LOG_DEBUG(LogCategory::Module, "Loaded module " + name + " from " + path.string());
    return {Outcome::Loaded, std::move(module)};
}

ModuleLoader::Attempt ModuleLoader::loadStatic(const std::string& name, ModuleKind kind) const {
    const auto& registry = StaticModuleRegistry();
    auto it = std::find_if(registry.begin(), registry.end(), [&](const StaticModuleEntry& entry) {
        return entry.kind == kind && entry.name == name;
    });
    if (it == registry.end()) {
        return {};
    }

    std::unique_ptr<IModule> instance;
    try {
        instance = it->factory();
    } catch (const std::exception& e) {
        logLoadFailure(name, std::nullopt, e.what());
        return {Outcome::Failed, nullptr};
    }
    if (!instance) {
        logLoadFailure(name, std::nullopt, "static module factory returned null");
        return {Outcome::Failed, nullptr};
    }

    auto module = std::make_shared<LoadedModule>(name, std::move(instance), host_);
    if (!registerCapabilities(*module)) {
        return {Outcome::Failed, nullptr};
    }
    return {Outcome::Loaded, std::move(module)};
}

bool ModuleLoader::registerCapabilities(LoadedModule& module) const {
    try {
        module.module().RegisterCapabilities(module.mutableCapabilities());
        return true;
    } catch (const std::exception& e) {
        logLoadFailure(module.Name(), module.LibraryPath(), e.what());
        return false;
    }
}

// ── Cache ───────────────────────────────────────────────────────────────

ModuleHandle ModuleLoader::remember(std::unordered_map<std::string, ModuleHandle>& cache,
                                    const std::string& key, ModuleHandle module) {
    std::lock_guard lock(mutex_);
    return cache.try_emplace(key, std::move(module)).first->second;
}

ModuleHandle ModuleLoader::cachedIn(const std::unordered_map<std::string, ModuleHandle>& cache,
                                    const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = cache.find(key);
    return it == cache.end() ? nullptr : it->second;
}

bool ModuleLoader::ensureConfigDir() const {
    if (config_.configDir) {
        return true;
    }
    INTG_LOG_ERROR(LogCategory::Module,
                   "Can't load integrations - configuration directory is not set");
    return false;
}

}  // namespace intg::loader
