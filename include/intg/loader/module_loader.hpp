#pragma once

/// @file module_loader.hpp
/// @brief Legacy module lookup across the custom and built-in namespaces.

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "intg/foundation/loader_result.hpp"
#include "intg/loader/filesystem.hpp"
#include "intg/loader/host_config.hpp"
#include "intg/loader/module.hpp"
#include "intg/loader/plugin.hpp"

namespace intg::loader {

/// File inside a package directory holding the package's own module.
inline constexpr std::string_view kPackageLibraryName = "component.so";
/// Extension of a custom module library.
inline constexpr std::string_view kModuleLibraryExtension = ".so";

/// A module instance together with whatever keeps its code mapped.
///
/// The module is destroyed before its shared library is closed.
class LoadedModule {
public:
    using Deleter = void (*)(IModule*);

    /// Statically linked module.
    LoadedModule(std::string name, std::unique_ptr<IModule> module, HostContext& host);

    /// Module created from a shared library. Takes ownership of
    /// @p libraryHandle; @p deleter may be null (plain delete).
    LoadedModule(std::string name, IModule* module, Deleter deleter, void* libraryHandle,
                 std::filesystem::path libraryPath, HostContext& host);

    ~LoadedModule();

    LoadedModule(const LoadedModule&) = delete;
    LoadedModule& operator=(const LoadedModule&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    /// Library path for custom modules, nullopt for built-in ones.
    [[nodiscard]] const std::optional<std::filesystem::path>& LibraryPath() const noexcept {
        return libraryPath_;
    }

    [[nodiscard]] bool IsBuiltIn() const noexcept { return !libraryPath_.has_value(); }

    [[nodiscard]] const CapabilityTable& Capabilities() const noexcept { return capabilities_; }

private:
    friend class ModuleLoader;

    CapabilityTable& mutableCapabilities() noexcept { return capabilities_; }
    IModule& module() noexcept { return *module_; }

    std::string name_;
    IModule* module_;
    Deleter deleter_;
    void* libraryHandle_;
    std::optional<std::filesystem::path> libraryPath_;
    CapabilityTable capabilities_;
};

using ModuleHandle = std::shared_ptr<const LoadedModule>;

/// Finds and caches modules by dotted name.
///
/// Search order for Load(): the custom namespace (shared libraries below the
/// custom root, "a.b" -> "<custom root>/a/b.so" or the package library
/// "<custom root>/a/b/component.so"), then the built-in namespace (the
/// static registry). Safe mode searches the built-in namespace only.
///
/// A module that does not exist in a namespace is a silent miss. Any other
/// failure (library will not open, factory symbol missing, factory returns
/// null or throws) is logged as an error and the search continues.
///
/// Thread-safe.
class ModuleLoader {
public:
    ModuleLoader(const IPluginFilesystem& fs, const HostConfig& config, HostContext& host);
    ~ModuleLoader();

    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;

    /// Load a component or platform module by dotted name.
    ///
    /// @return The cached or newly loaded module, ConfigDirMissing, or
    ///         ModuleNotFound when no namespace provides it.
    [[nodiscard]] foundation::LoaderResult<ModuleHandle> Load(const std::string& name);

    /// Load the package module of a resolved plugin from the plugin's own
    /// root only.
    [[nodiscard]] foundation::LoaderResult<ModuleHandle> LoadForPlugin(const Plugin& plugin);

    /// Load a statically registered helper module.
    [[nodiscard]] foundation::LoaderResult<ModuleHandle> LoadHelper(const std::string& name);

    /// Names of every cached component module, sorted.
    [[nodiscard]] std::vector<std::string> LoadedModules() const;

private:
    enum class Outcome : uint8_t { Loaded, Missing, Failed };

    struct Attempt {
        Outcome outcome = Outcome::Missing;
        ModuleHandle module;
    };

    /// Look for @p name in the custom namespace.
    Attempt loadCustom(const std::string& name) const;

    /// Open @p path and create the module. Failures are logged.
    Attempt loadLibrary(const std::string& name, const std::filesystem::path& path) const;

    /// Create @p name from the static registry. Failures are logged.
    Attempt loadStatic(const std::string& name, ModuleKind kind) const;

    /// Let the module publish its capabilities. Failures are logged.
    bool registerCapabilities(LoadedModule& module) const;

    /// Cache @p module under @p key; an entry stored concurrently wins.
    ModuleHandle remember(std::unordered_map<std::string, ModuleHandle>& cache,
                          const std::string& key, ModuleHandle module);

    [[nodiscard]] ModuleHandle cachedIn(const std::unordered_map<std::string, ModuleHandle>& cache,
                                        const std::string& key) const;

    bool ensureConfigDir() const;

    const IPluginFilesystem& fs_;
    const HostConfig& config_;
    HostContext& host_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ModuleHandle> components_;
    std::unordered_map<std::string, ModuleHandle> helpers_;
};

}  // namespace intg::loader
