#pragma once

/// @file module.hpp
/// @brief IModule interface, capability tables and module registration macros.
///
/// A module is the executable half of a plugin: it publishes named
/// capabilities that the component facade hands out to callers.
///
/// Custom modules are shared libraries exporting IntgCreateModule via
/// INTG_MODULE_EXPORT. Built-in modules are linked into the host and add
/// themselves to the static registry with INTG_MODULE_REGISTER (components)
/// or INTG_HELPER_REGISTER (helpers).

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "intg/foundation/loader_result.hpp"

namespace intg::loader {

class HostContext;

using CapabilityArgs = std::vector<std::string>;

/// A callable published by a module.
using CapabilityFn = std::function<foundation::LoaderResult<std::string>(const CapabilityArgs&)>;

/// A capability that needs the host. AddBound() adapts it to a CapabilityFn.
using BoundCapabilityFn =
    std::function<foundation::LoaderResult<std::string>(HostContext&, const CapabilityArgs&)>;

/// Named capabilities of one module.
///
/// Filled once by IModule::RegisterCapabilities() while the module loads;
/// read-only afterwards.
class CapabilityTable {
public:
    explicit CapabilityTable(HostContext& host) : host_(&host) {}

    /// Publish a capability that does not need the host.
    void Add(std::string name, CapabilityFn fn) {
        entries_.insert_or_assign(std::move(name), std::move(fn));
    }

    /// Publish a capability taking the host as its first argument. The host
    /// this table was created for is captured now.
    void AddBound(std::string name, BoundCapabilityFn fn) {
        entries_.insert_or_assign(
            std::move(name), [host = host_, bound = std::move(fn)](const CapabilityArgs& args) {
                return bound(*host, args);
            });
    }

    /// nullptr if no capability has that name.
    [[nodiscard]] const CapabilityFn* Find(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> Names() const;

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

    /// Drop every capability. Called before a module's library is unmapped.
    void Clear() noexcept { entries_.clear(); }

private:
    HostContext* host_;
    std::map<std::string, CapabilityFn, std::less<>> entries_;
};

/// Interface implemented by every loadable module.
class IModule {
public:
    virtual ~IModule() = default;

    /// Module name as used for lookups ("light", "hue.sensor").
    [[nodiscard]] virtual std::string_view Name() const = 0;

    /// Publish this module's capabilities.
    virtual void RegisterCapabilities(CapabilityTable& table) = 0;
};

// ── Static module registration ──────────────────────────────────────────

/// Namespace a statically registered module belongs to.
enum class ModuleKind : uint8_t {
    Component,  ///< Looked up by ModuleLoader::Load / LoadForPlugin
    Helper      ///< Looked up by ModuleLoader::LoadHelper
};

using ModuleFactory = std::function<std::unique_ptr<IModule>()>;

struct StaticModuleEntry {
    std::string name;
    ModuleKind kind = ModuleKind::Component;
    ModuleFactory factory;
};

/// Global registry of modules linked into the host.
///
/// Populated at static-init time by the registration macros.
inline std::vector<StaticModuleEntry>& StaticModuleRegistry() {
    static std::vector<StaticModuleEntry> registry;
    return registry;
}

namespace detail {

/// RAII helper that registers a factory on construction.
struct StaticModuleRegistrar {
    StaticModuleRegistrar(const char* name, ModuleKind kind, ModuleFactory factory) {
        StaticModuleRegistry().push_back({name, kind, std::move(factory)});
    }
};

}  // namespace detail
}  // namespace intg::loader

// ── Dynamic module export ───────────────────────────────────────────────

/// Name of the factory symbol looked up in custom module libraries.
#define INTG_MODULE_CREATE_SYMBOL "IntgCreateModule"
/// Name of the optional matching deleter symbol.
#define INTG_MODULE_DESTROY_SYMBOL "IntgDestroyModule"

/// Generate the C-linkage entry points of a custom module library.
///
/// @code
///   class HueModule : public intg::loader::IModule { ... };
///   INTG_MODULE_EXPORT(HueModule)
/// @endcode
#define INTG_MODULE_EXPORT(ModuleClass)                         \
    extern "C" {                                                \
    intg::loader::IModule* IntgCreateModule() {                 \
        return new ModuleClass();                               \
    }                                                           \
    void IntgDestroyModule(intg::loader::IModule* module) {     \
        delete module;                                          \
    }                                                           \
    }

/// Register a built-in component module.
///
/// @code
///   INTG_MODULE_REGISTER(LightModule, "light");
/// @endcode
#define INTG_MODULE_REGISTER(ModuleClass, ModuleName)                                        \
    static ::intg::loader::detail::StaticModuleRegistrar                                     \
    intg_static_module_##ModuleClass##_registrar(                                            \
        ModuleName, ::intg::loader::ModuleKind::Component,                                   \
        []() -> std::unique_ptr<::intg::loader::IModule> {                                   \
            return std::make_unique<ModuleClass>();                                          \
        })

/// Register a built-in helper module.
#define INTG_HELPER_REGISTER(ModuleClass, ModuleName)                                        \
    static ::intg::loader::detail::StaticModuleRegistrar                                     \
    intg_static_helper_##ModuleClass##_registrar(                                            \
        ModuleName, ::intg::loader::ModuleKind::Helper,                                      \
        []() -> std::unique_ptr<::intg::loader::IModule> {                                   \
            return std::make_unique<ModuleClass>();                                          \
        })
