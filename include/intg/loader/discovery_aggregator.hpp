#pragma once

/// @file discovery_aggregator.hpp
/// @brief Merges built-in discovery tables with custom plugin fragments.

#include <filesystem>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "intg/foundation/loader_result.hpp"
#include "intg/loader/discovery_types.hpp"
#include "intg/loader/filesystem.hpp"
#include "intg/loader/json_document.hpp"
#include "intg/loader/manifest.hpp"

namespace intg::loader {

class PluginRegistry;

/// Static tables shipped with the built-in plugins.
struct BuiltinDiscoveryTables {
    ZeroconfTable zeroconf;
    BluetoothTable bluetooth;
    DhcpTable dhcp;
    UsbTable usb;
    HomekitTable homekit;
    SsdpTable ssdp;
    MqttTable mqtt;
    /// Built-in domains offering a config flow, per integration type.
    std::map<IntegrationType, std::set<std::string>> configFlows;
    /// Built-in domains supporting application credentials.
    std::vector<std::string> applicationCredentials;
};

/// Parse the built-in tables document.
///
/// @code
///   {
///     "zeroconf": {"_hue._tcp.local.": [{"domain": "hue"}]},
///     "bluetooth": [{"domain": "govee", "local_name": "Govee*"}],
///     "dhcp": [...], "usb": [...],
///     "homekit": {"LIFX": "lifx"},
///     "ssdp": {"hue": [{"manufacturer": "Royal Philips Electronics"}]},
///     "mqtt": {"tasmota": ["tasmota/discovery/#"]},
///     "config_flows": {"integration": ["hue"], "helper": ["derivative"]},
///     "application_credentials": ["google"]
///   }
/// @endcode
///
/// @return DiscoveryTableInvalid on any shape error. Missing sections are empty.
[[nodiscard]] foundation::LoaderResult<BuiltinDiscoveryTables> ParseBuiltinDiscoveryTables(
    const Json& document);

/// Per-protocol discovery tables: the built-in table plus one tagged entry
/// per fragment of every custom plugin.
///
/// Each protocol table is built once per cache cycle and returned by value.
/// ResetCaches() starts a new cycle.
class DiscoveryAggregator {
public:
    explicit DiscoveryAggregator(PluginRegistry& registry, BuiltinDiscoveryTables builtin = {});

    DiscoveryAggregator(const DiscoveryAggregator&) = delete;
    DiscoveryAggregator& operator=(const DiscoveryAggregator&) = delete;

    /// Service type -> matchers. Legacy top-level macaddress / model /
    /// manufacturer keys of custom entries move into "properties", lower-cased.
    [[nodiscard]] ZeroconfTable GetZeroconf();
    [[nodiscard]] BluetoothTable GetBluetooth();
    [[nodiscard]] DhcpTable GetDhcp();
    /// "known_devices" is never part of a UsbMatcher.
    [[nodiscard]] UsbTable GetUsb();
    /// Model -> domain. Custom plugins override built-in models.
    [[nodiscard]] HomekitTable GetHomekit();
    /// Domain -> matchers. A custom plugin replaces any built-in entry.
    [[nodiscard]] SsdpTable GetSsdp();
    [[nodiscard]] MqttTable GetMqtt();

    /// Domains offering a config flow, optionally restricted to one type.
    [[nodiscard]] std::set<std::string> GetConfigFlows(
        std::optional<IntegrationType> typeFilter = std::nullopt);

    /// Built-in list plus custom plugins depending on "application_credentials".
    [[nodiscard]] std::vector<std::string> GetApplicationCredentials();

    /// Drop every cached table.
    void ResetCaches();

    /// Replace the built-in tables with the contents of a JSON file and reset caches.
    foundation::LoaderResult<void> LoadBuiltinDiscoveryTables(const IPluginFilesystem& fs,
                                                              const std::filesystem::path& path);

    /// Replace the built-in tables and reset caches.
    void SetBuiltinTables(BuiltinDiscoveryTables builtin);

private:
    struct Cache {
        std::optional<ZeroconfTable> zeroconf;
        std::optional<BluetoothTable> bluetooth;
        std::optional<DhcpTable> dhcp;
        std::optional<UsbTable> usb;
        std::optional<HomekitTable> homekit;
        std::optional<SsdpTable> ssdp;
        std::optional<MqttTable> mqtt;
    };

    /// Return the cached table or build and cache it. @p build receives the
    /// built-in tables and the custom plugin enumeration.
    template <typename Table, typename Builder>
    Table cached(std::optional<Table> Cache::*slot, Builder build);

    PluginRegistry& registry_;

    std::mutex mutex_;
    std::shared_ptr<const BuiltinDiscoveryTables> builtin_;
    Cache cache_;
    uint64_t generation_ = 0;
};

}  // namespace intg::loader
