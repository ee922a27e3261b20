#pragma once

/// @file discovery_types.hpp
/// @brief Discovery matcher records for each protocol and their table shapes.
///
/// Manifests carry protocol fragments with an empty @c domain; the
/// DiscoveryAggregator tags each record with the owning plugin's domain.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "intg/foundation/loader_result.hpp"
#include "intg/loader/json_document.hpp"

namespace intg::loader {

/// Network-advertisement (zeroconf) fragment as written in a manifest.
///
/// Either a bare service type or an object with a "type" key, optional
/// "properties" and other top-level matcher fields. Top-level
/// macaddress/model/manufacturer are a legacy layout kept in @c fields
/// until aggregation relocates them.
struct ZeroconfEntry {
    std::string type;
    std::map<std::string, std::string> fields;
    std::map<std::string, std::string> properties;
    bool isObject = false;

    bool operator==(const ZeroconfEntry&) const = default;
};

/// Aggregated zeroconf matcher, keyed by service type in ZeroconfTable.
struct ZeroconfMatcher {
    std::string domain;
    std::map<std::string, std::string> fields;
    std::map<std::string, std::string> properties;

    bool operator==(const ZeroconfMatcher&) const = default;
};

/// Short-range radio (bluetooth) matcher.
struct BluetoothMatcher {
    std::string domain;
    std::optional<std::string> localName;
    std::optional<std::string> serviceUuid;
    std::optional<std::string> serviceDataUuid;
    std::optional<int> manufacturerId;
    std::vector<int> manufacturerDataStart;
    std::optional<bool> connectable;

    bool operator==(const BluetoothMatcher&) const = default;
};

/// DHCP-style matcher.
struct DhcpMatcher {
    std::string domain;
    std::optional<std::string> macaddress;
    std::optional<std::string> hostname;
    std::optional<bool> registeredDevices;

    bool operator==(const DhcpMatcher&) const = default;
};

/// Wired vendor-id (USB) matcher. "known_devices" is documentation only
/// and never retained.
struct UsbMatcher {
    std::string domain;
    std::optional<std::string> vid;
    std::optional<std::string> pid;
    std::optional<std::string> serialNumber;
    std::optional<std::string> manufacturer;
    std::optional<std::string> description;

    bool operator==(const UsbMatcher&) const = default;
};

/// Service-discovery (SSDP) matcher: header name -> expected value.
using SsdpMatcher = std::map<std::string, std::string>;

using ZeroconfTable = std::map<std::string, std::vector<ZeroconfMatcher>>;
using BluetoothTable = std::vector<BluetoothMatcher>;
using DhcpTable = std::vector<DhcpMatcher>;
using UsbTable = std::vector<UsbMatcher>;
/// Pairing-hint model name -> domain.
using HomekitTable = std::map<std::string, std::string>;
/// Domain -> SSDP matchers.
using SsdpTable = std::map<std::string, std::vector<SsdpMatcher>>;
/// Domain -> MQTT discovery topics.
using MqttTable = std::map<std::string, std::vector<std::string>>;

// ── Parsing from manifest / table documents ─────────────────────────────────

[[nodiscard]] foundation::LoaderResult<ZeroconfEntry> ParseZeroconfEntry(const Json& node);

/// Parse a tagged zeroconf matcher from a built-in table ("domain" key required).
[[nodiscard]] foundation::LoaderResult<ZeroconfMatcher> ParseZeroconfMatcher(const Json& node);

[[nodiscard]] foundation::LoaderResult<BluetoothMatcher> ParseBluetoothMatcher(const Json& node);
[[nodiscard]] foundation::LoaderResult<DhcpMatcher> ParseDhcpMatcher(const Json& node);
[[nodiscard]] foundation::LoaderResult<UsbMatcher> ParseUsbMatcher(const Json& node);
[[nodiscard]] foundation::LoaderResult<SsdpMatcher> ParseSsdpMatcher(const Json& node);

/// Parse a JSON array of strings. A missing or null node is an empty list.
[[nodiscard]] foundation::LoaderResult<std::vector<std::string>> ParseStringList(
    const Json& node, std::string_view what);

}  // namespace intg::loader
