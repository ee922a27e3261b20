/// @file discovery_aggregator.cpp
/// @brief Discovery table aggregation and built-in table loading.

#include "intg/loader/discovery_aggregator.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "intg/foundation/logger.hpp"
#include "intg/loader/plugin_registry.hpp"

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;
using intg::foundation::LogCategory;

namespace intg::loader {

namespace {

/// Zeroconf keys that used to live at the top level of a matcher.
constexpr std::array<std::string_view, 3> kMovedZeroconfProps = {"macaddress", "model",
                                                                 "manufacturer"};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/// Tag a custom zeroconf entry and relocate legacy top-level properties.
ZeroconfMatcher toZeroconfMatcher(const std::string& domain, const ZeroconfEntry& entry) {
    ZeroconfMatcher matcher;
    matcher.domain = domain;
    if (!entry.isObject) {
        return matcher;
    }
    matcher.fields = entry.fields;
    matcher.properties = entry.properties;
    for (auto prop : kMovedZeroconfProps) {
        auto it = matcher.fields.find(std::string(prop));
        if (it == matcher.fields.end()) {
            continue;
        }
        auto value = std::move(it->second);
        matcher.fields.erase(it);
        if (value.empty()) {
            continue;
        }
        INTG_LOG_WARN(LogCategory::Discovery,
                      "Matching the zeroconf property \"" + std::string(prop) +
                          "\" at top-level is deprecated and should be moved into a "
                          "properties dict; Check the developer documentation");
        matcher.properties.insert_or_assign(std::string(prop), toLower(std::move(value)));
    }
    return matcher;
}

LoaderError tableError(std::string_view section, std::string_view detail) {
    return LoaderError(ErrorCode::DiscoveryTableInvalid,
                       "invalid built-in " + std::string(section) + " table: " +
                           std::string(detail));
}

/// Parse a list section where every entry must carry its domain.
template <typename T, typename Parser>
std::optional<LoaderError> parseTaggedList(const Json& node, std::string_view section,
                                           std::vector<T>& out, Parser parse) {
    if (!IsPresent(node)) {
        return std::nullopt;
    }
    if (!node.is_array()) {
        return tableError(section, "expected a list");
    }
    for (const auto& item : node) {
        auto parsed = parse(item);
        if (parsed.hasError()) {
            return tableError(section, parsed.error().message());
        }
        if (parsed.value().domain.empty()) {
            return tableError(section, "entry without \"domain\"");
        }
        out.push_back(std::move(parsed).value());
    }
    return std::nullopt;
}

std::optional<LoaderError> parseTables(const Json& document, BuiltinDiscoveryTables& out) {
    if (const auto& zeroconf = JsonMember(document, "zeroconf"); IsPresent(zeroconf)) {
        if (!zeroconf.is_object()) {
            return tableError("zeroconf", "expected an object");
        }
        for (const auto& [type, entries] : zeroconf.items()) {
            if (!entries.is_array()) {
                return tableError("zeroconf", "matchers of " + type + " must be a list");
            }
            auto& matchers = out.zeroconf[type];
            for (const auto& item : entries) {
                auto parsed = ParseZeroconfMatcher(item);
                if (parsed.hasError()) {
                    return tableError("zeroconf", parsed.error().message());
                }
                matchers.push_back(std::move(parsed).value());
            }
        }
    }

    if (auto error = parseTaggedList(JsonMember(document, "bluetooth"), "bluetooth",
                                     out.bluetooth, ParseBluetoothMatcher)) {
        return error;
    }
    if (auto error = parseTaggedList(JsonMember(document, "dhcp"), "dhcp", out.dhcp,
                                     ParseDhcpMatcher)) {
        return error;
    }
    if (auto error = parseTaggedList(JsonMember(document, "usb"), "usb", out.usb,
                                     ParseUsbMatcher)) {
        return error;
    }

    if (const auto& homekit = JsonMember(document, "homekit"); IsPresent(homekit)) {
        if (!homekit.is_object()) {
            return tableError("homekit", "expected an object");
        }
        for (const auto& [model, domain] : homekit.items()) {
            out.homekit.insert_or_assign(model, domain.get<std::string>());
        }
    }

    if (const auto& ssdp = JsonMember(document, "ssdp"); IsPresent(ssdp)) {
        if (!ssdp.is_object()) {
            return tableError("ssdp", "expected an object");
        }
        for (const auto& [domain, entries] : ssdp.items()) {
            if (!entries.is_array()) {
                return tableError("ssdp", "matchers of " + domain + " must be a list");
            }
            auto& matchers = out.ssdp[domain];
            for (const auto& item : entries) {
                auto parsed = ParseSsdpMatcher(item);
                if (parsed.hasError()) {
                    return tableError("ssdp", parsed.error().message());
                }
                matchers.push_back(std::move(parsed).value());
            }
        }
    }

    if (const auto& mqtt = JsonMember(document, "mqtt"); IsPresent(mqtt)) {
        if (!mqtt.is_object()) {
            return tableError("mqtt", "expected an object");
        }
        for (const auto& [domain, entries] : mqtt.items()) {
            auto topics = ParseStringList(entries, "mqtt." + domain);
            if (topics.hasError()) {
                return tableError("mqtt", topics.error().message());
            }
            out.mqtt.insert_or_assign(domain, std::move(topics).value());
        }
    }

    if (const auto& flows = JsonMember(document, "config_flows"); IsPresent(flows)) {
        if (!flows.is_object()) {
            return tableError("config_flows", "expected an object");
        }
        for (const auto& [typeName, entries] : flows.items()) {
            auto type = parseIntegrationType(typeName);
            if (!type) {
                return tableError("config_flows", "unknown integration type " + typeName);
            }
            auto domains = ParseStringList(entries, "config_flows." + typeName);
            if (domains.hasError()) {
                return tableError("config_flows", domains.error().message());
            }
            auto& typed = out.configFlows[*type];
            typed.insert(domains.value().begin(), domains.value().end());
        }
    }

    auto credentials = ParseStringList(JsonMember(document, "application_credentials"),
                                       "application_credentials");
    if (credentials.hasError()) {
        return tableError("application_credentials", credentials.error().message());
    }
    out.applicationCredentials = std::move(credentials).value();
    return std::nullopt;
}

}  // namespace

LoaderResult<BuiltinDiscoveryTables> ParseBuiltinDiscoveryTables(const Json& document) {
    if (!document.is_object()) {
        return LoaderResult<BuiltinDiscoveryTables>::err(
            LoaderError(ErrorCode::DiscoveryTableInvalid, "discovery tables must be an object"));
    }
    BuiltinDiscoveryTables tables;
    try {
        if (auto error = parseTables(document, tables)) {
            return LoaderResult<BuiltinDiscoveryTables>::err(std::move(*error));
        }
    } catch (const Json::exception& e) {
        return LoaderResult<BuiltinDiscoveryTables>::err(
            LoaderError(ErrorCode::DiscoveryTableInvalid, e.what()));
    }
    return LoaderResult<BuiltinDiscoveryTables>::ok(std::move(tables));
}

// ── DiscoveryAggregator ─────────────────────────────────────────────────

DiscoveryAggregator::DiscoveryAggregator(PluginRegistry& registry, BuiltinDiscoveryTables builtin)
    : registry_(registry),
      builtin_(std::make_shared<const BuiltinDiscoveryTables>(std::move(builtin))) {}

template <typename Table, typename Builder>
Table DiscoveryAggregator::cached(std::optional<Table> Cache::*slot, Builder build) {
    std::shared_ptr<const BuiltinDiscoveryTables> builtin;
    uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        if (const auto& hit = cache_.*slot) {
            return *hit;
        }
        builtin = builtin_;
        generation = generation_;
    }

    auto custom = registry_.GetCustomPlugins();
    if (custom.hasError()) {
        // Serve the built-in entries but retry the enumeration on the next call.
        return build(*builtin, CustomPluginMap{});
    }
    Table table = build(*builtin, *custom.value());

    std::lock_guard lock(mutex_);
    if (generation == generation_ && !(cache_.*slot)) {
        cache_.*slot = table;
    }
    return table;
}

ZeroconfTable DiscoveryAggregator::GetZeroconf() {
    return cached(&Cache::zeroconf, [](const BuiltinDiscoveryTables& builtin,
                                       const CustomPluginMap& custom) {
        auto table = builtin.zeroconf;
        for (const auto& [domain, plugin] : custom) {
            for (const auto& entry : plugin->GetManifest().zeroconf) {
                table[entry.type].push_back(toZeroconfMatcher(domain, entry));
            }
        }
        return table;
    });
}

BluetoothTable DiscoveryAggregator::GetBluetooth() {
    return cached(&Cache::bluetooth, [](const BuiltinDiscoveryTables& builtin,
                                        const CustomPluginMap& custom) {
        auto table = builtin.bluetooth;
        for (const auto& [domain, plugin] : custom) {
            for (auto matcher : plugin->GetManifest().bluetooth) {
                matcher.domain = domain;
                table.push_back(std::move(matcher));
            }
        }
        return table;
    });
}

DhcpTable DiscoveryAggregator::GetDhcp() {
    return cached(&Cache::dhcp, [](const BuiltinDiscoveryTables& builtin,
                                   const CustomPluginMap& custom) {
        auto table = builtin.dhcp;
        for (const auto& [domain, plugin] : custom) {
            for (auto matcher : plugin->GetManifest().dhcp) {
                matcher.domain = domain;
                table.push_back(std::move(matcher));
            }
        }
        return table;
    });
}

UsbTable DiscoveryAggregator::GetUsb() {
    return cached(&Cache::usb, [](const BuiltinDiscoveryTables& builtin,
                                  const CustomPluginMap& custom) {
        auto table = builtin.usb;
        for (const auto& [domain, plugin] : custom) {
            for (auto matcher : plugin->GetManifest().usb) {
                matcher.domain = domain;
                table.push_back(std::move(matcher));
            }
        }
        return table;
    });
}

HomekitTable DiscoveryAggregator::GetHomekit() {
    return cached(&Cache::homekit, [](const BuiltinDiscoveryTables& builtin,
                                      const CustomPluginMap& custom) {
        auto table = builtin.homekit;
        for (const auto& [domain, plugin] : custom) {
            for (const auto& model : plugin->GetManifest().homekitModels) {
                table.insert_or_assign(model, domain);
            }
        }
        return table;
    });
}

SsdpTable DiscoveryAggregator::GetSsdp() {
    return cached(&Cache::ssdp, [](const BuiltinDiscoveryTables& builtin,
                                   const CustomPluginMap& custom) {
        auto table = builtin.ssdp;
        for (const auto& [domain, plugin] : custom) {
            const auto& ssdp = plugin->GetManifest().ssdp;
            if (!ssdp.empty()) {
                table.insert_or_assign(domain, ssdp);
            }
        }
        return table;
    });
}

MqttTable DiscoveryAggregator::GetMqtt() {
    return cached(&Cache::mqtt, [](const BuiltinDiscoveryTables& builtin,
                                   const CustomPluginMap& custom) {
        auto table = builtin.mqtt;
        for (const auto& [domain, plugin] : custom) {
            const auto& topics = plugin->GetManifest().mqtt;
            if (!topics.empty()) {
                table.insert_or_assign(domain, topics);
            }
        }
        return table;
    });
}

std::set<std::string> DiscoveryAggregator::GetConfigFlows(
    std::optional<IntegrationType> typeFilter) {
    std::shared_ptr<const BuiltinDiscoveryTables> builtin;
    {
        std::lock_guard lock(mutex_);
        builtin = builtin_;
    }

    std::set<std::string> flows;
    for (const auto& [type, domains] : builtin->configFlows) {
        if (!typeFilter || *typeFilter == type) {
            flows.insert(domains.begin(), domains.end());
        }
    }

    auto custom = registry_.GetCustomPlugins();
    if (custom.hasError()) {
        return flows;
    }
    for (const auto& [domain, plugin] : *custom.value()) {
        if (plugin->HasConfigFlow() && (!typeFilter || *typeFilter == plugin->Type())) {
            flows.insert(domain);
        }
    }
    return flows;
}

std::vector<std::string> DiscoveryAggregator::GetApplicationCredentials() {
    std::shared_ptr<const BuiltinDiscoveryTables> builtin;
    {
        std::lock_guard lock(mutex_);
        builtin = builtin_;
    }

    auto out = builtin->applicationCredentials;
    auto custom = registry_.GetCustomPlugins();
    if (custom.hasError()) {
        return out;
    }
    for (const auto& [domain, plugin] : *custom.value()) {
        const auto& deps = plugin->Dependencies();
        if (std::find(deps.begin(), deps.end(), "application_credentials") != deps.end()) {
            out.push_back(domain);
        }
    }
    return out;
}

void DiscoveryAggregator::ResetCaches() {
    std::lock_guard lock(mutex_);
    cache_ = Cache{};
    ++generation_;
}

void DiscoveryAggregator::SetBuiltinTables(BuiltinDiscoveryTables builtin) {
    auto tables = std::make_shared<const BuiltinDiscoveryTables>(std::move(builtin));
    std::lock_guard lock(mutex_);
    builtin_ = std::move(tables);
    cache_ = Cache{};
    ++generation_;
}

LoaderResult<void> DiscoveryAggregator::LoadBuiltinDiscoveryTables(
    const IPluginFilesystem& fs, const std::filesystem::path& path) {
    auto text = fs.ReadText(path);
    if (text.hasError()) {
        return LoaderResult<void>::err(std::move(text).error());
    }

    auto document = ParseJsonDocument(text.value(), ErrorCode::DiscoveryTableInvalid);
    if (document.hasError()) {
        return LoaderResult<void>::err(
            LoaderError(ErrorCode::DiscoveryTableInvalid,
                        "Cannot parse " + path.string() + ": " +
                            std::string(document.error().message())));
    }

    auto tables = ParseBuiltinDiscoveryTables(document.value());
    if (tables.hasError()) {
        return LoaderResult<void>::err(std::move(tables).error());
    }
    SetBuiltinTables(std::move(tables).value());
    INTG_LOG_INFO(LogCategory::Discovery, "Loaded built-in discovery tables from " + path.string());
    return LoaderResult<void>::ok();
}

}  // namespace intg::loader
