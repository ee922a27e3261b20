/// @file discovery_types.cpp
/// @brief Parsing of discovery matcher fragments from manifest/table documents.

#include "intg/loader/discovery_types.hpp"

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;

namespace intg::loader {

namespace {

std::optional<std::string> optString(const Json& parent, const char* key) {
    const auto& value = JsonMember(parent, key);
    if (!IsPresent(value)) {
        return std::nullopt;
    }
    return value.get<std::string>();
}

template <typename T>
std::optional<T> optScalar(const Json& parent, const char* key) {
    const auto& value = JsonMember(parent, key);
    if (!IsPresent(value)) {
        return std::nullopt;
    }
    return value.get<T>();
}

/// Text of a matcher value. Numbers and booleans keep their JSON spelling;
/// arrays and objects are rejected by get<std::string>().
std::string scalarText(const Json& value) {
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    return value.get<std::string>();
}

LoaderError invalidFragment(std::string_view what, std::string_view detail) {
    return LoaderError(ErrorCode::ManifestInvalid,
                       std::string("invalid ") + std::string(what) + " matcher: " +
                           std::string(detail));
}

/// Copy every scalar member of @p node except the excluded keys.
std::map<std::string, std::string> scalarMembers(const Json& node,
                                                 std::initializer_list<std::string_view> skip) {
    std::map<std::string, std::string> out;
    for (const auto& [key, value] : node.items()) {
        bool skipped = false;
        for (auto s : skip) {
            if (key == s) {
                skipped = true;
                break;
            }
        }
        if (!skipped) {
            out.emplace(key, scalarText(value));
        }
    }
    return out;
}

std::map<std::string, std::string> stringMap(const Json& node, std::string_view what) {
    if (!IsPresent(node)) {
        return {};
    }
    if (!node.is_object()) {
        throw std::invalid_argument(std::string(what) + " must be an object");
    }
    return scalarMembers(node, {});
}

}  // namespace

// ── Zeroconf ────────────────────────────────────────────────────────────

LoaderResult<ZeroconfEntry> ParseZeroconfEntry(const Json& node) {
    try {
        ZeroconfEntry entry;
        if (node.is_string()) {
            entry.type = node.get<std::string>();
            return LoaderResult<ZeroconfEntry>::ok(std::move(entry));
        }
        if (!node.is_object()) {
            return LoaderResult<ZeroconfEntry>::err(
                invalidFragment("zeroconf", "entry must be a string or an object"));
        }
        auto type = optString(node, "type");
        if (!type || type->empty()) {
            return LoaderResult<ZeroconfEntry>::err(
                invalidFragment("zeroconf", "object entry without \"type\""));
        }
        entry.type = *type;
        entry.isObject = true;
        entry.properties = stringMap(JsonMember(node, "properties"), "properties");
        entry.fields = scalarMembers(node, {"type", "properties"});
        return LoaderResult<ZeroconfEntry>::ok(std::move(entry));
    } catch (const Json::exception& e) {
        return LoaderResult<ZeroconfEntry>::err(invalidFragment("zeroconf", e.what()));
    } catch (const std::invalid_argument& e) {
        return LoaderResult<ZeroconfEntry>::err(invalidFragment("zeroconf", e.what()));
    }
}

LoaderResult<ZeroconfMatcher> ParseZeroconfMatcher(const Json& node) {
    try {
        if (!node.is_object()) {
            return LoaderResult<ZeroconfMatcher>::err(
                invalidFragment("zeroconf", "table entry must be an object"));
        }
        ZeroconfMatcher matcher;
        matcher.domain = optString(node, "domain").value_or("");
        if (matcher.domain.empty()) {
            return LoaderResult<ZeroconfMatcher>::err(
                invalidFragment("zeroconf", "table entry without \"domain\""));
        }
        matcher.properties = stringMap(JsonMember(node, "properties"), "properties");
        matcher.fields = scalarMembers(node, {"domain", "properties"});
        return LoaderResult<ZeroconfMatcher>::ok(std::move(matcher));
    } catch (const Json::exception& e) {
        return LoaderResult<ZeroconfMatcher>::err(invalidFragment("zeroconf", e.what()));
    } catch (const std::invalid_argument& e) {
        return LoaderResult<ZeroconfMatcher>::err(invalidFragment("zeroconf", e.what()));
    }
}

// ── Bluetooth ───────────────────────────────────────────────────────────

LoaderResult<BluetoothMatcher> ParseBluetoothMatcher(const Json& node) {
    if (!node.is_object()) {
        return LoaderResult<BluetoothMatcher>::err(
            invalidFragment("bluetooth", "entry must be an object"));
    }
    try {
        BluetoothMatcher m;
        m.domain = optString(node, "domain").value_or("");
        m.localName = optString(node, "local_name");
        m.serviceUuid = optString(node, "service_uuid");
        m.serviceDataUuid = optString(node, "service_data_uuid");
        m.manufacturerId = optScalar<int>(node, "manufacturer_id");
        m.connectable = optScalar<bool>(node, "connectable");
        const auto& start = JsonMember(node, "manufacturer_data_start");
        if (IsPresent(start)) {
            if (!start.is_array()) {
                return LoaderResult<BluetoothMatcher>::err(
                    invalidFragment("bluetooth", "manufacturer_data_start must be a list"));
            }
            for (const auto& byte : start) {
                m.manufacturerDataStart.push_back(byte.get<int>());
            }
        }
        return LoaderResult<BluetoothMatcher>::ok(std::move(m));
    } catch (const Json::exception& e) {
        return LoaderResult<BluetoothMatcher>::err(invalidFragment("bluetooth", e.what()));
    }
}

// ── DHCP ────────────────────────────────────────────────────────────────

LoaderResult<DhcpMatcher> ParseDhcpMatcher(const Json& node) {
    if (!node.is_object()) {
        return LoaderResult<DhcpMatcher>::err(invalidFragment("dhcp", "entry must be an object"));
    }
    try {
        DhcpMatcher m;
        m.domain = optString(node, "domain").value_or("");
        m.macaddress = optString(node, "macaddress");
        m.hostname = optString(node, "hostname");
        m.registeredDevices = optScalar<bool>(node, "registered_devices");
        return LoaderResult<DhcpMatcher>::ok(std::move(m));
    } catch (const Json::exception& e) {
        return LoaderResult<DhcpMatcher>::err(invalidFragment("dhcp", e.what()));
    }
}

// ── USB ─────────────────────────────────────────────────────────────────

LoaderResult<UsbMatcher> ParseUsbMatcher(const Json& node) {
    if (!node.is_object()) {
        return LoaderResult<UsbMatcher>::err(invalidFragment("usb", "entry must be an object"));
    }
    try {
        UsbMatcher m;
        m.domain = optString(node, "domain").value_or("");
        m.vid = optString(node, "vid");
        m.pid = optString(node, "pid");
        m.serialNumber = optString(node, "serial_number");
        m.manufacturer = optString(node, "manufacturer");
        m.description = optString(node, "description");
        return LoaderResult<UsbMatcher>::ok(std::move(m));
    } catch (const Json::exception& e) {
        return LoaderResult<UsbMatcher>::err(invalidFragment("usb", e.what()));
    }
}

// ── SSDP ────────────────────────────────────────────────────────────────

LoaderResult<SsdpMatcher> ParseSsdpMatcher(const Json& node) {
    if (!node.is_object()) {
        return LoaderResult<SsdpMatcher>::err(invalidFragment("ssdp", "entry must be an object"));
    }
    try {
        return LoaderResult<SsdpMatcher>::ok(scalarMembers(node, {}));
    } catch (const Json::exception& e) {
        return LoaderResult<SsdpMatcher>::err(invalidFragment("ssdp", e.what()));
    }
}

LoaderResult<std::vector<std::string>> ParseStringList(const Json& node, std::string_view what) {
    std::vector<std::string> out;
    if (!IsPresent(node)) {
        return LoaderResult<std::vector<std::string>>::ok(std::move(out));
    }
    auto notAList = [what] {
        return LoaderResult<std::vector<std::string>>::err(LoaderError(
            ErrorCode::ManifestInvalid, std::string(what) + " must be a list of strings"));
    };
    if (!node.is_array()) {
        return notAList();
    }
    for (const auto& item : node) {
        if (!item.is_string()) {
            return notAList();
        }
        out.push_back(item.get<std::string>());
    }
    return LoaderResult<std::vector<std::string>>::ok(std::move(out));
}

}  // namespace intg::loader
