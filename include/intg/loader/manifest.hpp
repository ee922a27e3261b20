#pragma once

/// @file manifest.hpp
/// @brief Typed integration manifest parsed from <root>/<domain>/manifest.json.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "intg/foundation/loader_result.hpp"
#include "intg/loader/discovery_types.hpp"
#include "intg/loader/json_document.hpp"

namespace intg::loader {

/// Manifest file name looked up inside every plugin directory.
inline constexpr std::string_view kManifestFileName = "manifest.json";

/// Classification tag of an integration.
enum class IntegrationType : uint8_t {
    Entity,
    Integration,
    Hardware,
    Helper,
    System
};

[[nodiscard]] std::string_view integrationTypeName(IntegrationType type) noexcept;

/// Parse "entity" | "integration" | "hardware" | "helper" | "system".
[[nodiscard]] std::optional<IntegrationType> parseIntegrationType(std::string_view text) noexcept;

/// Static descriptor of an integration. Immutable once loaded.
///
/// Discovery fragments keep the manifest layout; records carry an empty
/// domain until the DiscoveryAggregator tags them.
struct Manifest {
    std::string domain;
    std::string name;
    std::vector<std::string> dependencies;
    std::vector<std::string> afterDependencies;
    std::vector<std::string> requirements;
    bool configFlow = false;
    IntegrationType integrationType = IntegrationType::Integration;
    std::optional<std::string> version;

    std::optional<std::string> documentation;
    std::optional<std::string> issueTracker;
    std::optional<std::string> qualityScale;
    std::optional<std::string> iotClass;
    std::optional<std::string> disabled;
    std::vector<std::string> codeowners;
    std::vector<std::string> loggers;

    std::vector<ZeroconfEntry> zeroconf;
    std::vector<BluetoothMatcher> bluetooth;
    std::vector<DhcpMatcher> dhcp;
    std::vector<UsbMatcher> usb;
    std::vector<SsdpMatcher> ssdp;
    std::vector<std::string> homekitModels;
    std::vector<std::string> mqtt;
};

/// Build a Manifest from a parsed document.
///
/// @return ManifestParseFailed if the document is not an object,
///         ManifestInvalid if "domain" is missing/empty or a field has the
///         wrong shape.
[[nodiscard]] foundation::LoaderResult<Manifest> ParseManifest(const Json& document);

/// Parse manifest JSON text.
///
/// @return ManifestParseFailed for text that is not exactly one JSON
///         document (trailing content, comments, repeated keys), otherwise
///         as ParseManifest().
[[nodiscard]] foundation::LoaderResult<Manifest> ParseManifestText(std::string_view text);

}  // namespace intg::loader
