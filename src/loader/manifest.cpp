/// @file manifest.cpp
/// @brief Manifest parsing and validation.

#include "intg/loader/manifest.hpp"

#include <string>

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;

namespace intg::loader {

std::string_view integrationTypeName(IntegrationType type) noexcept {
    switch (type) {
        case IntegrationType::Entity:      return "entity";
        case IntegrationType::Integration: return "integration";
        case IntegrationType::Hardware:    return "hardware";
        case IntegrationType::Helper:      return "helper";
        case IntegrationType::System:      return "system";
    }
    return "integration";
}

std::optional<IntegrationType> parseIntegrationType(std::string_view text) noexcept {
    if (text == "entity") return IntegrationType::Entity;
    if (text == "integration") return IntegrationType::Integration;
    if (text == "hardware") return IntegrationType::Hardware;
    if (text == "helper") return IntegrationType::Helper;
    if (text == "system") return IntegrationType::System;
    return std::nullopt;
}

namespace {

LoaderResult<Manifest> invalid(const std::string& domain, std::string_view detail) {
    auto who = domain.empty() ? std::string("manifest") : "manifest of '" + domain + "'";
    return LoaderResult<Manifest>::err(
        LoaderError(ErrorCode::ManifestInvalid, who + ": " + std::string(detail)));
}

/// Parse every element of a sequence with @p parse, appending to @p out.
template <typename T, typename Parser>
std::optional<LoaderError> parseSequence(const Json& node, std::string_view key,
                                         std::vector<T>& out, Parser parse) {
    if (!IsPresent(node)) {
        return std::nullopt;
    }
    if (!node.is_array()) {
        return LoaderError(ErrorCode::ManifestInvalid, std::string(key) + " must be a list");
    }
    for (const auto& item : node) {
        auto parsed = parse(item);
        if (parsed.hasError()) {
            return std::move(parsed).error();
        }
        out.push_back(std::move(parsed).value());
    }
    return std::nullopt;
}

}  // namespace

LoaderResult<Manifest> ParseManifest(const Json& document) {
    if (!document.is_object()) {
        return LoaderResult<Manifest>::err(
            LoaderError(ErrorCode::ManifestParseFailed, "manifest must be a JSON object"));
    }

    Manifest manifest;
    try {
        const auto& domain = JsonMember(document, "domain");
        if (!domain.is_string() || domain.get<std::string>().empty()) {
            return invalid({}, "missing \"domain\"");
        }
        manifest.domain = domain.get<std::string>();

        const auto& name = JsonMember(document, "name");
        manifest.name = IsPresent(name) ? name.get<std::string>() : manifest.domain;

        const auto& configFlow = JsonMember(document, "config_flow");
        manifest.configFlow = IsPresent(configFlow) && configFlow.get<bool>();

        const auto& type = JsonMember(document, "integration_type");
        if (IsPresent(type)) {
            auto typeName = type.get<std::string>();
            auto parsed = parseIntegrationType(typeName);
            if (!parsed) {
                return invalid(manifest.domain, "unknown integration_type \"" + typeName + "\"");
            }
            manifest.integrationType = *parsed;
        }

        auto optionalString = [&document](const char* key) -> std::optional<std::string> {
            const auto& node = JsonMember(document, key);
            if (!IsPresent(node)) {
                return std::nullopt;
            }
            return node.get<std::string>();
        };
        manifest.version = optionalString("version");
        manifest.documentation = optionalString("documentation");
        manifest.issueTracker = optionalString("issue_tracker");
        manifest.qualityScale = optionalString("quality_scale");
        manifest.iotClass = optionalString("iot_class");
        manifest.disabled = optionalString("disabled");
    } catch (const Json::exception& e) {
        return invalid(manifest.domain, e.what());
    }

    struct ListField {
        const char* key;
        std::vector<std::string>* target;
    };
    for (const auto& field : {ListField{"dependencies", &manifest.dependencies},
                              ListField{"after_dependencies", &manifest.afterDependencies},
                              ListField{"requirements", &manifest.requirements},
                              ListField{"codeowners", &manifest.codeowners},
                              ListField{"loggers", &manifest.loggers},
                              ListField{"mqtt", &manifest.mqtt}}) {
        auto list = ParseStringList(JsonMember(document, field.key), field.key);
        if (list.hasError()) {
            return invalid(manifest.domain, list.error().message());
        }
        *field.target = std::move(list).value();
    }

    std::optional<LoaderError> fragmentError;
    if (!fragmentError) {
        fragmentError = parseSequence(JsonMember(document, "zeroconf"), "zeroconf", manifest.zeroconf,
                                      ParseZeroconfEntry);
    }
    if (!fragmentError) {
        fragmentError = parseSequence(JsonMember(document, "bluetooth"), "bluetooth", manifest.bluetooth,
                                      ParseBluetoothMatcher);
    }
    if (!fragmentError) {
        fragmentError = parseSequence(JsonMember(document, "dhcp"), "dhcp", manifest.dhcp, ParseDhcpMatcher);
    }
    if (!fragmentError) {
        fragmentError = parseSequence(JsonMember(document, "usb"), "usb", manifest.usb, ParseUsbMatcher);
    }
    if (!fragmentError) {
        fragmentError = parseSequence(JsonMember(document, "ssdp"), "ssdp", manifest.ssdp, ParseSsdpMatcher);
    }
    if (fragmentError) {
        return invalid(manifest.domain, fragmentError->message());
    }

    const auto& homekit = JsonMember(document, "homekit");
    if (IsPresent(homekit)) {
        if (!homekit.is_object()) {
            return invalid(manifest.domain, "homekit must be an object");
        }
        auto models = ParseStringList(JsonMember(homekit, "models"), "homekit.models");
        if (models.hasError()) {
            return invalid(manifest.domain, models.error().message());
        }
        manifest.homekitModels = std::move(models).value();
    }

    return LoaderResult<Manifest>::ok(std::move(manifest));
}

LoaderResult<Manifest> ParseManifestText(std::string_view text) {
    auto document = ParseJsonDocument(text, ErrorCode::ManifestParseFailed);
    if (document.hasError()) {
        return LoaderResult<Manifest>::err(std::move(document).error());
    }
    return ParseManifest(document.value());
}

}  // namespace intg::loader
