#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "intg/loader/manifest.hpp"

using namespace intg::loader;
using intg::foundation::ErrorCode;

// --- Required fields ---

TEST(ManifestTest, MinimalManifest) {
    auto result = ParseManifestText(R"({"domain": "hue"})");
    ASSERT_TRUE(result.hasValue());
    const auto& m = result.value();
    EXPECT_EQ(m.domain, "hue");
    EXPECT_EQ(m.name, "hue");
    EXPECT_TRUE(m.dependencies.empty());
    EXPECT_TRUE(m.afterDependencies.empty());
    EXPECT_FALSE(m.configFlow);
    EXPECT_EQ(m.integrationType, IntegrationType::Integration);
    EXPECT_FALSE(m.version.has_value());
}

TEST(ManifestTest, UnknownIntegrationTypeIsInvalid) {
    auto result = ParseManifestText(R"({"domain": "hue", "integration_type": "hub"})");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);
}

TEST(ManifestTest, OptionalFields) {
    auto result = ParseManifestText(R"({
        "domain": "hue",
        "name": "Philips Hue",
        "version": "1.2.3",
        "config_flow": true,
        "integration_type": "hardware",
        "dependencies": ["http"],
        "after_dependencies": ["zeroconf"],
        "requirements": ["aiohue==4.0"],
        "codeowners": ["@someone"],
        "documentation": "https://example.org/hue",
        "iot_class": "local_push",
        "disabled": "broken upstream",
        "loggers": ["aiohue"]
    })");
    ASSERT_TRUE(result.hasValue());
    const auto& m = result.value();
    EXPECT_EQ(m.name, "Philips Hue");
    ASSERT_TRUE(m.version.has_value());
    EXPECT_EQ(*m.version, "1.2.3");
    EXPECT_TRUE(m.configFlow);
    EXPECT_EQ(m.integrationType, IntegrationType::Hardware);
    EXPECT_EQ(m.dependencies, (std::vector<std::string>{"http"}));
    EXPECT_EQ(m.afterDependencies, (std::vector<std::string>{"zeroconf"}));
    EXPECT_EQ(m.requirements, (std::vector<std::string>{"aiohue==4.0"}));
    EXPECT_EQ(m.codeowners, (std::vector<std::string>{"@someone"}));
    EXPECT_EQ(m.loggers, (std::vector<std::string>{"aiohue"}));
    EXPECT_EQ(m.documentation.value_or(""), "https://example.org/hue");
    EXPECT_EQ(m.iotClass.value_or(""), "local_push");
    EXPECT_EQ(m.disabled.value_or(""), "broken upstream");
}

TEST(ManifestTest, MissingDomainIsInvalid) {
    auto result = ParseManifestText(R"({"name": "Nameless"})");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);
}

TEST(ManifestTest, EmptyDomainIsInvalid) {
    auto result = ParseManifestText(R"({"domain": ""})");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);
}

TEST(ManifestTest, MalformedTextFailsToParse) {
    auto result = ParseManifestText(R"({"domain": "hue", )");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestParseFailed);
}

TEST(ManifestTest, OnlyStrictJsonIsAccepted) {
    const char* rejected[] = {
        "domain: hue\nname: Hue\n",                   // block YAML
        R"({"domain": "hue"} trailing)",               // content after the document
        R"({"domain": "hue", "dependencies": ["http",]})",  // trailing comma
        R"({domain: "hue", version: 1.0})",            // unquoted keys
        R"({"domain": "hue", "domain": "light"})",     // repeated key
        R"({"domain": "hue" /* comment */})",
        R"({'domain': 'hue'})",
        "",
    };
    for (const auto* text : rejected) {
        auto result = ParseManifestText(text);
        ASSERT_TRUE(result.hasError()) << text;
        EXPECT_EQ(result.error().code(), ErrorCode::ManifestParseFailed) << text;
    }
}

TEST(ManifestTest, RepeatedKeysInNestedObjectsAreRejected) {
    auto result = ParseManifestText(
        R"({"domain": "hue", "homekit": {"models": ["A"], "models": ["B"]}})");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestParseFailed);
    EXPECT_NE(result.error().message().find("models"), std::string_view::npos);
}

TEST(ManifestTest, SameKeyInSiblingObjectsIsAllowed) {
    auto result = ParseManifestText(R"({
        "domain": "hue",
        "usb": [{"vid": "1"}, {"vid": "2"}]
    })");
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().usb.size(), 2u);
    EXPECT_EQ(result.value().usb[1].vid.value_or(""), "2");
}

TEST(ManifestTest, NonStringVersionIsInvalid) {
    auto result = ParseManifestText(R"({"domain": "hue", "version": 1.0})");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);
}

TEST(ManifestTest, NonObjectDocumentFailsToParse) {
    auto result = ParseManifestText(R"(["hue"])");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestParseFailed);
}

TEST(ManifestTest, DependenciesMustBeList) {
    auto result = ParseManifestText(R"({"domain": "hue", "dependencies": "http"})");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);
}

// --- Discovery fragments ---

TEST(ManifestTest, ZeroconfStringAndObjectEntries) {
    auto result = ParseManifestText(R"({
        "domain": "hue",
        "zeroconf": [
            "_hue._tcp.local.",
            {"type": "_http._tcp.local.", "name": "hue*", "properties": {"vendor": "signify"}}
        ]
    })");
    ASSERT_TRUE(result.hasValue());
    const auto& zc = result.value().zeroconf;
    ASSERT_EQ(zc.size(), 2u);
    EXPECT_EQ(zc[0].type, "_hue._tcp.local.");
    EXPECT_FALSE(zc[0].isObject);
    EXPECT_EQ(zc[1].type, "_http._tcp.local.");
    EXPECT_TRUE(zc[1].isObject);
    EXPECT_EQ(zc[1].fields.at("name"), "hue*");
    EXPECT_EQ(zc[1].properties.at("vendor"), "signify");
}

TEST(ManifestTest, ZeroconfObjectWithoutTypeIsInvalid) {
    auto result = ParseManifestText(R"({"domain": "hue", "zeroconf": [{"name": "x"}]})");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);
}

TEST(ManifestTest, MatcherFragments) {
    auto result = ParseManifestText(R"({
        "domain": "hue",
        "bluetooth": [{"local_name": "Hue*", "manufacturer_id": 76, "connectable": false}],
        "dhcp": [{"hostname": "hue*", "macaddress": "ECB5FA*"}],
        "usb": [{"vid": "10C4", "pid": "EA60", "description": "*zigbee*"}],
        "ssdp": [{"manufacturer": "Signify"}],
        "homekit": {"models": ["BSB002"]},
        "mqtt": ["hue/+/state"]
    })");
    ASSERT_TRUE(result.hasValue());
    const auto& m = result.value();

    ASSERT_EQ(m.bluetooth.size(), 1u);
    EXPECT_EQ(m.bluetooth[0].localName.value_or(""), "Hue*");
    EXPECT_EQ(m.bluetooth[0].manufacturerId.value_or(0), 76);
    EXPECT_EQ(m.bluetooth[0].connectable, std::optional<bool>(false));

    ASSERT_EQ(m.dhcp.size(), 1u);
    EXPECT_EQ(m.dhcp[0].hostname.value_or(""), "hue*");

    ASSERT_EQ(m.usb.size(), 1u);
    EXPECT_EQ(m.usb[0].vid.value_or(""), "10C4");
    EXPECT_EQ(m.usb[0].description.value_or(""), "*zigbee*");
    EXPECT_FALSE(m.usb[0].serialNumber.has_value());

    ASSERT_EQ(m.ssdp.size(), 1u);
    EXPECT_EQ(m.ssdp[0].at("manufacturer"), "Signify");

    EXPECT_EQ(m.homekitModels, (std::vector<std::string>{"BSB002"}));
    EXPECT_EQ(m.mqtt, (std::vector<std::string>{"hue/+/state"}));
}

TEST(ManifestTest, HomekitMustBeObject) {
    auto result = ParseManifestText(R"({"domain": "hue", "homekit": ["BSB002"]})");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ManifestInvalid);
}

// --- Integration type names ---

TEST(IntegrationTypeTest, NamesRoundTrip) {
    for (auto type : {IntegrationType::Entity, IntegrationType::Integration,
                      IntegrationType::Hardware, IntegrationType::Helper,
                      IntegrationType::System}) {
        EXPECT_EQ(parseIntegrationType(integrationTypeName(type)), type);
    }
    EXPECT_FALSE(parseIntegrationType("device").has_value());
}
