#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fake_filesystem.hpp"
#include "intg/foundation/job_scheduler.hpp"
#include "intg/loader/plugin_registry.hpp"
#include "mock_logger.hpp"
#include "plugin_fixtures.hpp"

using namespace intg::loader;
using namespace intg::test;
using namespace std::chrono_literals;
using intg::foundation::DomainErrorInfo;
using intg::foundation::ErrorCode;
using intg::foundation::JobScheduler;

class PluginRegistryTest : public LoggingTest {
protected:
    PluginRegistry& registry() {
        if (!registry_) {
            registry_ = std::make_unique<PluginRegistry>(fs_, config_, scheduler_);
        }
        return *registry_;
    }

    FakeFilesystem fs_;
    HostConfig config_ = TestHostConfig();
    JobScheduler scheduler_{2};
    std::unique_ptr<PluginRegistry> registry_;
};

// ---------------------------------------------------------------------------
// Single lookups
// ---------------------------------------------------------------------------

TEST_F(PluginRegistryTest, GetBuiltinPlugin) {
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));

    auto result = registry().Get("hue");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value()->Domain(), "hue");
    EXPECT_TRUE(result.value()->IsBuiltIn());
}

TEST_F(PluginRegistryTest, ResolvedPluginIsCached) {
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));

    auto first = registry().Get("hue");
    auto second = registry().Get("hue");
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(fs_.Probes(ManifestPath(kBuiltinRoot, "hue")), 1);
    EXPECT_EQ(registry().GetCached("hue"), first.value());
}

TEST_F(PluginRegistryTest, UnknownDomainIsNotFound) {
    auto result = registry().Get("ghost");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::IntegrationNotFound);
    EXPECT_EQ(result.error().message(), "Integration 'ghost' not found.");
    EXPECT_EQ(registry().GetCached("ghost"), nullptr);
}

TEST_F(PluginRegistryTest, FailuresAreNotCached) {
    auto missing = registry().Get("hue");
    ASSERT_TRUE(missing.hasError());

    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));
    auto found = registry().Get("hue");
    ASSERT_TRUE(found.hasValue());
    EXPECT_EQ(fs_.Probes(ManifestPath(kBuiltinRoot, "hue")), 2);
}

TEST_F(PluginRegistryTest, DottedDomainIsInvalidWithoutProbing) {
    auto result = registry().Get("hue.light");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidDomain);
    EXPECT_EQ(fs_.TotalProbes(), 0);
}

TEST_F(PluginRegistryTest, PathLikeDomainsAreInvalidWithoutProbing) {
    fs_.AddFile("/elsewhere/evil/manifest.json", ManifestJson("evil"));
    fs_.AddFile(kBuiltinRoot / "a" / "b" / "manifest.json", ManifestJson("b"));

    for (const auto* domain : {"/elsewhere/evil", "/x", "a/b", "a\\b", ""}) {
        auto result = registry().Get(domain);
        ASSERT_TRUE(result.hasError()) << domain;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidDomain) << domain;
    }
    EXPECT_EQ(fs_.TotalProbes(), 0);
    EXPECT_TRUE(registry().CachedDomains().empty());
    EXPECT_FALSE(mockLogger_->contains(log_level::info, "Loaded evil"));
}

TEST_F(PluginRegistryTest, MalformedManifestKeepsCause) {
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), "[1, 2");

    auto result = registry().Get("hue");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::IntegrationNotFound);
    auto* info = result.error().context<DomainErrorInfo>();
    ASSERT_NE(info, nullptr);
    EXPECT_FALSE(info->cause.empty());
}

TEST_F(PluginRegistryTest, MissingConfigDirFailsEveryDomain) {
    config_.configDir.reset();
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));

    auto results = registry().GetMany({"hue", "zwave"});
    ASSERT_EQ(results.size(), 2u);
    for (const auto& [domain, result] : results) {
        ASSERT_TRUE(result.hasError()) << domain;
        EXPECT_EQ(result.error().code(), ErrorCode::IntegrationNotFound);
        auto* info = result.error().context<DomainErrorInfo>();
        ASSERT_NE(info, nullptr);
        EXPECT_EQ(info->cause, "configuration directory is not set");
    }
    EXPECT_TRUE(mockLogger_->contains(log_level::error,
                                      "configuration directory is not set"));
    EXPECT_EQ(fs_.TotalProbes(), 0);
}

// ---------------------------------------------------------------------------
// Batches
// ---------------------------------------------------------------------------

TEST_F(PluginRegistryTest, GetManyCoalescesDuplicates) {
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));

    auto results = registry().GetMany({"hue", "hue", "ghost", "bad.domain"});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results.at("hue").hasValue());
    EXPECT_EQ(results.at("ghost").error().code(), ErrorCode::IntegrationNotFound);
    EXPECT_EQ(results.at("bad.domain").error().code(), ErrorCode::InvalidDomain);
    EXPECT_EQ(fs_.Probes(ManifestPath(kBuiltinRoot, "hue")), 1);
}

TEST_F(PluginRegistryTest, CachedDomainsAreSorted) {
    for (const auto* domain : {"zwave", "hue", "mqtt"}) {
        fs_.AddFile(ManifestPath(kBuiltinRoot, domain), ManifestJson(domain));
    }
    auto results = registry().GetMany({"zwave", "hue", "mqtt", "ghost"});
    EXPECT_EQ(results.size(), 4u);
    EXPECT_EQ(registry().CachedDomains(), (std::vector<std::string>{"hue", "mqtt", "zwave"}));
}

// Concurrent requests for one domain share a single filesystem probe.
TEST_F(PluginRegistryTest, ConcurrentRequestsShareOneResolution) {
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));
    std::promise<void> release;
    fs_.SetReadGate(release.get_future().share());

    constexpr int kCallers = 8;
    std::vector<std::future<intg::foundation::LoaderResult<PluginPtr>>> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.push_back(std::async(std::launch::async, [this] { return registry().Get("hue"); }));
    }
    std::this_thread::sleep_for(50ms);
    release.set_value();

    PluginPtr first;
    for (auto& caller : callers) {
        auto result = caller.get();
        ASSERT_TRUE(result.hasValue());
        if (!first) {
            first = result.value();
        }
        EXPECT_EQ(result.value(), first);
    }
    EXPECT_EQ(fs_.Probes(ManifestPath(kBuiltinRoot, "hue")), 1);
}

TEST_F(PluginRegistryTest, ConcurrentFailuresShareOneOutcome) {
    fs_.AddFile(ManifestPath(kBuiltinRoot, "ghost"), "{\"domain\": ");
    std::promise<void> release;
    fs_.SetReadGate(release.get_future().share());

    constexpr int kCallers = 8;
    std::vector<std::future<intg::foundation::LoaderResult<PluginPtr>>> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.push_back(
            std::async(std::launch::async, [this] { return registry().Get("ghost"); }));
    }
    std::this_thread::sleep_for(50ms);
    release.set_value();

    for (auto& caller : callers) {
        auto result = caller.get();
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::IntegrationNotFound);
        EXPECT_EQ(result.error().message(), "Integration 'ghost' not found.");
    }
    EXPECT_EQ(fs_.Probes(ManifestPath(kBuiltinRoot, "ghost")), 1);
    EXPECT_EQ(registry().GetCached("ghost"), nullptr);
    EXPECT_TRUE(registry().CachedDomains().empty());
}

// ---------------------------------------------------------------------------
// Custom root
// ---------------------------------------------------------------------------

TEST_F(PluginRegistryTest, CustomOverridesBuiltin) {
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));
    fs_.AddFile(ManifestPath(kCustomRoot, "hue"), ManifestJson("hue", {}, "2024.1.0"));

    auto result = registry().Get("hue");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value()->Root(), PluginRoot::Custom);
    EXPECT_EQ(result.value()->Directory().string(), "/config/custom_components/hue");
}

TEST_F(PluginRegistryTest, BlockedCustomFallsBackToBuiltin) {
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));
    fs_.AddFile(ManifestPath(kCustomRoot, "hue"), ManifestJson("hue"));

    auto result = registry().Get("hue");
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value()->IsBuiltIn());
    EXPECT_TRUE(mockLogger_->contains(log_level::error, "does not have a version key"));
}

TEST_F(PluginRegistryTest, SafeModeIgnoresCustomRoot) {
    config_.safeMode = true;
    fs_.AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));
    fs_.AddFile(ManifestPath(kCustomRoot, "hue"), ManifestJson("hue", {}, "1.0.0"));
    fs_.AddFile(ManifestPath(kCustomRoot, "acme"), ManifestJson("acme", {}, "1.0.0"));

    auto hue = registry().Get("hue");
    ASSERT_TRUE(hue.hasValue());
    EXPECT_TRUE(hue.value()->IsBuiltIn());
    EXPECT_EQ(registry().Get("acme").error().code(), ErrorCode::IntegrationNotFound);
    auto custom = registry().GetCustomPlugins();
    ASSERT_TRUE(custom.hasValue());
    EXPECT_TRUE(custom.value()->empty());
    EXPECT_EQ(fs_.Probes(ManifestPath(kCustomRoot, "acme")), 0);
}

TEST_F(PluginRegistryTest, CustomPluginsKeyedByManifestDomain) {
    fs_.AddFile(ManifestPath(kCustomRoot, "acme_dir"), ManifestJson("acme", {}, "1.0.0"));
    fs_.AddFile(ManifestPath(kCustomRoot, "broken"), "{");
    fs_.AddDirectory(kCustomRoot / "no_manifest");

    auto enumerated = registry().GetCustomPlugins();
    ASSERT_TRUE(enumerated.hasValue());
    const auto& custom = enumerated.value();
    ASSERT_EQ(custom->size(), 1u);
    ASSERT_EQ(custom->count("acme"), 1u);
    EXPECT_EQ(custom->at("acme")->Directory().string(), "/config/custom_components/acme_dir");

    // Enumeration runs once.
    auto again = registry().GetCustomPlugins();
    ASSERT_TRUE(again.hasValue());
    EXPECT_EQ(again.value(), custom);
    EXPECT_EQ(fs_.Probes(ManifestPath(kCustomRoot, "acme_dir")), 1);
}
