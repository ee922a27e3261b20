#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "fake_filesystem.hpp"
#include "intg/foundation/config_manager.hpp"
#include "intg/loader/host_config.hpp"
#include "intg/loader/host_context.hpp"
#include "mock_logger.hpp"
#include "plugin_fixtures.hpp"

using namespace intg::loader;
using namespace intg::test;
using intg::foundation::ConfigManager;
using intg::foundation::ErrorCode;

// --- HostConfig ---

TEST(HostConfigTest, DefaultsWhenKeysMissing) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("{}").hasValue());

    auto result = HostConfig::FromConfig(config);
    ASSERT_TRUE(result.hasValue());
    const auto& host = result.value();
    EXPECT_FALSE(host.configDir.has_value());
    EXPECT_FALSE(host.safeMode);
    EXPECT_EQ(host.builtinRoot.string(), "./components");
    EXPECT_EQ(host.customDir, "custom_components");
    EXPECT_EQ(host.maxLoadConcurrency, 4u);
    EXPECT_FALSE(host.builtinDiscoveryTables.has_value());
    EXPECT_TRUE(host.CustomRoot().empty());
}

TEST(HostConfigTest, ReadsEveryKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
host:
  config_dir: /srv/config
  safe_mode: true
loader:
  builtin_root: /usr/share/intg/components
  custom_dir: plugins
  max_load_concurrency: 2
  builtin_discovery_tables: /usr/share/intg/discovery.json
)").hasValue());

    auto result = HostConfig::FromConfig(config);
    ASSERT_TRUE(result.hasValue());
    const auto& host = result.value();
    ASSERT_TRUE(host.configDir.has_value());
    EXPECT_EQ(host.configDir->string(), "/srv/config");
    EXPECT_TRUE(host.safeMode);
    EXPECT_EQ(host.builtinRoot.string(), "/usr/share/intg/components");
    EXPECT_EQ(host.maxLoadConcurrency, 2u);
    EXPECT_EQ(host.CustomRoot().string(), "/srv/config/plugins");
    ASSERT_TRUE(host.builtinDiscoveryTables.has_value());
    EXPECT_EQ(host.builtinDiscoveryTables->string(), "/usr/share/intg/discovery.json");
}

TEST(HostConfigTest, TypeMismatchIsReported) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("host:\n  safe_mode: sometimes\n").hasValue());

    auto result = HostConfig::FromConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(HostConfigTest, ZeroConcurrencyIsRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("loader:\n  max_load_concurrency: 0\n").hasValue());

    auto result = HostConfig::FromConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(HostConfigTest, ConcurrencyAboveWorkerCapIsRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("loader:\n  max_load_concurrency: 16\n").hasValue());

    auto result = HostConfig::FromConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_NE(std::string(result.error().message()).find("must not exceed 4"), std::string::npos);
}

// --- HostContext ---

class HostContextTest : public LoggingTest {};

TEST_F(HostContextTest, CreateWiresComponents) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
host:
  config_dir: /config
loader:
  builtin_root: /builtin
  max_load_concurrency: 3
  builtin_discovery_tables: /tables/discovery.json
)").hasValue());

    auto fs = std::make_unique<FakeFilesystem>();
    fs->AddFile(ManifestPath(kBuiltinRoot, "hue"), ManifestJson("hue"));
    fs->AddFile("/tables/discovery.json", R"({"homekit": {"BSB002": "hue"}})");

    auto host = HostContext::Create(config, std::move(fs));
    ASSERT_TRUE(host.hasValue());
    auto& ctx = *host.value();

    EXPECT_EQ(ctx.Scheduler().workerCount(), 3u);
    EXPECT_EQ(ctx.Config().CustomRoot().string(), "/config/custom_components");
    EXPECT_EQ(ctx.Discovery().GetHomekit().at("BSB002"), "hue");

    auto hue = ctx.Plugins().Get("hue");
    ASSERT_TRUE(hue.hasValue());
    EXPECT_TRUE(ctx.Dependencies().Resolve(*hue.value()));
}

TEST_F(HostContextTest, CreateFailsOnBadTables) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
host:
  config_dir: /config
loader:
  builtin_discovery_tables: /tables/discovery.json
)").hasValue());

    auto fs = std::make_unique<FakeFilesystem>();
    fs->AddFile("/tables/discovery.json", R"({"usb": "nope"})");

    auto host = HostContext::Create(config, std::move(fs));
    ASSERT_TRUE(host.hasError());
    EXPECT_EQ(host.error().code(), ErrorCode::DiscoveryTableInvalid);
}

TEST_F(HostContextTest, CreateFailsOnBadConfig) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("host:\n  config_dir: [a, b]\n").hasValue());

    auto host = HostContext::Create(config, std::make_unique<FakeFilesystem>());
    ASSERT_TRUE(host.hasError());
    EXPECT_EQ(host.error().code(), ErrorCode::ConfigTypeMismatch);
}
