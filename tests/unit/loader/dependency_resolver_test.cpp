#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "fake_filesystem.hpp"
#include "intg/foundation/job_scheduler.hpp"
#include "intg/loader/dependency_resolver.hpp"
#include "intg/loader/plugin_registry.hpp"
#include "mock_logger.hpp"
#include "plugin_fixtures.hpp"

using namespace intg::loader;
using namespace intg::test;
using intg::foundation::CircularDependencyInfo;
using intg::foundation::DomainErrorInfo;
using intg::foundation::ErrorCode;
using intg::foundation::JobScheduler;

class DependencyResolverTest : public LoggingTest {
protected:
    void addBuiltin(const std::string& domain, const std::vector<std::string>& deps = {},
                    const std::string& extra = {}) {
        fs_.AddFile(ManifestPath(kBuiltinRoot, domain),
                    ManifestJson(domain, deps, std::nullopt, extra));
    }

    PluginPtr plugin(const std::string& domain) {
        auto result = registry_.Get(domain);
        EXPECT_TRUE(result.hasValue()) << domain;
        return result.hasValue() ? result.value() : nullptr;
    }

    FakeFilesystem fs_;
    HostConfig config_ = TestHostConfig();
    JobScheduler scheduler_{2};
    PluginRegistry registry_{fs_, config_, scheduler_};
    DependencyResolver resolver_{registry_};
};

// ---------------------------------------------------------------------------
// Closures
// ---------------------------------------------------------------------------

TEST_F(DependencyResolverTest, PluginWithoutDependenciesStartsResolved) {
    addBuiltin("http");
    auto http = plugin("http");
    ASSERT_NE(http, nullptr);

    EXPECT_EQ(http->GetDependencyState(), DependencyState::Resolved);
    EXPECT_TRUE(resolver_.Resolve(*http));
    auto all = http->AllDependencies();
    ASSERT_TRUE(all.hasValue());
    EXPECT_TRUE(all.value().empty());
}

TEST_F(DependencyResolverTest, AllDependenciesBeforeResolution) {
    addBuiltin("a", {"b"});
    addBuiltin("b");
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);

    EXPECT_FALSE(a->AllDependenciesResolved());
    auto all = a->AllDependencies();
    ASSERT_TRUE(all.hasError());
    EXPECT_EQ(all.error().code(), ErrorCode::DependenciesNotResolved);
}

TEST_F(DependencyResolverTest, TransitiveChain) {
    addBuiltin("a", {"b"});
    addBuiltin("b", {"c"});
    addBuiltin("c");
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);

    EXPECT_TRUE(resolver_.Resolve(*a));
    EXPECT_TRUE(a->AllDependenciesResolved());
    auto all = a->AllDependencies();
    ASSERT_TRUE(all.hasValue());
    EXPECT_EQ(all.value(), (std::set<std::string>{"b", "c"}));
}

TEST_F(DependencyResolverTest, DiamondIsDeduplicated) {
    addBuiltin("a", {"b", "c"});
    addBuiltin("b", {"d"});
    addBuiltin("c", {"d"});
    addBuiltin("d");
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);

    auto closure = resolver_.ComputeDependencies(*a);
    ASSERT_TRUE(closure.hasValue());
    EXPECT_EQ(closure.value(), (std::set<std::string>{"b", "c", "d"}));
}

TEST_F(DependencyResolverTest, AfterDependenciesAreNotRequired) {
    addBuiltin("a", {}, ", \"after_dependencies\": [\"ghost\"]");
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);

    EXPECT_TRUE(resolver_.Resolve(*a));
    EXPECT_TRUE(a->AllDependencies().value().empty());
}

// ---------------------------------------------------------------------------
// Cycles
// ---------------------------------------------------------------------------

TEST_F(DependencyResolverTest, CycleReportsClosingEdge) {
    addBuiltin("a", {"b"});
    addBuiltin("b", {"c"});
    addBuiltin("c", {"a"});

    auto a = plugin("a");
    auto b = plugin("b");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    auto fromA = resolver_.ComputeDependencies(*a);
    ASSERT_TRUE(fromA.hasError());
    EXPECT_EQ(fromA.error().code(), ErrorCode::CircularDependency);
    auto* edgeA = fromA.error().context<CircularDependencyInfo>();
    ASSERT_NE(edgeA, nullptr);
    EXPECT_EQ(edgeA->fromDomain, "c");
    EXPECT_EQ(edgeA->toDomain, "a");

    auto fromB = resolver_.ComputeDependencies(*b);
    ASSERT_TRUE(fromB.hasError());
    auto* edgeB = fromB.error().context<CircularDependencyInfo>();
    ASSERT_NE(edgeB, nullptr);
    EXPECT_EQ(edgeB->fromDomain, "a");
    EXPECT_EQ(edgeB->toDomain, "b");
}

TEST_F(DependencyResolverTest, SelfDependencyIsCycle) {
    addBuiltin("a", {"a"});
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);

    auto closure = resolver_.ComputeDependencies(*a);
    ASSERT_TRUE(closure.hasError());
    auto* edge = closure.error().context<CircularDependencyInfo>();
    ASSERT_NE(edge, nullptr);
    EXPECT_EQ(edge->fromDomain, "a");
    EXPECT_EQ(edge->toDomain, "a");
}

TEST_F(DependencyResolverTest, AfterDependencyOnStartIsCycle) {
    addBuiltin("a", {"b"});
    addBuiltin("b", {}, ", \"after_dependencies\": [\"a\"]");
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);

    auto closure = resolver_.ComputeDependencies(*a);
    ASSERT_TRUE(closure.hasError());
    auto* edge = closure.error().context<CircularDependencyInfo>();
    ASSERT_NE(edge, nullptr);
    EXPECT_EQ(edge->fromDomain, "a");
    EXPECT_EQ(edge->toDomain, "b");
}

TEST_F(DependencyResolverTest, FailedResolutionIsLoggedOnceAndRemembered) {
    addBuiltin("a", {"b"});
    addBuiltin("b", {"c"});
    addBuiltin("c", {"a"});
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);

    EXPECT_FALSE(resolver_.Resolve(*a));
    EXPECT_EQ(a->GetDependencyState(), DependencyState::Failed);
    EXPECT_TRUE(a->AllDependenciesResolved());
    EXPECT_EQ(a->AllDependencies().error().code(), ErrorCode::DependenciesNotResolved);
    EXPECT_EQ(mockLogger_->count(log_level::error,
                                 "Unable to resolve dependencies for a:  it contains a "
                                 "circular dependency: c -> a"),
              1u);

    EXPECT_FALSE(resolver_.Resolve(*a));
    EXPECT_EQ(mockLogger_->count(log_level::error, "Unable to resolve dependencies for a"), 1u);
}

// ---------------------------------------------------------------------------
// Missing dependencies
// ---------------------------------------------------------------------------

TEST_F(DependencyResolverTest, MissingSubDependency) {
    addBuiltin("a", {"b"});
    addBuiltin("b", {"ghost"});
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);

    auto closure = resolver_.ComputeDependencies(*a);
    ASSERT_TRUE(closure.hasError());
    EXPECT_EQ(closure.error().code(), ErrorCode::IntegrationNotFound);
    auto* info = closure.error().context<DomainErrorInfo>();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->domain, "ghost");

    EXPECT_FALSE(resolver_.Resolve(*a));
    EXPECT_TRUE(mockLogger_->contains(
        log_level::error,
        "Unable to resolve dependencies for a:  we are unable to resolve (sub)dependency ghost"));
}

TEST_F(DependencyResolverTest, SuccessfulResolutionIsRemembered) {
    addBuiltin("a", {"b"});
    addBuiltin("b");
    auto a = plugin("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(resolver_.Resolve(*a));

    EXPECT_TRUE(resolver_.Resolve(*a));
    EXPECT_EQ(fs_.Probes(ManifestPath(kBuiltinRoot, "b")), 1);
    EXPECT_EQ(a->AllDependencies().value(), (std::set<std::string>{"b"}));
}
