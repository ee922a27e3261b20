#pragma once

/// @file version_strategy.hpp
/// @brief Version string classification used by the custom plugin gate.
///
/// A custom plugin must declare a version matching at least one of the
/// accepted strategies:
///   CalVer     "2023.4", "2023.04.1", "23.4.0b1"
///   SemVer     "1.2.3", "v1.2.3-beta.1+build.5"
///   SimpleVer  "1", "1.2", "v1.2.3.4"
///   BuildVer   "20230401"
///   PEP 440    "1.0.post1", "2.0rc1", "1!2.0.dev3"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "intg/foundation/loader_result.hpp"

namespace intg::loader {

/// Supported version schemes.
enum class VersionStrategy : uint8_t {
    CalVer,
    SemVer,
    SimpleVer,
    BuildVer,
    Pep440
};

[[nodiscard]] std::string_view versionStrategyName(VersionStrategy strategy) noexcept;

/// Strategies accepted for custom plugins, in match order.
inline constexpr std::initializer_list<VersionStrategy> kCustomPluginStrategies = {
    VersionStrategy::CalVer, VersionStrategy::SemVer, VersionStrategy::SimpleVer,
    VersionStrategy::BuildVer, VersionStrategy::Pep440};

/// A version string classified under one strategy.
struct ParsedVersion {
    std::string text;
    VersionStrategy strategy = VersionStrategy::SimpleVer;
    /// Leading numeric release segments ("v1.2.3-rc1" -> {1, 2, 3}).
    std::vector<uint64_t> release;
};

/// Check @p text against a single strategy.
[[nodiscard]] bool MatchesStrategy(std::string_view text, VersionStrategy strategy);

/// Classify @p text under the first matching strategy in @p strategies.
///
/// @return VersionInvalid if the text is empty or matches none of them.
[[nodiscard]] foundation::LoaderResult<ParsedVersion> ParseVersion(
    std::string_view text,
    std::initializer_list<VersionStrategy> strategies = kCustomPluginStrategies);

}  // namespace intg::loader
