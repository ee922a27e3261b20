/// @file version_strategy.cpp
/// @brief Version strategy matching.

#include "intg/loader/version_strategy.hpp"

#include <charconv>
#include <regex>

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;

namespace intg::loader {

namespace {

const std::regex& patternFor(VersionStrategy strategy) {
    static const std::regex calver(
        R"(^(\d{2}|\d{4})\.(0?[1-9]|1[0-2])(\.\d{1,2})?(\.?(a|b|rc|dev)\d*|\.\d+)?$)");
    static const std::regex semver(
        R"(^[vV]?(0|[1-9]\d*)\.(0|[1-9]\d*)\.(0|[1-9]\d*))"
        R"((-((0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*)(\.(0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*))*))?)"
        R"((\+[0-9a-zA-Z-]+(\.[0-9a-zA-Z-]+)*)?$)");
    static const std::regex simplever(R"(^[vV]?\d+(\.\d+)*$)");
    static const std::regex buildver(R"(^\d+$)");
    static const std::regex pep440(
        R"(^([1-9]\d*!)?(0|[1-9]\d*)(\.(0|[1-9]\d*))*((a|b|rc)(0|[1-9]\d*))?)"
        R"((\.post(0|[1-9]\d*))?(\.dev(0|[1-9]\d*))?$)");

    switch (strategy) {
        case VersionStrategy::CalVer:    return calver;
        case VersionStrategy::SemVer:    return semver;
        case VersionStrategy::SimpleVer: return simplever;
        case VersionStrategy::BuildVer:  return buildver;
        case VersionStrategy::Pep440:    return pep440;
    }
    return simplever;
}

std::vector<uint64_t> releaseSegments(std::string_view text) {
    std::vector<uint64_t> out;
    if (!text.empty() && (text.front() == 'v' || text.front() == 'V')) {
        text.remove_prefix(1);
    }
    if (auto bang = text.find('!'); bang != std::string_view::npos) {
        text.remove_prefix(bang + 1);
    }
    while (!text.empty()) {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc()) {
            break;
        }
        out.push_back(value);
        text.remove_prefix(static_cast<std::size_t>(ptr - text.data()));
        if (text.empty() || text.front() != '.') {
            break;
        }
        text.remove_prefix(1);
    }
    return out;
}

}  // namespace

std::string_view versionStrategyName(VersionStrategy strategy) noexcept {
    switch (strategy) {
        case VersionStrategy::CalVer:    return "CalVer";
        case VersionStrategy::SemVer:    return "SemVer";
        case VersionStrategy::SimpleVer: return "SimpleVer";
        case VersionStrategy::BuildVer:  return "BuildVer";
        case VersionStrategy::Pep440:    return "PEP 440";
    }
    return "unknown";
}

bool MatchesStrategy(std::string_view text, VersionStrategy strategy) {
    return std::regex_match(text.begin(), text.end(), patternFor(strategy));
}

LoaderResult<ParsedVersion> ParseVersion(std::string_view text,
                                         std::initializer_list<VersionStrategy> strategies) {
    if (text.empty()) {
        return LoaderResult<ParsedVersion>::err(
            LoaderError(ErrorCode::VersionInvalid, "Empty version string"));
    }

    for (auto strategy : strategies) {
        if (MatchesStrategy(text, strategy)) {
            return LoaderResult<ParsedVersion>::ok(
                ParsedVersion{std::string(text), strategy, releaseSegments(text)});
        }
    }

    return LoaderResult<ParsedVersion>::err(LoaderError(
        ErrorCode::VersionInvalid,
        "Version '" + std::string(text) + "' does not match any accepted strategy"));
}

}  // namespace intg::loader
