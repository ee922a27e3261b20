#pragma once

/// @file logger.hpp
/// @brief Logger wrapping the kcenon common_system logger interface.
///
/// Category-based filtering, structured context and per-category runtime
/// level control for the loader subsystems.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "intg/foundation/loader_result.hpp"

namespace intg::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Loader log categories.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Host context and tooling
    Loader     = 1, ///< Manifest probing and plugin construction
    Registry   = 2, ///< Plugin cache and pending markers
    Dependency = 3, ///< Dependency closure computation
    Discovery  = 4, ///< Discovery table aggregation
    Module     = 5, ///< Legacy module loading and component facade
    Config     = 6  ///< Host configuration
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Loader", "Registry", "Dependency", "Discovery", "Module", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.domain = "hue";
///   ctx.path = "/config/custom_components/hue/manifest.json";
///   ctx.extra["cause"] = "unexpected token";
///   Logger::instance().logWithContext(LogLevel::Error, LogCategory::Loader,
///                                     "Error loading integration", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> domain;
    std::optional<std::string> path;
    std::unordered_map<std::string, std::string> extra;
};

/// Loader logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to keep kcenon headers out of the public API. Each category
/// logs through a named logger ("intg.<Category>") registered in the
/// kcenon GlobalLoggerRegistry, falling back to the default logger.
/// Every category defaults to Info.
class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    LoaderResult<void> flush();

    /// Process-wide logger instance.
    static Logger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace intg::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// INTG_MIN_LOG_LEVEL can be defined before including this header to
/// compile out logging calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef INTG_MIN_LOG_LEVEL
    #define INTG_MIN_LOG_LEVEL 0
#endif

#define INTG_LOG(level, cat, msg)                                                   \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= INTG_MIN_LOG_LEVEL &&                        \
            ::intg::foundation::Logger::instance().isEnabled((level), (cat)))       \
        {                                                                           \
            ::intg::foundation::Logger::instance().log((level), (cat), (msg));      \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define INTG_LOG_DEBUG(cat, msg) \
    INTG_LOG(::intg::foundation::LogLevel::Debug, (cat), (msg))

#define INTG_LOG_INFO(cat, msg) \
    INTG_LOG(::intg::foundation::LogLevel::Info, (cat), (msg))

#define INTG_LOG_WARN(cat, msg) \
    INTG_LOG(::intg::foundation::LogLevel::Warning, (cat), (msg))

#define INTG_LOG_ERROR(cat, msg) \
    INTG_LOG(::intg::foundation::LogLevel::Error, (cat), (msg))
