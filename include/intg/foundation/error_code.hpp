#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the integration loader.

#include <cstdint>
#include <string_view>

namespace intg::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    UnexpectedException = 0x0005,

    // Loader (0x0100 - 0x01FF)
    InvalidDomain = 0x0100,
    IntegrationNotFound = 0x0101,
    ManifestParseFailed = 0x0102,
    ManifestInvalid = 0x0103,
    VersionMissing = 0x0104,
    VersionInvalid = 0x0105,
    ConfigDirMissing = 0x0106,
    FilesystemError = 0x0107,

    // Dependency (0x0200 - 0x02FF)
    CircularDependency = 0x0200,
    DependencyNotFound = 0x0201,
    DependenciesNotResolved = 0x0202,

    // Discovery (0x0300 - 0x03FF)
    DiscoveryTableInvalid = 0x0300,

    // Module (0x0400 - 0x04FF)
    ModuleNotFound = 0x0400,
    ModuleLoadFailed = 0x0401,
    SymbolNotFound = 0x0402,
    CapabilityNotFound = 0x0403,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Loader";
        case 0x0200: return "Dependency";
        case 0x0300: return "Discovery";
        case 0x0400: return "Module";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace intg::foundation
