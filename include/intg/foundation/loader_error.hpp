#pragma once

/// @file loader_error.hpp
/// @brief Loader error type used with Result<T, LoaderError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "intg/foundation/error_code.hpp"

namespace intg::foundation {

/// Context attached to per-domain failures (invalid domain, not found).
///
/// @c cause keeps the underlying diagnostic (parse error, version gate,
/// unexpected exception) without promoting it to the reported error kind.
struct DomainErrorInfo {
    std::string domain;
    std::string cause;
};

/// Context attached to CircularDependency errors: the edge that closed the cycle.
struct CircularDependencyInfo {
    std::string fromDomain;
    std::string toDomain;
};

/// Error carrying a categorized code, a human-readable message and
/// optional type-erased context data.
class LoaderError {
public:
    LoaderError() = default;

    explicit LoaderError(ErrorCode code)
        : code_(code) {}

    LoaderError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    LoaderError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

/// Build an InvalidDomain error for @p domain.
[[nodiscard]] inline LoaderError invalidDomainError(const std::string& domain) {
    return LoaderError(ErrorCode::InvalidDomain, "Invalid domain " + domain,
                       DomainErrorInfo{domain, {}});
}

/// Build an IntegrationNotFound error, optionally keeping the underlying cause.
[[nodiscard]] inline LoaderError notFoundError(const std::string& domain,
                                               std::string cause = {}) {
    return LoaderError(ErrorCode::IntegrationNotFound,
                       "Integration '" + domain + "' not found.",
                       DomainErrorInfo{domain, std::move(cause)});
}

/// Build a CircularDependency error for the edge @p from -> @p to.
[[nodiscard]] inline LoaderError circularDependencyError(const std::string& from,
                                                         const std::string& to) {
    return LoaderError(ErrorCode::CircularDependency,
                       "Circular dependency detected: " + from + " -> " + to + ".",
                       CircularDependencyInfo{from, to});
}

} // namespace intg::foundation
