#pragma once

/// @file loader_result.hpp
/// @brief LoaderResult<T> type alias for loader error handling.

#include "intg/core/result.hpp"
#include "intg/foundation/loader_error.hpp"

namespace intg::foundation {

/// Result type specialized with LoaderError.
///
/// Example:
/// @code
///   LoaderResult<std::string> readManifest(const std::filesystem::path& p) {
///       if (!exists(p)) {
///           return LoaderResult<std::string>::err(
///               LoaderError(ErrorCode::NotFound, "no manifest at " + p.string()));
///       }
///       return LoaderResult<std::string>::ok(slurp(p));
///   }
/// @endcode
template <typename T>
using LoaderResult = intg::Result<T, LoaderError>;

}  // namespace intg::foundation
