#pragma once

/// @file json_document.hpp
/// @brief Strict JSON parsing for manifests and discovery tables.

#include <string_view>

#include <nlohmann/json.hpp>

#include "intg/foundation/error_code.hpp"
#include "intg/foundation/loader_result.hpp"

namespace intg::loader {

using Json = nlohmann::json;

/// Parse @p text as one JSON document.
///
/// Comments, trailing content and repeated keys inside one object are
/// rejected.
///
/// @return The document, or @p failure with the parser's message.
[[nodiscard]] foundation::LoaderResult<Json> ParseJsonDocument(std::string_view text,
                                                               foundation::ErrorCode failure);

/// Member @p key of @p object, or a null value when @p object is not an
/// object or has no such member.
[[nodiscard]] const Json& JsonMember(const Json& object, std::string_view key);

/// True unless @p node is null.
[[nodiscard]] inline bool IsPresent(const Json& node) noexcept {
    return !node.is_null();
}

}  // namespace intg::loader
