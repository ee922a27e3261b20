/// @file json_document.cpp
/// @brief ParseJsonDocument implementation.

#include "intg/loader/json_document.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;

namespace intg::loader {

LoaderResult<Json> ParseJsonDocument(std::string_view text, ErrorCode failure) {
    // Keys seen so far, one set per open object.
    std::vector<std::set<std::string>> openObjects;
    std::optional<std::string> duplicate;

    Json::parser_callback_t trackKeys = [&](int /*depth*/, Json::parse_event_t event,
                                            Json& parsed) {
        switch (event) {
            case Json::parse_event_t::object_start:
                openObjects.emplace_back();
                break;
            case Json::parse_event_t::object_end:
                if (!openObjects.empty()) {
                    openObjects.pop_back();
                }
                break;
            case Json::parse_event_t::key:
                if (!openObjects.empty() &&
                    !openObjects.back().insert(parsed.get<std::string>()).second && !duplicate) {
                    duplicate = parsed.get<std::string>();
                }
                break;
            default:
                break;
        }
        return true;
    };

    Json document;
    try {
        document = Json::parse(text.begin(), text.end(), trackKeys);
    } catch (const Json::parse_error& e) {
        return LoaderResult<Json>::err(LoaderError(failure, e.what()));
    }
    if (duplicate) {
        return LoaderResult<Json>::err(
            LoaderError(failure, "duplicate key \"" + *duplicate + "\""));
    }
    return LoaderResult<Json>::ok(std::move(document));
}

const Json& JsonMember(const Json& object, std::string_view key) {
    static const Json kNull;
    if (!object.is_object()) {
        return kNull;
    }
    auto it = object.find(std::string(key));
    return it == object.end() ? kNull : *it;
}

}  // namespace intg::loader
