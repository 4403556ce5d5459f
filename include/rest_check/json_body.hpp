#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

#include "config.hpp"

namespace rest_check {

    /// @brief True if `content_type` names a JSON body: application/json, a
    /// `+json` suffix (when enabled), or one of config.json_media_types.
    /// A missing Content-Type is never JSON.
    [[nodiscard]] bool is_json_content_type(
        std::optional<std::string_view> content_type,
        const ClassifierConfiguration& config = {});

    /**
     * @brief Decode a body whose top-level value must be a JSON object.
     *
     * Top-level members whose value is null are removed. Nested values are
     * kept untouched, nulls included. Member order follows the document.
     *
     * @param body Raw response body.
     * @return The object, or std::nullopt if the body is not valid JSON or its
     * top-level value is not an object.
     */
    [[nodiscard]] std::optional<nlohmann::ordered_json> decode_json_object(
        std::string_view body);

}  // namespace rest_check
