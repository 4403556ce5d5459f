#include "rest_check/json_body.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "rest_check/media_type.hpp"

namespace rest_check {

    bool is_json_content_type(std::optional<std::string_view> content_type,
                              const ClassifierConfiguration& config) {
        if (!content_type) return false;
        const auto media = parse_media_type(*content_type);
        if (!media) return false;

        if (media->type == "application" && media->subtype == "json") {
            return true;
        }
        if (config.accept_json_suffix && media->suffix() == "json") {
            return true;
        }
        return std::any_of(config.json_media_types.begin(),
                           config.json_media_types.end(),
                           [&](const std::string& extra) {
                               const auto m = parse_media_type(extra);
                               return m && m->type == media->type &&
                                      m->subtype == media->subtype;
                           });
    }

    std::optional<nlohmann::ordered_json> decode_json_object(
        std::string_view body) {
        auto doc = nlohmann::ordered_json::parse(body.begin(), body.end(),
                                                 nullptr,
                                                 /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            spdlog::trace("rest_check: response body is not valid JSON");
            return std::nullopt;
        }
        if (!doc.is_object()) {
            spdlog::trace("rest_check: JSON body is a {}, not an object",
                          doc.type_name());
            return std::nullopt;
        }

        nlohmann::ordered_json out = nlohmann::ordered_json::object();
        for (auto& [key, value] : doc.items()) {
            if (value.is_null()) continue;
            out[key] = std::move(value);
        }
        return out;
    }

}  // namespace rest_check
