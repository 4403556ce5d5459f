#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "media_type.hpp"

namespace rest_check {

    /// @brief 2xx.
    inline bool is_success_status(int status) noexcept {
        return status >= 200 && status < 300;
    }

    /// @brief 3xx except 304 Not Modified.
    inline bool is_redirect_status(int status) noexcept {
        return status >= 300 && status < 400 && status != 304;
    }

    /**
     * @brief What the caller requires of a single response.
     */
    struct ResponseExpectations {
        /** @brief Whether a redirect response is acceptable. When false, a
         * status accepted by redirect_status is an UnexpectedRedirect. */
        bool allows_redirects{true};

        /** @brief Required Content-Type, if any. */
        std::optional<ContentTypeMatcher> required_content_type;

        /** @brief Whether a 204 No Content is a failure. */
        bool requires_entity{false};

        /** @brief Which status codes count as success. */
        std::function<bool(int)> success_status{&is_success_status};

        /** @brief Which status codes count as redirects. */
        std::function<bool(int)> redirect_status{&is_redirect_status};
    };

    /**
     * @brief Classifier-wide settings, shared by all requests.
     */
    struct ClassifierConfiguration {
        /** @brief Extra media types, besides application/json, whose bodies
         * are decoded into BodyJSON. Lowercase `type/subtype`. */
        std::vector<std::string> json_media_types;

        /** @brief Treat any `+json` suffixed subtype as JSON. */
        bool accept_json_suffix{true};
    };

}  // namespace rest_check
