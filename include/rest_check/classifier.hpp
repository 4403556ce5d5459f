#pragma once
#include <optional>

#include "config.hpp"
#include "error.hpp"
#include "response.hpp"
#include "result.hpp"

namespace rest_check {

    /**
     * @brief Decide whether a completed exchange satisfies the expectations.
     *
     * Rules are checked in this order and the first one that applies wins:
     *  1. redirect status while redirects are disallowed -> UnexpectedRedirect
     *  2. status rejected by success_status              -> FailedResponse
     *  3. 204 while an entity is required                -> UnexpectedNoContent
     *  4. Content-Type not accepted by the matcher       -> UnexpectedContentType
     *
     * Pure function: safe to call concurrently, never throws on malformed
     * headers or bodies.
     *
     * @param response The completed exchange.
     * @param expectations What the caller requires of this response.
     * @param config JSON media type settings used to populate BodyJSON.
     * @return std::nullopt on success, otherwise the classified error.
     */
    [[nodiscard]] std::optional<HttpError> classify(
        const Response& response, const ResponseExpectations& expectations,
        const ClassifierConfiguration& config = {});

    /**
     * @brief classify() in Result form.
     * @return The response itself if it is acceptable, otherwise the error.
     */
    [[nodiscard]] Result<Response> check_response(
        Response response, const ResponseExpectations& expectations,
        const ClassifierConfiguration& config = {});

}  // namespace rest_check
