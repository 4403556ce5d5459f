#include "rest_check/classifier.hpp"

#include <spdlog/spdlog.h>

#include <string>

#include "rest_check/json_body.hpp"

namespace rest_check {

    namespace {

        constexpr int kNoContent = 204;

        std::optional<std::string> body_if_present(const Response& response) {
            if (response.body.empty()) return std::nullopt;
            return response.body;
        }

        /// Empty header values are treated as absent.
        std::optional<std::string> header_copy(const Response& response,
                                               std::string_view name) {
            auto value = response.header(name);
            if (!value || value->empty()) return std::nullopt;
            return std::string(*value);
        }

        HttpError make_redirect_error(const Response& response) {
            UnexpectedRedirect p;
            p.status_code = response.status_code;
            p.location = header_copy(response, "Location");
            p.body_data = body_if_present(response);
            return HttpError(std::move(p));
        }

        HttpError make_failed_response_error(
            const Response& response, const ClassifierConfiguration& config) {
            FailedResponse p;
            p.status_code = response.status_code;
            p.body_data = body_if_present(response);
            if (p.body_data &&
                is_json_content_type(response.header("Content-Type"), config)) {
                p.body_json = decode_json_object(*p.body_data);
            }
            return HttpError(std::move(p));
        }

        HttpError make_content_type_error(const Response& response) {
            UnexpectedContentType p;
            p.content_type = header_copy(response, "Content-Type");
            p.body_data = body_if_present(response);
            return HttpError(std::move(p));
        }

        std::optional<HttpError> classify_impl(
            const Response& response, const ResponseExpectations& expectations,
            const ClassifierConfiguration& config) {
            const int status = response.status_code;

            if (!expectations.allows_redirects && expectations.redirect_status &&
                expectations.redirect_status(status)) {
                return make_redirect_error(response);
            }

            if (expectations.success_status &&
                !expectations.success_status(status)) {
                return make_failed_response_error(response, config);
            }

            if (status == kNoContent && expectations.requires_entity) {
                return HttpError(UnexpectedNoContent{});
            }

            if (expectations.required_content_type) {
                const auto content_type = response.header("Content-Type");
                if (!content_type ||
                    !expectations.required_content_type->matches(
                        *content_type)) {
                    return make_content_type_error(response);
                }
            }

            return std::nullopt;
        }

    }  // namespace

    std::optional<HttpError> classify(const Response& response,
                                      const ResponseExpectations& expectations,
                                      const ClassifierConfiguration& config) {
        auto error = classify_impl(response, expectations, config);
        if (error && spdlog::should_log(spdlog::level::debug)) {
            spdlog::debug("rest_check: {} (status {})", error->message(),
                          response.status_code);
        }
        return error;
    }

    Result<Response> check_response(Response response,
                                    const ResponseExpectations& expectations,
                                    const ClassifierConfiguration& config) {
        if (auto error = classify(response, expectations, config)) {
            return Result<Response>::err(std::move(*error));
        }
        return Result<Response>::ok(std::move(response));
    }

}  // namespace rest_check
