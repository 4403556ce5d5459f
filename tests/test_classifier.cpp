#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "gtest/gtest.h"
#include "rest_check/classifier.hpp"

using rest_check::classify;
using rest_check::ErrorKind;
using rest_check::PayloadKey;
using rest_check::Response;
using rest_check::ResponseExpectations;

namespace {

    Response make_response(int status, std::string body = {},
                           std::string content_type = {}) {
        Response r;
        r.status_code = status;
        r.body = std::move(body);
        if (!content_type.empty()) {
            r.headers.emplace("Content-Type", std::move(content_type));
        }
        return r;
    }

    ResponseExpectations no_redirects() {
        ResponseExpectations e;
        e.allows_redirects = false;
        return e;
    }

}  // namespace

TEST(ClassifierTest, SuccessProducesNoError) {
    auto r = make_response(200, "{}", "application/json");
    EXPECT_FALSE(classify(r, {}).has_value());
}

TEST(ClassifierTest, FailedResponseWithJsonBody) {
    const std::string body = R"({"error":"bad","detail":null})";
    auto r = make_response(500, body, "application/json");

    auto err = classify(r, {});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::FailedResponse);
    EXPECT_EQ(err->status_code(), 500);
    EXPECT_EQ(err->body_data(), body);
    ASSERT_NE(err->body_json(), nullptr);
    EXPECT_EQ(err->body_json()->dump(), R"({"error":"bad"})");
}

TEST(ClassifierTest, FailedResponseKeepsRawBytes) {
    std::string body("\x00\xff\r\n binary", 11);
    auto r = make_response(502, body, "application/octet-stream");

    auto err = classify(r, {});
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(err->body_data().has_value());
    EXPECT_EQ(std::string(*err->body_data()), body);
    EXPECT_EQ(err->body_json(), nullptr);
}

TEST(ClassifierTest, FailedResponseEmptyBodyHasNoBodyKeys) {
    auto r = make_response(500, "", "application/json");

    auto err = classify(r, {});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::FailedResponse);
    EXPECT_EQ(err->payload_keys(),
              std::vector<PayloadKey>{PayloadKey::StatusCode});
}

TEST(ClassifierTest, BodyJsonOmittedWhenNotJsonContentType) {
    auto r = make_response(400, R"({"error":"bad"})", "text/plain");
    auto err = classify(r, {});
    ASSERT_TRUE(err.has_value());
    EXPECT_TRUE(err->body_data().has_value());
    EXPECT_EQ(err->body_json(), nullptr);
}

TEST(ClassifierTest, BodyJsonOmittedWhenContentTypeMissing) {
    auto r = make_response(400, R"({"error":"bad"})");
    auto err = classify(r, {});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->body_json(), nullptr);
}

TEST(ClassifierTest, BodyJsonOmittedWhenDecodeFailsOrNotObject) {
    for (const char* body : {"{broken", "[1,2]", "\"str\"", "null"}) {
        auto r = make_response(422, body, "application/json");
        auto err = classify(r, {});
        ASSERT_TRUE(err.has_value()) << body;
        EXPECT_EQ(err->kind(), ErrorKind::FailedResponse) << body;
        EXPECT_EQ(err->body_data(), body);
        EXPECT_EQ(err->body_json(), nullptr) << body;
    }
}

TEST(ClassifierTest, ProblemJsonIsDecoded) {
    auto r = make_response(404, R"({"title":"Not Found"})",
                           "application/problem+json; charset=utf-8");
    auto err = classify(r, {});
    ASSERT_TRUE(err.has_value());
    ASSERT_NE(err->body_json(), nullptr);
    EXPECT_EQ((*err->body_json())["title"], "Not Found");
}

TEST(ClassifierTest, CustomJsonMediaType) {
    auto r = make_response(500, R"({"a":1})", "text/json");
    EXPECT_EQ(classify(r, {})->body_json(), nullptr);

    rest_check::ClassifierConfiguration cfg;
    cfg.json_media_types = {"text/json"};
    auto err = classify(r, {}, cfg);
    ASSERT_TRUE(err.has_value());
    ASSERT_NE(err->body_json(), nullptr);
}

TEST(ClassifierTest, CustomSuccessPredicate) {
    ResponseExpectations e;
    e.success_status = [](int status) { return status == 200 || status == 404; };

    EXPECT_FALSE(classify(make_response(404), e).has_value());
    auto err = classify(make_response(201), e);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::FailedResponse);
    EXPECT_EQ(err->status_code(), 201);
}

TEST(ClassifierTest, EveryFailingStatusIsReported) {
    for (int status : {100, 304, 400, 401, 403, 404, 409, 500, 503, 599}) {
        auto err = classify(make_response(status), no_redirects());
        ASSERT_TRUE(err.has_value()) << status;
        EXPECT_EQ(err->kind(), ErrorKind::FailedResponse) << status;
        EXPECT_EQ(err->status_code(), status);
    }
}

TEST(ClassifierTest, UnexpectedContentType) {
    const std::string body = "<html></html>";
    auto r = make_response(200, body, "text/html");
    ResponseExpectations e;
    e.required_content_type.emplace(
        rest_check::ContentTypeMatcher{"application/json"});

    auto err = classify(r, e);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnexpectedContentType);
    EXPECT_EQ(err->content_type(), "text/html");
    EXPECT_EQ(err->body_data(), body);
    EXPECT_FALSE(err->has_key(PayloadKey::StatusCode));
}

TEST(ClassifierTest, MissingContentTypeFailsRequirementWithoutKey) {
    auto r = make_response(200);
    ResponseExpectations e;
    e.required_content_type.emplace(
        rest_check::ContentTypeMatcher{"application/json"});

    auto err = classify(r, e);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnexpectedContentType);
    EXPECT_TRUE(err->payload_keys().empty());
}

TEST(ClassifierTest, MatchingContentTypePasses) {
    auto r = make_response(200, "{}", "application/json; charset=utf-8");
    ResponseExpectations e;
    e.required_content_type.emplace(
        rest_check::ContentTypeMatcher{"application/json"});
    EXPECT_FALSE(classify(r, e).has_value());
}

TEST(ClassifierTest, UnexpectedNoContent) {
    ResponseExpectations e;
    e.requires_entity = true;

    auto err = classify(make_response(204), e);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnexpectedNoContent);
    EXPECT_TRUE(err->payload_keys().empty());

    EXPECT_FALSE(classify(make_response(204), {}).has_value());
}

TEST(ClassifierTest, NoContentCheckedBeforeContentType) {
    ResponseExpectations e;
    e.requires_entity = true;
    e.required_content_type.emplace(
        rest_check::ContentTypeMatcher{"application/json"});

    auto err = classify(make_response(204), e);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnexpectedNoContent);
}

TEST(ClassifierTest, UnexpectedRedirectWithLocation) {
    auto r = make_response(302);
    r.headers.emplace("Location", "https://example.com/x");

    auto err = classify(r, no_redirects());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnexpectedRedirect);
    EXPECT_EQ(err->status_code(), 302);
    EXPECT_EQ(err->location(), "https://example.com/x");
    EXPECT_FALSE(err->has_key(PayloadKey::BodyData));
}

TEST(ClassifierTest, UnexpectedRedirectWithoutLocation) {
    auto err = classify(make_response(302, "moved"), no_redirects());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnexpectedRedirect);
    EXPECT_EQ(err->status_code(), 302);
    EXPECT_FALSE(err->has_key(PayloadKey::Location));
    EXPECT_EQ(err->body_data(), "moved");
}

TEST(ClassifierTest, EmptyLocationHeaderIsOmitted) {
    auto r = make_response(301);
    r.headers.emplace("Location", "");

    auto err = classify(r, no_redirects());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnexpectedRedirect);
    EXPECT_FALSE(err->has_key(PayloadKey::Location));
}

TEST(ClassifierTest, RedirectTakesPriorityOverStatusFailure) {
    ResponseExpectations e = no_redirects();
    e.required_content_type.emplace(
        rest_check::ContentTypeMatcher{"application/json"});
    auto r = make_response(307, R"({"a":1})", "application/json");

    auto err = classify(r, e);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnexpectedRedirect);
    EXPECT_FALSE(err->has_key(PayloadKey::BodyJSON));
}

TEST(ClassifierTest, AllowedRedirectFallsThroughToStatusCheck) {
    auto err = classify(make_response(301), {});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::FailedResponse);
}

TEST(ClassifierTest, CustomRedirectPolicy) {
    ResponseExpectations e = no_redirects();
    e.redirect_status = [](int status) { return status == 303; };

    auto other = classify(make_response(302), e);
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->kind(), ErrorKind::FailedResponse);

    auto see_other = classify(make_response(303), e);
    ASSERT_TRUE(see_other.has_value());
    EXPECT_EQ(see_other->kind(), ErrorKind::UnexpectedRedirect);
}

TEST(ClassifierTest, NotModifiedIsNotARedirect) {
    auto err = classify(make_response(304), no_redirects());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::FailedResponse);
}

TEST(ClassifierTest, ClassificationIsDeterministic) {
    auto r = make_response(500, R"({"b":2,"a":null,"c":[1]})",
                           "application/json");
    auto first = classify(r, {});
    auto second = classify(r, {});
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->payload_keys(), second->payload_keys());
    EXPECT_EQ(first->body_data(), second->body_data());
    EXPECT_EQ(*first->body_json(), *second->body_json());
}

TEST(ClassifierTest, ResultDoesNotDependOnLogLevel) {
    auto r = make_response(404, R"({"error":"missing"})", "application/json");
    const auto previous = spdlog::get_level();

    spdlog::set_level(spdlog::level::debug);
    auto with_debug = classify(r, {});
    spdlog::set_level(spdlog::level::off);
    auto quiet = classify(r, {});
    spdlog::set_level(previous);

    ASSERT_TRUE(with_debug && quiet);
    EXPECT_EQ(with_debug->kind(), quiet->kind());
    EXPECT_EQ(with_debug->status_code(), quiet->status_code());
    EXPECT_EQ(*with_debug->body_json(), *quiet->body_json());
}

TEST(CheckResponseTest, ReturnsResponseOnSuccess) {
    auto result = rest_check::check_response(
        make_response(200, "ok", "text/plain"), {});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().body, "ok");
}

TEST(CheckResponseTest, ReturnsErrorOnFailure) {
    auto result = rest_check::check_response(make_response(503), {});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind(), ErrorKind::FailedResponse);
    EXPECT_EQ(result.error().status_code(), 503);
}

TEST(CheckResponseTest, BeastResponseEndToEnd) {
    namespace http = boost::beast::http;
    http::response<http::string_body> beast_res;
    beast_res.result(http::status::found);
    beast_res.set(http::field::location, "/login");
    beast_res.prepare_payload();

    auto result = rest_check::check_response(
        rest_check::parse_beast_response(std::move(beast_res)), no_redirects());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind(), ErrorKind::UnexpectedRedirect);
    EXPECT_EQ(result.error().location(), "/login");
}
