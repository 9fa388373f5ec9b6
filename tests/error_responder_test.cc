#include "protocol/server_errors.h"
#include "test_support.h"
#include "transport/error_responder.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace eio::protocol;
using namespace eio::transport;
using eio::testing::make_request;
using json = nlohmann::json;

TEST(ServerErrorsTest, CodesAndMessagesAreStable) {
    EXPECT_EQ(describe(ServerError::UNKNOWN_TRANSPORT).code, 0);
    EXPECT_EQ(describe(ServerError::UNKNOWN_TRANSPORT).message, "Transport unknown");
    EXPECT_EQ(describe(ServerError::UNKNOWN_SID).code, 1);
    EXPECT_EQ(describe(ServerError::UNKNOWN_SID).message, "Session ID unknown");
    EXPECT_EQ(describe(ServerError::BAD_HANDSHAKE_METHOD).code, 2);
    EXPECT_EQ(describe(ServerError::BAD_HANDSHAKE_METHOD).message, "Bad handshake method");
    EXPECT_EQ(describe(ServerError::BAD_REQUEST).code, 3);
    EXPECT_EQ(describe(ServerError::BAD_REQUEST).message, "Bad request");
    EXPECT_EQ(describe(ServerError::FORBIDDEN).code, 4);
    EXPECT_EQ(describe(ServerError::FORBIDDEN).message, "Forbidden");
}

TEST(ServerErrorsTest, OnlyForbiddenIs403) {
    EXPECT_EQ(http_status(ServerError::UNKNOWN_TRANSPORT), 400);
    EXPECT_EQ(http_status(ServerError::UNKNOWN_SID), 400);
    EXPECT_EQ(http_status(ServerError::BAD_HANDSHAKE_METHOD), 400);
    EXPECT_EQ(http_status(ServerError::BAD_REQUEST), 400);
    EXPECT_EQ(http_status(ServerError::FORBIDDEN), 403);
    EXPECT_EQ(to_string(ServerError::UNKNOWN_SID), "UNKNOWN_SID");
}

TEST(ErrorResponderTest, EchoesOriginWithCredentials) {
    auto request = make_request("GET", "/engine.io/?transport=polling&sid=nope");
    request.headers["Origin"] = "http://client.example";
    HttpResponse response;

    send_error(request, response, ServerError::UNKNOWN_SID);

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.header("Content-Type"), kJsonContentType);
    EXPECT_EQ(response.header("Access-Control-Allow-Origin"), "http://client.example");
    EXPECT_EQ(response.header("Access-Control-Allow-Credentials"), "true");

    auto body = json::parse(response.body);
    EXPECT_EQ(body["code"], 1);
    EXPECT_EQ(body["message"], "Session ID unknown");
}

TEST(ErrorResponderTest, WildcardOriginWithoutOriginHeader) {
    auto request = make_request("GET", "/engine.io/?transport=flash");
    HttpResponse response;

    send_error(request, response, ServerError::UNKNOWN_TRANSPORT);

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.header("Access-Control-Allow-Origin"), "*");
    EXPECT_FALSE(response.header("Access-Control-Allow-Credentials").has_value());
    EXPECT_EQ(json::parse(response.body), (json{{"code", 0}, {"message", "Transport unknown"}}));
}

TEST(ErrorResponderTest, ForbiddenHasNoCorsHeaders) {
    auto request = make_request("GET", "/engine.io/?transport=polling");
    request.headers["Origin"] = "http://client.example";
    HttpResponse response;

    send_error(request, response, ServerError::FORBIDDEN);

    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(response.header("Content-Type"), kJsonContentType);
    EXPECT_FALSE(response.header("Access-Control-Allow-Origin").has_value());
    EXPECT_FALSE(response.header("Access-Control-Allow-Credentials").has_value());
    EXPECT_EQ(json::parse(response.body)["code"], 4);
}

TEST(ErrorResponderTest, ReplacesPreviousResponseState) {
    auto request = make_request("GET", "/engine.io/");
    HttpResponse response;
    response.status = 200;
    response.set_header("Content-Type", "text/plain");
    response.add_header("X-Stale", "1");
    response.body = "stale";

    send_error(request, response, ServerError::BAD_REQUEST);

    EXPECT_EQ(response.status, 400);
    EXPECT_FALSE(response.header("X-Stale").has_value());
    EXPECT_EQ(response.header("Content-Type"), kJsonContentType);
    EXPECT_EQ(json::parse(response.body)["message"], "Bad request");
}
