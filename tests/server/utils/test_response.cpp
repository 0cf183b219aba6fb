/*
 * test_response.cpp - Tests for Response Builder Utility
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "server/utils/response.hpp"

#include <string>

using namespace shiori::server::utils;
using shiori::extension::ExtensionErrorCode;
using shiori::extension::makeError;
using json = nlohmann::json;

namespace {

auto bodyOf(const crow::response& response) -> json {
    return json::parse(response.body);
}

}  // namespace

// ============================================================================
// Success Response Tests
// ============================================================================

TEST(ResponseBuilderSuccessTest, WrapsDataInEnvelope) {
    auto response = ResponseBuilder::success(json::array({1, 2}));

    EXPECT_EQ(response.code, 200);
    EXPECT_EQ(response.get_header_value("Content-Type"), "application/json");
    auto body = bodyOf(response);
    EXPECT_EQ(body["status"], "success");
    EXPECT_EQ(body["data"], json::array({1, 2}));
}

TEST(ResponseBuilderSuccessTest, MessageWithoutDataOmitsData) {
    auto response = ResponseBuilder::successWithMessage("source uninstalled");

    EXPECT_EQ(response.code, 200);
    auto body = bodyOf(response);
    EXPECT_EQ(body["message"], "source uninstalled");
    EXPECT_FALSE(body.contains("data"));
}

TEST(ResponseBuilderSuccessTest, MessageWithCreatedCode) {
    auto response = ResponseBuilder::successWithMessage(
        "source installed", json{{"id", 1}}, 201);

    EXPECT_EQ(response.code, 201);
    EXPECT_EQ(bodyOf(response)["data"]["id"], 1);
}

TEST(ResponseBuilderSuccessTest, Health) {
    auto response = ResponseBuilder::health();

    EXPECT_EQ(response.code, 200);
    EXPECT_EQ(bodyOf(response), json({{"status", "ok"}}));
}

// ============================================================================
// Error Response Tests
// ============================================================================

TEST(ResponseBuilderErrorTest, FromErrorUsesCodeStatusAndFixedMessage) {
    auto error = makeError(ExtensionErrorCode::AlreadyInstalled,
                           "id 7").error();
    auto response = ResponseBuilder::fromError(error);

    EXPECT_EQ(response.code, 409);
    auto body = bodyOf(response);
    EXPECT_EQ(body["status"], "error");
    EXPECT_EQ(body["error"]["code"], "already_installed");
    EXPECT_EQ(body["error"]["message"],
              "source installed, use update to update");
    EXPECT_EQ(response.body.find("id 7"), std::string::npos);
}

TEST(ResponseBuilderErrorTest, UpstreamFailuresAreBadGateway) {
    auto error = makeError(ExtensionErrorCode::ProtocolError, "element 0")
                     .error();
    auto response = ResponseBuilder::fromError(error);

    EXPECT_EQ(response.code, 502);
    EXPECT_EQ(bodyOf(response)["error"]["code"], "protocol_error");
}

TEST(ResponseBuilderErrorTest, InvalidFieldValue) {
    auto response =
        ResponseBuilder::invalidFieldValue("page", "positive integer");

    EXPECT_EQ(response.code, 400);
    auto body = bodyOf(response);
    EXPECT_EQ(body["error"]["code"], "invalid_field_value");
    EXPECT_EQ(body["error"]["details"]["field"], "page");
    EXPECT_EQ(body["error"]["details"]["constraint"], "positive integer");
}

TEST(ResponseBuilderErrorTest, MissingField) {
    auto response = ResponseBuilder::missingField("path");

    EXPECT_EQ(response.code, 400);
    EXPECT_EQ(bodyOf(response)["error"]["code"], "missing_required_field");
}

TEST(ResponseBuilderErrorTest, InternalError) {
    auto response = ResponseBuilder::internalError();

    EXPECT_EQ(response.code, 500);
    EXPECT_EQ(bodyOf(response)["error"]["code"], "internal_error");
}
