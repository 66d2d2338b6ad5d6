/**
 * @file test_protocol.cpp
 * @brief Unit tests for bridge JSON payloads
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Courier/Shell/Protocol.hpp>

using namespace Courier;
using namespace Courier::Shell;

// ============================================================================
// Fetch requests
// ============================================================================

TEST(ProtocolTest, FullRequest) {
    auto request = parseRequestDescriptor(
        R"({"url":"https://example.test/a","method":"post",)"
        R"("headers":{"X-Test":"1","Accept":"*/*"},"body":"hello"})");

    ASSERT_TRUE(request.isSuccess());
    EXPECT_EQ(request.value().url, "https://example.test/a");
    EXPECT_EQ(request.value().method, "post");
    ASSERT_TRUE(request.value().headers.has_value());
    EXPECT_EQ(request.value().headers->size(), 2u);
    EXPECT_EQ(request.value().headers->at("X-Test"), "1");
    ASSERT_TRUE(request.value().body.has_value());
    EXPECT_EQ(*request.value().body, "hello");
}

TEST(ProtocolTest, OptionalFieldsAbsentOrNull) {
    auto minimal = parseRequestDescriptor(R"({"url":"http://a/","method":"GET"})");
    ASSERT_TRUE(minimal.isSuccess());
    EXPECT_FALSE(minimal.value().headers.has_value());
    EXPECT_FALSE(minimal.value().body.has_value());

    auto nulls = parseRequestDescriptor(R"({"url":"http://a/","method":"GET","headers":null,"body":null})");
    ASSERT_TRUE(nulls.isSuccess());
    EXPECT_FALSE(nulls.value().headers.has_value());
    EXPECT_FALSE(nulls.value().body.has_value());

    auto emptyBody = parseRequestDescriptor(R"({"url":"http://a/","method":"POST","body":""})");
    ASSERT_TRUE(emptyBody.isSuccess());
    ASSERT_TRUE(emptyBody.value().body.has_value());
    EXPECT_TRUE(emptyBody.value().body->empty());
}

TEST(ProtocolTest, MalformedRequests) {
    EXPECT_EQ(parseRequestDescriptor("{not json").error(), ErrorCode::JsonParseFailed);
    EXPECT_EQ(parseRequestDescriptor("[1,2]").error(), ErrorCode::JsonInvalid);
    EXPECT_EQ(parseRequestDescriptor(R"({"method":"GET"})").error(), ErrorCode::MissingField);
    EXPECT_EQ(parseRequestDescriptor(R"({"url":"http://a/"})").error(), ErrorCode::MissingField);
    EXPECT_EQ(parseRequestDescriptor(R"({"url":1,"method":"GET"})").error(), ErrorCode::InvalidFieldType);
    EXPECT_EQ(parseRequestDescriptor(R"({"url":"http://a/","method":"GET","headers":[]})").error(),
              ErrorCode::InvalidFieldType);
    EXPECT_EQ(parseRequestDescriptor(R"({"url":"http://a/","method":"GET","headers":{"X":1}})").error(),
              ErrorCode::InvalidFieldType);
    EXPECT_EQ(parseRequestDescriptor(R"({"url":"http://a/","method":"GET","body":{}})").error(),
              ErrorCode::InvalidFieldType);
}

TEST(ProtocolTest, ResponseShape) {
    Network::ResponseDescriptor response;
    response.success = true;
    response.statusCode = 404;
    response.headers["content-type"] = "text/plain";
    response.body = "missing";

    json out = toJson(response);

    EXPECT_EQ(out["success"], true);
    EXPECT_EQ(out["status"], 404);
    EXPECT_EQ(out["headers"]["content-type"], "text/plain");
    EXPECT_EQ(out["body"], "missing");
}

// ============================================================================
// Instance notices
// ============================================================================

TEST(ProtocolTest, InstanceNotice) {
    InstanceNotice notice;
    notice.args = {"--open", "file.txt"};
    notice.cwd = "/home/user";

    auto parsed = parseInstanceNotice(toJson(notice).dump());

    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value().args, notice.args);
    EXPECT_EQ(parsed.value().cwd, "/home/user");
}

TEST(ProtocolTest, InstanceNoticeDefaultsAndErrors) {
    auto empty = parseInstanceNotice("{}");
    ASSERT_TRUE(empty.isSuccess());
    EXPECT_TRUE(empty.value().args.empty());
    EXPECT_TRUE(empty.value().cwd.empty());

    EXPECT_EQ(parseInstanceNotice(R"({"args":"x"})").error(), ErrorCode::InvalidFieldType);
    EXPECT_EQ(parseInstanceNotice(R"({"args":[1]})").error(), ErrorCode::InvalidFieldType);
    EXPECT_EQ(parseInstanceNotice(R"({"cwd":false})").error(), ErrorCode::InvalidFieldType);
    EXPECT_EQ(parseInstanceNotice("").error(), ErrorCode::JsonParseFailed);
}
