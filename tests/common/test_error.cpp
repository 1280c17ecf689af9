/*
 * test_error.cpp - Tests for error codes and Result helpers
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <string>

#include "common/exception.hpp"
#include "common/result.hpp"

using namespace firetv;

// ============================================================================
// ErrorCode Tests
// ============================================================================

TEST(ErrorCodeTest, WireNames) {
    EXPECT_EQ(errorCodeToString(ErrorCode::ParseError), "ParseError");
    EXPECT_EQ(errorCodeToString(ErrorCode::NotFound), "NotFound");
    EXPECT_EQ(errorCodeToString(ErrorCode::ValidationError),
              "ValidationError");
    EXPECT_EQ(errorCodeToString(ErrorCode::AuthError), "AuthError");
    EXPECT_EQ(errorCodeToString(ErrorCode::TimeoutError), "TimeoutError");
    EXPECT_EQ(errorCodeToString(ErrorCode::NotConnected),
              "NotConnectedError");
    EXPECT_EQ(errorCodeToString(ErrorCode::ProtocolError), "ProtocolError");
    EXPECT_EQ(errorCodeToString(ErrorCode::Internal), "InternalError");
}

TEST(ErrorCodeTest, LinkFailures) {
    EXPECT_TRUE(isLinkFailure(ErrorCode::NotConnected));
    EXPECT_TRUE(isLinkFailure(ErrorCode::TimeoutError));
    EXPECT_TRUE(isLinkFailure(ErrorCode::ProtocolError));
    EXPECT_FALSE(isLinkFailure(ErrorCode::AuthError));
    EXPECT_FALSE(isLinkFailure(ErrorCode::ValidationError));
    EXPECT_FALSE(isLinkFailure(ErrorCode::NotFound));
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, NotFoundCarriesDevice) {
    auto error = error::notFound("kitchen");
    EXPECT_EQ(error.code, ErrorCode::NotFound);
    ASSERT_TRUE(error.device.has_value());
    EXPECT_EQ(*error.device, "kitchen");
    EXPECT_EQ(error.toString(), "NotFound [kitchen]: Unknown device: kitchen");
}

TEST(ErrorTest, ForDeviceKeepsExistingDevice) {
    auto tagged = error::timeout("slow").forDevice("livingroom");
    EXPECT_EQ(tagged.device, "livingroom");

    auto kept = Error(ErrorCode::AuthError, "no", "bedroom")
                    .forDevice("livingroom");
    EXPECT_EQ(kept.device, "bedroom");
}

TEST(ErrorTest, JsonOmitsMissingDevice) {
    auto json = error::validation("bad").toJson();
    EXPECT_EQ(json["code"], "ValidationError");
    EXPECT_EQ(json["message"], "bad");
    EXPECT_FALSE(json.contains("device"));

    auto withDevice = error::notConnected("down").forDevice("tv").toJson();
    EXPECT_EQ(withDevice["device"], "tv");
    EXPECT_EQ(withDevice["code"], "NotConnectedError");
}

// ============================================================================
// Result Tests
// ============================================================================

TEST(ResultTest, SuccessAndFailure) {
    Result<int> ok = success(42);
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, 42);

    Result<int> failed = failure(ErrorCode::ProtocolError, "garbled");
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(failed.error().message, "garbled");

    VoidResult done = success();
    EXPECT_TRUE(done);
}

TEST(ResultTest, ValueOrThrow) {
    EXPECT_EQ(valueOrThrow(Result<int>(7)), 7);

    try {
        (void)valueOrThrow(Result<int>(failure(error::auth("rejected"))));
        FAIL() << "Expected OperationException";
    } catch (const OperationException& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthError);
        EXPECT_EQ(e.error().message, "rejected");
    }
}

TEST(ExceptionTest, CommandLineErrorKeepsMessage) {
    try {
        THROW_COMMAND_LINE_ERROR("Port must be between 1 and 65535: 0");
        FAIL() << "Expected CommandLineException";
    } catch (const CommandLineException& e) {
        EXPECT_NE(std::string(e.what()).find("65535"), std::string::npos);
    }
}
