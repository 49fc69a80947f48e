//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_errors.cpp
// Purpose: Error categories, status mapping and nested cause inspection
//==========================================================================================================

#include <gtest/gtest.h>

#include <exception>
#include <string>

#include "loginresp/errors/Errors.h"

using namespace loginresp::errors;
namespace http = boost::beast::http;

TEST(Errors, CategoryNames) {
    EXPECT_STREQ(errorCategoryName(ErrorCategory::Unauthorized), "unauthorized");
    EXPECT_STREQ(errorCategoryName(ErrorCategory::BadRequest), "bad_request");
    EXPECT_STREQ(errorCategoryName(ErrorCategory::NotFound), "not_found");
    EXPECT_STREQ(errorCategoryName(ErrorCategory::Io), "io");
    EXPECT_STREQ(errorCategoryName(ErrorCategory::Unknown), "unknown");
}

TEST(Errors, StatusMapping) {
    EXPECT_EQ(statusFromErrorCategory(ErrorCategory::BadRequest), http::status::bad_request);
    EXPECT_EQ(statusFromErrorCategory(ErrorCategory::NotFound), http::status::not_found);
    EXPECT_EQ(statusFromErrorCategory(ErrorCategory::Io), http::status::internal_server_error);
}

TEST(Errors, DescribeWalksNestedChain) {
    try {
        try {
            throw CollaboratorError(ErrorCategory::Unauthorized, "resolver refused");
        } catch (const std::exception&) {
            std::throw_with_nested(LoginResponseError("login page lookup failed"));
        }
    } catch (const LoginResponseError& e) {
        EXPECT_EQ(describeError(e), std::string("login page lookup failed: resolver refused"));
        EXPECT_EQ(rootCauseCategory(e), ErrorCategory::Unauthorized);
        return;
    }
    FAIL() << "expected LoginResponseError";
}

TEST(Errors, PlainErrorsDescribeThemselves) {
    LoginResponseError e("length mismatch");
    EXPECT_EQ(describeError(e), std::string("length mismatch"));
    EXPECT_EQ(rootCauseCategory(e), ErrorCategory::Unknown);

    CollaboratorError c(ErrorCategory::NotFound, "gone");
    EXPECT_EQ(rootCauseCategory(c), ErrorCategory::NotFound);
}
