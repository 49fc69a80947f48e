//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_auth_headers.cpp
// Purpose: Unit tests for WWW-Authenticate formatting and Authorization parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "loginresp/auth/AuthHeaders.hpp"

using namespace loginresp::auth;

TEST(WwwAuthenticate, FormatBasicRealm) {
    WwwAuthChallenge c;
    c.scheme = "Basic";
    c.params.emplace_back("realm", "loginresp");
    EXPECT_EQ(formatWwwAuthenticate(c), std::string("Basic realm=\"loginresp\""));
}

TEST(WwwAuthenticate, FormatEscapesQuotes) {
    WwwAuthChallenge c;
    c.scheme = "Basic";
    c.params.emplace_back("realm", "say \"hi\"");
    c.params.emplace_back("charset", "UTF-8");
    EXPECT_EQ(formatWwwAuthenticate(c), std::string(R"(Basic realm="say \"hi\"", charset="UTF-8")"));
}

TEST(WwwAuthenticate, FormatWithoutParams) {
    WwwAuthChallenge c;
    c.scheme = "Negotiate";
    EXPECT_EQ(formatWwwAuthenticate(c), std::string("Negotiate"));
}

TEST(Authorization, ParseBasic) {
    auto a = parseAuthorization("Basic dXNlcjpwYXNz");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->scheme, std::string("Basic"));
    EXPECT_EQ(a->tag, std::string("Basic"));
    EXPECT_EQ(a->credentials, std::string("dXNlcjpwYXNz"));
    EXPECT_TRUE(a->Attempted());
}

TEST(Authorization, SchemeOnlyStillAnAttempt) {
    auto a = parseAuthorization("  Bearer  ");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->scheme, std::string("Bearer"));
    EXPECT_TRUE(a->credentials.empty());
    EXPECT_TRUE(a->Attempted());
}

TEST(Authorization, CredentialsKeepBase64Padding) {
    auto a = parseAuthorization("Basic YWRtaW46YQ==");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->credentials, std::string("YWRtaW46YQ=="));
}

TEST(Authorization, BlankHeaderIsNoAuthorization) {
    EXPECT_FALSE(parseAuthorization("").has_value());
    EXPECT_FALSE(parseAuthorization("   ").has_value());
}
