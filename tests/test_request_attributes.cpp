//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_request_attributes.cpp
// Purpose: Typed access to per-request attributes
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "loginresp/Request.hpp"

using namespace loginresp;
namespace http = boost::beast::http;

TEST(RequestAttributes, StartsEmpty) {
    Request r(http::verb::get, "/", "localhost");
    EXPECT_EQ(r.Attributes().Size(), 0u);
    EXPECT_FALSE(r.Attributes().LoginResult().has_value());
    EXPECT_FALSE(r.Attributes().UserUrl().has_value());
    EXPECT_FALSE(r.Attributes().AuthReasonText().has_value());
}

TEST(RequestAttributes, TypedSettersRoundTrip) {
    Request r(http::verb::post, "/login", "localhost");
    r.Attributes().SetLoginResult(false);
    r.Attributes().SetUserUrl("/users/alice");
    ASSERT_TRUE(r.Attributes().LoginResult().has_value());
    EXPECT_FALSE(r.Attributes().LoginResult().value());
    EXPECT_EQ(r.Attributes().UserUrl().value(), std::string("/users/alice"));
    EXPECT_TRUE(r.Attributes().Contains(RequestAttributes::kLoginResult));
    EXPECT_EQ(r.Attributes().Size(), 2u);
}

TEST(RequestAttributes, WrongTypeReadsAsAbsent) {
    Request r(http::verb::get, "/", "localhost");
    r.Attributes().Set(RequestAttributes::kLoginResult, std::string("true"));
    r.Attributes().Set(RequestAttributes::kUserUrl, true);
    EXPECT_TRUE(r.Attributes().Contains(RequestAttributes::kLoginResult));
    EXPECT_FALSE(r.Attributes().LoginResult().has_value());
    EXPECT_FALSE(r.Attributes().UserUrl().has_value());
}

TEST(RequestAttributes, EraseRemovesValue) {
    Request r(http::verb::get, "/", "localhost");
    r.Attributes().SetUserUrl("/home");
    r.Attributes().Erase(RequestAttributes::kUserUrl);
    EXPECT_FALSE(r.Attributes().Contains(RequestAttributes::kUserUrl));
    EXPECT_EQ(r.Attributes().Find(RequestAttributes::kUserUrl), nullptr);
}
