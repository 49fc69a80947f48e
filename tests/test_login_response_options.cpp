//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_login_response_options.cpp
// Purpose: Parsing login response options from config strings and the environment
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "loginresp/LoginResponseOptions.hpp"

using namespace loginresp;

namespace {

//==========================================================================================================
// EnvGuard
// Purpose: Clears the login response environment variables before and after each test.
//==========================================================================================================
class EnvGuard : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }
    static void clear() {
        ::unsetenv("LOGINRESP_ENABLED");
        ::unsetenv("LOGINRESP_LOGIN_PAGE");
        ::unsetenv("LOGINRESP_EXCLUDE_PATHS");
    }
};

} // namespace

TEST(LoginResponseOptions, Defaults) {
    LoginResponseOptions o;
    EXPECT_TRUE(o.enabled);
    EXPECT_EQ(o.loginPage, std::string("/login.html"));
    EXPECT_TRUE(o.excludePaths.empty());

    LoginResponseOptions parsed = parseLoginResponseOptions("");
    EXPECT_TRUE(parsed.enabled);
    EXPECT_EQ(parsed.loginPage, std::string("/login.html"));
}

TEST(LoginResponseOptions, ParsesAllKeys) {
    auto o = parseLoginResponseOptions("enabled=false; loginPage=/auth/login.html; excludePaths=/api/, /dav/ ,");
    EXPECT_FALSE(o.enabled);
    EXPECT_EQ(o.loginPage, std::string("/auth/login.html"));
    ASSERT_EQ(o.excludePaths.size(), 2u);
    EXPECT_EQ(o.excludePaths[0], std::string("/api/"));
    EXPECT_EQ(o.excludePaths[1], std::string("/dav/"));
}

TEST(LoginResponseOptions, InvalidValuesKeepDefaults) {
    auto o = parseLoginResponseOptions("enabled=maybe;loginPage=;colour=blue;noequals");
    EXPECT_TRUE(o.enabled);
    EXPECT_EQ(o.loginPage, std::string("/login.html"));
    EXPECT_TRUE(o.excludePaths.empty());
}

TEST(LoginResponseOptions, BooleanSpellings) {
    EXPECT_FALSE(parseLoginResponseOptions("enabled=0").enabled);
    EXPECT_FALSE(parseLoginResponseOptions("enabled=OFF").enabled);
    EXPECT_TRUE(parseLoginResponseOptions("enabled=0;enabled=yes").enabled);
}

TEST(LoginResponseOptions, SplitPathListKeepsOrderAndDropsBlanks) {
    std::vector<std::string> v = splitPathList(" /b/ ,,/a/,  ");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0], std::string("/b/"));
    EXPECT_EQ(v[1], std::string("/a/"));
    EXPECT_TRUE(splitPathList("").empty());
}

TEST_F(EnvGuard, EnvironmentOverridesConfig) {
    ::setenv("LOGINRESP_ENABLED", "false", 1);
    ::setenv("LOGINRESP_LOGIN_PAGE", "/signin", 1);
    ::setenv("LOGINRESP_EXCLUDE_PATHS", "/x/,/y/", 1);
    auto o = applyLoginResponseEnv(parseLoginResponseOptions("enabled=true;loginPage=/login.html;excludePaths=/api/"));
    EXPECT_FALSE(o.enabled);
    EXPECT_EQ(o.loginPage, std::string("/signin"));
    ASSERT_EQ(o.excludePaths.size(), 2u);
    EXPECT_EQ(o.excludePaths[0], std::string("/x/"));
}

TEST_F(EnvGuard, UnsetEnvironmentLeavesOptionsAlone) {
    auto o = applyLoginResponseEnv(parseLoginResponseOptions("loginPage=/a.html;excludePaths=/api/"));
    EXPECT_TRUE(o.enabled);
    EXPECT_EQ(o.loginPage, std::string("/a.html"));
    ASSERT_EQ(o.excludePaths.size(), 1u);
}

TEST_F(EnvGuard, InvalidEnvironmentFlagIgnored) {
    ::setenv("LOGINRESP_ENABLED", "sometimes", 1);
    auto o = applyLoginResponseEnv(LoginResponseOptions{});
    EXPECT_TRUE(o.enabled);
}

TEST_F(EnvGuard, EmptyExcludeEnvironmentClearsList) {
    ::setenv("LOGINRESP_EXCLUDE_PATHS", "", 1);
    auto o = applyLoginResponseEnv(parseLoginResponseOptions("excludePaths=/api/"));
    EXPECT_TRUE(o.excludePaths.empty());
}
