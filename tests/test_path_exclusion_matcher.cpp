//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_path_exclusion_matcher.cpp
// Purpose: Prefix matching of excluded request paths
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "loginresp/PathExclusionMatcher.hpp"

using namespace loginresp;
namespace http = boost::beast::http;

TEST(PathExclusionMatcher, EmptyListExcludesNothing) {
    PathExclusionMatcher m;
    EXPECT_FALSE(m.Matches("/"));
    EXPECT_FALSE(m.Matches("/api/items"));
    EXPECT_TRUE(m.Prefixes().empty());
}

TEST(PathExclusionMatcher, MatchesPlainStringPrefix) {
    PathExclusionMatcher m({"/api/", "/static"});
    EXPECT_TRUE(m.Matches("/api/items"));
    EXPECT_TRUE(m.Matches("/api/"));
    EXPECT_TRUE(m.Matches("/static/logo.png"));
    // Prefix match is textual, not segment based
    EXPECT_TRUE(m.Matches("/staticfiles/a.css"));
    EXPECT_FALSE(m.Matches("/api"));
    EXPECT_FALSE(m.Matches("/public/api/items"));
}

TEST(PathExclusionMatcher, IsCaseSensitive) {
    PathExclusionMatcher m({"/api/"});
    EXPECT_FALSE(m.Matches("/API/items"));
}

TEST(PathExclusionMatcher, ExcludedUsesRequestPath) {
    PathExclusionMatcher m({"/downloads/"});
    Request excluded(http::verb::get, "/downloads/report.pdf", "example.com");
    Request included(http::verb::get, "/reports/report.pdf", "example.com");
    EXPECT_TRUE(m.Excluded(excluded));
    EXPECT_FALSE(m.Excluded(included));
}
