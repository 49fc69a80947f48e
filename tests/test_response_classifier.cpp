//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_response_classifier.cpp
// Purpose: Deciding whether a denied client can show a login page or expects JSON
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "loginresp/InMemoryResources.hpp"
#include "loginresp/ResponseClassifier.hpp"
#include "TestSupport.hpp"

using namespace loginresp;
namespace http = boost::beast::http;

namespace {

Request requestAccepting(const std::optional<std::string>& accept) {
    return Request(http::verb::get, "/protected", "example.com", accept);
}

} // namespace

TEST(ResponseClassifier, DeclaredHtmlCanLogin) {
    ContentTypeResponseClassifier c;
    auto page = fakes::htmlPage("index.html", "<html/>");
    EXPECT_TRUE(c.CanLogin(page.get(), requestAccepting(std::string("application/json"))));
    EXPECT_TRUE(c.CanLogin(page.get(), requestAccepting(std::nullopt)));
}

TEST(ResponseClassifier, DeclaredNonHtmlCannotLoginWhateverTheAcceptHeader) {
    ContentTypeResponseClassifier c;
    auto json = std::make_shared<MemoryResource>("data", "{}", std::string("application/json"));
    EXPECT_FALSE(c.CanLogin(json.get(), requestAccepting(std::string("text/html"))));
    auto binary = std::make_shared<MemoryResource>("bin", "x", std::string("application/octet-stream"));
    EXPECT_FALSE(c.CanLogin(binary.get(), requestAccepting(std::string("text/html,*/*"))));
}

TEST(ResponseClassifier, DeclaredXhtmlCountsAsHtml) {
    ContentTypeResponseClassifier c;
    auto page = std::make_shared<MemoryResource>("p", "x", std::string("application/xhtml+xml"));
    EXPECT_TRUE(c.CanLogin(page.get(), requestAccepting(std::nullopt)));
}

TEST(ResponseClassifier, UndeclaredTypeFallsBackToAccept) {
    ContentTypeResponseClassifier c;
    auto blob = fakes::untypedContent("blob", "x");
    EXPECT_TRUE(c.CanLogin(blob.get(), requestAccepting(std::string("text/html,*/*"))));
    EXPECT_FALSE(c.CanLogin(blob.get(), requestAccepting(std::string("application/json"))));
    EXPECT_FALSE(c.CanLogin(blob.get(), requestAccepting(std::nullopt)));
}

TEST(ResponseClassifier, NonContentResourceNeverLogsIn) {
    ContentTypeResponseClassifier c;
    CollectionResource folder("reports");
    EXPECT_FALSE(c.CanLogin(&folder, requestAccepting(std::string("text/html"))));
}

TEST(ResponseClassifier, NullResourceNeverLogsIn) {
    ContentTypeResponseClassifier c;
    EXPECT_FALSE(c.CanLogin(nullptr, requestAccepting(std::string("text/html"))));
}

TEST(ResponseClassifier, AjaxDetectedFromAcceptOnly) {
    ContentTypeResponseClassifier c;
    auto page = fakes::htmlPage("index.html", "<html/>");
    EXPECT_TRUE(c.IsAjax(page.get(), requestAccepting(std::string("application/json"))));
    EXPECT_TRUE(c.IsAjax(page.get(), requestAccepting(std::string("text/javascript, */*; q=0.01"))));
    EXPECT_TRUE(c.IsAjax(nullptr, requestAccepting(std::string("application/json"))));
    EXPECT_FALSE(c.IsAjax(page.get(), requestAccepting(std::string("text/html"))));
    EXPECT_FALSE(c.IsAjax(page.get(), requestAccepting(std::string("*/*"))));
    EXPECT_FALSE(c.IsAjax(page.get(), requestAccepting(std::nullopt)));
}
