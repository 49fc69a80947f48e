//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_structured_response_writer.cpp
// Purpose: JSON login-state payload written for script clients
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "loginresp/StructuredResponseWriter.hpp"
#include "TestSupport.hpp"

using namespace loginresp;
using loginresp::fakes::RecordingResponse;
namespace http = boost::beast::http;

namespace {

//==========================================================================================================
// FailingResponse
// Purpose: Response whose output stream is already in a failed state.
//==========================================================================================================
class FailingResponse : public RecordingResponse {
public:
    FailingResponse() { body.setstate(std::ios::badbit); }
};

} // namespace

TEST(StructuredResponseWriter, MinimalPayloadHasOnlyAuthReason) {
    StructuredResponseWriter w;
    Request r(http::verb::get, "/api/items", "example.com", std::string("application/json"));
    EXPECT_EQ(w.Serialize(r), std::string("{\"authReason\":\"required\"}"));
}

TEST(StructuredResponseWriter, FullPayloadInFixedOrder) {
    StructuredResponseWriter w;
    Request r(http::verb::post, "/api/items", "example.com", std::string("application/json"));
    r.Attributes().SetUserUrl("/home");
    r.Attributes().SetLoginResult(true);
    EXPECT_EQ(w.Serialize(r), std::string("{\"loginResult\":true,\"authReason\":\"required\",\"userUrl\":\"/home\"}"));
}

TEST(StructuredResponseWriter, NotPermittedAfterAttempt) {
    StructuredResponseWriter w;
    Request r(http::verb::get, "/api/items", "example.com", std::string("application/json"),
              fakes::basicAuthorization("Zm9vOmJhcg=="));
    r.Attributes().SetLoginResult(false);
    EXPECT_EQ(w.Serialize(r), std::string("{\"loginResult\":false,\"authReason\":\"notPermitted\"}"));
}

TEST(StructuredResponseWriter, UserUrlIsEscaped) {
    StructuredResponseWriter w;
    Request r(http::verb::get, "/api", "example.com");
    r.Attributes().SetUserUrl("/a\"b\\c");
    EXPECT_EQ(w.Serialize(r), std::string("{\"authReason\":\"required\",\"userUrl\":\"/a\\\"b\\\\c\"}"));
}

TEST(StructuredResponseWriter, WrongTypedAttributesAreOmitted) {
    StructuredResponseWriter w;
    Request r(http::verb::get, "/api", "example.com");
    r.Attributes().Set(RequestAttributes::kLoginResult, std::string("yes"));
    r.Attributes().Set(RequestAttributes::kUserUrl, false);
    EXPECT_EQ(w.Serialize(r), std::string("{\"authReason\":\"required\"}"));
}

TEST(StructuredResponseWriter, WriteSetsStatusHeadersAndExactLength) {
    StructuredResponseWriter w;
    Request r(http::verb::get, "/api/items", "example.com", std::string("application/json"));
    r.Attributes().SetLoginResult(true);
    r.Attributes().SetUserUrl("/home");
    RecordingResponse out;
    w.Write(out, r);

    const std::string expected = "{\"loginResult\":true,\"authReason\":\"required\",\"userUrl\":\"/home\"}";
    ASSERT_TRUE(out.status.has_value());
    EXPECT_EQ(out.status.value(), http::status::bad_request);
    EXPECT_TRUE(out.noCache);
    EXPECT_EQ(out.contentType.value_or(""), std::string("application/json"));
    ASSERT_TRUE(out.contentLength.has_value());
    EXPECT_EQ(out.contentLength.value(), expected.size());
    EXPECT_EQ(out.Body(), expected);
}

TEST(StructuredResponseWriter, WriteDoesNotTouchAttributes) {
    StructuredResponseWriter w;
    Request r(http::verb::get, "/api/items", "example.com");
    RecordingResponse out;
    w.Write(out, r);
    EXPECT_EQ(r.Attributes().Size(), 0u);
}

TEST(StructuredResponseWriter, StreamFailureIsRaisedWithCause) {
    StructuredResponseWriter w;
    Request r(http::verb::get, "/api/items", "example.com");
    FailingResponse out;
    try {
        w.Write(out, r);
        FAIL() << "expected LoginResponseError";
    } catch (const errors::LoginResponseError& e) {
        EXPECT_EQ(errors::rootCauseCategory(e), errors::ErrorCategory::Io);
    }
}
