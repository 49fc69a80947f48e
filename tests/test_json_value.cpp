//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json_value.cpp
// Purpose: Compact JSON serialization with stable member order
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "loginresp/JSONValue.h"

using namespace loginresp;

TEST(JSONValue, Scalars) {
    EXPECT_EQ(serializeJSONValue(JSONValue()), std::string("null"));
    EXPECT_EQ(serializeJSONValue(JSONValue(true)), std::string("true"));
    EXPECT_EQ(serializeJSONValue(JSONValue(false)), std::string("false"));
    EXPECT_EQ(serializeJSONValue(JSONValue(static_cast<int64_t>(-42))), std::string("-42"));
    EXPECT_EQ(serializeJSONValue(JSONValue("text")), std::string("\"text\""));
}

TEST(JSONValue, ObjectKeepsInsertionOrder) {
    JSONValue::Object o;
    o.Set("z", JSONValue(static_cast<int64_t>(1)));
    o.Set("a", JSONValue("x"));
    o.Set("m", JSONValue(false));
    EXPECT_EQ(serializeJSONValue(JSONValue(o)), std::string("{\"z\":1,\"a\":\"x\",\"m\":false}"));
}

TEST(JSONValue, SetReplacesInPlace) {
    JSONValue::Object o;
    o.Set("a", JSONValue(static_cast<int64_t>(1)));
    o.Set("b", JSONValue(static_cast<int64_t>(2)));
    o.Set("a", JSONValue(static_cast<int64_t>(3)));
    EXPECT_EQ(o.Size(), 2u);
    EXPECT_EQ(serializeJSONValue(JSONValue(o)), std::string("{\"a\":3,\"b\":2}"));
    ASSERT_NE(o.Find("b"), nullptr);
    EXPECT_TRUE(o.Contains("a"));
    EXPECT_FALSE(o.Contains("c"));
}

TEST(JSONValue, EscapesStrings) {
    EXPECT_EQ(serializeJSONValue(JSONValue(std::string("a\"b\\c\n\t"))), std::string("\"a\\\"b\\\\c\\n\\t\""));
    EXPECT_EQ(serializeJSONValue(JSONValue(std::string("\x01"))), std::string("\"\\u0001\""));
    EXPECT_EQ(serializeJSONValue(JSONValue(std::string("/home"))), std::string("\"/home\""));
}

TEST(JSONValue, NestedArrays) {
    JSONValue::Array a;
    a.push_back(std::make_shared<JSONValue>(true));
    a.push_back(nullptr);
    JSONValue::Object o;
    o.Set("items", JSONValue(a));
    o.Set("empty", JSONValue(JSONValue::Object{}));
    EXPECT_EQ(serializeJSONValue(JSONValue(o)), std::string("{\"items\":[true,null],\"empty\":{}}"));
}
