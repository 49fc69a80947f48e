//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Minimal JSON value with insertion-ordered objects and compact serialization
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace loginresp {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: insertion-ordered members; serialization emits members in the order they were set.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;

    class Object {
    public:
        using Member = std::pair<std::string, std::shared_ptr<JSONValue>>;

        // Replaces the value of an existing key in place, otherwise appends.
        void Set(const std::string& key, JSONValue value);
        const JSONValue* Find(const std::string& key) const;
        bool Contains(const std::string& key) const { return Find(key) != nullptr; }
        std::size_t Size() const { return members.size(); }
        bool Empty() const { return members.empty(); }

        std::vector<Member>::const_iterator begin() const { return members.begin(); }
        std::vector<Member>::const_iterator end() const { return members.end(); }

    private:
        std::vector<Member> members;
    };

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }
};

//==========================================================================================================
// serializeJSONValue
// Purpose: Compact serialization (no insignificant whitespace). Strings are escaped per RFC 8259;
//          control characters below 0x20 are written as \u00XX.
//==========================================================================================================
std::string serializeJSONValue(const JSONValue& value);

} // namespace loginresp
