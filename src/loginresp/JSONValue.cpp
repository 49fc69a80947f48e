//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.cpp
// Purpose: JSONValue constructors and compact serializer using only std library
//==========================================================================================================

#include <iomanip>
#include <sstream>
#include <type_traits>

#include "loginresp/JSONValue.h"
#include "logging/Logger.h"

namespace loginresp {

JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

void JSONValue::Object::Set(const std::string& key, JSONValue v) {
    for (auto& m : members) {
        if (m.first == key) {
            m.second = std::make_shared<JSONValue>(std::move(v));
            return;
        }
    }
    members.emplace_back(key, std::make_shared<JSONValue>(std::move(v)));
}

const JSONValue* JSONValue::Object::Find(const std::string& key) const {
    for (const auto& m : members) {
        if (m.first == key) {
            return m.second.get();
        }
    }
    return nullptr;
}

namespace {
    void writeEscaped(std::ostringstream& oss, const std::string& v) {
        oss << '"';
        for (char c : v) {
            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\b': oss << "\\b"; break;
                case '\f': oss << "\\f"; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (c >= 0 && c < 32) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                            << std::dec << std::setfill(' ');
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        oss << '"';
    }

    void writeValue(std::ostringstream& oss, const JSONValue& value) {
        std::visit([&oss](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                oss << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                oss << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, int64_t>) {
                oss << v;
            } else if constexpr (std::is_same_v<T, double>) {
                oss << std::setprecision(17) << v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                writeEscaped(oss, v);
            } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
                oss << '[';
                bool first = true;
                for (const auto& item : v) {
                    if (!first) oss << ',';
                    first = false;
                    if (item) {
                        writeValue(oss, *item);
                    } else {
                        oss << "null";
                    }
                }
                oss << ']';
            } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
                oss << '{';
                bool first = true;
                for (const auto& [key, member] : v) {
                    if (!first) oss << ',';
                    first = false;
                    writeEscaped(oss, key);
                    oss << ':';
                    if (member) {
                        writeValue(oss, *member);
                    } else {
                        oss << "null";
                    }
                }
                oss << '}';
            }
        }, value.get());
    }
}

std::string serializeJSONValue(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

} // namespace loginresp
