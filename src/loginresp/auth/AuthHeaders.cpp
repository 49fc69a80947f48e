//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthHeaders.cpp
// Purpose: WWW-Authenticate formatting and Authorization parsing
//==========================================================================================================

#include "loginresp/auth/AuthHeaders.hpp"

namespace loginresp::auth {

static void skipSpaces(const std::string& s, size_t& i) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) {
        ++i;
    }
}

static bool parseScheme(const std::string& s, size_t& i, std::string& out) {
    out.clear();
    size_t start = i;
    while (i < s.size() && s[i] != ' ' && s[i] != '\t') {
        ++i;
    }
    if (i == start) {
        return false;
    }
    out = s.substr(start, i - start);
    return true;
}

static std::string trimmed(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string formatWwwAuthenticate(const WwwAuthChallenge& challenge) {
    std::string out = challenge.scheme;
    bool first = true;
    for (const auto& [key, value] : challenge.params) {
        out += first ? " " : ", ";
        first = false;
        out += key;
        out += "=\"";
        for (char c : value) {
            if (c == '"' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        out += "\"";
    }
    return out;
}

std::optional<Authorization> parseAuthorization(const std::string& header) {
    size_t i = 0;
    skipSpaces(header, i);
    std::string scheme;
    if (!parseScheme(header, i, scheme)) {
        return std::nullopt;
    }
    Authorization auth;
    auth.scheme = scheme;
    auth.tag = scheme;
    auth.credentials = trimmed(header.substr(i));
    return auth;
}

} // namespace loginresp::auth
