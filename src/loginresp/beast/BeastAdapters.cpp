//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/beast/BeastAdapters.cpp
// Purpose: Beast request/response adapters
//==========================================================================================================

#include "loginresp/beast/BeastAdapters.hpp"

#include <cctype>

#include "loginresp/auth/AuthHeaders.hpp"
#include "loginresp/errors/Errors.h"

namespace loginresp::beast {

namespace {
    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::optional<std::string> headerValue(const http::request<http::string_body>& req, http::field f) {
        auto it = req.base().find(f);
        if (it == req.base().end()) {
            return std::nullopt;
        }
        return std::string(it->value());
    }

    bool parseUnsigned(const std::string& s, std::uint64_t& out) {
        if (s.empty() || s.size() > 19) {
            return false;
        }
        std::uint64_t v = 0;
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            v = v * 10 + static_cast<std::uint64_t>(c - '0');
        }
        out = v;
        return true;
    }
}

std::string decodeTargetPath(const std::string& target) {
    std::string path = target.substr(0, target.find_first_of("?#"));
    std::string out;
    out.reserve(path.size());
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '%' && i + 2 < path.size()) {
            int hi = hexValue(path[i + 1]);
            int lo = hexValue(path[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(path[i]);
    }
    if (out.empty()) {
        out = "/";
    }
    return out;
}

Request makeRequest(const http::request<http::string_body>& req) {
    std::optional<Authorization> authorization;
    if (auto h = headerValue(req, http::field::authorization); h.has_value()) {
        authorization = auth::parseAuthorization(h.value());
    }
    return Request(req.method(),
                   decodeTargetPath(std::string(req.target())),
                   headerValue(req, http::field::host).value_or(std::string()),
                   headerValue(req, http::field::accept),
                   std::move(authorization));
}

std::optional<ByteRange> parseByteRange(const std::string& header) {
    const std::string prefix = "bytes=";
    if (header.rfind(prefix, 0) != 0) {
        return std::nullopt;
    }
    std::string rangeSet = header.substr(prefix.size());
    if (rangeSet.find(',') != std::string::npos) {
        return std::nullopt;
    }
    auto dash = rangeSet.find('-');
    if (dash == std::string::npos || dash == 0) {
        return std::nullopt;
    }
    ByteRange r;
    if (!parseUnsigned(rangeSet.substr(0, dash), r.start)) {
        return std::nullopt;
    }
    std::string end = rangeSet.substr(dash + 1);
    if (!end.empty()) {
        std::uint64_t finish = 0;
        if (!parseUnsigned(end, finish) || finish < r.start) {
            return std::nullopt;
        }
        r.finish = finish;
    }
    return r;
}

void BeastResponse::SetContentLength(std::uint64_t length) {
    declaredLength = length;
    res.content_length(length);
}

void BeastResponse::Commit() {
    res.body() = body.str();
    if (!declaredLength.has_value()) {
        res.prepare_payload();
        return;
    }
    if (res.body().size() != declaredLength.value()) {
        throw errors::LoginResponseError("response body is " + std::to_string(res.body().size()) +
                                         " bytes but Content-Length says " + std::to_string(declaredLength.value()));
    }
}

} // namespace loginresp::beast
