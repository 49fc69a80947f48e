//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/errors/Errors.cpp
// Purpose: Error category mapping and nested-exception helpers
//==========================================================================================================

#include "loginresp/errors/Errors.h"

namespace loginresp {
namespace errors {

namespace http = boost::beast::http;

const char* errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Unauthorized: return "unauthorized";
        case ErrorCategory::BadRequest: return "bad_request";
        case ErrorCategory::NotFound: return "not_found";
        case ErrorCategory::Io: return "io";
        default: return "unknown";
    }
}

http::status statusFromErrorCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Unauthorized: return http::status::unauthorized;
        case ErrorCategory::BadRequest: return http::status::bad_request;
        case ErrorCategory::NotFound: return http::status::not_found;
        default: return http::status::internal_server_error;
    }
}

namespace {
    void appendChain(const std::exception& e, std::string& out) {
        if (!out.empty()) {
            out += ": ";
        }
        out += e.what();
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            appendChain(inner, out);
        } catch (...) {
            out += ": (non-standard exception)";
        }
    }

    ErrorCategory innermostCategory(const std::exception& e, ErrorCategory found) {
        if (const auto* ce = dynamic_cast<const CollaboratorError*>(&e)) {
            found = ce->Category();
        }
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            return innermostCategory(inner, found);
        } catch (...) {
            return ErrorCategory::Unknown;
        }
        return found;
    }
}

std::string describeError(const std::exception& e) {
    std::string out;
    appendChain(e, out);
    return out;
}

ErrorCategory rootCauseCategory(const std::exception& e) {
    return innermostCategory(e, ErrorCategory::Unknown);
}

} // namespace errors
} // namespace loginresp
