//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error categories for collaborator failures and the fatal login-response error
//==========================================================================================================

#pragma once

#include <exception>
#include <ostream>
#include <stdexcept>
#include <string>

#include <boost/beast/http/status.hpp>

namespace loginresp {
namespace errors {

// Categorization of failures reported by resolvers and responders.
enum class ErrorCategory {
    Unauthorized,
    BadRequest,
    NotFound,
    Io,
    Unknown
};

// Stable lower-case name for logs and diagnostics.
const char* errorCategoryName(ErrorCategory category);

// Map an ErrorCategory to the HTTP status a host should answer with.
boost::beast::http::status statusFromErrorCategory(ErrorCategory category);

//==========================================================================================================
// CollaboratorError
// Purpose: Thrown by IResourceResolver / IContentResponder implementations. The category tells the
//          caller whether the failure was an authorization problem, a malformed request, a missing
//          entity or an I/O failure.
//==========================================================================================================
class CollaboratorError : public std::runtime_error {
public:
    CollaboratorError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category(category) {}

    ErrorCategory Category() const noexcept { return category; }

private:
    ErrorCategory category;
};

//==========================================================================================================
// LoginResponseError
// Purpose: Fatal error for the current request, raised when an already selected outcome could not be
//          produced. When a collaborator failed it is thrown through std::throw_with_nested so the
//          original cause stays attached; callers that need it use std::rethrow_if_nested or describeError().
//==========================================================================================================
class LoginResponseError : public std::runtime_error {
public:
    explicit LoginResponseError(const std::string& message)
        : std::runtime_error(message) {}
};

// Flatten an exception and its nested causes into "outer: inner: innermost".
std::string describeError(const std::exception& e);

// Category of the innermost CollaboratorError nested in e (or e itself); Unknown when there is none.
ErrorCategory rootCauseCategory(const std::exception& e);

} // namespace errors
} // namespace loginresp
