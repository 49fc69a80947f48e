//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StructuredResponseWriter.hpp
// Purpose: JSON reply describing the authentication state to scripted (ajax) clients
//==========================================================================================================

#pragma once

#include <string>

#include "loginresp/JSONValue.h"
#include "loginresp/Request.hpp"
#include "loginresp/Response.hpp"

namespace loginresp {

//==========================================================================================================
// StructuredResponseWriter
// Purpose: Writes {"loginResult":<bool>,"authReason":"required"|"notPermitted","userUrl":<string>}
//          with status 400, Cache-Control: no-cache and an exact Content-Length. loginResult and userUrl
//          come from the request attributes and are omitted when absent.
//          400 rather than 401 keeps browsers from opening their own credential prompt for XHR calls.
//==========================================================================================================
class StructuredResponseWriter {
public:
    static constexpr const char* kContentType = "application/json";

    JSONValue BuildPayload(const Request& request) const;
    std::string Serialize(const Request& request) const;

    // Throws errors::LoginResponseError (nested cause) when the body cannot be written.
    void Write(IResponse& response, const Request& request) const;
};

} // namespace loginresp
