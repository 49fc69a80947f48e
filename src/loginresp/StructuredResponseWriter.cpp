//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/StructuredResponseWriter.cpp
// Purpose: Builds, sizes and writes the JSON login-state payload
//==========================================================================================================

#include "loginresp/StructuredResponseWriter.hpp"

#include <ostream>

#include "logging/Logger.h"
#include "loginresp/AuthReason.hpp"
#include "loginresp/errors/Errors.h"

namespace loginresp {

namespace http = boost::beast::http;

JSONValue StructuredResponseWriter::BuildPayload(const Request& request) const {
    const RequestAttributes& attrs = request.Attributes();
    JSONValue::Object obj;
    if (auto loginResult = attrs.LoginResult(); loginResult.has_value()) {
        obj.Set("loginResult", JSONValue(loginResult.value()));
    }
    obj.Set("authReason", JSONValue(toString(resolveAuthReason(request))));
    if (auto userUrl = attrs.UserUrl(); userUrl.has_value()) {
        obj.Set("userUrl", JSONValue(userUrl.value()));
    }
    return JSONValue(std::move(obj));
}

std::string StructuredResponseWriter::Serialize(const Request& request) const {
    return serializeJSONValue(BuildPayload(request));
}

void StructuredResponseWriter::Write(IResponse& response, const Request& request) const {
    const std::string body = Serialize(request);
    LOG_DEBUG("Responding with JSON login state ({} bytes): {}", body.size(), body);

    response.SetStatus(http::status::bad_request);
    response.SetCacheControlNoCache();
    response.SetContentType(kContentType);
    response.SetContentLength(static_cast<std::uint64_t>(body.size()));
    try {
        std::ostream& out = response.OutputStream();
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.flush();
        if (!out) {
            throw errors::CollaboratorError(errors::ErrorCategory::Io, "output stream rejected the response body");
        }
    } catch (const std::exception&) {
        std::throw_with_nested(errors::LoginResponseError("failed to write JSON login response"));
    }
}

} // namespace loginresp
