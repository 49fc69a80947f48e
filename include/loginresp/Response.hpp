//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Response.hpp
// Purpose: Outgoing response interface used by the denial handling and the responders
//==========================================================================================================

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>

namespace loginresp {

//==========================================================================================================
// IResponse
// Purpose: Minimal response surface. Headers and status must be set before the first byte is written
//          to OutputStream().
//==========================================================================================================
class IResponse {
public:
    virtual ~IResponse() = default;

    virtual void SetStatus(boost::beast::http::status status) = 0;
    virtual void SetHeader(boost::beast::http::field name, const std::string& value) = 0;
    virtual void SetContentType(const std::string& contentType) = 0;
    virtual void SetCacheControlNoCache() = 0;
    virtual void SetContentLength(std::uint64_t length) = 0;

    virtual std::ostream& OutputStream() = 0;
};

} // namespace loginresp
