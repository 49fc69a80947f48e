//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastAdapters.hpp
// Purpose: Bridges Boost.Beast HTTP messages to loginresp::Request / IResponse
//==========================================================================================================

#pragma once

#include <optional>
#include <sstream>
#include <string>

#include <boost/beast/http.hpp>

#include "loginresp/Request.hpp"
#include "loginresp/Resource.hpp"
#include "loginresp/Response.hpp"

namespace loginresp::beast {

namespace http = boost::beast::http;

//==========================================================================================================
// makeRequest
// Purpose: Snapshot a Beast request: method, percent-decoded path without query, Host, Accept and a
//          parsed Authorization header. Attributes start empty.
//==========================================================================================================
Request makeRequest(const http::request<http::string_body>& req);

// Path part of a request target, percent-decoded. Malformed escapes are kept verbatim.
std::string decodeTargetPath(const std::string& target);

//==========================================================================================================
// parseByteRange
// Purpose: Parse a single "bytes=<start>-[<end>]" Range value. Multi-range and suffix ranges
//          ("bytes=-500") yield std::nullopt so the full content is sent.
//==========================================================================================================
std::optional<ByteRange> parseByteRange(const std::string& header);

//==========================================================================================================
// BeastResponse
// Purpose: IResponse over a Beast string_body response. Body bytes are buffered and moved into the
//          message by Commit(). Without an explicit content length, Commit() calls prepare_payload().
//==========================================================================================================
class BeastResponse final : public IResponse {
public:
    explicit BeastResponse(http::response<http::string_body>& res) : res(res) {}

    void SetStatus(http::status status) override { res.result(status); }
    void SetHeader(http::field name, const std::string& value) override { res.set(name, value); }
    void SetContentType(const std::string& contentType) override { res.set(http::field::content_type, contentType); }
    void SetCacheControlNoCache() override { res.set(http::field::cache_control, "no-cache"); }
    void SetContentLength(std::uint64_t length) override;
    std::ostream& OutputStream() override { return body; }

    // Finalise the message. Throws errors::LoginResponseError when the declared length disagrees with the
    // bytes written.
    void Commit();

private:
    http::response<http::string_body>& res;
    std::ostringstream body;
    std::optional<std::uint64_t> declaredLength;
};

} // namespace loginresp::beast
