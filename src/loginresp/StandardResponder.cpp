//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/StandardResponder.cpp
// Purpose: 401 challenge and content (full or ranged) responses
//==========================================================================================================

#include "loginresp/StandardResponder.hpp"

#include <sstream>

#include "logging/Logger.h"
#include "loginresp/auth/AuthHeaders.hpp"
#include "loginresp/errors/Errors.h"

namespace loginresp {

namespace http = boost::beast::http;

void StandardResponder::RespondUnauthorised(const Resource* resource, IResponse& response, Request& request) {
    LOG_DEBUG("401 for {} ({})", request.AbsolutePath(), resource ? resource->Name() : std::string("unknown resource"));
    auth::WwwAuthChallenge challenge;
    challenge.scheme = "Basic";
    challenge.params.emplace_back("realm", realm);
    response.SetStatus(http::status::unauthorized);
    response.SetHeader(http::field::www_authenticate, auth::formatWwwAuthenticate(challenge));
    response.SetContentLength(0);
}

void StandardResponder::RespondContent(const ContentResource& resource,
                                       IResponse& response,
                                       Request& request,
                                       const std::optional<ByteRange>& range) {
    const std::string accepts = request.AcceptHeader().value_or("*/*");
    const std::string contentType = resource.GetContentType(accepts).value_or("application/octet-stream");
    const std::optional<std::uint64_t> total = resource.GetContentLength();

    std::optional<ByteRange> effective = range;
    if (effective.has_value() && total.has_value()) {
        if (effective->start >= total.value()) {
            throw errors::CollaboratorError(errors::ErrorCategory::BadRequest,
                                            "range start beyond end of " + resource.Name());
        }
        if (!effective->finish.has_value() || effective->finish.value() >= total.value()) {
            effective->finish = total.value() - 1;
        }
        if (effective->finish.value() < effective->start) {
            throw errors::CollaboratorError(errors::ErrorCategory::BadRequest,
                                            "inverted range for " + resource.Name());
        }
    }

    // Content length is needed before the body; render to a buffer when the resource cannot say.
    std::string buffered;
    bool useBuffer = !total.has_value();
    if (useBuffer) {
        std::ostringstream tmp;
        resource.SendContent(tmp, effective);
        buffered = tmp.str();
    }

    if (effective.has_value()) {
        response.SetStatus(http::status::partial_content);
        if (total.has_value()) {
            std::ostringstream cr;
            cr << "bytes " << effective->start << "-" << effective->finish.value() << "/" << total.value();
            response.SetHeader(http::field::content_range, cr.str());
        }
    } else {
        response.SetStatus(http::status::ok);
    }
    response.SetContentType(contentType);

    if (useBuffer) {
        response.SetContentLength(buffered.size());
        response.OutputStream().write(buffered.data(), static_cast<std::streamsize>(buffered.size()));
    } else {
        std::uint64_t length = effective.has_value()
            ? effective->finish.value() - effective->start + 1
            : total.value();
        response.SetContentLength(length);
        resource.SendContent(response.OutputStream(), effective);
    }
    if (!response.OutputStream()) {
        throw errors::CollaboratorError(errors::ErrorCategory::Io, "failed writing content of " + resource.Name());
    }
}

} // namespace loginresp
