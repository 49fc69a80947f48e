//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseClassifier.hpp
// Purpose: Pluggable decision of which response shape suits a denied request
//==========================================================================================================

#pragma once

#include "loginresp/Request.hpp"
#include "loginresp/Resource.hpp"

namespace loginresp {

//==========================================================================================================
// IResponseClassifier
// Purpose: Strategy consulted by LoginResponseDispatcher. resource may be null.
// Methods:
//   CanLogin: true when a browser login page is an appropriate reply.
//   IsAjax: true when the reply should be a JSON payload for a scripted client.
//==========================================================================================================
class IResponseClassifier {
public:
    virtual ~IResponseClassifier() = default;
    virtual bool CanLogin(const Resource* resource, const Request& request) const = 0;
    virtual bool IsAjax(const Resource* resource, const Request& request) const = 0;
};

//==========================================================================================================
// ContentTypeResponseClassifier
// Purpose: Default classifier driven by the resource's declared content type and the Accept header.
//   CanLogin: resource must produce content; its declared type (queried with "text/html" preferred)
//             must contain "html". With no declared type the Accept header decides; with neither, false.
//   IsAjax:   Accept contains "application/json" or "text/javascript".
//==========================================================================================================
class ContentTypeResponseClassifier final : public IResponseClassifier {
public:
    bool CanLogin(const Resource* resource, const Request& request) const override;
    bool IsAjax(const Resource* resource, const Request& request) const override;
};

} // namespace loginresp
