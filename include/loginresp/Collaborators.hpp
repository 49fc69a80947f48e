//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Collaborators.hpp
// Purpose: Interfaces of the host services the denial handling depends on
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "loginresp/Request.hpp"
#include "loginresp/Resource.hpp"
#include "loginresp/Response.hpp"

namespace loginresp {

//==========================================================================================================
// IResourceResolver
// Purpose: Maps (host header, logical path) to a resource.
// Returns:
//   The resource, or nullptr when nothing exists at that path.
// Throws:
//   errors::CollaboratorError with category Unauthorized or BadRequest when the lookup itself is refused.
//==========================================================================================================
class IResourceResolver {
public:
    virtual ~IResourceResolver() = default;
    virtual std::shared_ptr<Resource> Resolve(const std::string& hostHeader, const std::string& logicalPath) = 0;
};

//==========================================================================================================
// IContentResponder
// Purpose: Writes a content resource as a normal (non-error) response, optionally limited to a range.
// Throws:
//   errors::CollaboratorError with category Unauthorized, BadRequest or NotFound.
//==========================================================================================================
class IContentResponder {
public:
    virtual ~IContentResponder() = default;
    virtual void RespondContent(const ContentResource& resource,
                                IResponse& response,
                                Request& request,
                                const std::optional<ByteRange>& range) = 0;
};

//==========================================================================================================
// IChallengeResponder
// Purpose: Writes the host's standard "authentication required" response. resource may be null when the
//          denied entity is unknown.
//==========================================================================================================
class IChallengeResponder {
public:
    virtual ~IChallengeResponder() = default;
    virtual void RespondUnauthorised(const Resource* resource, IResponse& response, Request& request) = 0;
};

} // namespace loginresp
