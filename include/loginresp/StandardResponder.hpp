//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StandardResponder.hpp
// Purpose: Default challenge and content responders over IResponse
//==========================================================================================================

#pragma once

#include <string>

#include "loginresp/Collaborators.hpp"

namespace loginresp {

//==========================================================================================================
// StandardResponder
// Purpose: The plain host behaviour the login dispatcher falls back to.
//   RespondUnauthorised: 401, WWW-Authenticate: Basic realm="<realm>", empty body.
//   RespondContent: 200 (206 for a range) with the resource's content type, exact Content-Length and bytes.
// Notes:
//   - Content type falls back to application/octet-stream when the resource declares none.
//   - A range starting beyond the content throws errors::CollaboratorError(BadRequest).
//==========================================================================================================
class StandardResponder final : public IChallengeResponder, public IContentResponder {
public:
    explicit StandardResponder(std::string realm = "loginresp") : realm(std::move(realm)) {}

    void RespondUnauthorised(const Resource* resource, IResponse& response, Request& request) override;

    void RespondContent(const ContentResource& resource,
                        IResponse& response,
                        Request& request,
                        const std::optional<ByteRange>& range) override;

    const std::string& Realm() const { return realm; }

private:
    std::string realm;
};

} // namespace loginresp
