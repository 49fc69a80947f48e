//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PageResponseWriter.hpp
// Purpose: Renders the configured login page in place of an authentication challenge
//==========================================================================================================

#pragma once

#include <string>

#include "loginresp/Collaborators.hpp"

namespace loginresp {

enum class PageWriteResult {
    Rendered,
    LoginPageUnavailable  // nothing renderable at the login page path; caller falls back to the challenge
};

//==========================================================================================================
// PageResponseWriter
// Purpose: Resolves loginPage against the request's host and renders it through the content responder
//          with the page's own status (no 401), after recording the authReason request attribute.
// Notes:
//   - Missing or non-content login page: returns LoginPageUnavailable, nothing is written.
//   - Resolver Unauthorized/BadRequest, or any failure while rendering: throws
//     errors::LoginResponseError with the collaborator's exception nested.
//   - Resolver and responder are non-owning; they must outlive the writer.
//==========================================================================================================
class PageResponseWriter {
public:
    PageResponseWriter(IResourceResolver& resolver, IContentResponder& contentResponder, std::string loginPage);

    PageWriteResult Write(IResponse& response, Request& request) const;

    const std::string& LoginPage() const { return loginPage; }

private:
    IResourceResolver& resolver;
    IContentResponder& contentResponder;
    std::string loginPage;
};

} // namespace loginresp
