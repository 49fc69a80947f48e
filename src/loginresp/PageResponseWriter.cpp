//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/PageResponseWriter.cpp
// Purpose: Login page resolution and rendering with soft/hard fault separation
//==========================================================================================================

#include "loginresp/PageResponseWriter.hpp"

#include "logging/Logger.h"
#include "loginresp/AuthReason.hpp"
#include "loginresp/errors/Errors.h"

namespace loginresp {

PageResponseWriter::PageResponseWriter(IResourceResolver& resolver,
                                       IContentResponder& contentResponder,
                                       std::string loginPage)
    : resolver(resolver), contentResponder(contentResponder), loginPage(std::move(loginPage)) {}

PageWriteResult PageResponseWriter::Write(IResponse& response, Request& request) const {
    std::shared_ptr<Resource> page;
    try {
        page = resolver.Resolve(request.HostHeader(), loginPage);
    } catch (const errors::CollaboratorError& e) {
        if (e.Category() != errors::ErrorCategory::NotFound) {
            std::throw_with_nested(errors::LoginResponseError(
                "login page lookup failed for " + request.HostHeader() + loginPage));
        }
        page.reset();
    } catch (const std::exception&) {
        std::throw_with_nested(errors::LoginResponseError(
            "login page lookup failed for " + request.HostHeader() + loginPage));
    }

    const ContentResource* content = page ? page->AsContent() : nullptr;
    if (content == nullptr) {
        LOG_INFO("Couldn't find login resource: {}{}", request.HostHeader(), loginPage);
        return PageWriteResult::LoginPageUnavailable;
    }

    LOG_DEBUG("Rendering login page {} instead of a challenge", content->Name());
    request.Attributes().Set(RequestAttributes::kAuthReason, std::string(toString(resolveAuthReason(request))));
    try {
        contentResponder.RespondContent(*content, response, request, std::nullopt);
    } catch (const std::exception&) {
        std::throw_with_nested(errors::LoginResponseError("failed to render login page " + loginPage));
    }
    return PageWriteResult::Rendered;
}

} // namespace loginresp
