//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/LoginResponseDispatcher.cpp
// Purpose: Denial outcome selection and dispatch
//==========================================================================================================

#include "loginresp/LoginResponseDispatcher.hpp"

#include "logging/Logger.h"

namespace loginresp {

namespace http = boost::beast::http;

const char* toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::RenderedPage: return "RenderedPage";
        case Outcome::StructuredPayload: return "StructuredPayload";
        case Outcome::StandardChallenge: return "StandardChallenge";
    }
    return "StandardChallenge";
}

LoginResponseDispatcher::LoginResponseDispatcher(LoginResponseOptions opts,
                                                 IChallengeResponder& fallback,
                                                 IContentResponder& contentResponder,
                                                 IResourceResolver& resolver,
                                                 std::shared_ptr<const IResponseClassifier> classifier)
    : options(std::move(opts)),
      fallback(fallback),
      exclusions(options.excludePaths),
      classifier(classifier ? std::move(classifier)
                            : std::shared_ptr<const IResponseClassifier>(std::make_shared<ContentTypeResponseClassifier>())),
      pageWriter(resolver, contentResponder, options.loginPage) {}

Outcome LoginResponseDispatcher::Decide(const Resource* resource, const Request& request) const {
    if (!options.enabled) {
        return Outcome::StandardChallenge;
    }
    if (exclusions.Excluded(request)) {
        LOG_DEBUG("Path {} is excluded from login responses", request.AbsolutePath());
        return Outcome::StandardChallenge;
    }
    const http::verb method = request.Method();
    if (method != http::verb::get && method != http::verb::post) {
        return Outcome::StandardChallenge;
    }
    if (classifier->CanLogin(resource, request)) {
        return Outcome::RenderedPage;
    }
    if (classifier->IsAjax(resource, request)) {
        return Outcome::StructuredPayload;
    }
    return Outcome::StandardChallenge;
}

Outcome LoginResponseDispatcher::HandleDenied(const Resource* resource, IResponse& response, Request& request) const {
    Outcome outcome = Decide(resource, request);
    LOG_DEBUG("Access denied: {} {} -> {}",
              std::string(http::to_string(request.Method())), request.AbsolutePath(), toString(outcome));

    switch (outcome) {
        case Outcome::RenderedPage:
            if (pageWriter.Write(response, request) == PageWriteResult::Rendered) {
                return Outcome::RenderedPage;
            }
            break;
        case Outcome::StructuredPayload:
            structuredWriter.Write(response, request);
            return Outcome::StructuredPayload;
        case Outcome::StandardChallenge:
            break;
    }

    LOG_DEBUG("Responding with standard challenge");
    fallback.RespondUnauthorised(resource, response, request);
    return Outcome::StandardChallenge;
}

void LoginResponseDispatcher::RespondUnauthorised(const Resource* resource, IResponse& response, Request& request) {
    (void)HandleDenied(resource, response, request);
}

} // namespace loginresp
