//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoginResponseDispatcher.hpp
// Purpose: Chooses how an access denial is reported: challenge, login page, or JSON login state
//==========================================================================================================

#pragma once

#include <memory>

#include "loginresp/Collaborators.hpp"
#include "loginresp/LoginResponseOptions.hpp"
#include "loginresp/PageResponseWriter.hpp"
#include "loginresp/PathExclusionMatcher.hpp"
#include "loginresp/ResponseClassifier.hpp"
#include "loginresp/StructuredResponseWriter.hpp"

namespace loginresp {

enum class Outcome {
    StandardChallenge,
    RenderedPage,
    StructuredPayload
};

const char* toString(Outcome outcome);

//==========================================================================================================
// LoginResponseDispatcher
// Purpose: Entry point invoked by the host whenever access is denied. Replaces the authentication
//          challenge with a login page for browsers, or with a JSON payload for scripted clients, and
//          leaves every other caller (WebDAV clients, curl, excluded paths) with the standard challenge.
// Decision:
//   1. disabled, excluded path, or method other than GET/POST -> standard challenge
//   2. classifier CanLogin -> login page (falls back to the challenge when no login page exists)
//   3. classifier IsAjax   -> JSON payload
//   4. otherwise           -> standard challenge
// Notes:
//   - Collaborators are non-owning and must outlive the dispatcher. The fallback must not be this
//     dispatcher.
//   - Holds only immutable state; safe to call concurrently with distinct Request/IResponse objects.
//==========================================================================================================
class LoginResponseDispatcher final : public IChallengeResponder {
public:
    LoginResponseDispatcher(LoginResponseOptions options,
                            IChallengeResponder& fallback,
                            IContentResponder& contentResponder,
                            IResourceResolver& resolver,
                            std::shared_ptr<const IResponseClassifier> classifier = nullptr);

    //==========================================================================================================
    // HandleDenied
    // Purpose: Produce exactly one denial response.
    // Returns:
    //   The outcome actually written (a login page that could not be found reports StandardChallenge).
    // Throws:
    //   errors::LoginResponseError when the selected login page or JSON reply fails part way.
    //==========================================================================================================
    Outcome HandleDenied(const Resource* resource, IResponse& response, Request& request) const;

    // Selection only; writes nothing.
    Outcome Decide(const Resource* resource, const Request& request) const;

    void RespondUnauthorised(const Resource* resource, IResponse& response, Request& request) override;

    const LoginResponseOptions& Options() const { return options; }

private:
    LoginResponseOptions options;
    IChallengeResponder& fallback;
    PathExclusionMatcher exclusions;
    std::shared_ptr<const IResponseClassifier> classifier;
    PageResponseWriter pageWriter;
    StructuredResponseWriter structuredWriter;
};

} // namespace loginresp
