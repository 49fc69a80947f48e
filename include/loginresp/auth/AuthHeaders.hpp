//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthHeaders.hpp
// Purpose: WWW-Authenticate challenge formatting and Authorization header parsing
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "loginresp/Request.hpp"

namespace loginresp::auth {

//==========================================================================================================
// WwwAuthChallenge
// Purpose: A single WWW-Authenticate challenge, e.g. Basic realm="files".
// Fields:
//   scheme: Auth scheme, written as given.
//   params: Parameters in header order.
//==========================================================================================================
struct WwwAuthChallenge {
    std::string scheme;
    std::vector<std::pair<std::string, std::string>> params;
};

//==========================================================================================================
// formatWwwAuthenticate
// Purpose: Render a challenge as a header value; every parameter value is quoted and escaped.
//==========================================================================================================
std::string formatWwwAuthenticate(const WwwAuthChallenge& challenge);

//==========================================================================================================
// parseAuthorization
// Purpose: Split an Authorization header into scheme and credentials. The scheme is recorded as the tag:
//          presenting any credential counts as an authentication attempt.
// Returns:
//   std::nullopt for an empty or blank header.
//==========================================================================================================
std::optional<Authorization> parseAuthorization(const std::string& header);

} // namespace loginresp::auth
