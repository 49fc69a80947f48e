//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthReason.hpp
// Purpose: Reason code explaining why a caller is asked to log in
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "loginresp/Request.hpp"

namespace loginresp {

enum class AuthReason {
    Required,     // no authentication attempt was made
    NotPermitted  // an attempt was made and access is still denied
};

// Wire form: "required" / "notPermitted".
const char* toString(AuthReason reason);

std::optional<AuthReason> authReasonFromString(const std::string& text);

//==========================================================================================================
// resolveAuthReason
// Purpose: NotPermitted when the request carries an Authorization with a non-empty tag, else Required.
//          Stateless; every caller evaluates it independently.
//==========================================================================================================
AuthReason resolveAuthReason(const Request& request);

} // namespace loginresp
