//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/AuthReason.cpp
// Purpose: AuthReason conversions and derivation
//==========================================================================================================

#include "loginresp/AuthReason.hpp"

namespace loginresp {

const char* toString(AuthReason reason) {
    switch (reason) {
        case AuthReason::NotPermitted: return "notPermitted";
        case AuthReason::Required: return "required";
    }
    return "required";
}

std::optional<AuthReason> authReasonFromString(const std::string& text) {
    if (text == "required") {
        return AuthReason::Required;
    }
    if (text == "notPermitted") {
        return AuthReason::NotPermitted;
    }
    return std::nullopt;
}

AuthReason resolveAuthReason(const Request& request) {
    const auto& auth = request.GetAuthorization();
    if (auth.has_value() && auth->Attempted()) {
        return AuthReason::NotPermitted;
    }
    return AuthReason::Required;
}

} // namespace loginresp
