//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoginResponseOptions.hpp
// Purpose: Configuration of the login response dispatcher and its parsers
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

namespace loginresp {

//==========================================================================================================
// LoginResponseOptions
// Fields:
//   enabled: When false every denial gets the standard challenge.
//   loginPage: Logical path of the login page, resolved against the request's host header.
//   excludePaths: Path prefixes that always get the standard challenge (e.g. WebDAV or API mounts).
//==========================================================================================================
struct LoginResponseOptions {
    bool enabled{true};
    std::string loginPage{"/login.html"};
    std::vector<std::string> excludePaths;
};

//==========================================================================================================
// parseLoginResponseOptions
// Purpose: Parse semicolon-delimited key=value config into options, starting from defaults.
//          Example: "enabled=true; loginPage=/signin.html; excludePaths=/dav,/api"
// Notes:
//   - Unknown keys are ignored; an unparsable boolean is logged and leaves the default.
//   - excludePaths is comma-separated; empty entries are dropped.
//==========================================================================================================
LoginResponseOptions parseLoginResponseOptions(const std::string& config);

//==========================================================================================================
// applyLoginResponseEnv
// Purpose: Override options from LOGINRESP_ENABLED, LOGINRESP_LOGIN_PAGE and LOGINRESP_EXCLUDE_PATHS.
//          Unset variables leave the corresponding field untouched.
//==========================================================================================================
LoginResponseOptions applyLoginResponseEnv(LoginResponseOptions options);

// Comma-separated prefix list -> vector, trimming blanks and dropping empty entries.
std::vector<std::string> splitPathList(const std::string& text);

} // namespace loginresp
