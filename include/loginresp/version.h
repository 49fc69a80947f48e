//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the loginresp library. Components come from the build's project
//          version (LOGINRESP_VERSION_MAJOR/MINOR/PATCH).
//==========================================================================================================
#pragma once

#include <string>

namespace loginresp {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH", also sent in the Server header as "loginresp/<version>".
std::string getVersionString();

} // namespace loginresp
