//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/version.cpp
// Purpose: Version helpers backed by the compile-time project version.
//==========================================================================================================
#include "loginresp/version.h"

#include <fmt/format.h>

#ifndef LOGINRESP_VERSION_MAJOR
#define LOGINRESP_VERSION_MAJOR 0
#endif
#ifndef LOGINRESP_VERSION_MINOR
#define LOGINRESP_VERSION_MINOR 1
#endif
#ifndef LOGINRESP_VERSION_PATCH
#define LOGINRESP_VERSION_PATCH 0
#endif

namespace loginresp {

VersionInfo getVersion() {
    return VersionInfo{LOGINRESP_VERSION_MAJOR, LOGINRESP_VERSION_MINOR, LOGINRESP_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace loginresp
