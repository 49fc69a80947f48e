//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/PathExclusionMatcher.cpp
// Purpose: Prefix matching for excluded paths
//==========================================================================================================

#include "loginresp/PathExclusionMatcher.hpp"

namespace loginresp {

bool PathExclusionMatcher::Matches(const std::string& absolutePath) const {
    for (const auto& prefix : prefixes) {
        if (absolutePath.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace loginresp
