//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathExclusionMatcher.hpp
// Purpose: Decides whether a request path is exempt from login page handling
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "loginresp/Request.hpp"

namespace loginresp {

class PathExclusionMatcher {
public:
    PathExclusionMatcher() = default;
    explicit PathExclusionMatcher(std::vector<std::string> prefixes)
        : prefixes(std::move(prefixes)) {}

    // True iff the absolute path starts with any configured prefix. Plain string prefix test:
    // "/dav" also matches "/davfoo".
    bool Matches(const std::string& absolutePath) const;

    bool Excluded(const Request& request) const { return Matches(request.AbsolutePath()); }

    const std::vector<std::string>& Prefixes() const { return prefixes; }

private:
    std::vector<std::string> prefixes;
};

} // namespace loginresp
