//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/LoginResponseOptions.cpp
// Purpose: key=value and environment parsing for LoginResponseOptions
//==========================================================================================================

#include "loginresp/LoginResponseOptions.hpp"

#include <cstdlib>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace loginresp {

namespace {
    std::string trim(const std::string& s) {
        std::size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) {
            ++b;
        }
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
            --e;
        }
        return s.substr(b, e - b);
    }

    void applyEnabled(LoginResponseOptions& opts, const std::string& val, const char* source) {
        auto flag = ParseBoolFlag(val);
        if (flag.has_value()) {
            opts.enabled = flag.value();
        } else {
            LOG_WARN("Ignoring invalid boolean '{}' for enabled ({})", val, source);
        }
    }
}

std::vector<std::string> splitPathList(const std::string& text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t sep = text.find(',', start);
        if (sep == std::string::npos) { sep = text.size(); }
        std::string item = trim(text.substr(start, sep - start));
        if (!item.empty()) {
            out.push_back(item);
        }
        start = sep + 1;
    }
    return out;
}

LoginResponseOptions parseLoginResponseOptions(const std::string& config) {
    LoginResponseOptions opts;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        if (!kv.empty()) {
            std::size_t eq = kv.find('=');
            if (eq != std::string::npos) {
                std::string key = trim(kv.substr(0, eq));
                std::string val = trim(kv.substr(eq + 1));
                if (key == "enabled") {
                    applyEnabled(opts, val, "config");
                }
                else if (key == "loginPage") {
                    if (!val.empty()) {
                        opts.loginPage = val;
                    }
                }
                else if (key == "excludePaths") {
                    opts.excludePaths = splitPathList(val);
                }
                else {
                    LOG_DEBUG("Ignoring unknown login response option '{}'", key);
                }
            }
        }
        start = sep + 1;
    }
    return opts;
}

LoginResponseOptions applyLoginResponseEnv(LoginResponseOptions options) {
    if (const char* v = std::getenv("LOGINRESP_ENABLED")) {
        applyEnabled(options, v, "LOGINRESP_ENABLED");
    }
    std::string page = GetEnvOrDefault("LOGINRESP_LOGIN_PAGE", "");
    if (!page.empty()) {
        options.loginPage = page;
    }
    if (const char* v = std::getenv("LOGINRESP_EXCLUDE_PATHS")) {
        options.excludePaths = splitPathList(v);
    }
    return options;
}

} // namespace loginresp
