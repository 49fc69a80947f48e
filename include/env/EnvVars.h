//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and boolean-like configuration flags.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// ParseBoolFlag
// Purpose: Interprets 1/0, true/false, yes/no, on/off (case-insensitive).
// Returns:
//   The parsed flag, or std::nullopt when the text is not a recognised boolean.
//==========================================================================================================
inline std::optional<bool> ParseBoolFlag(const std::string& text) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (c == ' ' || c == '\t') {
            continue;
        }
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        return false;
    }
    return std::nullopt;
}
