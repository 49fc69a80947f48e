//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/Request.cpp
// Purpose: RequestAttributes storage and typed reads
//==========================================================================================================

#include "loginresp/Request.hpp"

#include "logging/Logger.h"

namespace loginresp {

void RequestAttributes::Set(const std::string& key, Value value) {
    values[key] = std::move(value);
}

void RequestAttributes::Erase(const std::string& key) {
    values.erase(key);
}

bool RequestAttributes::Contains(const std::string& key) const {
    return values.find(key) != values.end();
}

const RequestAttributes::Value* RequestAttributes::Find(const std::string& key) const {
    auto it = values.find(key);
    if (it == values.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<bool> RequestAttributes::GetBool(const std::string& key) const {
    const Value* v = Find(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<bool>(*v)) {
        LOG_WARN("Request attribute '{}' is not a boolean; treating as absent", key);
        return std::nullopt;
    }
    return std::get<bool>(*v);
}

std::optional<std::string> RequestAttributes::GetString(const std::string& key) const {
    const Value* v = Find(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<std::string>(*v)) {
        LOG_WARN("Request attribute '{}' is not a string; treating as absent", key);
        return std::nullopt;
    }
    return std::get<std::string>(*v);
}

} // namespace loginresp
