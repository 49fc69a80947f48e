//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/ResponseClassifier.cpp
// Purpose: Content-type based response classification
//==========================================================================================================

#include "loginresp/ResponseClassifier.hpp"

#include "logging/Logger.h"

namespace loginresp {

bool ContentTypeResponseClassifier::CanLogin(const Resource* resource, const Request& request) const {
    const ContentResource* content = resource ? resource->AsContent() : nullptr;
    if (content == nullptr) {
        LOG_DEBUG("CanLogin: resource does not produce content");
        return false;
    }
    std::optional<std::string> declared = content->GetContentType("text/html");
    if (declared.has_value()) {
        bool html = declared->find("html") != std::string::npos;
        LOG_DEBUG("CanLogin: resource declares content type '{}', html={}", *declared, html);
        return html;
    }
    const auto& accept = request.AcceptHeader();
    if (accept.has_value()) {
        bool html = accept->find("html") != std::string::npos;
        LOG_DEBUG("CanLogin: no declared content type, Accept '{}' html={}", *accept, html);
        return html;
    }
    LOG_DEBUG("CanLogin: no declared content type and no Accept header");
    return false;
}

bool ContentTypeResponseClassifier::IsAjax(const Resource* resource, const Request& request) const {
    (void)resource;
    const auto& accept = request.AcceptHeader();
    if (!accept.has_value()) {
        return false;
    }
    return accept->find("application/json") != std::string::npos ||
           accept->find("text/javascript") != std::string::npos;
}

} // namespace loginresp
