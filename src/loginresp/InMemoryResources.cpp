//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/InMemoryResources.cpp
// Purpose: In-memory resources and resolver implementation
//==========================================================================================================

#include "loginresp/InMemoryResources.hpp"

#include <algorithm>

#include "loginresp/errors/Errors.h"

namespace loginresp {

std::optional<std::string> MemoryResource::GetContentType(const std::string& accepts) const {
    (void)accepts;
    return contentType;
}

void MemoryResource::SendContent(std::ostream& out, const std::optional<ByteRange>& range) const {
    if (!range.has_value()) {
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        return;
    }
    if (range->start >= body.size()) {
        throw errors::CollaboratorError(errors::ErrorCategory::BadRequest, "range outside " + name);
    }
    std::uint64_t last = std::min<std::uint64_t>(range->finish.value_or(body.size() - 1), body.size() - 1);
    if (last < range->start) {
        throw errors::CollaboratorError(errors::ErrorCategory::BadRequest, "inverted range for " + name);
    }
    out.write(body.data() + range->start, static_cast<std::streamsize>(last - range->start + 1));
}

std::string InMemoryResourceResolver::hostKey(const std::string& hostHeader, const std::string& logicalPath) {
    return hostHeader + "\n" + logicalPath;
}

void InMemoryResourceResolver::Add(const std::string& logicalPath, std::shared_ptr<Resource> resource) {
    std::lock_guard<std::mutex> lock(mtx);
    anyHost[logicalPath] = std::move(resource);
}

void InMemoryResourceResolver::AddForHost(const std::string& hostHeader,
                                          const std::string& logicalPath,
                                          std::shared_ptr<Resource> resource) {
    std::lock_guard<std::mutex> lock(mtx);
    perHost[hostKey(hostHeader, logicalPath)] = std::move(resource);
}

void InMemoryResourceResolver::Remove(const std::string& logicalPath) {
    std::lock_guard<std::mutex> lock(mtx);
    anyHost.erase(logicalPath);
}

std::shared_ptr<Resource> InMemoryResourceResolver::Resolve(const std::string& hostHeader,
                                                            const std::string& logicalPath) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = perHost.find(hostKey(hostHeader, logicalPath));
    if (it != perHost.end()) {
        return it->second;
    }
    auto jt = anyHost.find(logicalPath);
    if (jt != anyHost.end()) {
        return jt->second;
    }
    return nullptr;
}

} // namespace loginresp
