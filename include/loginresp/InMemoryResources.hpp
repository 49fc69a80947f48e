//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryResources.hpp
// Purpose: In-process resources and resolver for embedding, demos and tests
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "loginresp/Collaborators.hpp"

namespace loginresp {

//==========================================================================================================
// MemoryResource
// Purpose: Content resource backed by a string. contentType may be absent to model resources that do
//          not declare one.
//==========================================================================================================
class MemoryResource final : public ContentResource {
public:
    MemoryResource(std::string name, std::string body, std::optional<std::string> contentType)
        : name(std::move(name)), body(std::move(body)), contentType(std::move(contentType)) {}

    std::string Name() const override { return name; }
    std::optional<std::string> GetContentType(const std::string& accepts) const override;
    std::optional<std::uint64_t> GetContentLength() const override { return body.size(); }
    void SendContent(std::ostream& out, const std::optional<ByteRange>& range) const override;

    const std::string& Body() const { return body; }

private:
    std::string name;
    std::string body;
    std::optional<std::string> contentType;
};

//==========================================================================================================
// CollectionResource
// Purpose: Addressable entity with no byte representation (a folder, a WebDAV collection).
//==========================================================================================================
class CollectionResource final : public Resource {
public:
    explicit CollectionResource(std::string name) : name(std::move(name)) {}
    std::string Name() const override { return name; }

private:
    std::string name;
};

//==========================================================================================================
// InMemoryResourceResolver
// Purpose: Path -> resource map. A resource registered for a specific host wins over the host-agnostic
//          registration of the same path. Registration and lookup are thread-safe.
//==========================================================================================================
class InMemoryResourceResolver final : public IResourceResolver {
public:
    void Add(const std::string& logicalPath, std::shared_ptr<Resource> resource);
    void AddForHost(const std::string& hostHeader, const std::string& logicalPath, std::shared_ptr<Resource> resource);
    void Remove(const std::string& logicalPath);

    std::shared_ptr<Resource> Resolve(const std::string& hostHeader, const std::string& logicalPath) override;

private:
    static std::string hostKey(const std::string& hostHeader, const std::string& logicalPath);

    mutable std::mutex mtx;
    std::unordered_map<std::string, std::shared_ptr<Resource>> anyHost;
    std::unordered_map<std::string, std::shared_ptr<Resource>> perHost;
};

} // namespace loginresp
