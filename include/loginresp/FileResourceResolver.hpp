//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileResourceResolver.hpp
// Purpose: Resolves logical paths to files under a document root
//==========================================================================================================

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "loginresp/Collaborators.hpp"

namespace loginresp {

// Content type from a file extension (".html" -> "text/html"); application/octet-stream when unknown.
std::string mimeTypeFromPath(const std::string& path);

//==========================================================================================================
// FileResource
// Purpose: Regular file served from disk. Content type derives from the extension; length is read when
//          the resource is resolved.
//==========================================================================================================
class FileResource final : public ContentResource {
public:
    FileResource(std::filesystem::path file, std::uint64_t size);

    std::string Name() const override { return file.filename().string(); }
    std::optional<std::string> GetContentType(const std::string& accepts) const override;
    std::optional<std::uint64_t> GetContentLength() const override { return size; }
    void SendContent(std::ostream& out, const std::optional<ByteRange>& range) const override;

    const std::filesystem::path& Path() const { return file; }

private:
    std::filesystem::path file;
    std::uint64_t size;
};

//==========================================================================================================
// FileResourceResolver
// Purpose: Serves one document root for every host.
// Notes:
//   - Paths must be absolute; a ".." segment throws errors::CollaboratorError(BadRequest).
//   - Missing entries resolve to nullptr; directories resolve to a CollectionResource.
//==========================================================================================================
class FileResourceResolver final : public IResourceResolver {
public:
    explicit FileResourceResolver(std::filesystem::path documentRoot);

    std::shared_ptr<Resource> Resolve(const std::string& hostHeader, const std::string& logicalPath) override;

    const std::filesystem::path& DocumentRoot() const { return root; }

private:
    std::filesystem::path root;
};

} // namespace loginresp
