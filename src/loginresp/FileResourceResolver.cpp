//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/FileResourceResolver.cpp
// Purpose: Document-root file resolution and streaming
//==========================================================================================================

#include "loginresp/FileResourceResolver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <unordered_map>

#include "logging/Logger.h"
#include "loginresp/InMemoryResources.hpp"
#include "loginresp/errors/Errors.h"

namespace loginresp {

namespace fs = std::filesystem;

std::string mimeTypeFromPath(const std::string& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".txt", "text/plain"},
        {".xml", "application/xml"},
        {".svg", "image/svg+xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".ico", "image/x-icon"},
        {".pdf", "application/pdf"},
    };
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : std::string("application/octet-stream");
}

FileResource::FileResource(fs::path file, std::uint64_t size)
    : file(std::move(file)), size(size) {}

std::optional<std::string> FileResource::GetContentType(const std::string& accepts) const {
    (void)accepts;
    return mimeTypeFromPath(file.string());
}

void FileResource::SendContent(std::ostream& out, const std::optional<ByteRange>& range) const {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw errors::CollaboratorError(errors::ErrorCategory::NotFound, "cannot open " + file.string());
    }
    std::uint64_t start = 0;
    std::uint64_t remaining = size;
    if (range.has_value()) {
        if (range->start >= size) {
            throw errors::CollaboratorError(errors::ErrorCategory::BadRequest, "range outside " + Name());
        }
        std::uint64_t last = std::min<std::uint64_t>(range->finish.value_or(size - 1), size - 1);
        start = range->start;
        remaining = last - start + 1;
        in.seekg(static_cast<std::streamoff>(start));
    }
    std::array<char, 8192> buf{};
    while (remaining > 0 && in) {
        std::streamsize want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buf.size()));
        in.read(buf.data(), want);
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(buf.data(), got);
        remaining -= static_cast<std::uint64_t>(got);
    }
    if (remaining > 0) {
        throw errors::CollaboratorError(errors::ErrorCategory::Io, "short read from " + file.string());
    }
}

FileResourceResolver::FileResourceResolver(fs::path documentRoot)
    : root(std::move(documentRoot)) {}

std::shared_ptr<Resource> FileResourceResolver::Resolve(const std::string& hostHeader, const std::string& logicalPath) {
    (void)hostHeader;
    if (logicalPath.empty() || logicalPath.front() != '/') {
        throw errors::CollaboratorError(errors::ErrorCategory::BadRequest, "path must be absolute: " + logicalPath);
    }
    fs::path relative = fs::path(logicalPath).relative_path();
    for (const auto& part : relative) {
        if (part == "..") {
            throw errors::CollaboratorError(errors::ErrorCategory::BadRequest, "path escapes document root: " + logicalPath);
        }
    }
    fs::path full = root / relative;

    std::error_code ec;
    fs::file_status st = fs::status(full, ec);
    if (ec || !fs::exists(st)) {
        return nullptr;
    }
    if (fs::is_directory(st)) {
        return std::make_shared<CollectionResource>(full.filename().empty() ? std::string("/") : full.filename().string());
    }
    if (!fs::is_regular_file(st)) {
        LOG_DEBUG("Not serving special file {}", full.string());
        return nullptr;
    }
    std::uintmax_t size = fs::file_size(full, ec);
    if (ec) {
        throw errors::CollaboratorError(errors::ErrorCategory::Io, "cannot stat " + full.string() + ": " + ec.message());
    }
    return std::make_shared<FileResource>(full, static_cast<std::uint64_t>(size));
}

} // namespace loginresp
