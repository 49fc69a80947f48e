//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Resource.hpp
// Purpose: Resource abstraction with an optional content-producing capability
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace loginresp {

class ContentResource;

//==========================================================================================================
// ByteRange
// Purpose: Inclusive byte range; finish absent means "to the end of the content".
//==========================================================================================================
struct ByteRange {
    std::uint64_t start{0};
    std::optional<std::uint64_t> finish;
};

//==========================================================================================================
// Resource
// Purpose: Any entity a request can address. Only resources that can stream bytes return a non-null
//          AsContent(); collections and other non-renderable entities keep the default.
//==========================================================================================================
class Resource {
public:
    virtual ~Resource() = default;

    virtual std::string Name() const = 0;

    virtual const ContentResource* AsContent() const { return nullptr; }
};

//==========================================================================================================
// ContentResource
// Purpose: Resource that declares a content type and can write its bytes to a sink.
//==========================================================================================================
class ContentResource : public Resource {
public:
    const ContentResource* AsContent() const override { return this; }

    // Declared content type, given the type the caller would prefer. std::nullopt when the resource
    // does not declare one.
    virtual std::optional<std::string> GetContentType(const std::string& accepts) const = 0;

    // Total length in bytes when known up front.
    virtual std::optional<std::uint64_t> GetContentLength() const = 0;

    // Writes the content, or the requested slice of it. May throw errors::CollaboratorError.
    virtual void SendContent(std::ostream& out, const std::optional<ByteRange>& range) const = 0;
};

} // namespace loginresp
