//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Resource.h
// Purpose: Resource entity, resource contents and the resource reader interface
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "tfomcp/Identifiers.h"
#include "tfomcp/JSONRPCTypes.h"

namespace tfomcp {

//==========================================================================================================
// ResourceContent
// Purpose: One item of a resources/read result. Exactly one of text/blob is normally set.
// Fields:
//   blob: Raw bytes; serialized as base64.
//==========================================================================================================
struct ResourceContent {
    std::string uri;
    std::string mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob;

    static ResourceContent Text(std::string uri, std::string mimeType, std::string text);
    static ResourceContent Blob(std::string uri, std::string mimeType, std::string bytes);

    // { uri, mimeType, text? , blob? (base64) }
    JSONValue ToJSON() const;
};

// Standard base64 (RFC 4648) with '=' padding.
std::string EncodeBase64(const std::string& bytes);

//==========================================================================================================
// IResourceReader
// Purpose: Produces content for a resource.
// Args (Read):
//   uri: The URI the client asked for (for templates, the concrete URI, not the template).
//   params: The optional "params" object of the resources/read request (empty object when absent).
//==========================================================================================================
class IResourceReader {
public:
    virtual ~IResourceReader() = default;
    virtual ResourceContent Read(const std::string& uri, const JSONValue& params) = 0;
};

using ResourceReadFunction = std::function<ResourceContent(const std::string&, const JSONValue&)>;

std::shared_ptr<IResourceReader> MakeResourceReader(ResourceReadFunction fn);

//==========================================================================================================
// Resource
// Purpose: Readable capability identified by its URI.
// Notes:
//   Template resources match any URI starting with the literal text before the first '{'.
//==========================================================================================================
class Resource {
public:
    // Template-ness derived from the URI (throws errors::ValidationError on an invalid URI).
    static Resource Create(const std::string& uri, const std::string& name, const std::string& description = "",
                           const std::string& mimeType = "text/plain",
                           std::shared_ptr<IResourceReader> reader = nullptr);

    // Always a template; uriTemplate equals the URI.
    static Resource Template(const std::string& uriTemplate, const std::string& name,
                             const std::string& description = "", const std::string& mimeType = "text/plain",
                             std::shared_ptr<IResourceReader> reader = nullptr);

    const std::string& Uri() const { return uri_.Value(); }
    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }
    const std::string& GetMimeType() const { return mimeType_; }
    bool IsTemplate() const { return isTemplate_; }
    const std::optional<std::string>& UriTemplate() const { return uriTemplate_; }
    Timestamp CreatedAt() const { return createdAt_; }

    // True on exact match, or for templates when uri starts with the literal prefix.
    bool MatchesUri(const std::string& uri) const;

    // Reads content for requestedUri (defaults to this resource's URI).
    ResourceContent Read(const std::string& requestedUri = "", const JSONValue& params = JSONValue{JSONValue::Object{}}) const;

    // { uri, name, mimeType, description? }
    JSONValue ToMcpFormat() const;
    // { uriTemplate, name, mimeType, description? }; std::nullopt for non-templates.
    std::optional<JSONValue> ToTemplateFormat() const;

private:
    Resource(ResourceURI uri, std::string name, std::string description, std::string mimeType,
             std::shared_ptr<IResourceReader> reader, bool isTemplate);

    ResourceURI uri_;
    std::string name_;
    std::string description_;
    std::string mimeType_;
    std::shared_ptr<IResourceReader> reader_;
    bool isTemplate_{false};
    std::optional<std::string> uriTemplate_;
    Timestamp createdAt_;
};

} // namespace tfomcp
