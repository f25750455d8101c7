//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Resource.cpp
// Purpose: Resource entity implementation, base64 blob encoding and wire formats
//==========================================================================================================

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include "tfomcp/Resource.h"

namespace tfomcp {

namespace {
class FunctionResourceReader : public IResourceReader {
public:
    explicit FunctionResourceReader(ResourceReadFunction fn) : fn(std::move(fn)) {}
    ResourceContent Read(const std::string& uri, const JSONValue& params) override {
        return fn(uri, params);
    }
private:
    ResourceReadFunction fn;
};
} // namespace

std::string EncodeBase64(const std::string& bytes) {
    using namespace boost::archive::iterators;
    using Base64Iterator = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;
    std::string out(Base64Iterator(bytes.begin()), Base64Iterator(bytes.end()));
    // transform_width emits the trailing partial group but no padding
    out.append((3 - bytes.size() % 3) % 3, '=');
    return out;
}

ResourceContent ResourceContent::Text(std::string uri, std::string mimeType, std::string text) {
    ResourceContent c;
    c.uri = std::move(uri);
    c.mimeType = std::move(mimeType);
    c.text = std::move(text);
    return c;
}

ResourceContent ResourceContent::Blob(std::string uri, std::string mimeType, std::string bytes) {
    ResourceContent c;
    c.uri = std::move(uri);
    c.mimeType = std::move(mimeType);
    c.blob = std::move(bytes);
    return c;
}

JSONValue ResourceContent::ToJSON() const {
    JSONValue::Object o;
    o["uri"] = MakeString(uri);
    o["mimeType"] = MakeString(mimeType);
    if (text.has_value()) {
        o["text"] = MakeString(text.value());
    }
    if (blob.has_value()) {
        o["blob"] = MakeString(EncodeBase64(blob.value()));
    }
    return JSONValue{o};
}

std::shared_ptr<IResourceReader> MakeResourceReader(ResourceReadFunction fn) {
    return std::make_shared<FunctionResourceReader>(std::move(fn));
}

Resource::Resource(ResourceURI uri, std::string name, std::string description, std::string mimeType,
                   std::shared_ptr<IResourceReader> reader, bool isTemplate)
    : uri_(std::move(uri)), name_(std::move(name)), description_(std::move(description)),
      mimeType_(std::move(mimeType)), reader_(std::move(reader)), isTemplate_(isTemplate), createdAt_(Now()) {
    if (isTemplate_) {
        uriTemplate_ = uri_.Value();
    }
}

Resource Resource::Create(const std::string& uri, const std::string& name, const std::string& description,
                          const std::string& mimeType, std::shared_ptr<IResourceReader> reader) {
    ResourceURI parsed(uri);
    const bool tmpl = parsed.IsTemplate();
    return Resource(std::move(parsed), name, description, mimeType, std::move(reader), tmpl);
}

Resource Resource::Template(const std::string& uriTemplate, const std::string& name, const std::string& description,
                            const std::string& mimeType, std::shared_ptr<IResourceReader> reader) {
    return Resource(ResourceURI(uriTemplate), name, description, mimeType, std::move(reader), true);
}

bool Resource::MatchesUri(const std::string& uri) const {
    if (!isTemplate_) {
        return uri_.Value() == uri;
    }
    return uri.rfind(uri_.LiteralPrefix(), 0) == 0;
}

ResourceContent Resource::Read(const std::string& requestedUri, const JSONValue& params) const {
    const std::string& target = requestedUri.empty() ? uri_.Value() : requestedUri;
    if (!reader_) {
        return ResourceContent::Text(target, mimeType_, "No reader configured for resource: " + uri_.Value());
    }
    return reader_->Read(target, params);
}

JSONValue Resource::ToMcpFormat() const {
    JSONValue::Object o;
    o["uri"] = MakeString(uri_.Value());
    o["name"] = MakeString(name_);
    o["mimeType"] = MakeString(mimeType_);
    if (!description_.empty()) {
        o["description"] = MakeString(description_);
    }
    return JSONValue{o};
}

std::optional<JSONValue> Resource::ToTemplateFormat() const {
    if (!isTemplate_ || !uriTemplate_.has_value()) {
        return std::nullopt;
    }
    JSONValue::Object o;
    o["uriTemplate"] = MakeString(uriTemplate_.value());
    o["name"] = MakeString(name_);
    o["mimeType"] = MakeString(mimeType_);
    if (!description_.empty()) {
        o["description"] = MakeString(description_);
    }
    return JSONValue{o};
}

} // namespace tfomcp
