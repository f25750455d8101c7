//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 TelemetryFlow-MCP contributors
// File: Identifiers.cpp
// Purpose: Value object validation, identifier generation and timestamp formatting
//==========================================================================================================

#include <array>
#include <cstdio>
#include <ctime>
#include <random>

#include "tfomcp/Identifiers.h"
#include "tfomcp/errors/Errors.h"

namespace tfomcp {

std::string FormatTimestamp(Timestamp t) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count() % 1000;
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm buf{};
    ::gmtime_r(&tt, &buf);
    char out[40];
    std::snprintf(out, sizeof(out), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  buf.tm_year + 1900, buf.tm_mon + 1, buf.tm_mday,
                  buf.tm_hour, buf.tm_min, buf.tm_sec, static_cast<int>(ms < 0 ? 0 : ms));
    return out;
}

std::string GenerateUuid() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dis(0, 255);
    std::array<unsigned char, 16> bytes{};
    for (auto& b : bytes) b = static_cast<unsigned char>(dis(gen));
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }
    return out;
}

template <typename Tag>
BasicId<Tag>::BasicId(std::string value) : value_(std::move(value)) {
    if (value_.empty()) {
        throw errors::ValidationError("Identifier cannot be empty");
    }
}

template class BasicId<SessionIdTag>;
template class BasicId<ConversationIdTag>;
template class BasicId<MessageIdTag>;

//----------------------------------------------------------------------------------------------------------
// ToolName
//----------------------------------------------------------------------------------------------------------
bool ToolName::IsValid(const std::string& value) {
    if (value.empty() || value.size() > MaxLength) return false;
    if (value[0] < 'a' || value[0] > 'z') return false;
    for (char c : value) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

ToolName::ToolName(std::string value) : value_(std::move(value)) {
    if (value_.empty()) {
        throw errors::ValidationError("Tool name cannot be empty");
    }
    if (value_.size() > MaxLength) {
        throw errors::ValidationError("Tool name cannot exceed 64 characters");
    }
    if (!IsValid(value_)) {
        throw errors::ValidationError("Invalid tool name format: " + value_);
    }
}

//----------------------------------------------------------------------------------------------------------
// ToolDescription
//----------------------------------------------------------------------------------------------------------
ToolDescription::ToolDescription(std::string value) : value_(std::move(value)) {
    if (value_.empty()) {
        throw errors::ValidationError("Tool description cannot be empty");
    }
    if (value_.size() > MaxLength) {
        throw errors::ValidationError("Tool description cannot exceed 1024 characters");
    }
}

//----------------------------------------------------------------------------------------------------------
// ResourceURI
//----------------------------------------------------------------------------------------------------------
namespace {
constexpr std::array<const char*, 5> kSchemes{"file", "config", "status", "http", "https"};
}

bool ResourceURI::IsValid(const std::string& value) {
    const auto sep = value.find("://");
    if (value.empty() || sep == std::string::npos || sep == 0) return false;
    const std::string scheme = value.substr(0, sep);
    for (const char* s : kSchemes) {
        if (scheme == s) return true;
    }
    return false;
}

ResourceURI::ResourceURI(std::string value) : value_(std::move(value)) {
    if (value_.empty()) {
        throw errors::ValidationError("Resource URI cannot be empty");
    }
    if (value_.find("://") == std::string::npos) {
        throw errors::ValidationError("Invalid resource URI format: " + value_);
    }
    if (!IsValid(value_)) {
        throw errors::ValidationError("Invalid resource URI scheme: " + Scheme());
    }
}

std::string ResourceURI::Scheme() const {
    const auto sep = value_.find("://");
    return sep == std::string::npos ? std::string() : value_.substr(0, sep);
}

bool ResourceURI::IsTemplate() const {
    return value_.find('{') != std::string::npos && value_.find('}') != std::string::npos;
}

std::string ResourceURI::LiteralPrefix() const {
    return value_.substr(0, value_.find('{'));
}

//----------------------------------------------------------------------------------------------------------
// SystemPrompt
//----------------------------------------------------------------------------------------------------------
SystemPrompt::SystemPrompt(std::string value) : value_(std::move(value)) {
    if (value_.size() > MaxLength) {
        throw errors::ValidationError("System prompt cannot exceed 100000 characters");
    }
}

bool SystemPrompt::IsEmpty() const {
    return value_.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

} // namespace tfomcp
