//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseReader.h
// Purpose: Test helper that reads a response envelope back from wire bytes
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <string>

#include "storemcp/JSONRPCTypes.h"

namespace storemcp::test_support {

//==========================================================================================================
// ResponseEnvelope
// Purpose: Members of a response as seen by a client.
// Fields:
//   hasId: false when the id member was omitted.
//   id: parsed id member (null when absent).
//==========================================================================================================
struct ResponseEnvelope {
    bool hasId{false};
    JSONValue id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    bool IsError() const { return error.has_value(); }
};

// Returns false unless text is a JSON object carrying exactly one of result or error.
inline bool ReadResponse(const std::string& text, ResponseEnvelope& out) {
    JSONValue doc;
    try {
        doc = ParseJSON(text);
    } catch (const std::exception&) {
        return false;
    }
    if (!std::holds_alternative<JSONValue::Object>(doc.value)) {
        return false;
    }
    const auto& obj = std::get<JSONValue::Object>(doc.value);
    out = ResponseEnvelope{};
    if (auto it = obj.find("id"); it != obj.end() && it->second) {
        out.hasId = true;
        out.id = *it->second;
    }
    if (auto it = obj.find("result"); it != obj.end() && it->second) {
        out.result = *it->second;
    }
    if (auto it = obj.find("error"); it != obj.end() && it->second) {
        out.error = *it->second;
    }
    return out.result.has_value() != out.error.has_value();
}

} // namespace storemcp::test_support
