//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structure, the server's error taxonomy and the error envelope helper
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "storemcp/JSONRPCTypes.h"

namespace storemcp {
namespace errors {

// Typed error representation used by handlers before it is placed in an envelope.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    return e;
}

//////////////////////////////////////////// Taxonomy ////////////////////////////////////////////
// Bytes do not decode into a request envelope. detail is the parser or shape message.
inline McpError parseError(const std::string& detail) {
    return makeError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue{detail});
}

// data carries the offending method name.
inline McpError methodNotFound(const std::string& method) {
    return makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found", JSONValue{method});
}

// Same code as methodNotFound; data carries the requested tool name.
inline McpError unknownTool(const std::string& name) {
    return makeError(JSONRPCErrorCodes::MethodNotFound, "Unknown tool", JSONValue{name});
}

inline McpError invalidParams(const std::string& detail) {
    return makeError(JSONRPCErrorCodes::InvalidParams, "Invalid params", JSONValue{detail});
}

inline McpError notInitialized() {
    return makeError(JSONRPCErrorCodes::ServerNotInitialized, "Server not initialized");
}

inline McpError internalError(const std::string& detail) {
    return makeError(JSONRPCErrorCodes::InternalError, "Internal error", JSONValue{detail});
}

// Wraps err into a response envelope carrying id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace storemcp
