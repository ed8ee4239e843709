//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants served by store-mcp-server
//==========================================================================================================

#pragma once

#include "storemcp/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace storemcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version answered to every client, independent of what the client requests
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Server identity reported in serverInfo
constexpr const char* SERVER_NAME = "store-mcp-server";
constexpr const char* SERVER_VERSION = "0.002";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
};

// Client capabilities are accepted as an opaque object; nothing in them changes server behavior.
struct ClientCapabilities {
    JSONValue raw{JSONValue::Object{}};
};

///////////////////////////////////////// Handshake ///////////////////////////////////////////
struct InitializeParams {
    std::optional<std::string> protocolVersion;
    ClientCapabilities capabilities;
    std::optional<Implementation> clientInfo;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool structures
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolParams {
    std::string name;
    JSONValue arguments{JSONValue::Object{}};
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

// Builds a {"type":"text","text":...} content block.
JSONValue MakeTextContent(const std::string& text);

// Serializers for the result payloads placed in response envelopes.
JSONValue SerializeImplementation(const Implementation& impl);
JSONValue SerializeServerCapabilities(const ServerCapabilities& caps);
JSONValue SerializeTool(const Tool& tool);
JSONValue SerializeCallToolResult(const CallToolResult& result);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

} // namespace storemcp
