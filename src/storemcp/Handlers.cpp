//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handlers.cpp
// Purpose: initialize, notifications/initialized, ping, tools/list and tools/call handlers
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "storemcp/Handlers.h"
#include "storemcp/Tools.h"

namespace storemcp {

namespace {

// Parses the deferred params text; a malformed payload is an InvalidParams error.
std::optional<errors::McpError> parseRaw(const RawParams& params, JSONValue& out) {
    if (!params.has_value()) {
        out = JSONValue{nullptr};
        return std::nullopt;
    }
    try {
        out = params->Parse();
    } catch (const std::runtime_error& e) {
        return errors::invalidParams(e.what());
    }
    return std::nullopt;
}

bool isNull(const JSONValue& v) {
    return std::holds_alternative<std::nullptr_t>(v.value);
}

// Looks up key; null members count as absent.
const JSONValue* member(const JSONValue::Object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second || isNull(*it->second)) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<errors::McpError> optionalString(const JSONValue::Object& obj, const char* key,
                                               std::optional<std::string>& out) {
    const JSONValue* v = member(obj, key);
    if (!v) return std::nullopt;
    if (!std::holds_alternative<std::string>(v->value)) {
        return errors::invalidParams(std::string(key) + " must be a string");
    }
    out = std::get<std::string>(v->value);
    return std::nullopt;
}

} // namespace

std::optional<errors::McpError> ParseInitializeParams(const RawParams& params, InitializeParams& out) {
    JSONValue value;
    if (auto err = parseRaw(params, value)) return err;
    out = InitializeParams{};
    if (isNull(value)) {
        return std::nullopt;
    }
    if (!std::holds_alternative<JSONValue::Object>(value.value)) {
        return errors::invalidParams("params must be an object");
    }
    const auto& obj = std::get<JSONValue::Object>(value.value);

    if (auto err = optionalString(obj, "protocolVersion", out.protocolVersion)) return err;

    if (const JSONValue* caps = member(obj, "capabilities")) {
        if (!std::holds_alternative<JSONValue::Object>(caps->value)) {
            return errors::invalidParams("capabilities must be an object");
        }
        out.capabilities.raw = *caps;
    }

    if (const JSONValue* info = member(obj, "clientInfo")) {
        if (!std::holds_alternative<JSONValue::Object>(info->value)) {
            return errors::invalidParams("clientInfo must be an object");
        }
        const auto& infoObj = std::get<JSONValue::Object>(info->value);
        std::optional<std::string> name;
        std::optional<std::string> version;
        if (auto err = optionalString(infoObj, "name", name)) return err;
        if (auto err = optionalString(infoObj, "version", version)) return err;
        out.clientInfo = Implementation(name.value_or(""), version.value_or(""));
    }
    return std::nullopt;
}

std::optional<errors::McpError> ParseCallToolParams(const RawParams& params, CallToolParams& out) {
    JSONValue value;
    if (auto err = parseRaw(params, value)) return err;
    if (!std::holds_alternative<JSONValue::Object>(value.value)) {
        return errors::invalidParams("params must be an object");
    }
    const auto& obj = std::get<JSONValue::Object>(value.value);

    const JSONValue* name = member(obj, "name");
    if (!name || !std::holds_alternative<std::string>(name->value)) {
        return errors::invalidParams("name must be a string");
    }
    out.name = std::get<std::string>(name->value);

    out.arguments = JSONValue{JSONValue::Object{}};
    if (const JSONValue* args = member(obj, "arguments")) {
        if (!std::holds_alternative<JSONValue::Object>(args->value)) {
            return errors::invalidParams("arguments must be an object");
        }
        out.arguments = *args;
    }
    return std::nullopt;
}

HandlerResult HandleInitialize(HandlerContext& ctx, const RawParams& params) {
    InitializeParams init;
    if (auto err = ParseInitializeParams(params, init)) {
        LOG_WARN("Rejected initialize params: {}", SerializeJSON(err->data.value_or(JSONValue{})));
        return *err;
    }
    const std::string clientName = init.clientInfo ? init.clientInfo->name : std::string("<unknown>");
    LOG_INFO("Handling initialize request from client '{}' (requested protocol {})",
             clientName, init.protocolVersion.value_or("<none>"));

    ctx.session.MarkReady();

    ServerCapabilities caps;
    caps.tools = ToolsCapability{};

    JSONValue::Object resultObj;
    resultObj["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    resultObj["capabilities"] = std::make_shared<JSONValue>(SerializeServerCapabilities(caps));
    resultObj["serverInfo"] = std::make_shared<JSONValue>(SerializeImplementation(ctx.serverInfo));
    return JSONValue{resultObj};
}

HandlerResult HandleInitializedNotification(HandlerContext& ctx, const RawParams& /*params*/) {
    LOG_INFO("Client reported initialized (session ready: {})", ctx.session.IsReady());
    return JSONValue{nullptr};
}

HandlerResult HandlePing(HandlerContext& /*ctx*/, const RawParams& /*params*/) {
    LOG_DEBUG("Handling ping request");
    return JSONValue{JSONValue::Object{}};
}

HandlerResult HandleToolsList(HandlerContext& /*ctx*/, const RawParams& /*params*/) {
    LOG_DEBUG("Handling tools/list request");
    JSONValue::Array toolsArray;
    for (const auto& tool : DescribeTools()) {
        toolsArray.push_back(std::make_shared<JSONValue>(SerializeTool(tool)));
    }
    JSONValue::Object resultObj;
    resultObj["tools"] = std::make_shared<JSONValue>(toolsArray);
    return JSONValue{resultObj};
}

HandlerResult HandleToolsCall(HandlerContext& /*ctx*/, const RawParams& params) {
    LOG_DEBUG("Handling tools/call request");
    CallToolParams call;
    if (auto err = ParseCallToolParams(params, call)) {
        return *err;
    }
    const ToolEntry* tool = FindTool(call.name);
    if (!tool) {
        LOG_DEBUG("Unknown tool requested: {}", call.name);
        return errors::unknownTool(call.name);
    }
    return SerializeCallToolResult(tool->invoke(call.arguments));
}

} // namespace storemcp
