//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON serialization of MCP protocol result structures
//==========================================================================================================

#include "storemcp/Protocol.h"

namespace storemcp {

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object block;
    block["type"] = std::make_shared<JSONValue>(std::string("text"));
    block["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{block};
}

JSONValue SerializeImplementation(const Implementation& impl) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(impl.name);
    obj["version"] = std::make_shared<JSONValue>(impl.version);
    return JSONValue{obj};
}

JSONValue SerializeServerCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object capsObj;
    if (caps.tools.has_value()) {
        JSONValue::Object toolsObj;
        toolsObj["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        capsObj["tools"] = std::make_shared<JSONValue>(toolsObj);
    }
    return JSONValue{capsObj};
}

JSONValue SerializeTool(const Tool& tool) {
    JSONValue::Object toolObj;
    toolObj["name"] = std::make_shared<JSONValue>(tool.name);
    toolObj["description"] = std::make_shared<JSONValue>(tool.description);
    toolObj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    return JSONValue{toolObj};
}

JSONValue SerializeCallToolResult(const CallToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    for (const auto& v : result.content) content.push_back(std::make_shared<JSONValue>(v));
    obj["content"] = std::make_shared<JSONValue>(content);
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue{obj};
}

} // namespace storemcp
