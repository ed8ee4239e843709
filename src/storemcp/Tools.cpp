//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Tools.cpp
// Purpose: Tool catalog and tool implementations
//==========================================================================================================

#include <iterator>

#include "logging/Logger.h"
#include "storemcp/Tools.h"

namespace storemcp {

namespace {

constexpr ToolEntry kToolCatalog[] = {
    {"list_indian_stores", "List popular Indian online stores", &ListIndianStores},
};

// {"type":"object","properties":{}}
JSONValue emptyObjectSchema() {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
    return JSONValue{schema};
}

} // namespace

const ToolEntry* FindTool(std::string_view name) {
    for (const auto& entry : kToolCatalog) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<Tool> DescribeTools() {
    std::vector<Tool> tools;
    tools.reserve(std::size(kToolCatalog));
    for (const auto& entry : kToolCatalog) {
        tools.emplace_back(std::string(entry.name), std::string(entry.description), emptyObjectSchema());
    }
    return tools;
}

CallToolResult ListIndianStores(const JSONValue& /*arguments*/) {
    LOG_DEBUG("Tool list_indian_stores invoked");
    CallToolResult result;
    result.content.push_back(MakeTextContent(kIndianStoresText));
    result.isError = false;
    return result;
}

} // namespace storemcp
