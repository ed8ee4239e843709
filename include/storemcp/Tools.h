//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Tools.h
// Purpose: Fixed tool catalog exposed through tools/list and tools/call
//==========================================================================================================

#pragma once

#include <string_view>
#include <vector>

#include "storemcp/Protocol.h"

namespace storemcp {

// Result of the list_indian_stores tool.
constexpr const char* kIndianStoresText =
    "Flipkart, Amazon India, Reliance Digital, Myntra, Snapdeal, Tata CLiQ";

// Tool implementations are pure functions of their arguments.
using ToolFunction = CallToolResult (*)(const JSONValue& arguments);

//==========================================================================================================
// ToolEntry
// Purpose: One compile-time catalog row.
// Fields:
//   name: Tool name matched exactly against tools/call params.name.
//   description: Human readable description for tools/list.
//   invoke: Implementation producing the call result.
//==========================================================================================================
struct ToolEntry {
    std::string_view name;
    std::string_view description;
    ToolFunction invoke;
};

// Returns the catalog row for name, or nullptr when the tool does not exist.
const ToolEntry* FindTool(std::string_view name);

// Descriptors for every catalog row, in catalog order.
std::vector<Tool> DescribeTools();

// Ignores arguments and always returns kIndianStoresText as a single text block.
CallToolResult ListIndianStores(const JSONValue& arguments);

} // namespace storemcp
