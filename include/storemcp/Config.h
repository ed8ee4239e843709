//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Process configuration from STOREMCP_* environment variables and --name=value arguments
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "logging/Logger.h"

namespace storemcp {

//==========================================================================================================
// ServerConfig
// Purpose: Validated settings for the store-mcp-server executable.
//==========================================================================================================
struct ServerConfig {
    std::string address{"0.0.0.0"};
    std::string port{"8080"};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;
    unsigned int threads{4};
    std::string mcpPath{"/mcp"};
    LogLevel logLevel{LogLevel::LOG_INFO_LEVEL};
    std::string logFile;
};

//==========================================================================================================
// GetArgValue
// Purpose: Parses simple key=value style command-line options.
// Args:
//   key: Option name including leading dashes (e.g., "--port")
// Returns:
//   Value of the last matching argument; empty optional when absent.
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

//==========================================================================================================
// LoadServerConfig
// Purpose: Reads each setting from its environment variable, then applies the matching argument.
// Throws:
//   std::invalid_argument naming the offending setting when a value is malformed or out of range.
//==========================================================================================================
ServerConfig LoadServerConfig(int argc, char** argv);

} // namespace storemcp
