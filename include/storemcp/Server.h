//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: JSON-RPC dispatcher for store-mcp-server: decode, gate, route, and encode
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "storemcp/JSONRPCTypes.h"
#include "storemcp/Protocol.h"

namespace storemcp {

//==========================================================================================================
// Server
// Purpose: Owns one session and dispatches requests against it. Safe to call from many threads at once.
// Notes:
//   - Every code path ends in a result envelope, an error envelope, or (for notifications) nothing.
//   - Separate Server instances never share session state.
//==========================================================================================================
class Server {
public:
    explicit Server(Implementation serverInfo = Implementation(SERVER_NAME, SERVER_VERSION));
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // Handle
    // Purpose: Transport entry point.
    // Args:
    //   raw: Request bytes as received.
    // Returns:
    //   Encoded response envelope, or std::nullopt when the method produces no response.
    //==========================================================================================================
    std::optional<std::string> Handle(const std::string& raw);

    //==========================================================================================================
    // HandleJSONRPC
    // Purpose: Dispatches an already decoded request.
    // Returns:
    //   Response envelope, or nullptr for notification methods.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleJSONRPC(const JSONRPCRequest& request);

    // true once an initialize request has succeeded.
    bool IsInitialized() const;

    const Implementation& GetServerInfo() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace storemcp
