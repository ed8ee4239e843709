//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.h
// Purpose: Static method table mapping JSON-RPC method names to handlers and gating rules
//==========================================================================================================

#pragma once

#include <span>
#include <string_view>
#include <variant>

#include "storemcp/JSONRPCTypes.h"
#include "storemcp/Protocol.h"
#include "storemcp/SessionState.h"
#include "storemcp/errors/Errors.h"

namespace storemcp {

//==========================================================================================================
// HandlerContext
// Purpose: Per-server state handed to every method handler.
//==========================================================================================================
struct HandlerContext {
    SessionState& session;
    const Implementation& serverInfo;
};

// A handler yields either the result payload or the error to place in the envelope.
using HandlerResult = std::variant<JSONValue, errors::McpError>;
using MethodHandler = HandlerResult (*)(HandlerContext& ctx, const RawParams& params);

//==========================================================================================================
// Route
// Purpose: One row of the method table.
// Fields:
//   method: Exact, case-sensitive method name.
//   gated: Requires a completed handshake; checked before params are parsed.
//   respond: false for notifications, which never produce an envelope.
//   handler: Method implementation.
//==========================================================================================================
struct Route {
    std::string_view method;
    bool gated;
    bool respond;
    MethodHandler handler;
};

// Returns the route for method, or nullptr when the method is unknown.
const Route* FindRoute(std::string_view method);

// All routes, in table order.
std::span<const Route> Routes();

} // namespace storemcp
