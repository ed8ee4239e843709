//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handlers.h
// Purpose: Handshake and capability method handlers plus their parameter parsers
//==========================================================================================================

#pragma once

#include <optional>

#include "storemcp/MethodRouter.h"
#include "storemcp/Protocol.h"
#include "storemcp/errors/Errors.h"

namespace storemcp {

/////////////////////////////////////////// Parameter parsing ///////////////////////////////////////////
//==========================================================================================================
// ParseInitializeParams
// Purpose: Decode initialize params. Absent or null params decode as the empty shape.
// Returns:
//   std::nullopt on success (out filled), otherwise an InvalidParams error.
//==========================================================================================================
std::optional<errors::McpError> ParseInitializeParams(const RawParams& params, InitializeParams& out);

//==========================================================================================================
// ParseCallToolParams
// Purpose: Decode tools/call params: an object with string "name" and optional object "arguments".
// Returns:
//   std::nullopt on success (out filled), otherwise an InvalidParams error.
//==========================================================================================================
std::optional<errors::McpError> ParseCallToolParams(const RawParams& params, CallToolParams& out);

/////////////////////////////////////////// Handlers ///////////////////////////////////////////
// initialize: marks the session ready and reports the server identity and capabilities.
HandlerResult HandleInitialize(HandlerContext& ctx, const RawParams& params);

// notifications/initialized: logged only; the session is not touched.
HandlerResult HandleInitializedNotification(HandlerContext& ctx, const RawParams& params);

HandlerResult HandlePing(HandlerContext& ctx, const RawParams& params);

HandlerResult HandleToolsList(HandlerContext& ctx, const RawParams& params);

// tools/call: looks the tool up in the catalog; unknown names yield the "Unknown tool" error.
HandlerResult HandleToolsCall(HandlerContext& ctx, const RawParams& params);

} // namespace storemcp
