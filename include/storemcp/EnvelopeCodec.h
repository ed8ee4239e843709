//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeCodec.h
// Purpose: Decoding raw bytes into request envelopes and encoding response envelopes
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <variant>

#include "storemcp/JSONRPCTypes.h"
#include "storemcp/errors/Errors.h"

namespace storemcp {

//==========================================================================================================
// DecodeFailure
// Purpose: Envelope-level failure, kept apart from application errors. Always a ParseError: the bytes are
// not a JSON object, or a member cannot be read (non-string method; boolean, array or object id). Its
// response carries a null id.
//==========================================================================================================
struct DecodeFailure {
    errors::McpError error;
};

using DecodeResult = std::variant<JSONRPCRequest, DecodeFailure>;

//==========================================================================================================
// DecodeRequest
// Purpose: Decodes one request envelope. Never throws for malformed input.
// Notes:
//   - Missing/null id, missing params and missing or unexpected "jsonrpc" are accepted.
//   - A missing method decodes as the empty string.
//   - params is captured verbatim for lazy, per-method parsing.
//   - Numeric ids that are not canonical int64 text keep their source text.
//==========================================================================================================
DecodeResult DecodeRequest(const std::string& bytes);

//==========================================================================================================
// EncodeResponse
// Purpose: Serializes a response envelope to wire bytes.
//==========================================================================================================
std::string EncodeResponse(const JSONRPCResponse& response);

// Error envelope for a decode failure; the id is always null.
std::unique_ptr<JSONRPCResponse> MakeDecodeFailureResponse(const DecodeFailure& failure);

} // namespace storemcp
