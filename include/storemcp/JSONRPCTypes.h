//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelope types for the store MCP server
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace storemcp {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }
};

//==========================================================================================================
// ParseJSON
// Purpose: Strict parse of a complete JSON document (RFC 8259, nesting limited to kMaxJSONDepth).
// Throws:
//   std::runtime_error describing the first syntax error, including trailing content.
//==========================================================================================================
constexpr std::size_t kMaxJSONDepth = 512;
JSONValue ParseJSON(const std::string& json);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact serialization. Strings and keys are escaped; doubles use the shortest round-trip form
// and always keep a fractional marker so they re-parse as doubles.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// RawJSON
// Purpose: Unparsed JSON text kept verbatim until a handler knows which shape to parse it into.
//==========================================================================================================
struct RawJSON {
    std::string text;

    // Parses text with ParseJSON; throws std::runtime_error when malformed.
    JSONValue Parse() const;
};

//==========================================================================================================
// JSONRPCId
// Purpose: Request identifier exactly as received. std::monostate means the member was absent and must
// stay absent in the response.
// Notes:
//   - int64_t holds integers whose decimal text round-trips unchanged.
//   - RawJSON holds every other number as its source text (fractions, exponents, -0, beyond int64), so
//     the response repeats the same bytes.
//==========================================================================================================
using JSONRPCId = std::variant<std::monostate, std::nullptr_t, int64_t, std::string, RawJSON>;

using RawParams = std::optional<RawJSON>;

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request envelope with id (possibly absent), method and deferred params.
// Notes:
//   jsonrpc holds whatever string the peer sent; a missing or non-string tag is tolerated.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    RawParams params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, RawParams params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response envelope carrying exactly one of result or error.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    std::string Serialize() const override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Error codes returned by the server. Values mirror the JSON-RPC 2.0 reserved range.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // MCP specific error codes
    constexpr int ServerNotInitialized = -32002;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace storemcp
