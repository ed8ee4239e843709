//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict JSON parser/serializer using only std library, and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "logging/Logger.h"
#include "storemcp/EnvelopeCodec.h"
#include "storemcp/JSONRPCTypes.h"
#include "JsonParser.h"

namespace storemcp {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

namespace detail {

// -------------------------------
// Recursive JSON parser
// -------------------------------
void JsonParser::fail(const std::string& what) const {
    throw std::runtime_error(what + " at offset " + std::to_string(i));
}

void JsonParser::skipWs() {
    while (i < s.size()) {
        char c = s[i];
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
    }
}

bool JsonParser::match(char c) {
    skipWs();
    if (i < s.size() && s[i] == c) { ++i; return true; }
    return false;
}

void JsonParser::expect(char c, const char* what) {
    if (!match(c)) fail(std::string("Expected ") + what);
}

void JsonParser::expectEnd() {
    skipWs();
    if (i != s.size()) fail("Unexpected trailing content");
}

JSONValue JsonParser::parseDocument() {
    JSONValue v = parseValue();
    expectEnd();
    return v;
}

unsigned int JsonParser::parseHex4() {
    if (i + 4 > s.size()) fail("Invalid unicode escape");
    unsigned int code = 0;
    for (std::size_t k = 0; k < 4; ++k) {
        char h = s[i++];
        code <<= 4;
        if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
        else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
        else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
        else fail("Invalid hex in unicode escape");
    }
    return code;
}

std::string JsonParser::parseString() {
    skipWs();
    if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
    ++i;
    std::string out;
    while (true) {
        if (i >= s.size()) fail("Unterminated string");
        char c = s[i++];
        if (c == '"') break;
        if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i >= s.size()) fail("Invalid escape");
        char e = s[i++];
        switch (e) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                unsigned int code = parseHex4();
                if (code >= 0xD800 && code <= 0xDBFF) {
                    // High surrogate must be followed by \uDC00-\uDFFF
                    if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                    i += 2;
                    unsigned int low = parseHex4();
                    if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                } else if (code >= 0xDC00 && code <= 0xDFFF) {
                    fail("Unpaired surrogate");
                }
                if (code <= 0x7F) {
                    out.push_back(static_cast<char>(code));
                } else if (code <= 0x7FF) {
                    out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
                    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
                } else if (code <= 0xFFFF) {
                    out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
                    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
                } else {
                    out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
                    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
                }
                break;
            }
            default: fail("Unknown escape");
        }
    }
    return out;
}

JSONValue JsonParser::parseNumber() {
    skipWs();
    auto isDigit = [this](std::size_t k) {
        return k < s.size() && s[k] >= '0' && s[k] <= '9';
    };
    std::size_t start = i;
    if (i < s.size() && s[i] == '-') ++i;
    if (!isDigit(i)) fail("Invalid value");
    if (s[i] == '0') {
        ++i;
    } else {
        while (isDigit(i)) ++i;
    }
    bool isFloat = false;
    if (i < s.size() && s[i] == '.') {
        isFloat = true; ++i;
        if (!isDigit(i)) fail("Expected digit after decimal point");
        while (isDigit(i)) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        isFloat = true; ++i;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
        if (!isDigit(i)) fail("Expected digit in exponent");
        while (isDigit(i)) ++i;
    }
    const char* first = s.data() + start;
    const char* last = s.data() + i;
    if (!isFloat) {
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec == std::errc() && ptr == last) {
            return JSONValue(v);
        }
        // Integers beyond int64 fall through to double
    }
    const std::string text(first, last);
    double d = std::strtod(text.c_str(), nullptr);
    if (std::isinf(d)) fail("Number out of range");
    return JSONValue(d);
}

JSONValue JsonParser::parseArray() {
    expect('[', "'['");
    if (++depth > kMaxJSONDepth) fail("Nesting too deep");
    JSONValue::Array arr;
    if (!match(']')) {
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            expect(',', "',' in array");
        }
    }
    --depth;
    return JSONValue(std::move(arr));
}

JSONValue JsonParser::parseObject() {
    expect('{', "'{'");
    if (++depth > kMaxJSONDepth) fail("Nesting too deep");
    JSONValue::Object obj;
    if (!match('}')) {
        while (true) {
            std::string key = parseString();
            expect(':', "':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            expect(',', "',' in object");
        }
    }
    --depth;
    return JSONValue(std::move(obj));
}

JSONValue JsonParser::parseValue() {
    skipWs();
    if (i >= s.size()) fail("Unexpected end of JSON");
    char c = s[i];
    if (c == '"') return JSONValue(parseString());
    if (c == '{') return parseObject();
    if (c == '[') return parseArray();
    if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
    if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
    if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
    return parseNumber();
}

} // namespace detail

namespace {

void writeString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeDouble(std::ostringstream& oss, double v) {
    if (!std::isfinite(v)) {
        oss << "null";
        return;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) {
        oss << "null";
        return;
    }
    std::string text(buf, ptr);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    oss << text;
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            writeDouble(oss, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) writeValue(oss, *v[k]); else oss << "null";
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeString(oss, key);
                oss << ':';
                if (val) writeValue(oss, *val); else oss << "null";
            }
            oss << '}';
        }
    }, value.get());
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            writeString(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, RawJSON>) {
            oss << v.text;
        } else {
            oss << "null";
        }
    }, id);
}

// Maps a parsed id member and its source text onto JSONRPCId; false for booleans, arrays and objects.
bool idFromValue(const JSONValue& v, const std::string& text, JSONRPCId& out) {
    if (std::holds_alternative<std::nullptr_t>(v.value)) { out = nullptr; return true; }
    if (std::holds_alternative<std::string>(v.value)) { out = std::get<std::string>(v.value); return true; }
    if (std::holds_alternative<int64_t>(v.value) && std::to_string(std::get<int64_t>(v.value)) == text) {
        out = std::get<int64_t>(v.value);
        return true;
    }
    if (std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value)) {
        out = RawJSON{text};
        return true;
    }
    return false;
}

} // namespace

JSONValue ParseJSON(const std::string& json) {
    detail::JsonParser p(json);
    return p.parseDocument();
}

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

JSONValue RawJSON::Parse() const {
    return ParseJSON(text);
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeString(oss, jsonrpc);
    if (!std::holds_alternative<std::monostate>(id)) {
        oss << ",\"id\":";
        writeId(oss, id);
    }
    oss << ",\"method\":";
    writeString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":" << params->text;
    }
    oss << "}";
    return oss.str();
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeString(oss, jsonrpc);
    if (!std::holds_alternative<std::monostate>(id)) {
        oss << ",\"id\":";
        writeId(oss, id);
    }
    if (error.has_value()) {
        oss << ",\"error\":";
        writeValue(oss, error.value());
    } else if (result.has_value()) {
        oss << ",\"result\":";
        writeValue(oss, result.value());
    }
    oss << "}";
    return oss.str();
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

//==========================================================================================================
// Envelope codec
//==========================================================================================================
DecodeResult DecodeRequest(const std::string& bytes) {
    FUNC_SCOPE();
    JSONValue::Object members;
    std::optional<RawJSON> rawParams;
    std::string idText;
    try {
        detail::JsonParser p(bytes);
        p.skipWs();
        if (!p.match('{')) {
            // Reject non-objects, but report malformed JSON ahead of a mere wrong shape
            detail::JsonParser whole(bytes);
            (void)whole.parseDocument();
            p.fail("Expected a JSON object");
        }
        if (!p.match('}')) {
            while (true) {
                std::string key = p.parseString();
                p.expect(':', "':' after key");
                p.skipWs();
                const std::size_t start = p.position();
                JSONValue v = p.parseValue();
                if (key == "params") {
                    rawParams = RawJSON{bytes.substr(start, p.position() - start)};
                } else if (key == "id") {
                    idText = bytes.substr(start, p.position() - start);
                }
                members[key] = std::make_shared<JSONValue>(std::move(v));
                if (p.match('}')) break;
                p.expect(',', "',' in object");
            }
        }
        p.expectEnd();
    } catch (const std::exception& e) {
        return DecodeFailure{errors::parseError(e.what())};
    }

    JSONRPCRequest req;
    auto it = members.find("id");
    if (it != members.end() && !idFromValue(*it->second, idText, req.id)) {
        return DecodeFailure{errors::parseError("id must be a string, number or null")};
    }
    it = members.find("jsonrpc");
    if (it != members.end() && std::holds_alternative<std::string>(it->second->value)) {
        req.jsonrpc = std::get<std::string>(it->second->value);
    }
    it = members.find("method");
    if (it != members.end()) {
        if (!std::holds_alternative<std::string>(it->second->value)) {
            return DecodeFailure{errors::parseError("method must be a string")};
        }
        req.method = std::get<std::string>(it->second->value);
    }
    req.params = std::move(rawParams);
    return req;
}

std::string EncodeResponse(const JSONRPCResponse& response) {
    return response.Serialize();
}

std::unique_ptr<JSONRPCResponse> MakeDecodeFailureResponse(const DecodeFailure& failure) {
    return errors::makeErrorResponse(nullptr, failure.error);
}

} // namespace storemcp
