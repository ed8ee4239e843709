//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonParser.h
// Purpose: Internal recursive-descent JSON parser shared by the value model and the envelope codec
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>

#include "storemcp/JSONRPCTypes.h"

namespace storemcp::detail {

//==========================================================================================================
// JsonParser
// Purpose: Cursor over a JSON text. Every parse* method throws std::runtime_error on malformed input,
// with the byte offset in the message.
//==========================================================================================================
class JsonParser {
public:
    explicit JsonParser(const std::string& text, std::size_t start = 0) : s(text), i(start) {}

    // Parses exactly one value followed only by whitespace.
    JSONValue parseDocument();

    JSONValue parseValue();
    std::string parseString();

    void skipWs();
    bool match(char c);
    void expect(char c, const char* what);
    void expectEnd();
    std::size_t position() const { return i; }

    [[noreturn]] void fail(const std::string& what) const;

private:
    JSONValue parseNumber();
    JSONValue parseArray();
    JSONValue parseObject();
    unsigned int parseHex4();

    const std::string& s;
    std::size_t i{0};
    std::size_t depth{0};
};

} // namespace storemcp::detail
