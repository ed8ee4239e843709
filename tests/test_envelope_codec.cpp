//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_envelope_codec.cpp
// Purpose: GoogleTests for request decoding and response encoding
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "storemcp/EnvelopeCodec.h"
#include "storemcp/JSONRPCTypes.h"

#include "ResponseReader.h"

using namespace storemcp;

namespace {

JSONRPCRequest decodeOk(const std::string& bytes) {
    auto decoded = DecodeRequest(bytes);
    EXPECT_TRUE(std::holds_alternative<JSONRPCRequest>(decoded)) << bytes;
    if (auto* req = std::get_if<JSONRPCRequest>(&decoded)) {
        return *req;
    }
    return JSONRPCRequest{};
}

DecodeFailure decodeFail(const std::string& bytes) {
    auto decoded = DecodeRequest(bytes);
    EXPECT_TRUE(std::holds_alternative<DecodeFailure>(decoded)) << bytes;
    if (auto* f = std::get_if<DecodeFailure>(&decoded)) {
        return *f;
    }
    return DecodeFailure{};
}

} // namespace

TEST(EnvelopeDecode, FullRequest) {
    auto req = decodeOk("{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tools/call\",\"params\": {\"a\": [1, 2]} }");
    ASSERT_TRUE(std::holds_alternative<int64_t>(req.id));
    EXPECT_EQ(std::get<int64_t>(req.id), 7);
    EXPECT_EQ(req.method, "tools/call");
    EXPECT_EQ(req.jsonrpc, "2.0");
    ASSERT_TRUE(req.params.has_value());
    // Verbatim text of the member value, surrounding whitespace excluded
    EXPECT_EQ(req.params->text, "{\"a\": [1, 2]}");
}

TEST(EnvelopeDecode, IdentifierVariants) {
    EXPECT_TRUE(std::holds_alternative<std::monostate>(decodeOk("{\"method\":\"ping\"}").id));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(decodeOk("{\"id\":null,\"method\":\"ping\"}").id));

    auto s = decodeOk("{\"id\":\"abc\",\"method\":\"ping\"}");
    ASSERT_TRUE(std::holds_alternative<std::string>(s.id));
    EXPECT_EQ(std::get<std::string>(s.id), "abc");

    auto d = decodeOk("{\"id\":1.5,\"method\":\"ping\"}");
    ASSERT_TRUE(std::holds_alternative<RawJSON>(d.id));
    EXPECT_EQ(std::get<RawJSON>(d.id).text, "1.5");

    // Only canonical int64 text becomes an integer id
    auto big = decodeOk("{\"id\": 12345678901234567891 ,\"method\":\"ping\"}");
    ASSERT_TRUE(std::holds_alternative<RawJSON>(big.id));
    EXPECT_EQ(std::get<RawJSON>(big.id).text, "12345678901234567891");
    EXPECT_EQ(std::get<RawJSON>(decodeOk("{\"id\":1e2,\"method\":\"ping\"}").id).text, "1e2");
    EXPECT_EQ(std::get<RawJSON>(decodeOk("{\"id\":-0,\"method\":\"ping\"}").id).text, "-0");
    EXPECT_EQ(std::get<int64_t>(decodeOk("{\"id\":-42,\"method\":\"ping\"}").id), -42);

    // Last duplicate wins for both the value and its text
    auto dup = decodeOk("{\"id\":1,\"id\":2.0,\"method\":\"ping\"}");
    ASSERT_TRUE(std::holds_alternative<RawJSON>(dup.id));
    EXPECT_EQ(std::get<RawJSON>(dup.id).text, "2.0");
}

TEST(EnvelopeDecode, ToleratesMissingOptionalMembers) {
    auto req = decodeOk("{\"id\":1,\"method\":\"ping\"}");
    EXPECT_FALSE(req.params.has_value());
    EXPECT_EQ(req.jsonrpc, "2.0");

    auto other = decodeOk("{\"jsonrpc\":\"1.0\",\"id\":1,\"method\":\"ping\"}");
    EXPECT_EQ(other.jsonrpc, "1.0");

    auto numeric = decodeOk("{\"jsonrpc\":2,\"id\":1,\"method\":\"ping\"}");
    EXPECT_EQ(numeric.method, "ping");

    auto noMethod = decodeOk("{\"id\":1}");
    EXPECT_EQ(noMethod.method, "");

    auto nullParams = decodeOk("{\"id\":1,\"method\":\"ping\",\"params\":null}");
    ASSERT_TRUE(nullParams.params.has_value());
    EXPECT_EQ(nullParams.params->text, "null");

    EXPECT_EQ(decodeOk("{}").method, "");
}

TEST(EnvelopeDecode, ParseErrorsCarryNullId) {
    for (const char* bytes : {"", "   ", "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"pi",
                              "not json", "[1,2]", "42", "\"ping\"", "null",
                              "{\"id\":1,\"method\":\"ping\"} trailing", "{\"id\":1,}"}) {
        auto f = decodeFail(bytes);
        EXPECT_EQ(f.error.code, JSONRPCErrorCodes::ParseError) << bytes;
        EXPECT_EQ(f.error.message, "Parse error");
    }
}

TEST(EnvelopeDecode, UnreadableMembersAreParseErrors) {
    for (const char* bytes : {"{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":5}", "{\"id\":1,\"method\":null}",
                              "{\"id\":true,\"method\":\"ping\"}", "{\"id\":[1],\"method\":\"ping\"}",
                              "{\"id\":{},\"method\":\"ping\"}"}) {
        auto f = decodeFail(bytes);
        EXPECT_EQ(f.error.code, JSONRPCErrorCodes::ParseError) << bytes;
        EXPECT_EQ(f.error.message, "Parse error") << bytes;
    }
}

TEST(EnvelopeEncode, ResultEnvelope) {
    JSONRPCResponse resp;
    resp.id = static_cast<int64_t>(1);
    resp.result = JSONValue{JSONValue::Object{}};
    EXPECT_EQ(EncodeResponse(resp), "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}");

    resp.id = std::string("a\"b");
    EXPECT_EQ(EncodeResponse(resp), "{\"jsonrpc\":\"2.0\",\"id\":\"a\\\"b\",\"result\":{}}");

    resp.id = RawJSON{"2.50e1"};
    EXPECT_EQ(EncodeResponse(resp), "{\"jsonrpc\":\"2.0\",\"id\":2.50e1,\"result\":{}}");

    resp.id = nullptr;
    EXPECT_EQ(EncodeResponse(resp), "{\"jsonrpc\":\"2.0\",\"id\":null,\"result\":{}}");

    resp.id = std::monostate{};
    EXPECT_EQ(EncodeResponse(resp), "{\"jsonrpc\":\"2.0\",\"result\":{}}");
}

TEST(EnvelopeEncode, DecodeFailureResponse) {
    auto f = decodeFail("{\"id\":1");
    auto resp = MakeDecodeFailureResponse(f);
    ASSERT_TRUE(resp != nullptr);
    ASSERT_TRUE(resp->IsError());
    EXPECT_FALSE(resp->result.has_value());

    test_support::ResponseEnvelope parsed;
    ASSERT_TRUE(test_support::ReadResponse(EncodeResponse(*resp), parsed));
    ASSERT_TRUE(parsed.hasId);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(parsed.id.value));
    const auto& err = std::get<JSONValue::Object>(parsed.error->value);
    EXPECT_EQ(std::get<int64_t>(err.at("code")->value), JSONRPCErrorCodes::ParseError);
    EXPECT_EQ(std::get<std::string>(err.at("message")->value), "Parse error");
    EXPECT_TRUE(std::holds_alternative<std::string>(err.at("data")->value));
}

TEST(EnvelopeEncode, RequestSerializeKeepsRawParams) {
    JSONRPCRequest req(static_cast<int64_t>(9), "tools/call", RawJSON{"{\"name\":\"x\"}"});
    EXPECT_EQ(req.Serialize(), "{\"jsonrpc\":\"2.0\",\"id\":9,\"method\":\"tools/call\",\"params\":{\"name\":\"x\"}}");

    auto back = decodeOk(req.Serialize());
    EXPECT_EQ(back.method, "tools/call");
    ASSERT_TRUE(back.params.has_value());
    EXPECT_EQ(back.params->text, "{\"name\":\"x\"}");

    JSONRPCRequest raw(RawJSON{"1e2"}, "ping");
    EXPECT_EQ(raw.Serialize(), "{\"jsonrpc\":\"2.0\",\"id\":1e2,\"method\":\"ping\"}");
}
