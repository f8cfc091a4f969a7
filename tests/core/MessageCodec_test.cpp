#include "core/MessageCodec.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace toolrpc;
using json = nlohmann::json;

TEST(MessageCodecTest, DecodeRequestWithIntegerId) {
    Request request = MessageCodec::decode(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"calculator"}})");

    ASSERT_TRUE(request.id.has_value());
    EXPECT_EQ(std::get<std::int64_t>(*request.id), 7);
    EXPECT_EQ(request.method, "tools/call");
    ASSERT_TRUE(request.params.has_value());
    EXPECT_EQ((*request.params)["name"], "calculator");
    EXPECT_FALSE(request.is_notification());
}

TEST(MessageCodecTest, DecodeRequestWithStringId) {
    Request request = MessageCodec::decode(R"({"jsonrpc":"2.0","id":"abc-1","method":"tools/list"})");

    ASSERT_TRUE(request.id.has_value());
    EXPECT_EQ(std::get<std::string>(*request.id), "abc-1");
    EXPECT_FALSE(request.params.has_value());
}

TEST(MessageCodecTest, DecodeNotification) {
    Request request = MessageCodec::decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    EXPECT_TRUE(request.is_notification());
    EXPECT_EQ(request.method, "notifications/initialized");
}

TEST(MessageCodecTest, DecodeAcceptsArrayParams) {
    Request request = MessageCodec::decode(R"({"jsonrpc":"2.0","id":1,"method":"sum","params":[1,2]})");

    ASSERT_TRUE(request.params.has_value());
    EXPECT_TRUE(request.params->is_array());
}

TEST(MessageCodecTest, MalformedJsonIsParseError) {
    try {
        MessageCodec::decode(R"({"jsonrpc":"2.0","id":1,)");
        FAIL() << "Expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), CodecErrorKind::PARSE_ERROR);
        EXPECT_EQ(e.code(), -32700);
        EXPECT_FALSE(e.id().has_value());
    }
}

TEST(MessageCodecTest, WrongVersionKeepsId) {
    try {
        MessageCodec::decode(R"({"jsonrpc":"1.0","id":"x","method":"tools/list"})");
        FAIL() << "Expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), CodecErrorKind::INVALID_ENVELOPE);
        EXPECT_EQ(e.code(), -32600);
        ASSERT_TRUE(e.id().has_value());
        EXPECT_EQ(std::get<std::string>(*e.id()), "x");
    }
}

TEST(MessageCodecTest, InvalidEnvelopes) {
    const char* frames[] = {
        R"("just a string")",
        R"(42)",
        R"({"id":1,"method":"tools/list"})",
        R"({"jsonrpc":2.0,"id":1,"method":"tools/list"})",
        R"({"jsonrpc":"2.0","id":1})",
        R"({"jsonrpc":"2.0","id":1,"method":5})",
        R"({"jsonrpc":"2.0","id":1,"method":""})",
        R"({"jsonrpc":"2.0","id":1,"method":"x","params":"text"})",
        R"({"jsonrpc":"2.0","id":1.5,"method":"x"})",
        R"({"jsonrpc":"2.0","id":true,"method":"x"})",
        R"({"jsonrpc":"2.0","id":null,"method":"x"})",
        R"({"jsonrpc":"2.0","id":[1],"method":"x"})",
    };

    for (const char* frame : frames) {
        try {
            MessageCodec::decode(frame);
            ADD_FAILURE() << "Accepted invalid frame: " << frame;
        } catch (const CodecError& e) {
            EXPECT_EQ(e.kind(), CodecErrorKind::INVALID_ENVELOPE) << frame;
        }
    }
}

TEST(MessageCodecTest, IdRange) {
    Request smallest = MessageCodec::decode(R"({"jsonrpc":"2.0","id":-9223372036854775808,"method":"x"})");
    EXPECT_EQ(std::get<std::int64_t>(*smallest.id), std::numeric_limits<std::int64_t>::min());

    Request largest = MessageCodec::decode(R"({"jsonrpc":"2.0","id":9223372036854775807,"method":"x"})");
    EXPECT_EQ(std::get<std::int64_t>(*largest.id), std::numeric_limits<std::int64_t>::max());

    EXPECT_THROW(MessageCodec::decode(R"({"jsonrpc":"2.0","id":9223372036854775808,"method":"x"})"),
                 CodecError);
}

TEST(MessageCodecTest, SingleDecodeRejectsBatch) {
    EXPECT_THROW(MessageCodec::decode(R"([{"jsonrpc":"2.0","id":1,"method":"x"}])"), CodecError);
}

TEST(MessageCodecTest, DecodeMessageSingle) {
    DecodedMessage message = MessageCodec::decode_message(R"({"jsonrpc":"2.0","id":1,"method":"x"})");

    EXPECT_FALSE(message.is_batch);
    ASSERT_EQ(message.entries.size(), 1);
    EXPECT_TRUE(std::holds_alternative<Request>(message.entries[0]));
}

TEST(MessageCodecTest, DecodeMessageSingleInvalidIsEntry) {
    DecodedMessage message = MessageCodec::decode_message(R"({"jsonrpc":"2.0","id":3})");

    ASSERT_EQ(message.entries.size(), 1);
    const auto* error = std::get_if<CodecError>(&message.entries[0]);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(std::get<std::int64_t>(*error->id()), 3);
}

TEST(MessageCodecTest, InvalidNotificationIsFlagged) {
    try {
        MessageCodec::decode(R"({"jsonrpc":"2.0","method":"x","params":5})");
        FAIL() << "Expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), CodecErrorKind::INVALID_ENVELOPE);
        EXPECT_TRUE(e.is_notification());
    }

    try {
        MessageCodec::decode(R"({"jsonrpc":"2.0","id":2,"method":"x","params":5})");
        FAIL() << "Expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_FALSE(e.is_notification());
    }

    try {
        MessageCodec::decode(R"({"jsonrpc":"1.0","method":"x"})");
        FAIL() << "Expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_FALSE(e.is_notification());
    }
}

TEST(MessageCodecTest, DecodeMessageBatchKeepsOrderAndErrors) {
    DecodedMessage message = MessageCodec::decode_message(
        R"([{"jsonrpc":"2.0","id":1,"method":"a"},"junk",{"jsonrpc":"2.0","method":"b"}])");

    EXPECT_TRUE(message.is_batch);
    ASSERT_EQ(message.entries.size(), 3);
    EXPECT_EQ(std::get<Request>(message.entries[0]).method, "a");
    EXPECT_TRUE(std::holds_alternative<CodecError>(message.entries[1]));
    EXPECT_TRUE(std::get<Request>(message.entries[2]).is_notification());
}

TEST(MessageCodecTest, DecodeMessageErrors) {
    try {
        MessageCodec::decode_message("[]");
        FAIL() << "Expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), CodecErrorKind::INVALID_ENVELOPE);
    }

    try {
        MessageCodec::decode_message("[{");
        FAIL() << "Expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), CodecErrorKind::PARSE_ERROR);
    }
}

TEST(MessageCodecTest, EncodeSuccess) {
    json encoded = json::parse(MessageCodec::encode(Response::success(RequestId{std::int64_t{2}}, 3)));

    EXPECT_EQ(encoded["jsonrpc"], "2.0");
    EXPECT_EQ(encoded["id"], 2);
    EXPECT_EQ(encoded["result"], 3);
    EXPECT_FALSE(encoded.contains("error"));
}

TEST(MessageCodecTest, EncodeNullResultKeepsResultMember) {
    json encoded = json::parse(MessageCodec::encode(Response::success(RequestId{std::string("n")}, nullptr)));

    ASSERT_TRUE(encoded.contains("result"));
    EXPECT_TRUE(encoded["result"].is_null());
}

TEST(MessageCodecTest, EncodeErrorWithNullId) {
    json encoded = json::parse(MessageCodec::encode(
        Response::failure(std::nullopt, error_code::PARSE_ERROR, "Parse error")));

    ASSERT_TRUE(encoded.contains("id"));
    EXPECT_TRUE(encoded["id"].is_null());
    EXPECT_EQ(encoded["error"]["code"], -32700);
    EXPECT_EQ(encoded["error"]["message"], "Parse error");
    EXPECT_FALSE(encoded["error"].contains("data"));
    EXPECT_FALSE(encoded.contains("result"));
}

TEST(MessageCodecTest, EncodeErrorWithData) {
    json encoded = json::parse(MessageCodec::encode(Response::failure(
        RequestId{std::int64_t{5}}, error_code::INVALID_PARAMS, "Invalid params", json{{"path", "y"}})));

    EXPECT_EQ(encoded["error"]["data"]["path"], "y");
}

TEST(MessageCodecTest, EncodeIsSingleLine) {
    std::string encoded = MessageCodec::encode(
        Response::success(RequestId{std::int64_t{1}}, {{"text", "line one\nline two"}}));

    EXPECT_EQ(encoded.find('\n'), std::string::npos);
}

TEST(MessageCodecTest, EncodeBatch) {
    std::vector<Response> responses;
    responses.push_back(Response::success(RequestId{std::int64_t{1}}, 1));
    responses.push_back(Response::failure(RequestId{std::int64_t{2}}, error_code::METHOD_NOT_FOUND, "nope"));

    json encoded = json::parse(MessageCodec::encode_batch(responses));

    ASSERT_TRUE(encoded.is_array());
    ASSERT_EQ(encoded.size(), 2);
    EXPECT_EQ(encoded[0]["id"], 1);
    EXPECT_EQ(encoded[1]["error"]["code"], -32601);
}

TEST(MessageCodecTest, CodecErrorResponseCarriesReason) {
    CodecError error(CodecErrorKind::INVALID_ENVELOPE, "method must be a string", RequestId{std::int64_t{9}});
    Response response = error.to_response();

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, -32600);
    EXPECT_EQ(response.error().message, "Invalid Request");
    ASSERT_TRUE(response.error().data.has_value());
    EXPECT_EQ((*response.error().data)["reason"], "method must be a string");
}
