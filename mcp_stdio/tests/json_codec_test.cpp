#include <gtest/gtest.h>

#include "json_codec.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <mutex>
#include <string>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

nlohmann::json reparse(const nlohmann::json& value) {
    return nlohmann::json::parse(value.dump());
}

} // namespace

TEST(JsonCodec, NumericIdEncodesAsBareNumber) {
    nlohmann::json encoded = mcp::codec::encode_id(mcp::Id{uint64_t{42}});
    EXPECT_TRUE(encoded.is_number_unsigned());
    EXPECT_EQ(encoded.dump(), "42");
}

TEST(JsonCodec, StringIdEncodesAsBareString) {
    nlohmann::json encoded = mcp::codec::encode_id(mcp::Id{std::string("42")});
    EXPECT_TRUE(encoded.is_string());
    EXPECT_EQ(encoded.dump(), "\"42\"");
}

TEST(JsonCodec, DecodeIdAcceptsUnsignedIntegersAndStrings) {
    auto number = mcp::codec::decode_id(nlohmann::json::parse("18446744073709551615"));
    ASSERT_TRUE(number.has_value());
    EXPECT_EQ(std::get<uint64_t>(*number), std::numeric_limits<uint64_t>::max());

    auto text = mcp::codec::decode_id(nlohmann::json("abc"));
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(std::get<std::string>(*text), "abc");
}

TEST(JsonCodec, DecodeIdRejectsOtherShapes) {
    EXPECT_FALSE(mcp::codec::decode_id(nlohmann::json::parse("-1")).has_value());
    EXPECT_FALSE(mcp::codec::decode_id(nlohmann::json::parse("1.5")).has_value());
    EXPECT_FALSE(mcp::codec::decode_id(nlohmann::json(nullptr)).has_value());
    EXPECT_FALSE(mcp::codec::decode_id(nlohmann::json(true)).has_value());
    EXPECT_FALSE(mcp::codec::decode_id(nlohmann::json::array({1})).has_value());
    EXPECT_FALSE(mcp::codec::decode_id(nlohmann::json::object()).has_value());
}

TEST(JsonCodec, IdEqualityIsStructural) {
    EXPECT_EQ(mcp::Id{uint64_t{7}}, mcp::Id{uint64_t{7}});
    EXPECT_NE(mcp::Id{uint64_t{7}}, mcp::Id{std::string("7")});
}

TEST(JsonCodec, IdToStringForLogging) {
    EXPECT_EQ(mcp::codec::id_to_string(mcp::Id{uint64_t{12}}), "12");
    EXPECT_EQ(mcp::codec::id_to_string(mcp::Id{std::string("req-1")}), "req-1");
}

TEST(JsonCodec, SuccessResponseRoundTrip) {
    mcp::SuccessResponse sent{mcp::Id{std::string("abc")}, nlohmann::json{{"items", {1, 2, 3}}, {"done", true}}};

    auto decoded = mcp::codec::decode_success_response(reparse(mcp::codec::encode(sent)));

    EXPECT_EQ(decoded, sent);
}

TEST(JsonCodec, SuccessResponseWithoutResultCarriesNull) {
    nlohmann::json encoded = mcp::codec::encode(mcp::SuccessResponse{mcp::Id{uint64_t{3}}, std::nullopt});

    ASSERT_TRUE(encoded.contains("result"));
    EXPECT_TRUE(encoded["result"].is_null());
    EXPECT_FALSE(encoded.contains("error"));
    EXPECT_EQ(encoded["jsonrpc"], "2.0");
}

TEST(JsonCodec, ErrorResponseRoundTripWithData) {
    mcp::ErrorResponse sent{
        mcp::Id{uint64_t{9}},
        mcp::make_error(mcp::ErrorCode::InvalidParams, "bad params", nlohmann::json{{"field", "uri"}})};

    nlohmann::json encoded = mcp::codec::encode(sent);
    EXPECT_FALSE(encoded.contains("result"));
    EXPECT_EQ(encoded["error"]["code"], -32602);

    EXPECT_EQ(mcp::codec::decode_error_response(reparse(encoded)), sent);
}

TEST(JsonCodec, ErrorObjectOmitsAbsentData) {
    nlohmann::json encoded = mcp::codec::encode(mcp::make_error(mcp::ErrorCode::InternalError, "oops"));

    EXPECT_EQ(encoded["code"], -32603);
    EXPECT_EQ(encoded["message"], "oops");
    EXPECT_FALSE(encoded.contains("data"));
}

TEST(JsonCodec, ErrorCodesMatchJsonRpcRegistry) {
    EXPECT_EQ(static_cast<int32_t>(mcp::ErrorCode::ParseError), -32700);
    EXPECT_EQ(static_cast<int32_t>(mcp::ErrorCode::InvalidRequest), -32600);
    EXPECT_EQ(static_cast<int32_t>(mcp::ErrorCode::MethodNotFound), -32601);
    EXPECT_EQ(static_cast<int32_t>(mcp::ErrorCode::InvalidParams), -32602);
    EXPECT_EQ(static_cast<int32_t>(mcp::ErrorCode::InternalError), -32603);
}

TEST(JsonCodec, DecodeResponseRejectsBothResultAndError) {
    auto both = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":-32603,"message":"x"}})");

    EXPECT_THROW(mcp::codec::decode_success_response(both), mcp::codec::DecodeError);
    EXPECT_THROW(mcp::codec::decode_error_response(both), mcp::codec::DecodeError);
}

TEST(JsonCodec, DecodeErrorResponseRejectsCodeOutsideInt32) {
    auto too_big = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":2147483648,"message":"x"}})");
    auto too_small = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-2147483649,"message":"x"}})");

    EXPECT_THROW(mcp::codec::decode_error_response(too_big), mcp::codec::DecodeError);
    EXPECT_THROW(mcp::codec::decode_error_response(too_small), mcp::codec::DecodeError);
}

TEST(JsonCodec, RequestAndNotificationEncoding) {
    mcp::Request request{mcp::Id{uint64_t{5}}, "initialize", nlohmann::json{{"protocolVersion", "2024-11-05"}}};
    EXPECT_EQ(mcp::codec::decode_request(reparse(mcp::codec::encode(request))), request);

    mcp::Notification notification{"notifications/initialized", std::nullopt};
    nlohmann::json encoded = mcp::codec::encode(notification);
    EXPECT_FALSE(encoded.contains("id"));
    EXPECT_FALSE(encoded.contains("params"));
    EXPECT_EQ(mcp::codec::decode_notification(encoded), notification);
}

TEST(JsonCodec, FindKeyAndAsString) {
    auto obj = nlohmann::json{{"name", "mcp"}, {"count", 2}};

    ASSERT_NE(mcp::codec::find_key(obj, "name"), nullptr);
    EXPECT_EQ(mcp::codec::find_key(obj, "missing"), nullptr);
    EXPECT_EQ(mcp::codec::find_key(nlohmann::json::array({1}), "name"), nullptr);

    EXPECT_EQ(mcp::codec::as_string(obj["name"]), "mcp");
    EXPECT_EQ(mcp::codec::as_string(obj["count"], "fallback"), "fallback");
}
