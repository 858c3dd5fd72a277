#include "rpc/json_rpc.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

using namespace nodegate;
using namespace nodegate::rpc;
using namespace testing;
using json = nlohmann::json;

namespace {

struct ParseResult {
    bool ok = false;
    Frame frame;
    RpcError error;
    json error_id;
};

ParseResult parse(const std::string &text) {
    ParseResult r;
    r.ok = parse_frame(text, r.frame, r.error, r.error_id);
    return r;
}

}  // namespace

// ============================================================================
// parse_frame
// ============================================================================

TEST(JsonRpcParseTest, MalformedJsonIsParseError) {
    auto r = parse("{not json");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, error_codes::PARSE_ERROR);
    EXPECT_THAT(r.error.message, HasSubstr("Failed to parse JSON"));
    EXPECT_TRUE(r.error_id.is_null());
}

TEST(JsonRpcParseTest, NonObjectIsInvalidRequest) {
    auto r = parse("[1,2,3]");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, error_codes::INVALID_REQUEST);
}

TEST(JsonRpcParseTest, RequestWithStringId) {
    auto r = parse(R"({"jsonrpc":"2.0","method":"node.invoke","params":{"a":1},"id":"req-7"})");
    ASSERT_TRUE(r.ok) << r.error.message;
    EXPECT_EQ(r.frame.type, FrameType::REQUEST);
    EXPECT_EQ(r.frame.method, "node.invoke");
    EXPECT_EQ(r.frame.params["a"], 1);
    EXPECT_EQ(r.frame.id, "req-7");
}

TEST(JsonRpcParseTest, RequestWithIntegerId) {
    auto r = parse(R"({"jsonrpc":"2.0","method":"x","id":42})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.frame.type, FrameType::REQUEST);
    EXPECT_EQ(r.frame.id, 42);
    EXPECT_TRUE(r.frame.params.is_null());
}

TEST(JsonRpcParseTest, MissingIdIsNotification) {
    auto r = parse(R"({"jsonrpc":"2.0","method":"node.describe","params":{}})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.frame.type, FrameType::NOTIFICATION);
}

TEST(JsonRpcParseTest, WrongVersionRejectedWithId) {
    auto r = parse(R"({"jsonrpc":"1.0","method":"x","id":"a"})");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, error_codes::INVALID_REQUEST);
    EXPECT_THAT(r.error.message, HasSubstr("2.0"));
    EXPECT_EQ(r.error_id, "a");
}

TEST(JsonRpcParseTest, EmptyMethodRejected) {
    auto r = parse(R"({"jsonrpc":"2.0","method":"","id":1})");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, error_codes::INVALID_REQUEST);
    EXPECT_EQ(r.error_id, 1);
}

TEST(JsonRpcParseTest, ObjectIdRejected) {
    auto r = parse(R"({"jsonrpc":"2.0","method":"x","id":{"nested":true}})");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, error_codes::INVALID_REQUEST);
    EXPECT_TRUE(r.error_id.is_null());
}

TEST(JsonRpcParseTest, ShortResponseForm) {
    auto r = parse(R"({"correlation_id":"gw-1","result":{"ok":true}})");
    ASSERT_TRUE(r.ok) << r.error.message;
    EXPECT_EQ(r.frame.type, FrameType::RESPONSE);
    EXPECT_EQ(r.frame.correlation_id, "gw-1");
    EXPECT_EQ(r.frame.result["ok"], true);
    EXPECT_FALSE(r.frame.error.has_value());
}

TEST(JsonRpcParseTest, FullResponseUsesId) {
    auto r = parse(R"({"jsonrpc":"2.0","id":"gw-2","result":null})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.frame.type, FrameType::RESPONSE);
    EXPECT_EQ(r.frame.correlation_id, "gw-2");
    EXPECT_TRUE(r.frame.result.is_null());
}

TEST(JsonRpcParseTest, NumericResponseIdNormalisedToString) {
    auto r = parse(R"({"id":17,"result":1})");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.frame.correlation_id, "17");
}

TEST(JsonRpcParseTest, ResponseErrorObject) {
    auto r = parse(R"({"correlation_id":"gw-3","error":{"code":-1,"message":"boom","data":{"x":1}}})");
    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(r.frame.error.has_value());
    EXPECT_EQ(r.frame.error->code, -1);
    EXPECT_EQ(r.frame.error->message, "boom");
    EXPECT_EQ(r.frame.error->data["x"], 1);
}

TEST(JsonRpcParseTest, ResponseErrorString) {
    auto r = parse(R"({"correlation_id":"gw-4","error":"sensor offline"})");
    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(r.frame.error.has_value());
    EXPECT_EQ(r.frame.error->code, error_codes::DEVICE_ERROR);
    EXPECT_EQ(r.frame.error->message, "sensor offline");
}

TEST(JsonRpcParseTest, ResponseWithoutIdRejected) {
    auto r = parse(R"({"result":1})");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.code, error_codes::INVALID_REQUEST);
}

// ============================================================================
// Envelopes
// ============================================================================

TEST(JsonRpcEnvelopeTest, ResultEnvelope) {
    auto env = make_result("a", {{"v", 1}});
    EXPECT_EQ(env["jsonrpc"], "2.0");
    EXPECT_EQ(env["id"], "a");
    EXPECT_EQ(env["result"]["v"], 1);
    EXPECT_FALSE(env.contains("error"));
}

TEST(JsonRpcEnvelopeTest, ErrorKindEnvelopeCarriesKind) {
    auto env = make_error(json("a"), ErrorKind::SERVICE_UNAVAILABLE, "No connection advertises service: cam");
    EXPECT_EQ(env["error"]["code"], error_codes::SERVICE_UNAVAILABLE);
    EXPECT_EQ(env["error"]["data"]["kind"], "ServiceUnavailable");
    EXPECT_EQ(env["id"], "a");
}

TEST(JsonRpcEnvelopeTest, NonObjectDataWrappedAsDetail) {
    auto env = make_error(json(1), ErrorKind::DEVICE_ERROR, "failed", json("raw"));
    EXPECT_EQ(env["error"]["data"]["detail"], "raw");
    EXPECT_EQ(env["error"]["data"]["kind"], "DeviceError");
}

TEST(JsonRpcEnvelopeTest, PlainErrorOmitsNullData) {
    auto env = make_error(json(), error_codes::METHOD_NOT_FOUND, "Method not found: x");
    EXPECT_EQ(env["error"]["code"], error_codes::METHOD_NOT_FOUND);
    EXPECT_FALSE(env["error"].contains("data"));
    EXPECT_TRUE(env["id"].is_null());
}

TEST(JsonRpcEnvelopeTest, DuplicateCorrelationIdMapsToInternal) {
    EXPECT_EQ(error_kind_to_code(ErrorKind::DUPLICATE_CORRELATION_ID), error_codes::INTERNAL_ERROR);
    EXPECT_EQ(error_kind_to_code(ErrorKind::INVALID_TIMEOUT), error_codes::INVALID_PARAMS);
    EXPECT_EQ(error_kind_to_code(ErrorKind::INVALID_CAPABILITY_LIST), error_codes::INVALID_PARAMS);
}

// ============================================================================
// node.describe params
// ============================================================================

TEST(JsonRpcDescribeParamsTest, FlatAndGroupedForms) {
    DescribeParams out;
    ErrorKind kind;
    std::string error;
    auto params = json::parse(R"({
        "device_id": "dev-1",
        "capabilities": [
            {"service": "echo", "method": "ping"},
            {"service": "camera", "methods": ["snap", "zoom"], "description": "front"}
        ]
    })");

    ASSERT_TRUE(decode_describe_params(params, out, kind, error)) << error;
    EXPECT_EQ(kind, ErrorKind::NONE);
    EXPECT_EQ(out.device_id, std::optional<std::string>("dev-1"));
    ASSERT_EQ(out.capabilities.size(), 3);
    EXPECT_EQ(out.capabilities[0].service, "echo");
    EXPECT_EQ(out.capabilities[2].method, "zoom");
}

TEST(JsonRpcDescribeParamsTest, EmptyListAccepted) {
    DescribeParams out;
    ErrorKind kind;
    std::string error;
    ASSERT_TRUE(decode_describe_params(json::parse(R"({"capabilities":[]})"), out, kind, error));
    EXPECT_TRUE(out.capabilities.empty());
    EXPECT_FALSE(out.device_id.has_value());
}

TEST(JsonRpcDescribeParamsTest, NonObjectParamsIsInvalidParams) {
    DescribeParams out;
    ErrorKind kind;
    std::string error;
    EXPECT_FALSE(decode_describe_params(json(), out, kind, error));
    EXPECT_EQ(kind, ErrorKind::INVALID_PARAMS);
}

TEST(JsonRpcDescribeParamsTest, MalformedCapabilities) {
    const char *cases[] = {
        R"({"capabilities":"echo"})",
        R"({"capabilities":[42]})",
        R"({"capabilities":[{"method":"ping"}]})",
        R"({"capabilities":[{"service":"echo"}]})",
        R"({"capabilities":[{"service":"echo","methods":[]}]})",
        R"({"capabilities":[{"service":"echo","methods":[1]}]})",
        R"({"device_id":5,"capabilities":[]})",
    };
    for (const char *text : cases) {
        DescribeParams out;
        ErrorKind kind;
        std::string error;
        EXPECT_FALSE(decode_describe_params(json::parse(text), out, kind, error)) << text;
        EXPECT_EQ(kind, ErrorKind::INVALID_CAPABILITY_LIST) << text;
        EXPECT_FALSE(error.empty());
    }
}

// ============================================================================
// node.invoke params
// ============================================================================

TEST(JsonRpcInvokeParamsTest, MinimalParamsDefault) {
    InvokeParams out;
    ErrorKind kind;
    std::string error;
    ASSERT_TRUE(decode_invoke_params(json::parse(R"({"service":"echo","method":"ping"})"), out, kind, error));
    EXPECT_EQ(out.service, "echo");
    EXPECT_EQ(out.method, "ping");
    EXPECT_TRUE(out.params.is_object());
    EXPECT_TRUE(out.params.empty());
    EXPECT_FALSE(out.timeout_ms.has_value());
    EXPECT_FALSE(out.device_id.has_value());
}

TEST(JsonRpcInvokeParamsTest, AllFields) {
    InvokeParams out;
    ErrorKind kind;
    std::string error;
    auto params = json::parse(
        R"({"service":"echo","method":"ping","params":[1,2],"timeout_ms":500,"device_id":"dev-1"})");
    ASSERT_TRUE(decode_invoke_params(params, out, kind, error));
    EXPECT_EQ(out.params, json::parse("[1,2]"));
    EXPECT_EQ(out.timeout_ms, std::optional<int64_t>(500));
    EXPECT_EQ(out.device_id, std::optional<std::string>("dev-1"));
}

TEST(JsonRpcInvokeParamsTest, NonIntegerTimeoutIsInvalidTimeout) {
    InvokeParams out;
    ErrorKind kind;
    std::string error;
    EXPECT_FALSE(decode_invoke_params(json::parse(R"({"service":"s","method":"m","timeout_ms":"5"})"), out, kind,
                                      error));
    EXPECT_EQ(kind, ErrorKind::INVALID_TIMEOUT);

    EXPECT_FALSE(decode_invoke_params(json::parse(R"({"service":"s","method":"m","timeout_ms":1.5})"), out, kind,
                                      error));
    EXPECT_EQ(kind, ErrorKind::INVALID_TIMEOUT);
}

TEST(JsonRpcInvokeParamsTest, NegativeTimeoutDecodesForLaterRejection) {
    InvokeParams out;
    ErrorKind kind;
    std::string error;
    ASSERT_TRUE(decode_invoke_params(json::parse(R"({"service":"s","method":"m","timeout_ms":-1})"), out, kind,
                                     error));
    EXPECT_EQ(out.timeout_ms, std::optional<int64_t>(-1));
}

TEST(JsonRpcInvokeParamsTest, MissingServiceIsInvalidParams) {
    InvokeParams out;
    ErrorKind kind;
    std::string error;
    EXPECT_FALSE(decode_invoke_params(json::parse(R"({"method":"m"})"), out, kind, error));
    EXPECT_EQ(kind, ErrorKind::INVALID_PARAMS);
    EXPECT_THAT(error, HasSubstr("service"));
}

// ============================================================================
// Encoding
// ============================================================================

TEST(JsonRpcEncodeTest, ConnectionCapabilities) {
    capability::ConnectionCapabilities entry;
    entry.conn_id = "c1";
    entry.capabilities = {{"echo", "ping"}, {"camera", "snap"}};

    auto encoded = encode_connection_capabilities(entry);
    EXPECT_EQ(encoded["conn_id"], "c1");
    EXPECT_TRUE(encoded["device_id"].is_null());
    EXPECT_EQ(encoded["services"], json::parse(R"(["camera","echo"])"));
    EXPECT_EQ(encoded["capabilities"].size(), 2);
}
