#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/request_codec.hpp"

namespace {

using nlohmann::json;
using venvbox::core::errors::ErrorCategory;
using venvbox::core::errors::get_error;
using venvbox::core::errors::get_value;
using venvbox::core::errors::is_error;
using venvbox::protocol::ExecutionResult;
using venvbox::protocol::decode_request;
using venvbox::protocol::encode_result;
using venvbox::protocol::encode_service_info;

TEST(RequestCodecTest, DecodesFullRequest) {
    auto result = decode_request(
        R"json({"code": "print(1)", "lib": ["requests==2.31.0", "rich"], "name": "web", "id": "a1"})json");
    ASSERT_FALSE(is_error(result));

    const auto& decoded = get_value(result);
    EXPECT_EQ(decoded.request.code, "print(1)");
    ASSERT_EQ(decoded.request.dependencies.size(), 2u);
    EXPECT_EQ(decoded.request.dependencies[0], "requests==2.31.0");
    ASSERT_TRUE(decoded.request.environment_name.has_value());
    EXPECT_EQ(decoded.request.environment_name.value(), "web");
    ASSERT_TRUE(decoded.correlation_id.has_value());
    EXPECT_EQ(decoded.correlation_id.value(), "a1");
}

TEST(RequestCodecTest, TreatsNullLibAndNameAsAbsent) {
    auto result = decode_request(R"({"code": "pass", "lib": null, "name": null})");
    ASSERT_FALSE(is_error(result));

    const auto& decoded = get_value(result);
    EXPECT_TRUE(decoded.request.dependencies.empty());
    EXPECT_FALSE(decoded.request.environment_name.has_value());
    EXPECT_FALSE(decoded.correlation_id.has_value());
}

TEST(RequestCodecTest, DumpsNonStringIds) {
    auto result = decode_request(R"({"code": "pass", "id": 42})");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).correlation_id.value(), "42");
}

TEST(RequestCodecTest, RejectsMalformedJson) {
    auto result = decode_request("{\"code\": ");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "malformed_json");
}

TEST(RequestCodecTest, RequiresCodeString) {
    for (const std::string doc : {"[]", "{}", R"({"code": 5})"}) {
        auto result = decode_request(doc);
        ASSERT_TRUE(is_error(result)) << doc;
        EXPECT_EQ(get_error(result).code, "invalid_request");
    }
}

TEST(RequestCodecTest, RejectsNonStringLibEntries) {
    auto result = decode_request(R"({"code": "pass", "lib": ["ok", 3]})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_request");

    auto scalar = decode_request(R"({"code": "pass", "lib": "requests"})");
    ASSERT_TRUE(is_error(scalar));
    EXPECT_EQ(get_error(scalar).code, "invalid_request");
}

TEST(RequestCodecTest, RunsGuardOnNameAndSpecifiers) {
    auto bad_name = decode_request(R"({"code": "pass", "name": "../escape"})");
    ASSERT_TRUE(is_error(bad_name));
    EXPECT_EQ(get_error(bad_name).code, "invalid_environment_name");

    auto bad_lib = decode_request(R"({"code": "pass", "lib": ["--index-url=http://x"]})");
    ASSERT_TRUE(is_error(bad_lib));
    EXPECT_EQ(get_error(bad_lib).code, "invalid_dependency");
}

TEST(RequestCodecTest, EncodesResultWithAndWithoutId) {
    const ExecutionResult result{"Hello, World!\n", ""};

    const auto plain = json::parse(encode_result(result));
    EXPECT_EQ(plain["output"], "Hello, World!\n");
    EXPECT_EQ(plain["error"], "");
    EXPECT_FALSE(plain.contains("id"));

    const auto tagged = json::parse(encode_result(result, std::string("a1")));
    EXPECT_EQ(tagged["id"], "a1");
}

TEST(RequestCodecTest, EncodesInvalidUtf8Output) {
    const ExecutionResult result{std::string("bad \xff byte"), ""};
    const auto encoded = encode_result(result);
    const auto parsed = json::parse(encoded);
    EXPECT_EQ(parsed["output"].get<std::string>().rfind("bad ", 0), 0u);
}

TEST(RequestCodecTest, EncodesServiceInfo) {
    const auto info = json::parse(encode_service_info("1.0.0"));
    EXPECT_EQ(info["message"], "Python Code Execution Service");
    EXPECT_EQ(info["version"], "1.0.0");
    EXPECT_EQ(info["endpoint"], "execute");
}

}  // namespace
