/**
 * @file test_envelope.cpp
 * @brief Unit tests for the command / response envelope codec
 */

#include <gtest/gtest.h>

#include <ftp_bridge/core/json_codec.h>
#include <ftp_bridge/protocol/action_codes.h>
#include <ftp_bridge/protocol/envelope.h>

#include <string>

#include "support/json_builders.h"

namespace ftp_bridge::test {

// =============================================================================
// decode_command Tests
// =============================================================================

class DecodeCommandTest : public ::testing::Test {};

TEST_F(DecodeCommandTest, DecodesListingCommand) {
    auto cmd = decode_command(
        R"({"action":58,"data":{"index":7,"value":{"local_path":"/tmp/x"}}})");

    ASSERT_TRUE(cmd.has_value()) << cmd.error().message;
    EXPECT_EQ(cmd.value().action, 58);
    EXPECT_EQ(cmd.value().index, 7);
    EXPECT_EQ(cmd.value().value["local_path"], "/tmp/x");
    EXPECT_FALSE(cmd.value().extra.has_value());
}

TEST_F(DecodeCommandTest, MissingValueDefaultsToEmptyString) {
    auto cmd = decode_command(R"({"action":68,"data":{"index":0}})");

    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd.value().value, Json::Value(""));
}

TEST_F(DecodeCommandTest, KeepsExtraAndRedirect) {
    auto cmd = decode_command(
        R"({"action":35,"data":{"index":2,"value":"",)"
        R"("extra":{"index":9,"name":"ops","send_to":"send_queue_index_3"}}})");

    ASSERT_TRUE(cmd.has_value());
    ASSERT_TRUE(cmd.value().extra.has_value());
    EXPECT_EQ((*cmd.value().extra)["name"], "ops");
    EXPECT_EQ(cmd.value().send_to(), "send_queue_index_3");
}

TEST_F(DecodeCommandTest, EmptyRedirectIsIgnored) {
    auto cmd = decode_command(
        R"({"action":35,"data":{"index":2,"value":"","extra":{"send_to":""}}})");

    ASSERT_TRUE(cmd.has_value());
    EXPECT_FALSE(cmd.value().send_to().has_value());
}

TEST_F(DecodeCommandTest, NestingPastReaderLimitIsMalformed) {
    const std::string nested = std::string(1100, '[') + std::string(1100, ']');

    auto cmd = decode_command(R"({"action":58,"data":{"index":2,"value":)" + nested + "}}");

    ASSERT_FALSE(cmd.has_value());
    EXPECT_EQ(cmd.error().code, error_code::malformed_envelope);

    std::string reason;
    EXPECT_FALSE(parse_json(nested, &reason).has_value());
    EXPECT_FALSE(reason.empty());
}

TEST_F(DecodeCommandTest, RejectsMalformedInput) {
    const char* inputs[] = {
        "not json",
        "[1,2,3]",
        R"({"data":{"index":1}})",
        R"({"action":"58","data":{"index":1}})",
        R"({"action":58.5,"data":{"index":1}})",
        R"({"action":58})",
        R"({"action":58,"data":{"value":""}})",
        R"({"action":58,"data":{"index":"1"}})",
        R"({"action":58,"data":{"index":4294967296}})",
        R"({"action":58,"data":"x"})",
    };
    for (const auto* input : inputs) {
        auto cmd = decode_command(input);
        ASSERT_FALSE(cmd.has_value()) << input;
        EXPECT_EQ(cmd.error().code, error_code::malformed_envelope) << input;
    }
}

TEST_F(DecodeCommandTest, ValueShapeIsNotValidated) {
    auto cmd = decode_command(R"({"action":35,"data":{"index":1,"value":[1,2]}})");
    EXPECT_TRUE(cmd.has_value());
}

// =============================================================================
// encode_response Tests
// =============================================================================

class EncodeResponseTest : public ::testing::Test {};

TEST_F(EncodeResponseTest, NumericFieldsStayIntegers) {
    response_envelope resp;
    resp.action = 60;
    resp.index = 7;
    resp.value = json_object({{"success", true}});
    resp.timestamp = 1700000000;

    auto parsed = parse_json(encode_response(resp));
    ASSERT_TRUE(parsed.has_value());
    const Json::Value& doc = *parsed;

    EXPECT_TRUE(is_integer(doc["action"]));
    EXPECT_TRUE(is_integer(doc["data"]["index"]));
    EXPECT_TRUE(is_integer(doc["data"]["timestamp"]));
    EXPECT_EQ(doc["data"]["timestamp"].asInt64(), 1700000000);
    EXPECT_FALSE(doc["data"].isMember("extra"));
}

TEST_F(EncodeResponseTest, ExtraIsCarried) {
    response_envelope resp;
    resp.action = 33;
    resp.index = 2;
    resp.extra = json_object({{"send_to", "send_queue_index_3"}, {"name", "ops"}});

    auto decoded = decode_response(encode_response(resp));

    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded.value().extra.has_value());
    EXPECT_EQ((*decoded.value().extra)["name"], "ops");
    EXPECT_EQ(decoded.value().value, Json::Value(""));
}

TEST_F(EncodeResponseTest, EncodeCommandDecodes) {
    command_envelope cmd;
    cmd.action = 64;
    cmd.index = 1;
    cmd.value = json_object({{"remote_path", "/jobs/"}});

    auto decoded = decode_command(encode_command(cmd));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().value["remote_path"], "/jobs/");
}

// =============================================================================
// Payload accessor Tests
// =============================================================================

class PayloadTest : public ::testing::Test {};

TEST_F(PayloadTest, PathFromObjectOrBareString) {
    EXPECT_EQ(payload_path(json_object({{"remote_path", "/a"}}), "remote_path").value(), "/a");
    EXPECT_EQ(payload_path(Json::Value("/b"), "remote_path").value(), "/b");
    EXPECT_EQ(payload_path(Json::Value(""), "remote_path").value(), "");
    EXPECT_EQ(payload_path(Json::Value(), "remote_path").value(), "");
    EXPECT_EQ(payload_path(Json::Value(Json::objectValue), "remote_path").value(), "");
}

TEST_F(PayloadTest, WrongTypesAreInvalidPayload) {
    auto path = payload_path(json_object({{"remote_path", 5}}), "remote_path");
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code, error_code::invalid_payload);

    auto list = payload_path(Json::Value(Json::arrayValue), "remote_path");
    EXPECT_FALSE(list.has_value());
}

TEST_F(PayloadTest, RequiredString) {
    EXPECT_EQ(payload_string(json_object({{"local_path", "/x"}}), "local_path").value(), "/x");

    auto missing = payload_string(Json::Value(Json::objectValue), "local_path");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::invalid_payload);
    EXPECT_NE(missing.error().message.find("local_path"), std::string::npos);
}

// =============================================================================
// Action code Tests
// =============================================================================

class ActionCodeTest : public ::testing::Test {};

TEST_F(ActionCodeTest, WireValues) {
    EXPECT_EQ(to_int(action_code::start_stream_file), 33);
    EXPECT_EQ(to_int(action_code::finish_stream_file), 34);
    EXPECT_EQ(to_int(action_code::stream_file), 35);
    EXPECT_EQ(to_int(action_code::error_download_file), 57);
    EXPECT_EQ(to_int(action_code::error), 62);
    EXPECT_EQ(to_int(action_code::progress_send_file), 67);
    EXPECT_EQ(to_int(action_code::list_peripherals), 68);
    EXPECT_EQ(legacy_download_file_code, to_int(action_code::delete_remote_file));
}

TEST_F(ActionCodeTest, StreamCodeSets) {
    EXPECT_EQ(upload_stream_codes.start, action_code::start_stream_file);
    EXPECT_EQ(upload_stream_codes.finish, action_code::finish_stream_file);
    EXPECT_EQ(upload_stream_codes.failure, action_code::error);
    EXPECT_EQ(download_stream_codes.start, action_code::start_download_file);
    EXPECT_EQ(download_stream_codes.failure, action_code::error_download_file);
}

}  // namespace ftp_bridge::test
