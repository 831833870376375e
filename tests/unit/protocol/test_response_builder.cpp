/**
 * @file test_response_builder.cpp
 * @brief Unit tests for response shaping, destination selection and notifications
 */

#include <gtest/gtest.h>

#include <ftp_bridge/broker/in_memory_broker.h>
#include <ftp_bridge/protocol/response_builder.h>

#include <string>
#include <vector>

#include "support/json_builders.h"

namespace ftp_bridge::test {

namespace {

auto command_with_redirect(const std::string& target) -> command_envelope {
    command_envelope cmd;
    cmd.action = 35;
    cmd.index = 2;
    cmd.extra = json_object({{"index", 5}, {"name", "ops"}, {"send_to", target}});
    return cmd;
}

auto decode_all(in_memory_broker& broker, const std::string& queue)
    -> std::vector<response_envelope> {
    std::vector<response_envelope> out;
    for (const auto& raw : broker.drain(queue)) {
        auto decoded = decode_response(raw);
        if (decoded) {
            out.push_back(decoded.value());
        }
    }
    return out;
}

}  // namespace

// =============================================================================
// response_builder Tests
// =============================================================================

class ResponseBuilderTest : public ::testing::Test {
protected:
    response_builder builder_{[] { return int64_t{1700000123}; }};
};

TEST_F(ResponseBuilderTest, DestinationDefaultsToPeripheralQueue) {
    command_envelope cmd;
    cmd.index = 4;
    EXPECT_EQ(response_builder::destination(cmd, "send_queue_index_4"), "send_queue_index_4");
}

TEST_F(ResponseBuilderTest, DestinationFollowsRedirect) {
    auto cmd = command_with_redirect("send_queue_index_3");
    EXPECT_EQ(response_builder::destination(cmd, "send_queue_index_2"), "send_queue_index_3");
}

TEST_F(ResponseBuilderTest, MakeCopiesIndexExtraAndTimestamp) {
    auto cmd = command_with_redirect("send_queue_index_3");

    auto resp = builder_.make(action_code::start_stream_file, cmd, "");

    EXPECT_EQ(resp.action, 33);
    EXPECT_EQ(resp.index, 2);
    EXPECT_EQ(resp.timestamp, 1700000123);
    ASSERT_TRUE(resp.extra.has_value());
    EXPECT_EQ(*resp.extra, *cmd.extra);
}

TEST_F(ResponseBuilderTest, ErrorValueCarriesMessageCodeAndAction) {
    command_envelope cmd;
    cmd.action = 59;
    cmd.index = 1;

    auto resp = builder_.make_error(action_code::error, cmd,
                                    error{error_code::remote_list_error, "LIST refused"});

    EXPECT_EQ(resp.action, 62);
    EXPECT_EQ(resp.value["message"], "LIST refused");
    EXPECT_EQ(resp.value["code"], static_cast<int>(error_code::remote_list_error));
    EXPECT_EQ(resp.value["action"], 59);
}

TEST_F(ResponseBuilderTest, EmptyErrorMessageFallsBackToCodeName) {
    command_envelope cmd;
    auto resp = builder_.make_error(action_code::error, cmd, error{error_code::transfer_error, ""});
    EXPECT_EQ(resp.value["message"], "transfer error");
}

// =============================================================================
// transfer_notifier Tests
// =============================================================================

class TransferNotifierTest : public ::testing::Test {
protected:
    in_memory_broker broker_;
    response_builder builder_{[] { return int64_t{1}; }};
};

TEST_F(TransferNotifierTest, StreamGoesToRedirectTarget) {
    auto cmd = command_with_redirect("send_queue_index_3");
    transfer_notifier notifier(broker_, builder_, cmd,
                               response_builder::destination(cmd, "send_queue_index_2"),
                               upload_stream_codes);

    notifier.start();
    notifier.progress(progress_record{"job.txt", std::nullopt, std::nullopt, 50, 100, 50});
    notifier.finish();

    EXPECT_EQ(broker_.pending("send_queue_index_2"), 0u);
    auto sent = decode_all(broker_, "send_queue_index_3");
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].action, 33);
    EXPECT_EQ(sent[1].action, 67);
    EXPECT_EQ(sent[1].value["percent"], 50);
    EXPECT_FALSE(sent[1].value.isMember("file_index"));
    EXPECT_EQ(sent[2].action, 34);
    EXPECT_EQ(sent[2].value, Json::Value(""));
}

TEST_F(TransferNotifierTest, TerminalIsSentOnce) {
    command_envelope cmd;
    cmd.action = 66;
    cmd.index = 2;
    transfer_notifier notifier(broker_, builder_, cmd, "out", download_stream_codes);

    notifier.start();
    notifier.start();
    notifier.fail(error{error_code::transfer_error, "reset twice"});
    notifier.finish();
    notifier.progress(progress_record{"late", std::nullopt, std::nullopt, 1, 1, 100});

    auto sent = decode_all(broker_, "out");
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].action, 55);
    EXPECT_EQ(sent[1].action, 57);
    EXPECT_EQ(sent[1].value["message"], "reset twice");
    ASSERT_TRUE(notifier.terminal().has_value());
    EXPECT_EQ(notifier.terminal()->action, 57);
}

TEST_F(TransferNotifierTest, PublishFailureDoesNotThrow) {
    command_envelope cmd;
    transfer_notifier notifier(broker_, builder_, cmd, "out", upload_stream_codes);
    broker_.shutdown();

    notifier.start();
    notifier.finish();

    EXPECT_TRUE(notifier.terminal().has_value());
}

}  // namespace ftp_bridge::test
