/**
 * @file test_peripheral_worker.cpp
 * @brief Unit tests for the per-peripheral command loop
 */

#include <gtest/gtest.h>

#include <ftp_bridge/service/peripheral_worker.h>

#include <chrono>
#include <thread>

#include "support/test_fixtures.h"

namespace ftp_bridge::test {

using namespace std::chrono_literals;

class PeripheralWorkerTest : public DispatcherFixture {
protected:
    auto make_worker() -> std::unique_ptr<peripheral_worker> {
        auto table = action_table::build(action_profile::standard);
        EXPECT_TRUE(table.has_value());
        connection_options options;
        options.retry_delay = 0ms;
        auto dispatcher = std::make_unique<action_dispatcher>(
            peripheral_index,
            action_dispatcher::collaborators{registry_, *broker_, history_, server_},
            table.value(), options, engine_options{},
            response_builder{[] { return fixed_timestamp; }});
        return std::make_unique<peripheral_worker>(default_inbound_queue(peripheral_index),
                                                   *broker_, std::move(dispatcher), 10ms);
    }

    auto wait_for(const std::string& queue, std::chrono::milliseconds timeout = 5000ms)
        -> std::optional<response_envelope> {
        auto raw = broker_->receive(queue, timeout);
        if (!raw) {
            return std::nullopt;
        }
        auto decoded = decode_response(*raw);
        if (!decoded) {
            return std::nullopt;
        }
        return decoded.value();
    }
};

TEST_F(PeripheralWorkerTest, ProcessesCommandsInOrder) {
    auto worker = make_worker();
    worker->start();
    EXPECT_TRUE(worker->is_running());

    const auto inbound = default_inbound_queue(peripheral_index);
    ASSERT_TRUE(broker_->publish(inbound, R"({"action":68,"data":{"index":2,"value":""}})")
                    .has_value());
    ASSERT_TRUE(broker_->publish(inbound, R"({"action":99,"data":{"index":2,"value":""}})")
                    .has_value());

    const auto outbound = default_outbound_queue(peripheral_index);
    auto first = wait_for(outbound);
    auto second = wait_for(outbound);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->action, 68);
    EXPECT_EQ(second->action, 62);

    worker->stop();
    EXPECT_FALSE(worker->is_running());
    EXPECT_EQ(worker->processed(), 2u);
}

TEST_F(PeripheralWorkerTest, StartIsIdempotentAndStopWithoutStartIsSafe) {
    auto idle = make_worker();
    idle->stop();
    EXPECT_FALSE(idle->is_running());

    auto worker = make_worker();
    worker->start();
    worker->start();
    EXPECT_TRUE(worker->is_running());
    worker->stop();
    worker->stop();
    EXPECT_EQ(worker->processed(), 0u);
}

TEST_F(PeripheralWorkerTest, IgnoresOtherQueues) {
    auto worker = make_worker();
    worker->start();

    ASSERT_TRUE(broker_->publish(default_inbound_queue(7),
                                 R"({"action":68,"data":{"index":7,"value":""}})")
                    .has_value());
    std::this_thread::sleep_for(50ms);
    worker->stop();

    EXPECT_EQ(worker->processed(), 0u);
    EXPECT_EQ(broker_->pending(default_inbound_queue(7)), 1u);
}

}  // namespace ftp_bridge::test
