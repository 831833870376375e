/**
 * @file test_bridge_service.cpp
 * @brief Integration tests: service, workers, broker and fake peripherals
 */

#include <gtest/gtest.h>

#include <ftp_bridge/ftp_bridge.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "support/json_builders.h"
#include "support/test_fixtures.h"

namespace ftp_bridge::test {

using namespace std::chrono_literals;

namespace {

/**
 * @brief Routes each peripheral to its own fake server
 */
class routing_session_factory : public session_factory {
public:
    void route(int32_t index, std::shared_ptr<fake_ftp_server> server) {
        servers_[index] = std::move(server);
    }

    auto create(const peripheral_ref& peripheral) -> std::unique_ptr<ftp_session> override {
        auto it = servers_.find(peripheral.index);
        if (it == servers_.end()) {
            return nullptr;
        }
        return it->second->create(peripheral);
    }

private:
    std::map<int32_t, std::shared_ptr<fake_ftp_server>> servers_;
};

auto command(int32_t action, int32_t index, const Json::Value& value) -> std::string {
    return write_json(json_object(
        {{"action", action}, {"data", json_object({{"index", index}, {"value", value}})}}));
}

}  // namespace

class BridgeServiceTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        first_ = std::make_shared<fake_ftp_server>();
        second_ = std::make_shared<fake_ftp_server>();
        factory_ = std::make_shared<routing_session_factory>();
        factory_->route(1, first_);
        factory_->route(2, second_);
        broker_ = std::make_shared<in_memory_broker>();
        history_ = std::make_shared<memory_history_sink>();
    }

    auto build_service() -> result<bridge_service> {
        bridge_config config;
        config.connection.retry_delay = 0ms;
        config.poll_interval = 10ms;
        config.engine.chunk_size = min_chunk_size;

        auto builder = bridge_service::builder();
        builder.with_config(config)
            .with_broker(broker_)
            .with_session_factory(factory_)
            .with_history_sink(history_)
            .with_clock([] { return fixed_timestamp; });
        for (int32_t index : {1, 2}) {
            auto p = fake_ftp_server::peripheral(index);
            p.local_root = test_dir_.string();
            builder.with_peripheral(p);
        }
        return builder.build();
    }

    /**
     * @brief Collect envelopes from @p queue until one with a terminal code
     */
    auto collect_until(const std::string& queue, const std::vector<int32_t>& terminal)
        -> std::vector<response_envelope> {
        std::vector<response_envelope> out;
        for (;;) {
            auto raw = broker_->receive(queue, 5000ms);
            if (!raw) {
                ADD_FAILURE() << "timed out waiting on " << queue;
                return out;
            }
            auto decoded = decode_response(*raw);
            if (!decoded) {
                ADD_FAILURE() << "undecodable response: " << *raw;
                return out;
            }
            out.push_back(decoded.value());
            for (auto code : terminal) {
                if (decoded.value().action == code) {
                    return out;
                }
            }
        }
    }

    std::shared_ptr<fake_ftp_server> first_;
    std::shared_ptr<fake_ftp_server> second_;
    std::shared_ptr<routing_session_factory> factory_;
    std::shared_ptr<in_memory_broker> broker_;
    std::shared_ptr<memory_history_sink> history_;
};

TEST_F(BridgeServiceTest, StartsOneWorkerPerPeripheral) {
    auto service = build_service();
    ASSERT_TRUE(service.has_value()) << service.error().message;

    ASSERT_TRUE(service.value().start().has_value());
    EXPECT_TRUE(service.value().is_running());
    EXPECT_EQ(service.value().worker_count(), 2u);
    EXPECT_EQ(service.value().registry().list().size(), 2u);

    service.value().stop();
    EXPECT_FALSE(service.value().is_running());
    EXPECT_EQ(service.value().worker_count(), 0u);
}

TEST_F(BridgeServiceTest, StartWithoutPeripheralsFails) {
    auto service = bridge_service::builder().with_broker(broker_).build();
    ASSERT_TRUE(service.has_value());

    auto started = service.value().start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::invalid_configuration);
}

TEST_F(BridgeServiceTest, BuildRejectsInvalidConfiguration) {
    bridge_config config;
    config.action_overrides["upload_file"] = 58;

    auto service = bridge_service::builder().with_config(config).build();
    ASSERT_FALSE(service.has_value());
    EXPECT_EQ(service.error().code, error_code::action_code_collision);
}

TEST_F(BridgeServiceTest, PeripheralsAreServedIndependently) {
    first_->plan().unreachable = true;
    second_->add_directory("/inbox");
    create_test_file("frame.raw", 9 * 1024);

    auto service = build_service();
    ASSERT_TRUE(service.has_value()) << service.error().message;
    ASSERT_TRUE(service.value().start().has_value());

    const auto upload = json_object({{"local_path", "frame.raw"}, {"remote_path", "/inbox/"}});
    ASSERT_TRUE(broker_->publish(default_inbound_queue(1), command(35, 1, upload)).has_value());
    ASSERT_TRUE(broker_->publish(default_inbound_queue(2), command(35, 2, upload)).has_value());

    auto failed = collect_until(default_outbound_queue(1), {34, 62});
    auto done = collect_until(default_outbound_queue(2), {34, 62});
    service.value().stop();

    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].action, 62);
    EXPECT_EQ(failed[0].index, 1);

    ASSERT_GE(done.size(), 3u);
    EXPECT_EQ(done.front().action, 33);
    EXPECT_EQ(done.back().action, 34);
    EXPECT_EQ(second_->content("/inbox/frame.raw"), read_file(test_dir_ / "frame.raw"));
    EXPECT_FALSE(first_->exists("/inbox/frame.raw"));

    EXPECT_EQ(history_->size(), 2u);
}

TEST_F(BridgeServiceTest, RoundTripThroughRemotePeripheral) {
    second_->add_file("/outbox/report.txt", "line 1\nline 2\n");

    auto service = build_service();
    ASSERT_TRUE(service.has_value());
    ASSERT_TRUE(service.value().start().has_value());

    const auto in = default_inbound_queue(2);
    const auto out = default_outbound_queue(2);

    ASSERT_TRUE(broker_->publish(in, command(59, 2, "/outbox")).has_value());
    auto listing = collect_until(out, {61, 62});
    ASSERT_EQ(listing.size(), 1u);
    ASSERT_EQ(listing[0].action, 61);
    ASSERT_EQ(listing[0].value["files"].size(), 1u);
    EXPECT_EQ(listing[0].value["files"][0]["size"], 14);

    ASSERT_TRUE(broker_->publish(in, command(66, 2, json_object({{"remote_path", "/outbox"},
                                                          {"local_path", "mirror"}})))
                    .has_value());
    auto mirrored = collect_until(out, {56, 57, 62});
    EXPECT_EQ(mirrored.back().action, 56);
    EXPECT_EQ(read_file(test_dir_ / "mirror" / "report.txt"), "line 1\nline 2\n");

    ASSERT_TRUE(broker_->publish(in, command(64, 2, "/outbox")).has_value());
    auto deleted = collect_until(out, {64, 62});
    ASSERT_EQ(deleted.size(), 1u);
    EXPECT_EQ(deleted[0].action, 64);
    EXPECT_FALSE(second_->exists("/outbox"));

    service.value().stop();
    EXPECT_EQ(history_->size(), 3u);
}

}  // namespace ftp_bridge::test
