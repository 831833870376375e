/**
 * @file test_fixtures.h
 * @brief Shared fixtures for unit and integration tests
 */

#ifndef FTP_BRIDGE_TESTS_SUPPORT_TEST_FIXTURES_H
#define FTP_BRIDGE_TESTS_SUPPORT_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <ftp_bridge/broker/in_memory_broker.h>
#include <ftp_bridge/history/history_sink.h>
#include <ftp_bridge/protocol/envelope.h>
#include <ftp_bridge/registry/peripheral_registry.h>
#include <ftp_bridge/service/action_dispatcher.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "support/fake_ftp_server.h"

namespace ftp_bridge::test {

/// Response timestamp used by fixtures with a fixed clock
inline constexpr int64_t fixed_timestamp = 1700000000;

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("ftp_bridge_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    auto create_text_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
    std::filesystem::path download_dir_;
};

/**
 * @brief Dispatcher wired to a fake peripheral, an in-memory broker and an
 *        in-memory history
 */
class DispatcherFixture : public TempDirectoryFixture {
protected:
    static constexpr int32_t peripheral_index = 2;

    void SetUp() override {
        TempDirectoryFixture::SetUp();
        server_ = std::make_shared<fake_ftp_server>();
        broker_ = std::make_shared<in_memory_broker>();
        history_ = std::make_shared<memory_history_sink>();

        auto p = fake_ftp_server::peripheral(peripheral_index);
        p.local_root = test_dir_.string();
        ASSERT_TRUE(registry_.add(p).has_value());
    }

    void TearDown() override {
        dispatcher_.reset();
        TempDirectoryFixture::TearDown();
    }

    auto dispatcher(action_profile profile = action_profile::standard,
                    const std::map<std::string, int32_t>& overrides = {}) -> action_dispatcher& {
        auto table = action_table::build(profile, overrides);
        EXPECT_TRUE(table.has_value());
        connection_options options;
        options.retry_delay = std::chrono::milliseconds{0};
        engine_options engine;
        engine.chunk_size = 4 * 1024;
        dispatcher_ = std::make_unique<action_dispatcher>(
            peripheral_index,
            action_dispatcher::collaborators{registry_, *broker_, history_, server_},
            table.value(), options, engine,
            response_builder{[] { return fixed_timestamp; }});
        return *dispatcher_;
    }

    void send(const std::string& raw) {
        if (!dispatcher_) {
            dispatcher();
        }
        dispatcher_->dispatch(raw);
    }

    /**
     * @brief Decode and remove every response published to @p queue
     */
    auto responses(const std::string& queue = default_outbound_queue(peripheral_index))
        -> std::vector<response_envelope> {
        std::vector<response_envelope> out;
        for (const auto& raw : broker_->drain(queue)) {
            auto decoded = decode_response(raw);
            EXPECT_TRUE(decoded.has_value()) << raw;
            if (decoded) {
                out.push_back(decoded.value());
            }
        }
        return out;
    }

    static auto actions(const std::vector<response_envelope>& envelopes) -> std::vector<int32_t> {
        std::vector<int32_t> out;
        for (const auto& e : envelopes) {
            out.push_back(e.action);
        }
        return out;
    }

    std::shared_ptr<fake_ftp_server> server_;
    std::shared_ptr<in_memory_broker> broker_;
    std::shared_ptr<memory_history_sink> history_;
    static_peripheral_registry registry_;
    std::unique_ptr<action_dispatcher> dispatcher_;
};

}  // namespace ftp_bridge::test

#endif  // FTP_BRIDGE_TESTS_SUPPORT_TEST_FIXTURES_H
