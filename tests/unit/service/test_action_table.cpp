/**
 * @file test_action_table.cpp
 * @brief Unit tests for action code binding profiles and overrides
 */

#include <gtest/gtest.h>

#include <ftp_bridge/service/action_table.h>

namespace ftp_bridge::test {

class ActionTableTest : public ::testing::Test {};

TEST_F(ActionTableTest, StandardProfileBindings) {
    auto table = action_table::build(action_profile::standard);
    ASSERT_TRUE(table.has_value()) << table.error().message;

    EXPECT_EQ(table.value().resolve(58), handler_id::list_local);
    EXPECT_EQ(table.value().resolve(59), handler_id::list_remote);
    EXPECT_EQ(table.value().resolve(35), handler_id::upload_file);
    EXPECT_EQ(table.value().resolve(63), handler_id::delete_file);
    EXPECT_EQ(table.value().resolve(64), handler_id::delete_directory);
    EXPECT_EQ(table.value().resolve(65), handler_id::upload_directory);
    EXPECT_EQ(table.value().resolve(66), handler_id::download_directory);
    EXPECT_EQ(table.value().resolve(68), handler_id::list_peripherals);
    EXPECT_FALSE(table.value().code_of(handler_id::download_file).has_value());
}

TEST_F(ActionTableTest, LegacyProfileBindsDownloadTo63) {
    auto table = action_table::build(action_profile::legacy);
    ASSERT_TRUE(table.has_value());

    EXPECT_EQ(table.value().resolve(63), handler_id::download_file);
    EXPECT_FALSE(table.value().code_of(handler_id::delete_file).has_value());
}

TEST_F(ActionTableTest, ResponseCodesAreNotCommands) {
    auto table = action_table::build(action_profile::standard);
    ASSERT_TRUE(table.has_value());

    for (int32_t code : {33, 34, 55, 56, 57, 60, 61, 62, 67}) {
        EXPECT_FALSE(table.value().resolve(code).has_value()) << code;
    }
}

TEST_F(ActionTableTest, OverrideAddsHandlerOnNewCode) {
    auto table = action_table::build(action_profile::standard, {{"download_file", 69}});
    ASSERT_TRUE(table.has_value()) << table.error().message;

    EXPECT_EQ(table.value().resolve(69), handler_id::download_file);
    EXPECT_EQ(table.value().resolve(63), handler_id::delete_file);
}

TEST_F(ActionTableTest, OverridesMaySwapCodes) {
    auto table = action_table::build(action_profile::standard,
                                     {{"list_local", 59}, {"list_remote", 58}});
    ASSERT_TRUE(table.has_value()) << table.error().message;

    EXPECT_EQ(table.value().resolve(58), handler_id::list_remote);
    EXPECT_EQ(table.value().resolve(59), handler_id::list_local);
}

TEST_F(ActionTableTest, CollisionIsRejected) {
    auto table = action_table::build(action_profile::standard, {{"download_file", 63}});
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, error_code::action_code_collision);
    EXPECT_NE(table.error().message.find("63"), std::string::npos);
}

TEST_F(ActionTableTest, InvalidOverrides) {
    auto unknown = action_table::build(action_profile::standard, {{"format_disk", 70}});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, error_code::invalid_configuration);

    auto negative = action_table::build(action_profile::standard, {{"upload_file", 0}});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, error_code::invalid_configuration);
}

TEST_F(ActionTableTest, NameConversions) {
    EXPECT_EQ(handler_from_string("delete_directory"), handler_id::delete_directory);
    EXPECT_FALSE(handler_from_string("DELETE_DIRECTORY").has_value());
    EXPECT_EQ(action_profile_from_string("legacy"), action_profile::legacy);
    EXPECT_FALSE(action_profile_from_string("classic").has_value());
    EXPECT_TRUE(is_streamed(handler_id::download_directory));
    EXPECT_FALSE(is_streamed(handler_id::delete_directory));
}

}  // namespace ftp_bridge::test
