/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, result and path utilities
 */

#include <gtest/gtest.h>

#include <ftp_bridge/core/error_codes.h>
#include <ftp_bridge/core/path_utils.h>
#include <ftp_bridge/core/types.h>

#include <string>

namespace ftp_bridge::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::malformed_envelope), -100);
    EXPECT_EQ(static_cast<int>(error_code::path_not_found), -110);
    EXPECT_EQ(static_cast<int>(error_code::connection_error), -120);
    EXPECT_EQ(static_cast<int>(error_code::transfer_error), -130);
    EXPECT_EQ(static_cast<int>(error_code::peripheral_not_found), -140);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, RangePredicates) {
    EXPECT_TRUE(is_envelope_error(error_code::unknown_action));
    EXPECT_TRUE(is_local_error(error_code::local_file_not_found));
    EXPECT_TRUE(is_connection_error(error_code::login_failed));
    EXPECT_TRUE(is_remote_error(error_code::remote_delete_error));
    EXPECT_TRUE(is_service_error(error_code::history_write_error));

    EXPECT_FALSE(is_remote_error(error_code::connection_lost));
    EXPECT_FALSE(is_local_error(error_code::remote_file_not_found));
}

TEST_F(ErrorCodeTest, OnlyDroppedOrStalledLinksAreTransient) {
    EXPECT_TRUE(is_transient(error_code::connection_lost));
    EXPECT_TRUE(is_transient(error_code::connection_timeout));

    EXPECT_FALSE(is_transient(error_code::connection_error));
    EXPECT_FALSE(is_transient(error_code::login_failed));
    EXPECT_FALSE(is_transient(error_code::transfer_error));
    EXPECT_FALSE(is_transient(error_code::remote_command_failed));
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::malformed_envelope), "malformed envelope");
    EXPECT_STREQ(to_string(error_code::remote_list_error), "remote list error");
}

TEST_F(ErrorCodeTest, WithContextKeepsCode) {
    auto err = with_context(error{error_code::transfer_error, "reset"}, "upload a.txt");
    EXPECT_EQ(err.code, error_code::transfer_error);
    EXPECT_EQ(err.message, "upload a.txt: reset");
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected{error{error_code::invalid_payload, "bad"}};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_payload);
    EXPECT_EQ(r.error().message, "bad");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::connection_lost}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "connection lost");
}

TEST_F(ResultTest, ErrorBoolConversion) {
    EXPECT_FALSE(static_cast<bool>(error{}));
    EXPECT_TRUE(static_cast<bool>(error{error_code::transfer_error}));
}

// =============================================================================
// path_utils Tests
// =============================================================================

class PathUtilsTest : public ::testing::Test {};

TEST_F(PathUtilsTest, NormalizeCollapsesSeparators) {
    EXPECT_EQ(path_utils::normalize("/jobs//in/"), "/jobs/in");
    EXPECT_EQ(path_utils::normalize("\\jobs\\in"), "/jobs/in");
    EXPECT_EQ(path_utils::normalize("/"), "/");
    EXPECT_EQ(path_utils::normalize("//"), "/");
    EXPECT_EQ(path_utils::normalize(""), "");
    EXPECT_EQ(path_utils::normalize("a/b/"), "a/b");
}

TEST_F(PathUtilsTest, Join) {
    EXPECT_EQ(path_utils::join("/jobs", "a.txt"), "/jobs/a.txt");
    EXPECT_EQ(path_utils::join("/jobs/", "a.txt"), "/jobs/a.txt");
    EXPECT_EQ(path_utils::join("/", "a.txt"), "/a.txt");
    EXPECT_EQ(path_utils::join("", "a.txt"), "a.txt");
}

TEST_F(PathUtilsTest, ParentAndBasename) {
    EXPECT_EQ(path_utils::parent("/jobs/a.txt"), "/jobs");
    EXPECT_EQ(path_utils::parent("/a.txt"), "/");
    EXPECT_EQ(path_utils::parent("a.txt"), "");
    EXPECT_EQ(path_utils::basename("/jobs/a.txt"), "a.txt");
    EXPECT_EQ(path_utils::basename("/jobs/"), "jobs");
    EXPECT_EQ(path_utils::basename("a.txt"), "a.txt");
}

TEST_F(PathUtilsTest, DirectoryLikeAndAbsolute) {
    EXPECT_TRUE(path_utils::is_directory_like("/"));
    EXPECT_TRUE(path_utils::is_directory_like("/jobs/"));
    EXPECT_FALSE(path_utils::is_directory_like("/jobs"));
    EXPECT_FALSE(path_utils::is_directory_like(""));

    EXPECT_TRUE(path_utils::is_absolute("/jobs"));
    EXPECT_FALSE(path_utils::is_absolute("jobs"));
}

}  // namespace ftp_bridge::test
