/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes and the result type
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/core/types.h>

#include <string>

namespace kcenon::webhdfs::test {

// ============================================================================
// Error code tests
// ============================================================================

TEST(ErrorCodeTest, CodesAreGroupedInRanges) {
    EXPECT_EQ(static_cast<int>(error_code::success), 0);
    EXPECT_LE(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_GT(static_cast<int>(error_code::remote_error), -140);
    EXPECT_LE(static_cast<int>(error_code::invalid_path), -140);
    EXPECT_LE(static_cast<int>(error_code::connection_failed), -160);
    EXPECT_LE(static_cast<int>(error_code::protocol_error), -180);
    EXPECT_LE(static_cast<int>(error_code::transfer_failed), -200);
    EXPECT_LE(static_cast<int>(error_code::internal_error), -220);
}

TEST(ErrorCodeTest, ToStringNamesEveryCode) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::file_not_found), "file not found");
    EXPECT_STREQ(to_string(error_code::already_exists), "already exists");
    EXPECT_STREQ(to_string(error_code::network_error), "network error");
    EXPECT_STREQ(to_string(error_code::transfer_failed), "transfer failed");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST(ErrorCodeTest, TransientCodesAreTheConnectionFailures) {
    EXPECT_TRUE(is_transient(error_code::connection_failed));
    EXPECT_TRUE(is_transient(error_code::connection_refused));
    EXPECT_TRUE(is_transient(error_code::connection_timeout));
    EXPECT_TRUE(is_transient(error_code::connection_lost));
    EXPECT_TRUE(is_transient(error_code::server_error));
    EXPECT_TRUE(is_transient(error_code::standby_endpoint));

    EXPECT_FALSE(is_transient(error_code::network_error));
    EXPECT_FALSE(is_transient(error_code::file_not_found));
    EXPECT_FALSE(is_transient(error_code::protocol_error));
}

TEST(ErrorCodeTest, FilesystemErrorGroup) {
    EXPECT_TRUE(is_filesystem_error(error_code::file_not_found));
    EXPECT_TRUE(is_filesystem_error(error_code::already_exists));
    EXPECT_TRUE(is_filesystem_error(error_code::permission_denied));
    EXPECT_TRUE(is_filesystem_error(error_code::not_empty_directory));
    EXPECT_TRUE(is_filesystem_error(error_code::remote_error));

    EXPECT_FALSE(is_filesystem_error(error_code::success));
    EXPECT_FALSE(is_filesystem_error(error_code::invalid_path));
    EXPECT_FALSE(is_filesystem_error(error_code::network_error));
}

// ============================================================================
// Result tests
// ============================================================================

TEST(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, HoldsError) {
    result<std::string> r = unexpected{error{error_code::invalid_path, "bad"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_path);
    EXPECT_EQ(r.error().message, "bad");
}

TEST(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::aborted}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "aborted");
}

TEST(ResultTest, ErrorCarriesFailureDetails) {
    error err(error_code::transfer_failed, "2 of 3 file(s) failed",
              {{"/a", error_code::network_error, "lost"},
               {"/b", error_code::permission_denied, "denied"}});

    EXPECT_TRUE(static_cast<bool>(err));
    ASSERT_EQ(err.failures.size(), 2u);
    EXPECT_EQ(err.failures[0].path, "/a");
    EXPECT_EQ(err.failures[1].code, error_code::permission_denied);
}

}  // namespace kcenon::webhdfs::test
