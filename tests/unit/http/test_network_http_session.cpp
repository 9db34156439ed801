/**
 * @file test_network_http_session.cpp
 * @brief Unit tests for the production HTTP session
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/http/network_http_session.h>

namespace kcenon::webhdfs::test {

TEST(SendFailureTest, RefusedAndUnresolvedNeverReachedServer) {
    EXPECT_EQ(classify_send_failure("Connection refused"), error_code::connection_refused);
    EXPECT_EQ(classify_send_failure("connect: CONNECTION REFUSED"),
              error_code::connection_refused);
    EXPECT_EQ(classify_send_failure("Host not found (authoritative)"),
              error_code::connection_refused);
    EXPECT_EQ(classify_send_failure("Failed to resolve host nn1"),
              error_code::connection_refused);
}

TEST(SendFailureTest, TimeoutsAreReported) {
    EXPECT_EQ(classify_send_failure("Connection timed out"), error_code::connection_timeout);
    EXPECT_EQ(classify_send_failure("Read timeout"), error_code::connection_timeout);
}

TEST(SendFailureTest, AnythingElseMayHaveBeenDelivered) {
    EXPECT_EQ(classify_send_failure("Connection reset by peer"), error_code::connection_lost);
    EXPECT_EQ(classify_send_failure("End of file"), error_code::connection_lost);
    EXPECT_EQ(classify_send_failure(""), error_code::connection_lost);
}

TEST(NetworkHttpSessionTest, ReportsMissingBackend) {
    network_http_session session;
    if (session.is_available()) {
        GTEST_SKIP() << "network_system backend compiled in";
    }

    http_request request;
    request.method = "GET";
    request.url = "http://nn1:50070/webhdfs/v1/?op=GETFILESTATUS";
    auto response = session.send(request);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::not_available);
}

}  // namespace kcenon::webhdfs::test
