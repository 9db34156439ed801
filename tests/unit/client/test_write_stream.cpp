/**
 * @file test_write_stream.cpp
 * @brief Unit tests for write_stream
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/client/write_stream.h>

#include <atomic>
#include <memory>
#include <string>

namespace kcenon::webhdfs::test {

namespace {

/// Request that drains the body into a shared string
auto capturing_request(std::shared_ptr<std::string> sink) -> write_stream::request_function {
    return [sink](body_source body) -> result<void> {
        auto data = drain_body_source(body, 4);
        if (!data.has_value()) {
            return unexpected{data.error()};
        }
        sink->assign(data.value().begin(), data.value().end());
        return {};
    };
}

}  // namespace

TEST(WriteStreamTest, CloseDeliversAllData) {
    auto sink = std::make_shared<std::string>();
    write_stream stream("/out", capturing_request(sink), 2);

    ASSERT_TRUE(stream.write("hello ").has_value());
    ASSERT_TRUE(stream.write("streaming ").has_value());
    ASSERT_TRUE(stream.write("world").has_value());
    auto closed = stream.close();

    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(*sink, "hello streaming world");
    EXPECT_EQ(stream.bytes_written(), 21u);
}

TEST(WriteStreamTest, CloseIsRepeatable) {
    auto sink = std::make_shared<std::string>();
    write_stream stream("/out", capturing_request(sink));
    ASSERT_TRUE(stream.write("x").has_value());
    EXPECT_TRUE(stream.close().has_value());
    EXPECT_TRUE(stream.close().has_value());
}

TEST(WriteStreamTest, WriteAfterCloseFails) {
    auto sink = std::make_shared<std::string>();
    write_stream stream("/out", capturing_request(sink));
    ASSERT_TRUE(stream.close().has_value());

    auto written = stream.write("late");
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::illegal_argument);
}

TEST(WriteStreamTest, AbortFailsTheBody) {
    auto outcome = std::make_shared<std::atomic<int>>(0);
    {
        write_stream stream("/out", [outcome](body_source body) -> result<void> {
            auto data = drain_body_source(body);
            if (!data.has_value()) {
                outcome->store(static_cast<int>(data.error().code));
                return unexpected{data.error()};
            }
            outcome->store(1);
            return {};
        });
        ASSERT_TRUE(stream.write("partial").has_value());
        stream.abort();
    }
    EXPECT_EQ(outcome->load(), static_cast<int>(error_code::aborted));
}

TEST(WriteStreamTest, DestructionWithoutCloseAborts) {
    auto outcome = std::make_shared<std::atomic<bool>>(false);
    {
        write_stream stream("/out", [outcome](body_source body) -> result<void> {
            auto data = drain_body_source(body);
            outcome->store(data.has_value());
            if (!data.has_value()) {
                return unexpected{data.error()};
            }
            return {};
        });
        ASSERT_TRUE(stream.write("never committed").has_value());
    }
    EXPECT_FALSE(outcome->load());
}

TEST(WriteStreamTest, RequestFailureIsReported) {
    write_stream stream("/out", [](body_source) -> result<void> {
        return unexpected{error{error_code::permission_denied, "Permission denied"}};
    });

    auto closed = stream.close();
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().code, error_code::permission_denied);
}

TEST(WriteStreamTest, WriteAfterRequestFailedReturnsItsError) {
    write_stream stream("/out", [](body_source) -> result<void> {
        return unexpected{error{error_code::already_exists, "exists"}};
    });
    // Wait for the request to finish
    auto closed = stream.close();
    ASSERT_FALSE(closed.has_value());

    auto written = stream.write("data");
    ASSERT_FALSE(written.has_value());
}

}  // namespace kcenon::webhdfs::test
