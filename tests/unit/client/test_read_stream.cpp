/**
 * @file test_read_stream.cpp
 * @brief Unit tests for read_stream
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/client/read_stream.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace kcenon::webhdfs::test {

namespace {

auto make_response(std::size_t size) -> http_response {
    std::vector<uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i % 251);
    }
    http_response response;
    response.status_code = 200;
    response.body = std::make_unique<buffered_body_reader>(std::move(data));
    return response;
}

/**
 * @brief Body handing out at most a few bytes per read
 */
class trickle_reader : public body_reader {
public:
    explicit trickle_reader(std::size_t total) : remaining_(total) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        auto count = std::min({buffer.size(), remaining_, std::size_t{3}});
        std::fill_n(buffer.begin(), count, std::byte{'x'});
        remaining_ -= count;
        return count;
    }

private:
    std::size_t remaining_;
};

class failing_reader : public body_reader {
public:
    auto read(std::span<std::byte>) -> result<std::size_t> override {
        return unexpected{error{error_code::connection_lost, "Connection reset"}};
    }
};

}  // namespace

TEST(ReadStreamTest, ReportsProgressPerChunkThenDone) {
    constexpr std::size_t mib = 1024 * 1024;
    std::vector<std::pair<std::string, int64_t>> signals;
    read_stream stream("/data/big.bin", make_response(10 * mib), mib,
        [&](const std::string& path, int64_t bytes) { signals.emplace_back(path, bytes); });

    std::size_t chunks = 0;
    while (true) {
        auto chunk = stream.next_chunk();
        ASSERT_TRUE(chunk.has_value());
        if (chunk.value().empty()) {
            break;
        }
        EXPECT_EQ(chunk.value().size(), mib);
        ++chunks;
    }

    EXPECT_EQ(chunks, 10u);
    ASSERT_EQ(signals.size(), 11u);
    for (std::size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(signals[i].first, "/data/big.bin");
        EXPECT_EQ(signals[i].second, static_cast<int64_t>((i + 1) * mib));
    }
    EXPECT_EQ(signals.back().second, progress_done);
    EXPECT_TRUE(stream.is_finished());
}

TEST(ReadStreamTest, ChunksAreFullExceptLast) {
    http_response response;
    response.status_code = 200;
    response.body = std::make_unique<trickle_reader>(25);
    read_stream stream("/f", std::move(response), 10);

    auto first = stream.next_chunk();
    auto second = stream.next_chunk();
    auto third = stream.next_chunk();
    auto end = stream.next_chunk();
    ASSERT_TRUE(first.has_value() && second.has_value() && third.has_value() && end.has_value());
    EXPECT_EQ(first.value().size(), 10u);
    EXPECT_EQ(second.value().size(), 10u);
    EXPECT_EQ(third.value().size(), 5u);
    EXPECT_TRUE(end.value().empty());
    EXPECT_EQ(stream.bytes_read(), 25u);
}

TEST(ReadStreamTest, ReadAllReturnsContent) {
    read_stream stream("/f", make_response(1000), 64);
    auto content = stream.read_all();
    ASSERT_TRUE(content.has_value());
    ASSERT_EQ(content.value().size(), 1000u);
    EXPECT_EQ(content.value()[252], 1);
}

TEST(ReadStreamTest, DestroyingEarlyEmitsDoneOnce) {
    int done = 0;
    {
        read_stream stream("/f", make_response(100), 10,
            [&](const std::string&, int64_t bytes) {
                if (bytes == progress_done) {
                    ++done;
                }
            });
        auto chunk = stream.next_chunk();
        ASSERT_TRUE(chunk.has_value());
    }
    EXPECT_EQ(done, 1);
}

TEST(ReadStreamTest, CloseReleasesAndStopsReading) {
    int done = 0;
    read_stream stream("/f", make_response(100), 10,
        [&](const std::string&, int64_t bytes) {
            if (bytes == progress_done) {
                ++done;
            }
        });
    stream.close();
    stream.close();
    EXPECT_EQ(done, 1);

    auto chunk = stream.next_chunk();
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(chunk.value().empty());
}

TEST(ReadStreamTest, MovedStreamKeepsPosition) {
    read_stream original("/f", make_response(30), 10);
    auto first = original.next_chunk();
    ASSERT_TRUE(first.has_value());

    read_stream moved(std::move(original));
    auto rest = moved.read_all();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(rest.value().size(), 20u);
    EXPECT_EQ(moved.bytes_read(), 30u);
}

TEST(ReadStreamTest, BodyErrorPropagates) {
    http_response response;
    response.status_code = 200;
    response.body = std::make_unique<failing_reader>();
    read_stream stream("/f", std::move(response), 10);

    auto chunk = stream.next_chunk();
    ASSERT_FALSE(chunk.has_value());
    EXPECT_EQ(chunk.error().code, error_code::connection_lost);
}

}  // namespace kcenon::webhdfs::test
