/**
 * @file test_path_resolver.cpp
 * @brief Unit tests for path_resolver
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/resolver/path_resolver.h>

#include <map>

namespace kcenon::webhdfs::test {

namespace {

auto entry(const std::string& name, int64_t mtime, bool directory = true) -> file_status {
    file_status status;
    status.path_suffix = name;
    status.type = directory ? file_type::directory : file_type::file;
    status.modification_time = mtime;
    return status;
}

}  // namespace

class PathResolverTest : public ::testing::Test {
protected:
    auto make_resolver(const std::string& root = "/user/alice") -> path_resolver {
        return path_resolver(root, [this](const std::string& dir)
                                       -> result<std::vector<file_status>> {
            ++calls_;
            listed_.push_back(dir);
            auto it = listings_.find(dir);
            if (it == listings_.end()) {
                return unexpected{error{error_code::file_not_found, "File does not exist: " + dir}};
            }
            return it->second;
        });
    }

    std::map<std::string, std::vector<file_status>> listings_;
    std::vector<std::string> listed_;
    int calls_ = 0;
};

TEST_F(PathResolverTest, RelativePathJoinsRoot) {
    auto resolver = make_resolver();
    auto resolved = resolver.resolve("data/input.csv");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved.value(), "/user/alice/data/input.csv");
    EXPECT_EQ(calls_, 0);
}

TEST_F(PathResolverTest, AbsolutePathIgnoresRoot) {
    auto resolver = make_resolver();
    auto resolved = resolver.resolve("/tmp//staging/");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved.value(), "/tmp/staging");
}

TEST_F(PathResolverTest, ResolveIsIdempotent) {
    auto resolver = make_resolver();
    auto first = resolver.resolve("reports/./2024/../2025");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), "/user/alice/reports/2025");

    auto second = resolver.resolve(first.value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), first.value());
}

TEST_F(PathResolverTest, EmptyPathIsInvalid) {
    auto resolver = make_resolver();
    auto resolved = resolver.resolve("");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::invalid_path);
}

TEST_F(PathResolverTest, RelativePathWithoutRootIsConfigError) {
    auto resolver = make_resolver("");
    auto resolved = resolver.resolve("data");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::config_error);

    auto absolute = resolver.resolve("/data");
    ASSERT_TRUE(absolute.has_value());
    EXPECT_EQ(absolute.value(), "/data");
}

TEST_F(PathResolverTest, RelativeRootIsConfigError) {
    auto resolver = make_resolver("user/alice");
    auto resolved = resolver.resolve("data");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::config_error);
}

TEST_F(PathResolverTest, LatestPicksNewestChildWithOneListing) {
    listings_["/user/alice/logs"] = {entry("a", 10), entry("b", 30), entry("c", 20)};
    auto resolver = make_resolver();

    auto resolved = resolver.resolve("logs/#LATEST/part-0");
    ASSERT_TRUE(resolved.has_value()) << resolved.error().message;
    EXPECT_EQ(resolved.value(), "/user/alice/logs/b/part-0");
    EXPECT_EQ(calls_, 1);
    ASSERT_EQ(listed_.size(), 1u);
    EXPECT_EQ(listed_[0], "/user/alice/logs");
}

TEST_F(PathResolverTest, LatestAsLastSegment) {
    listings_["/snapshots"] = {entry("s1", 5, false), entry("s2", 7, false)};
    auto resolver = make_resolver();

    auto resolved = resolver.resolve("/snapshots/#LATEST");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved.value(), "/snapshots/s2");
}

TEST_F(PathResolverTest, LatestTieGoesToFirstListed) {
    listings_["/user/alice/runs"] = {entry("x", 50), entry("y", 50), entry("z", 10)};
    auto resolver = make_resolver();

    auto resolved = resolver.resolve("runs/#LATEST");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved.value(), "/user/alice/runs/x");
}

TEST_F(PathResolverTest, MarkerInsideSegmentIsRejected) {
    auto resolver = make_resolver();
    auto resolved = resolver.resolve("logs/day-#LATEST/part-0");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::config_error);
    EXPECT_EQ(calls_, 0);
}

TEST_F(PathResolverTest, TwoMarkersAreRejected) {
    auto resolver = make_resolver();
    auto resolved = resolver.resolve("logs/#LATEST/#LATEST");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::config_error);
    EXPECT_EQ(calls_, 0);
}

TEST_F(PathResolverTest, EmptyMarkerParentIsNotFound) {
    listings_["/user/alice/empty"] = {};
    auto resolver = make_resolver();

    auto resolved = resolver.resolve("empty/#LATEST");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::file_not_found);
}

TEST_F(PathResolverTest, FileMarkerParentIsNotADirectory) {
    listings_["/user/alice/report.csv"] = {entry("", 99, false)};
    auto resolver = make_resolver();

    auto resolved = resolver.resolve("report.csv/#LATEST");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::not_a_directory);
}

TEST_F(PathResolverTest, ListingErrorPropagates) {
    auto resolver = make_resolver();
    auto resolved = resolver.resolve("missing/#LATEST");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::file_not_found);
}

TEST(PathResolverNoListerTest, MarkerWithoutListerIsConfigError) {
    path_resolver resolver("/user/alice", nullptr);
    auto plain = resolver.resolve("data");
    ASSERT_TRUE(plain.has_value());

    auto marked = resolver.resolve("data/#LATEST");
    ASSERT_FALSE(marked.has_value());
    EXPECT_EQ(marked.error().code, error_code::config_error);
}

}  // namespace kcenon::webhdfs::test
