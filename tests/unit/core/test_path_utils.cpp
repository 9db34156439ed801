/**
 * @file test_path_utils.cpp
 * @brief Unit tests for remote path helpers
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/core/path_utils.h>

namespace kcenon::webhdfs::test {

TEST(PathUtilsTest, SplitDropsEmptySegments) {
    auto segments = path_utils::split("//a/b///c/");
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0], "a");
    EXPECT_EQ(segments[1], "b");
    EXPECT_EQ(segments[2], "c");

    EXPECT_TRUE(path_utils::split("/").empty());
}

TEST(PathUtilsTest, NormalizeFoldsDotsAndSlashes) {
    EXPECT_EQ(path_utils::normalize("/a//b/./c/").value(), "/a/b/c");
    EXPECT_EQ(path_utils::normalize("/a/b/../c").value(), "/a/c");
    EXPECT_EQ(path_utils::normalize("/a/..").value(), "/");
    EXPECT_EQ(path_utils::normalize("/").value(), "/");
}

TEST(PathUtilsTest, NormalizeRejectsRelativeAndEscapingPaths) {
    auto relative = path_utils::normalize("a/b");
    ASSERT_FALSE(relative.has_value());
    EXPECT_EQ(relative.error().code, error_code::invalid_path);

    auto escaping = path_utils::normalize("/a/../..");
    ASSERT_FALSE(escaping.has_value());
    EXPECT_EQ(escaping.error().code, error_code::invalid_path);

    EXPECT_FALSE(path_utils::normalize("").has_value());
}

TEST(PathUtilsTest, NormalizeIsIdempotent) {
    for (const auto* path : {"/x/./y/../z", "/", "//deep//tree/./", "/a/b/c"}) {
        auto once = path_utils::normalize(path);
        ASSERT_TRUE(once.has_value()) << path;
        auto twice = path_utils::normalize(once.value());
        ASSERT_TRUE(twice.has_value());
        EXPECT_EQ(once.value(), twice.value());
    }
}

TEST(PathUtilsTest, JoinPrefersAbsoluteRight) {
    EXPECT_EQ(path_utils::join("/root", "dir/file"), "/root/dir/file");
    EXPECT_EQ(path_utils::join("/root/", "file"), "/root/file");
    EXPECT_EQ(path_utils::join("/root", "/abs"), "/abs");
    EXPECT_EQ(path_utils::join("/root", ""), "/root");
}

TEST(PathUtilsTest, ParentAndBaseName) {
    EXPECT_EQ(path_utils::parent("/a/b/c"), "/a/b");
    EXPECT_EQ(path_utils::parent("/a"), "/");
    EXPECT_EQ(path_utils::parent("/"), "/");
    EXPECT_EQ(path_utils::parent("/a/b/"), "/a");

    EXPECT_EQ(path_utils::base_name("/a/b/c.txt"), "c.txt");
    EXPECT_EQ(path_utils::base_name("/a/b/"), "b");
    EXPECT_EQ(path_utils::base_name("/"), "");
}

TEST(PathUtilsTest, RelativeTo) {
    EXPECT_EQ(path_utils::relative_to("/data/in/x/y.txt", "/data/in"), "x/y.txt");
    EXPECT_EQ(path_utils::relative_to("/data/in", "/"), "data/in");
    EXPECT_EQ(path_utils::relative_to("/data/input", "/data/in"), "");
    EXPECT_EQ(path_utils::relative_to("/data", "/data"), "");
}

}  // namespace kcenon::webhdfs::test
