/**
 * @file test_url_utils.cpp
 * @brief Unit tests for URL construction and redirect resolution
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/transport/url_utils.h>

namespace kcenon::webhdfs::test {

TEST(UrlUtilsTest, EncodeReservedCharacters) {
    EXPECT_EQ(url_utils::url_encode("a b&c"), "a%20b%26c");
    EXPECT_EQ(url_utils::url_encode("/x/y"), "%2Fx%2Fy");
    EXPECT_EQ(url_utils::url_encode("/x/y", false), "/x/y");
    EXPECT_EQ(url_utils::url_encode("safe-_.~"), "safe-_.~");
}

TEST(UrlUtilsTest, DecodeReversesEncode) {
    EXPECT_EQ(url_utils::url_decode("a%20b%26c"), "a b&c");
    EXPECT_EQ(url_utils::url_decode("%2Fdata%23LATEST"), "/data#LATEST");
    EXPECT_EQ(url_utils::url_decode("bad%zz"), "bad%zz");
}

TEST(UrlUtilsTest, BuildOperationUrl) {
    auto url = url_utils::build_operation_url("http://nn1:50070/", "/user/a b", operation::open,
                                              {{"offset", "10"}, {"user.name", "alice"}});
    EXPECT_EQ(url, "http://nn1:50070/webhdfs/v1/user/a%20b?op=OPEN&offset=10&user.name=alice");
}

TEST(UrlUtilsTest, BuildOperationUrlKeepsSlashesInValues) {
    auto url = url_utils::build_operation_url("http://nn1:50070", "/a", operation::rename,
                                              {{"destination", "/b/c"}});
    EXPECT_EQ(url, "http://nn1:50070/webhdfs/v1/a?op=RENAME&destination=/b/c");
}

TEST(UrlUtilsTest, OriginOf) {
    EXPECT_EQ(url_utils::origin_of("http://nn1:50070/webhdfs/v1/x?op=OPEN"), "http://nn1:50070");
    EXPECT_EQ(url_utils::origin_of("https://gateway"), "https://gateway");
    EXPECT_EQ(url_utils::origin_of("nn1:50070"), "");
}

TEST(UrlUtilsTest, ResolveAbsoluteLocation) {
    auto target = url_utils::resolve_location(
        "http://nn1:50070", "http://dn3:50075/webhdfs/v1/x?op=CREATE");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, "http://dn3:50075/webhdfs/v1/x?op=CREATE");
}

TEST(UrlUtilsTest, ResolveRootRelativeLocation) {
    auto target = url_utils::resolve_location("http://gw:14000/base", "/webhdfs/v1/x?op=OPEN");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, "http://gw:14000/webhdfs/v1/x?op=OPEN");
}

TEST(UrlUtilsTest, RejectMalformedLocation) {
    EXPECT_FALSE(url_utils::resolve_location("http://nn1:50070", "").has_value());
    EXPECT_FALSE(url_utils::resolve_location("http://nn1:50070", "http:///x").has_value());
    EXPECT_FALSE(url_utils::resolve_location("http://nn1:50070", "dn1/x").has_value());
}

}  // namespace kcenon::webhdfs::test
