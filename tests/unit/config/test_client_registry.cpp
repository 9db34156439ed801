/**
 * @file test_client_registry.cpp
 * @brief Unit tests for client_registry
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/webhdfs/config/client_registry.h>

namespace kcenon::webhdfs::test {

class ClientRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        cluster_ = std::make_shared<fake_webhdfs_cluster>();
        cluster_->put_directory("/data");
        config_.urls = {"http://nn1:50070"};
        config_.retry = retry_policy::immediate();
    }

    std::shared_ptr<fake_webhdfs_cluster> cluster_;
    client_config config_;
};

TEST_F(ClientRegistryTest, BuiltinKinds) {
    auto registry = client_registry::with_builtin_kinds();
    EXPECT_TRUE(registry.contains("insecure"));
    EXPECT_TRUE(registry.contains("token"));
    EXPECT_FALSE(registry.contains("kerberos"));
    EXPECT_EQ(registry.kinds(), (std::vector<std::string>{"insecure", "token"}));
}

TEST_F(ClientRegistryTest, InsecureKindSendsUserName) {
    config_.options["user"] = "alice";
    auto client = client_registry::with_builtin_kinds().create(config_, cluster_);
    ASSERT_TRUE(client.has_value()) << client.error().message;

    ASSERT_TRUE(client.value().status("/data").has_value());
    auto requests = cluster_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].params.at("user.name"), "alice");
}

TEST_F(ClientRegistryTest, InsecureKindWithoutUser) {
    auto client = client_registry::with_builtin_kinds().create(config_, cluster_);
    ASSERT_TRUE(client.has_value());

    ASSERT_TRUE(client.value().status("/data").has_value());
    EXPECT_EQ(cluster_->requests()[0].params.count("user.name"), 0u);
}

TEST_F(ClientRegistryTest, TokenKindSendsDelegation) {
    config_.kind = "token";
    config_.options["token"] = "s3cr3t";
    auto client = client_registry::with_builtin_kinds().create(config_, cluster_);
    ASSERT_TRUE(client.has_value());

    ASSERT_TRUE(client.value().status("/data").has_value());
    EXPECT_EQ(cluster_->requests()[0].params.at("delegation"), "s3cr3t");
}

TEST_F(ClientRegistryTest, TokenKindRequiresToken) {
    config_.kind = "token";
    auto client = client_registry::with_builtin_kinds().create(config_, cluster_);
    ASSERT_FALSE(client.has_value());
    EXPECT_EQ(client.error().code, error_code::config_error);
}

TEST_F(ClientRegistryTest, UnknownKindIsConfigError) {
    config_.kind = "kerberos";
    auto client = client_registry::with_builtin_kinds().create(config_, cluster_);
    ASSERT_FALSE(client.has_value());
    EXPECT_EQ(client.error().code, error_code::config_error);
}

TEST_F(ClientRegistryTest, CustomKind) {
    auto registry = client_registry::with_builtin_kinds();
    int created = 0;
    registry.register_kind("custom",
        [&created](const client_config& config, std::shared_ptr<http_session> session) {
            ++created;
            return webhdfs_client::builder()
                .with_config(config)
                .with_root("/custom")
                .with_session(std::move(session))
                .build();
        });

    config_.kind = "custom";
    auto client = registry.create(config_, cluster_);
    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(created, 1);
    EXPECT_EQ(client.value().config().root, "/custom");
}

TEST_F(ClientRegistryTest, InvalidConfigIsRejectedBeforeFactory) {
    config_.urls.clear();
    auto client = client_registry::with_builtin_kinds().create(config_, cluster_);
    ASSERT_FALSE(client.has_value());
    EXPECT_EQ(client.error().code, error_code::config_error);
}

}  // namespace kcenon::webhdfs::test
