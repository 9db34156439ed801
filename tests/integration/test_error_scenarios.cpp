/**
 * @file test_error_scenarios.cpp
 * @brief Failure handling of batch transfers: fail-fast checks, partial
 *        failures, interrupted streams and endpoint failover
 */

#include "test_fixtures.h"

#include <map>
#include <mutex>

namespace kcenon::webhdfs::test {

namespace {

auto contains_temp(const std::vector<std::string>& paths) -> bool {
    return std::any_of(paths.begin(), paths.end(),
        [](const std::string& p) { return p.find(".temp-") != std::string::npos; });
}

/**
 * @brief Records progress signals per path
 */
class signal_recorder {
public:
    auto callback() -> progress_callback {
        return [this](const std::string& path, int64_t bytes) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (bytes == progress_done) {
                ++done_[path];
            }
        };
    }

    auto done_counts() const -> std::map<std::string, int> {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, int> done_;
};

}  // namespace

class TransferErrorTest : public ClusterFixture {
protected:
    void SetUp() override {
        ClusterFixture::SetUp();
        cluster_->put_directory("/user/test");
    }
};

// ============================================================================
// Fail-fast destination checks
// ============================================================================

TEST_F(TransferErrorTest, ExistingRemoteFileRejectsUploadBeforeAnyData) {
    cluster_->put_file("/user/test/existing.txt", "keep me");
    auto client = make_client();
    auto local = create_local_file("existing.txt", "replacement");

    auto uploaded = client.upload(local.string(), "existing.txt");
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::already_exists);
    EXPECT_EQ(cluster_->count("CREATE"), 0u);
    EXPECT_EQ(cluster_->count("CREATE", true), 0u);
    EXPECT_EQ(cluster_->file_content("/user/test/existing.txt"), "keep me");
}

TEST_F(TransferErrorTest, ExistingRemoteDirectoryTargetRejectsUpload) {
    cluster_->put_file("/user/test/inbox/tree/old.txt", "old");
    create_local_file("tree/new.txt", "new");
    auto client = make_client();

    auto uploaded = client.upload((test_dir_ / "tree").string(), "inbox");
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::already_exists);
    EXPECT_FALSE(cluster_->exists("/user/test/inbox/tree/new.txt"));
}

TEST_F(TransferErrorTest, ExistingLocalFileRejectsDownloadBeforeAnyData) {
    cluster_->put_file("/user/test/report.csv", "remote");
    auto local = create_local_file("report.csv", "local");
    auto client = make_client();

    auto downloaded = client.download("report.csv", local.string());
    ASSERT_FALSE(downloaded.has_value());
    EXPECT_EQ(downloaded.error().code, error_code::already_exists);
    EXPECT_EQ(cluster_->count("OPEN"), 0u);
    EXPECT_EQ(read_local_file(local), "local");

    transfer_options options;
    options.overwrite = true;
    ASSERT_TRUE(client.download("report.csv", local.string(), options).has_value());
    EXPECT_EQ(read_local_file(local), "remote");
}

TEST_F(TransferErrorTest, MissingRemoteSourceFails) {
    auto client = make_client();
    auto downloaded = client.download("missing", (test_dir_ / "out").string());
    ASSERT_FALSE(downloaded.has_value());
    EXPECT_EQ(downloaded.error().code, error_code::file_not_found);
}

// ============================================================================
// Partial failures
// ============================================================================

TEST_F(TransferErrorTest, FailedUploadIsReportedWhileOthersCommit) {
    create_local_file("batch/good-1.txt", "one");
    create_local_file("batch/bad.txt", "broken");
    create_local_file("batch/good-2.txt", "two");
    cluster_->fail_writes_matching("bad.txt");
    auto client = make_client();

    signal_recorder recorder;
    transfer_options options;
    options.threads = 2;
    options.progress = recorder.callback();

    auto uploaded = client.upload((test_dir_ / "batch").string(), "out", options);
    ASSERT_FALSE(uploaded.has_value());
    const auto& err = uploaded.error();
    EXPECT_EQ(err.code, error_code::transfer_failed);
    ASSERT_EQ(err.failures.size(), 1u);
    EXPECT_NE(err.failures[0].path.find("bad.txt"), std::string::npos);
    EXPECT_EQ(err.message.rfind("1 of 3 file(s) failed to transfer:", 0), 0u) << err.message;

    EXPECT_EQ(cluster_->file_content("/user/test/out/good-1.txt"), "one");
    EXPECT_EQ(cluster_->file_content("/user/test/out/good-2.txt"), "two");
    EXPECT_FALSE(cluster_->exists("/user/test/out/bad.txt"));
    EXPECT_FALSE(contains_temp(cluster_->paths()));

    auto done = recorder.done_counts();
    ASSERT_EQ(done.size(), 3u);
    for (const auto& [path, count] : done) {
        EXPECT_EQ(count, 1) << path;
    }
}

TEST_F(TransferErrorTest, InterruptedDownloadLeavesNoPartialFile) {
    cluster_->put_file("/user/test/data/big.bin", create_random_content(50000));
    cluster_->put_file("/user/test/data/small.bin", "small");
    cluster_->truncate_reads_matching("big.bin");
    auto client = make_client();

    signal_recorder recorder;
    transfer_options options;
    options.chunk_size = 4096;
    options.progress = recorder.callback();

    auto target = test_dir_ / "data";
    auto downloaded = client.download("data", target.string(), options);
    ASSERT_FALSE(downloaded.has_value());
    EXPECT_EQ(downloaded.error().code, error_code::transfer_failed);
    ASSERT_EQ(downloaded.error().failures.size(), 1u);
    EXPECT_EQ(downloaded.error().failures[0].path, "/user/test/data/big.bin");

    EXPECT_EQ(local_tree(target), (std::vector<std::string>{"small.bin"}));
    EXPECT_EQ(recorder.done_counts().at("/user/test/data/big.bin"), 1);
}

TEST_F(TransferErrorTest, EveryFileFailing) {
    create_local_file("all/a.txt", "a");
    create_local_file("all/b.txt", "b");
    cluster_->fail_writes_matching(".txt");
    auto client = make_client();

    transfer_options options;
    options.threads = 0;
    auto uploaded = client.upload((test_dir_ / "all").string(), "all", options);
    ASSERT_FALSE(uploaded.has_value());
    ASSERT_EQ(uploaded.error().failures.size(), 2u);
    EXPECT_LT(uploaded.error().failures[0].path, uploaded.error().failures[1].path);
    EXPECT_FALSE(contains_temp(cluster_->paths()));
}

// ============================================================================
// Endpoint failures
// ============================================================================

TEST_F(TransferErrorTest, UploadFailsOverToStandbyPair) {
    auto cluster = std::make_shared<fake_webhdfs_cluster>(
        std::vector<std::string>{"http://nn1:50070", "http://nn2:50070"});
    cluster->put_directory("/user/test");
    cluster->set_endpoint_state("http://nn1:50070", fake_webhdfs_cluster::endpoint_state::standby);

    auto client = webhdfs_client::builder()
        .with_urls({"http://nn1:50070", "http://nn2:50070"})
        .with_root("/user/test")
        .with_retry_policy(retry_policy::immediate())
        .with_session(cluster)
        .build();
    ASSERT_TRUE(client.has_value());

    auto local = create_local_file("ha.txt", "highly available");
    auto uploaded = client.value().upload(local.string(), "ha.txt");
    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().message;
    EXPECT_EQ(cluster->file_content("/user/test/ha.txt"), "highly available");
    EXPECT_EQ(client.value().transport().active_endpoint(), "http://nn2:50070");
}

TEST_F(TransferErrorTest, TransientNamenodeFailureIsRetried) {
    cluster_->put_file("/user/test/flaky.txt", "eventually");
    auto client = make_client();
    cluster_->drop_next_namenode_requests(1);

    auto target = test_dir_ / "flaky.txt";
    auto downloaded = client.download("flaky.txt", target.string());
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
    EXPECT_EQ(read_local_file(target), "eventually");
}

TEST_F(TransferErrorTest, UnreachableClusterIsNetworkError) {
    cluster_->set_endpoint_state("http://nn1:50070",
                                 fake_webhdfs_cluster::endpoint_state::unreachable);
    auto client = make_client();

    auto status = client.status("anything");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, error_code::network_error);
}

}  // namespace kcenon::webhdfs::test
