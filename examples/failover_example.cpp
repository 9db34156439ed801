/**
 * @file failover_example.cpp
 * @brief High-availability namenode failover
 *
 * This example demonstrates:
 * - Configuring several namenode URLs of one cluster
 * - Tuning the retry policy
 * - Observing which endpoint became active
 */

#include <kcenon/webhdfs/webhdfs.h>

#include <iostream>
#include <string>
#include <vector>

using namespace kcenon::webhdfs;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <path> <url1> [url2] ..." << std::endl;
        return 1;
    }

    std::vector<std::string> urls(argv + 2, argv + argc);

    retry_policy policy;
    policy.max_attempts = 5;
    policy.initial_delay = std::chrono::milliseconds{200};
    policy.max_delay = std::chrono::milliseconds{5000};

    get_logger().set_level(log_level::info);

    auto client_result = webhdfs_client::builder()
        .with_urls(urls)
        .with_retry_policy(policy)
        .build();
    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    auto status = client.status(argv[1]);
    if (!status.has_value()) {
        std::cerr << "Status failed: " << status.error().message << std::endl;
        return 1;
    }

    std::cout << status.value()->to_json().dump(2) << std::endl;
    std::cout << "Active namenode: " << client.transport().active_endpoint() << std::endl;
    return 0;
}
