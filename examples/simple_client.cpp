/**
 * @file simple_client.cpp
 * @brief Basic WebHDFS client example
 *
 * This example demonstrates how to:
 * - Build a client for one namenode with a root directory
 * - Write and read a small file through streams
 * - List a directory and print file status
 * - Resolve a path that uses the #LATEST marker
 */

#include <kcenon/webhdfs/webhdfs.h>

#include <iostream>
#include <string>

using namespace kcenon::webhdfs;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <namenode_url> [root] [user]" << std::endl;
    std::cout << std::endl;
    std::cout << "Example:" << std::endl;
    std::cout << "  " << program << " http://localhost:9870 /tmp/webhdfs-demo alice" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string url = argv[1];
    std::string root = argc >= 3 ? argv[2] : "/tmp/webhdfs-demo";

    webhdfs_client::builder builder;
    builder.with_url(url).with_root(root);
    if (argc >= 4) {
        builder.with_default_param("user.name", argv[3]);
    }

    auto client_result = builder.build();
    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    std::cout << "=== Write ===" << std::endl;
    write_options write;
    write.overwrite = true;
    auto written = client.write("runs/run-1/hello.txt", std::string_view("Hello, WebHDFS!\n"), write);
    if (!written.has_value()) {
        std::cerr << "Write failed: " << written.error().message << std::endl;
        return 1;
    }

    std::cout << "=== Read ===" << std::endl;
    auto stream = client.read("runs/#LATEST/hello.txt");
    if (!stream.has_value()) {
        std::cerr << "Read failed: " << stream.error().message << std::endl;
        return 1;
    }
    auto data = stream.value().read_all();
    if (!data.has_value()) {
        std::cerr << "Read failed: " << data.error().message << std::endl;
        return 1;
    }
    std::cout << std::string(data.value().begin(), data.value().end());

    std::cout << "=== List ===" << std::endl;
    auto entries = client.list_status("runs/run-1");
    if (!entries.has_value()) {
        std::cerr << "List failed: " << entries.error().message << std::endl;
        return 1;
    }
    for (const auto& [name, status] : entries.value()) {
        std::cout << "  " << name << " (" << status.length << " bytes, "
                  << to_string(status.type) << ")" << std::endl;
    }

    auto resolved = client.resolve("runs/#LATEST");
    if (resolved.has_value()) {
        std::cout << "Latest run: " << resolved.value() << std::endl;
    }

    return 0;
}
