/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_WEBHDFS_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_WEBHDFS_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/webhdfs/http/http_session.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace kcenon::webhdfs::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with the given content
     * @param name File name, may contain subdirectories
     */
    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Minimal in-memory namenode and datanode pair
 *
 * Serves the operations a transfer issues (status, listing, mkdirs, create,
 * open, rename, delete) with the same two-phase redirects as a real cluster,
 * so benchmarks measure client overhead rather than the network.
 */
class memory_cluster : public http_session {
public:
    static constexpr const char* namenode_url = "http://bench-nn:50070";

    memory_cluster();

    auto send(const http_request& request) -> result<http_response> override;

    [[nodiscard]] auto file_count() const -> std::size_t;

private:
    auto namenode(const std::string& op, const std::string& path,
                  const std::map<std::string, std::string>& params,
                  const std::string& url) -> http_response;

    auto datanode(const std::string& op, const std::string& path,
                  const std::map<std::string, std::string>& params,
                  const http_request& request) -> result<http_response>;

    void make_parents(const std::string& path);

    mutable std::mutex mutex_;
    std::set<std::string> directories_;
    std::map<std::string, std::string> files_;
};

/**
 * @brief Format bytes as human-readable string
 * @return Formatted string (e.g., "1.50 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 4 * MB;
constexpr std::size_t large_file = 32 * MB;

constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t default_chunk = 1 * MB;
constexpr std::size_t max_chunk = 8 * MB;
}  // namespace sizes

}  // namespace kcenon::webhdfs::benchmark

#endif  // KCENON_WEBHDFS_BENCHMARKS_BENCHMARK_HELPERS_H
