// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file webhdfs_client.h
 * @brief WebHDFS client public API
 */

#ifndef KCENON_WEBHDFS_CLIENT_WEBHDFS_CLIENT_H
#define KCENON_WEBHDFS_CLIENT_WEBHDFS_CLIENT_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/webhdfs/client/client_types.h"
#include "kcenon/webhdfs/client/read_stream.h"
#include "kcenon/webhdfs/client/write_stream.h"
#include "kcenon/webhdfs/config/client_config.h"
#include "kcenon/webhdfs/core/file_status.h"
#include "kcenon/webhdfs/core/types.h"
#include "kcenon/webhdfs/http/http_session.h"
#include "kcenon/webhdfs/transport/webhdfs_transport.h"

namespace kcenon::webhdfs {

/**
 * @brief Client for a WebHDFS or HttpFS cluster
 *
 * Every path argument goes through resolve() first, so relative paths are
 * taken from the configured root and may contain the #LATEST marker.
 *
 * @code
 * auto client = webhdfs_client::builder()
 *     .with_urls({"http://nn1:9870", "http://nn2:9870"})
 *     .with_root("/user/alice")
 *     .with_default_param("user.name", "alice")
 *     .build();
 * auto names = client.value().list("logs");
 * @endcode
 *
 * @note All operations are thread-safe.
 */
class webhdfs_client {
public:
    /**
     * @brief Builder for webhdfs_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Start from a complete configuration
         */
        auto with_config(client_config config) -> builder&;

        auto with_url(std::string url) -> builder&;

        auto with_urls(std::vector<std::string> urls) -> builder&;

        auto with_root(std::string root) -> builder&;

        /**
         * @brief Set the per-request timeout used for the default session
         */
        auto with_timeout(std::chrono::milliseconds timeout) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        auto with_chunk_size(std::size_t size) -> builder&;

        auto with_threads(std::optional<std::size_t> threads) -> builder&;

        /**
         * @brief Use a pre-authenticated session instead of the default one
         */
        auto with_session(std::shared_ptr<http_session> session) -> builder&;

        /**
         * @brief Add a query parameter sent with every namenode request
         */
        auto with_default_param(std::string key, std::string value) -> builder&;

        /**
         * @brief Build the client instance
         * @return Result containing the client or a config_error
         */
        [[nodiscard]] auto build() -> result<webhdfs_client>;

    private:
        client_config config_;
        std::shared_ptr<http_session> session_;
        query_params default_params_;
    };

    ~webhdfs_client();

    webhdfs_client(const webhdfs_client&) = delete;
    auto operator=(const webhdfs_client&) -> webhdfs_client& = delete;
    webhdfs_client(webhdfs_client&&) noexcept;
    auto operator=(webhdfs_client&&) noexcept -> webhdfs_client&;

    // ========================================================================
    // Paths and metadata
    // ========================================================================

    /**
     * @brief Canonical absolute form of a path
     */
    [[nodiscard]] auto resolve(const std::string& path) const -> result<std::string>;

    /**
     * @brief Status of a path
     * @param strict When false, a missing path yields an empty optional
     */
    [[nodiscard]] auto status(const std::string& path, bool strict = true)
        -> result<std::optional<file_status>>;

    /**
     * @brief Content summary of a path
     * @param strict When false, a missing path yields an empty optional
     */
    [[nodiscard]] auto content(const std::string& path, bool strict = true)
        -> result<std::optional<content_summary>>;

    /**
     * @brief Names of a directory's children, in server order
     * @return not_a_directory when the path is a file
     */
    [[nodiscard]] auto list(const std::string& path) -> result<std::vector<std::string>>;

    /**
     * @brief Names and statuses of a directory's children
     */
    [[nodiscard]] auto list_status(const std::string& path)
        -> result<std::vector<status_entry>>;

    /**
     * @brief Top-down traversal of a directory tree
     *
     * Walking a file yields nothing.
     */
    [[nodiscard]] auto walk(const std::string& path, const walk_options& options = {})
        -> result<std::vector<walk_entry>>;

    /**
     * @brief Part-files of a dataset directory sorted by index
     * @param indices Part indices to select, all parts when empty
     *
     * A file path yields itself.
     */
    [[nodiscard]] auto parts(const std::string& path, const std::vector<int>& indices = {})
        -> result<std::vector<status_entry>>;

    /**
     * @brief Paths matching a shell-style pattern
     */
    [[nodiscard]] auto glob(const std::string& pattern) -> result<std::vector<std::string>>;

    [[nodiscard]] auto checksum(const std::string& path) -> result<file_checksum>;

    // ========================================================================
    // Mutations
    // ========================================================================

    /**
     * @brief Create a directory and its missing parents
     */
    [[nodiscard]] auto makedirs(const std::string& path,
                                const std::optional<std::string>& permission = std::nullopt)
        -> result<void>;

    /**
     * @brief Move a file or directory
     *
     * When the destination is an existing directory the source is moved
     * inside it.
     */
    [[nodiscard]] auto rename(const std::string& source, const std::string& destination)
        -> result<void>;

    /**
     * @brief Delete a path
     * @return true if something was deleted, false if nothing existed
     */
    [[nodiscard]] auto remove(const std::string& path, bool recursive = false) -> result<bool>;

    [[nodiscard]] auto set_owner(const std::string& path,
                                 const std::optional<std::string>& owner,
                                 const std::optional<std::string>& group = std::nullopt)
        -> result<void>;

    [[nodiscard]] auto set_permission(const std::string& path, const std::string& permission)
        -> result<void>;

    [[nodiscard]] auto set_replication(const std::string& path, uint32_t replication)
        -> result<void>;

    /**
     * @brief Set access and modification times (milliseconds since epoch)
     */
    [[nodiscard]] auto set_times(const std::string& path,
                                 std::optional<int64_t> access_time,
                                 std::optional<int64_t> modification_time) -> result<void>;

    // ========================================================================
    // Streams
    // ========================================================================

    /**
     * @brief Open a remote file for reading
     */
    [[nodiscard]] auto read(const std::string& path, const read_options& options = {})
        -> result<read_stream>;

    /**
     * @brief Open a streaming writer
     * @return illegal_argument for conflicting options
     */
    [[nodiscard]] auto write(const std::string& path, const write_options& options = {})
        -> result<std::unique_ptr<write_stream>>;

    /**
     * @brief Write a complete buffer
     */
    [[nodiscard]] auto write(const std::string& path,
                             std::span<const uint8_t> data,
                             const write_options& options = {}) -> result<void>;

    [[nodiscard]] auto write(const std::string& path,
                             std::string_view data,
                             const write_options& options = {}) -> result<void>;

    // ========================================================================
    // Batch transfers
    // ========================================================================

    /**
     * @brief Upload a local file or directory
     * @return transfer_failed with per-path failures when some files failed
     */
    [[nodiscard]] auto upload(const std::string& local_path,
                              const std::string& remote_path,
                              const transfer_options& options = {})
        -> result<transfer_summary>;

    /**
     * @brief Download a remote file or directory
     * @return transfer_failed with per-path failures when some files failed
     */
    [[nodiscard]] auto download(const std::string& remote_path,
                                const std::string& local_path,
                                const transfer_options& options = {})
        -> result<transfer_summary>;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto config() const -> const client_config&;

    [[nodiscard]] auto transport() -> webhdfs_transport&;

private:
    webhdfs_client(client_config config,
                   std::unique_ptr<webhdfs_transport> transport);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CLIENT_WEBHDFS_CLIENT_H
