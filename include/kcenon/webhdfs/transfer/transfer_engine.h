// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file transfer_engine.h
 * @brief Concurrent upload and download of files and directory trees
 */

#ifndef KCENON_WEBHDFS_TRANSFER_TRANSFER_ENGINE_H
#define KCENON_WEBHDFS_TRANSFER_TRANSFER_ENGINE_H

#include "kcenon/webhdfs/client/client_types.h"
#include "kcenon/webhdfs/core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::webhdfs {

class webhdfs_client;

/**
 * @brief Direction of a transfer task
 */
enum class transfer_direction {
    upload,
    download
};

/**
 * @brief One file moved by a batch transfer
 */
struct transfer_task {
    std::string source;
    std::string destination;
    transfer_direction direction = transfer_direction::upload;
    uint64_t size = 0;
};

/**
 * @brief Moves files between the local filesystem and the cluster
 *
 * A batch is flattened into one task per file, sorted by source path, and
 * drained by a fixed-size worker pool. Each file is streamed chunk by chunk
 * into a temporary sibling of its destination and renamed into place only
 * after the whole stream succeeded, so a destination never holds partial
 * data.
 *
 * Without overwrite, an existing destination rejects the batch before any
 * data moves. A failing file does not stop the others; once every task has
 * finished the batch reports transfer_failed listing each failed path, and
 * files committed so far stay in place.
 *
 * Progress callbacks receive the source path with the cumulative byte count
 * at each chunk boundary and exactly one -1 when the file is done, whether
 * it succeeded or not.
 */
class transfer_engine {
public:
    explicit transfer_engine(webhdfs_client& client);

    /**
     * @brief Upload a local file or directory tree
     * @param local_path Local file or directory
     * @param remote_path Destination; an existing directory receives the
     *        source inside it
     */
    [[nodiscard]] auto upload(const std::string& local_path,
                              const std::string& remote_path,
                              const transfer_options& options) -> result<transfer_summary>;

    /**
     * @brief Download a remote file or directory tree
     * @param remote_path Source path
     * @param local_path Destination; an existing directory receives the
     *        source inside it
     */
    [[nodiscard]] auto download(const std::string& remote_path,
                                const std::string& local_path,
                                const transfer_options& options) -> result<transfer_summary>;

    /**
     * @brief Number of workers used for a batch
     *
     * nullopt gives one worker, 0 one worker per task, any other value is
     * capped by the task count. At least one worker is always used.
     */
    [[nodiscard]] static auto worker_count(std::optional<std::size_t> threads,
                                           std::size_t tasks) -> std::size_t;

    /**
     * @brief Hidden temporary name for a remote upload ("<dir>/.<name>.temp-<us>-<seq>")
     */
    [[nodiscard]] static auto remote_temp_path(const std::string& final_path) -> std::string;

    /**
     * @brief Temporary name for a local download ("<dir>/<name>.temp-<us>-<seq>")
     */
    [[nodiscard]] static auto local_temp_path(const std::string& final_path) -> std::string;

private:
    auto run_batch(const std::vector<transfer_task>& tasks,
                   const transfer_options& options) -> result<transfer_summary>;

    auto upload_file(const transfer_task& task, const transfer_options& options)
        -> result<uint64_t>;

    auto download_file(const transfer_task& task, const transfer_options& options)
        -> result<uint64_t>;

    webhdfs_client& client_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_TRANSFER_TRANSFER_ENGINE_H
