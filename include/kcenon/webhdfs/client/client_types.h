/**
 * @file client_types.h
 * @brief Option and result types of the WebHDFS client operations
 */

#ifndef KCENON_WEBHDFS_CLIENT_CLIENT_TYPES_H
#define KCENON_WEBHDFS_CLIENT_CLIENT_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/webhdfs/core/file_status.h"
#include "kcenon/webhdfs/transfer/progress_tracker.h"

namespace kcenon::webhdfs {

/// Default size of streamed chunks (64KB)
inline constexpr std::size_t default_chunk_size = 64 * 1024;

/**
 * @brief Read options
 */
struct read_options {
    uint64_t offset = 0;
    std::optional<uint64_t> length;
    std::optional<uint64_t> buffer_size;
    std::size_t chunk_size = default_chunk_size;
    /// Reports cumulative bytes per chunk, then -1 when the stream ends
    progress_callback progress;
};

/**
 * @brief Write options
 */
struct write_options {
    bool overwrite = false;
    bool append = false;
    /// Octal permission, e.g. "644"
    std::optional<std::string> permission;
    std::optional<uint64_t> blocksize;
    std::optional<uint32_t> replication;
    std::optional<uint64_t> buffer_size;
    /// Chunks buffered between the writer and the request thread
    std::size_t queue_depth = 16;
};

/**
 * @brief Walk options
 */
struct walk_options {
    /// Maximum depth to descend, 0 for unlimited
    std::size_t depth = 0;
    /// Return nothing instead of file_not_found for a missing root
    bool ignore_missing = false;
};

/**
 * @brief One directory visited by walk()
 */
struct walk_entry {
    std::string path;
    file_status status;
    std::vector<status_entry> directories;
    std::vector<status_entry> files;
};

/**
 * @brief Batch transfer options
 */
struct transfer_options {
    /// nullopt runs sequentially, 0 allocates one worker per file
    std::optional<std::size_t> threads;
    std::size_t chunk_size = default_chunk_size;
    bool overwrite = false;
    progress_callback progress;
    /// Permission of uploaded files
    std::optional<std::string> permission;
};

/**
 * @brief Outcome of a successful batch transfer
 */
struct transfer_summary {
    std::size_t files = 0;
    uint64_t bytes = 0;
    std::chrono::milliseconds elapsed{0};
    /// Final paths that were committed, in task order
    std::vector<std::string> committed;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CLIENT_CLIENT_TYPES_H
