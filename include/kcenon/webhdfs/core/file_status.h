// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file file_status.h
 * @brief Server-reported file attributes
 */

#ifndef KCENON_WEBHDFS_CORE_FILE_STATUS_H
#define KCENON_WEBHDFS_CORE_FILE_STATUS_H

#include "kcenon/webhdfs/core/types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::webhdfs {

/**
 * @brief Type of a remote entry
 */
enum class file_type {
    file,
    directory,
    symlink,
};

[[nodiscard]] constexpr auto to_string(file_type type) -> const char* {
    switch (type) {
        case file_type::file: return "FILE";
        case file_type::directory: return "DIRECTORY";
        case file_type::symlink: return "SYMLINK";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Snapshot of a FileStatus object
 */
struct file_status {
    /// Name relative to the listed directory; empty for GETFILESTATUS
    std::string path_suffix;
    file_type type = file_type::file;
    uint64_t length = 0;
    /// Milliseconds since the epoch
    int64_t modification_time = 0;
    int64_t access_time = 0;
    /// Octal permission string, e.g. "755"
    std::string permission;
    std::string owner;
    std::string group;
    uint32_t replication = 0;
    uint64_t block_size = 0;

    [[nodiscard]] auto is_directory() const noexcept -> bool {
        return type == file_type::directory;
    }

    [[nodiscard]] auto to_json() const -> nlohmann::json;

    /**
     * @brief Parse a FileStatus JSON object
     * @return protocol_error when required fields are missing
     */
    [[nodiscard]] static auto from_json(const nlohmann::json& object) -> result<file_status>;
};

/**
 * @brief ContentSummary of a path
 */
struct content_summary {
    uint64_t length = 0;
    uint64_t file_count = 0;
    uint64_t directory_count = 0;
    int64_t quota = -1;
    uint64_t space_consumed = 0;
    int64_t space_quota = -1;

    [[nodiscard]] auto to_json() const -> nlohmann::json;

    [[nodiscard]] static auto from_json(const nlohmann::json& object) -> result<content_summary>;
};

/**
 * @brief FileChecksum of a file
 */
struct file_checksum {
    std::string algorithm;
    std::string bytes;
    uint64_t length = 0;

    [[nodiscard]] static auto from_json(const nlohmann::json& object) -> result<file_checksum>;
};

/**
 * @brief Name and status of a directory child
 */
using status_entry = std::pair<std::string, file_status>;

/**
 * @brief Parse a LISTSTATUS answer, preserving server order
 */
[[nodiscard]] auto parse_listing(const nlohmann::json& answer) -> result<std::vector<file_status>>;

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CORE_FILE_STATUS_H
