// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file path_resolver.h
 * @brief Root-relative path resolution and the #LATEST marker
 */

#ifndef KCENON_WEBHDFS_RESOLVER_PATH_RESOLVER_H
#define KCENON_WEBHDFS_RESOLVER_PATH_RESOLVER_H

#include "kcenon/webhdfs/core/file_status.h"
#include "kcenon/webhdfs/core/types.h"

#include <functional>
#include <string>
#include <vector>

namespace kcenon::webhdfs {

/**
 * @brief Lists the direct children of a canonical directory path
 *
 * A single FileStatus with an empty pathSuffix means the path is a file.
 */
using directory_lister =
    std::function<result<std::vector<file_status>>(const std::string&)>;

/**
 * @brief Turns user paths into canonical absolute remote paths
 *
 * Relative paths are joined with the configured root exactly once; absolute
 * paths only get normalized. A "#LATEST" segment is replaced by the child
 * of its parent directory with the greatest modification time, found with
 * one listing. Ties go to the child listed first.
 *
 * @code
 * path_resolver resolver("/user/alice", lister);
 * auto p = resolver.resolve("logs/#LATEST/part-0");  // "/user/alice/logs/<newest>/part-0"
 * @endcode
 *
 * @note Thread-safe; the resolver holds no mutable state.
 */
class path_resolver {
public:
    /// Marker segment replaced by the most recently modified child
    static constexpr const char* latest_marker = "#LATEST";

    /**
     * @param root Absolute root for relative paths, may be empty
     * @param lister Directory listing used for marker resolution
     */
    path_resolver(std::string root, directory_lister lister);

    /**
     * @brief Resolve a path
     * @return invalid_path for an empty or escaping path, config_error for a
     *         relative path without root or bad marker usage,
     *         file_not_found when the marker's parent has no children
     */
    [[nodiscard]] auto resolve(const std::string& path) const -> result<std::string>;

    [[nodiscard]] auto root() const -> const std::string& { return root_; }

private:
    [[nodiscard]] auto resolve_latest(const std::string& parent) const -> result<std::string>;

    std::string root_;
    directory_lister lister_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_RESOLVER_PATH_RESOLVER_H
