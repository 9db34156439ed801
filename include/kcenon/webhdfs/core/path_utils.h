// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file path_utils.h
 * @brief Remote path manipulation helpers
 *
 * Remote paths always use '/' as separator regardless of the local platform.
 */

#ifndef KCENON_WEBHDFS_CORE_PATH_UTILS_H
#define KCENON_WEBHDFS_CORE_PATH_UTILS_H

#include "kcenon/webhdfs/core/types.h"

#include <string>
#include <string_view>
#include <vector>

namespace kcenon::webhdfs::path_utils {

/**
 * @brief Split a path into its non-empty segments
 */
[[nodiscard]] auto split(std::string_view path) -> std::vector<std::string>;

/**
 * @brief Canonicalize an absolute path
 *
 * Collapses repeated separators, drops "." segments, folds ".." segments
 * and removes any trailing separator except for the root itself.
 *
 * @return invalid_path when the path is not absolute or ".." climbs above
 *         the root
 */
[[nodiscard]] auto normalize(std::string_view path) -> result<std::string>;

/**
 * @brief Join two remote paths (an absolute rhs replaces lhs)
 */
[[nodiscard]] auto join(std::string_view lhs, std::string_view rhs) -> std::string;

/**
 * @brief Parent of a canonical path ("/" for top-level entries and the root)
 */
[[nodiscard]] auto parent(std::string_view path) -> std::string;

/**
 * @brief Last segment of a path (empty for the root)
 */
[[nodiscard]] auto base_name(std::string_view path) -> std::string;

/**
 * @brief Path of descendant relative to ancestor, or empty if not below it
 */
[[nodiscard]] auto relative_to(std::string_view descendant,
                               std::string_view ancestor) -> std::string;

}  // namespace kcenon::webhdfs::path_utils

#endif  // KCENON_WEBHDFS_CORE_PATH_UTILS_H
