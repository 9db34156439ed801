// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file glob_pattern.h
 * @brief Shell-style wildcard matching for remote names
 */

#ifndef KCENON_WEBHDFS_CORE_GLOB_PATTERN_H
#define KCENON_WEBHDFS_CORE_GLOB_PATTERN_H

#include <string_view>

namespace kcenon::webhdfs::glob_pattern {

/**
 * @brief Whether a string contains wildcard characters ('*', '?' or '[')
 */
[[nodiscard]] auto has_magic(std::string_view text) noexcept -> bool;

/**
 * @brief Whether a name is hidden (starts with a dot)
 */
[[nodiscard]] auto is_hidden(std::string_view name) noexcept -> bool;

/**
 * @brief Match a single name against a pattern
 *
 * Supports '*', '?', '[seq]' and '[!seq]' with ranges. An unterminated
 * '[' matches itself. Matching is case-sensitive.
 */
[[nodiscard]] auto matches(std::string_view name, std::string_view pattern) -> bool;

}  // namespace kcenon::webhdfs::glob_pattern

#endif  // KCENON_WEBHDFS_CORE_GLOB_PATTERN_H
