// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file url_utils.h
 * @brief URL helpers for WebHDFS request construction
 */

#ifndef KCENON_WEBHDFS_TRANSPORT_URL_UTILS_H
#define KCENON_WEBHDFS_TRANSPORT_URL_UTILS_H

#include "kcenon/webhdfs/transport/operation.h"

#include <optional>
#include <string>

namespace kcenon::webhdfs::url_utils {

/// REST prefix under every endpoint
inline constexpr const char* api_prefix = "/webhdfs/v1";

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes
 */
[[nodiscard]] auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Decode percent escapes ('+' is kept as is)
 */
[[nodiscard]] auto url_decode(const std::string& value) -> std::string;

/**
 * @brief Build the namenode URL for an operation
 * @param endpoint Base URL (trailing separators are ignored)
 * @param path Canonical absolute remote path
 * @param op Operation
 * @param params Operation parameters, appended after op in order
 */
[[nodiscard]] auto build_operation_url(const std::string& endpoint,
                                       const std::string& path,
                                       operation op,
                                       const query_params& params) -> std::string;

/**
 * @brief Resolve a redirect Location header against the endpoint it came from
 * @return Absolute URL, or nullopt when the location is malformed
 */
[[nodiscard]] auto resolve_location(const std::string& endpoint,
                                    const std::string& location) -> std::optional<std::string>;

/**
 * @brief Extract "scheme://host[:port]" from a URL
 */
[[nodiscard]] auto origin_of(const std::string& url) -> std::string;

}  // namespace kcenon::webhdfs::url_utils

#endif  // KCENON_WEBHDFS_TRANSPORT_URL_UTILS_H
