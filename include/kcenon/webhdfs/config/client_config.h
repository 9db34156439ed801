// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file client_config.h
 * @brief Client configuration and option parsing
 */

#ifndef KCENON_WEBHDFS_CONFIG_CLIENT_CONFIG_H
#define KCENON_WEBHDFS_CONFIG_CLIENT_CONFIG_H

#include "kcenon/webhdfs/client/client_types.h"
#include "kcenon/webhdfs/core/types.h"
#include "kcenon/webhdfs/transport/retry_policy.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::webhdfs {

/// Kind used when the configuration names none
inline constexpr const char* default_client_kind = "insecure";

/**
 * @brief Client configuration
 *
 * The configuration is supplied by an external layer (a config file reader,
 * the CLI, environment variables). Only its option map form is defined here.
 */
struct client_config {
    /// Namenode base URLs of one cluster, in failover order
    std::vector<std::string> urls;

    /// Root for relative paths, empty to require absolute paths
    std::string root;

    /// Per-request timeout
    std::chrono::milliseconds timeout{30000};

    retry_policy retry;

    /// Default chunk size for streams and transfers
    std::size_t chunk_size = default_chunk_size;

    /// Default worker count for transfers (nullopt runs sequentially)
    std::optional<std::size_t> threads;

    /// Registered client kind
    std::string kind = default_client_kind;

    /// Kind-specific options (user, token, ...)
    std::map<std::string, std::string> options;

    /**
     * @brief Check that the configuration can create a client
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Build a configuration from string options
     *
     * Recognized keys: url (';' separated), root, timeout (seconds),
     * retries, retry_delay (milliseconds), chunk_size, threads, client.
     * Every other key is kept as a kind-specific option.
     *
     * @return config_error for a missing url or a malformed number
     */
    [[nodiscard]] static auto from_options(const std::map<std::string, std::string>& options)
        -> result<client_config>;
};

/**
 * @brief Split a ';' separated URL list, trimming blanks
 */
[[nodiscard]] auto split_urls(const std::string& value) -> std::vector<std::string>;

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CONFIG_CLIENT_CONFIG_H
