// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file webhdfs_transport.h
 * @brief Fault-tolerant execution of WebHDFS operations
 */

#ifndef KCENON_WEBHDFS_TRANSPORT_WEBHDFS_TRANSPORT_H
#define KCENON_WEBHDFS_TRANSPORT_WEBHDFS_TRANSPORT_H

#include "kcenon/webhdfs/core/types.h"
#include "kcenon/webhdfs/http/http_session.h"
#include "kcenon/webhdfs/transport/operation.h"
#include "kcenon/webhdfs/transport/retry_policy.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::webhdfs {

/**
 * @brief Transport configuration
 */
struct transport_config {
    /// Candidate namenode base URLs of one logical cluster, in failover order
    std::vector<std::string> endpoints;

    /// Retry policy for idempotent operations
    retry_policy retry;

    /// Parameters appended to every namenode request (user.name, delegation)
    query_params default_params;
};

/**
 * @brief Executes filesystem operations against a list of namenodes
 *
 * Every request starts at the active endpoint. Connection failures, 5xx
 * answers and StandbyException move the active pointer to the next
 * candidate and the same operation is sent there; a successful answer pins
 * the pointer to the endpoint that produced it. When every candidate has
 * failed the call reports network_error.
 *
 * Idempotent operations repeat the sweep up to retry_policy::max_attempts
 * with exponential backoff. For APPEND, RENAME, DELETE and CREATE without
 * overwrite, a failure after the request may have reached the server
 * (timeout, lost connection, 5xx) is reported immediately.
 *
 * Data operations (OPEN, CREATE, APPEND and a redirected GETFILECHECKSUM)
 * run in two phases: the namenode answers with a redirect and the payload
 * is exchanged with the redirect target. The body of a write is only pulled
 * in the second phase, so a failover during the first phase never consumes
 * it.
 *
 * @code
 * auto t = webhdfs_transport::create(session, config);
 * auto status = t.value()->execute_json(operation::get_file_status, "/data");
 * @endcode
 *
 * @note All methods are thread-safe. The active endpoint pointer is the only
 *       state shared between concurrent calls.
 */
class webhdfs_transport {
public:
    /**
     * @brief Create a transport
     * @return config_error when no endpoint is configured or the session is null
     */
    [[nodiscard]] static auto create(std::shared_ptr<http_session> session,
                                     transport_config config)
        -> result<std::unique_ptr<webhdfs_transport>>;

    ~webhdfs_transport();

    webhdfs_transport(const webhdfs_transport&) = delete;
    auto operator=(const webhdfs_transport&) -> webhdfs_transport& = delete;

    /**
     * @brief Execute one operation
     * @param op Operation
     * @param path Canonical absolute remote path
     * @param params Operation parameters
     * @param body Payload for CREATE and APPEND
     * @return Successful response; for OPEN its body streams the file data
     */
    [[nodiscard]] auto execute(operation op,
                               const std::string& path,
                               const query_params& params = {},
                               body_source body = {}) -> result<http_response>;

    /**
     * @brief Execute an operation and parse its JSON answer
     * @return protocol_error when the answer is not valid JSON
     */
    [[nodiscard]] auto execute_json(operation op,
                                    const std::string& path,
                                    const query_params& params = {})
        -> result<nlohmann::json>;

    [[nodiscard]] auto active_endpoint() const -> std::string;

    [[nodiscard]] auto active_index() const -> std::size_t;

    [[nodiscard]] auto endpoints() const -> const std::vector<std::string>&;

    [[nodiscard]] auto policy() const -> const retry_policy&;

private:
    webhdfs_transport(std::shared_ptr<http_session> session, transport_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_TRANSPORT_WEBHDFS_TRANSPORT_H
