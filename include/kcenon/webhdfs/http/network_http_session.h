// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file network_http_session.h
 * @brief http_session backed by the network_system HTTP client
 */

#ifndef KCENON_WEBHDFS_HTTP_NETWORK_HTTP_SESSION_H
#define KCENON_WEBHDFS_HTTP_NETWORK_HTTP_SESSION_H

#include "kcenon/webhdfs/http/http_session.h"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::webhdfs {

/**
 * @brief Production HTTP session
 *
 * Wraps the network_system HTTP client. Request bodies are drained before
 * the request is sent and response bodies are buffered, since the
 * underlying client exchanges whole messages. Extra headers (for example an
 * Authorization header built by an external negotiator) are attached to
 * every request.
 *
 * When the library is built without network_system, send() reports
 * error_code::not_available.
 *
 * @note This session is thread-safe for concurrent operations.
 */
class network_http_session : public http_session {
public:
    explicit network_http_session(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
        std::map<std::string, std::string> default_headers = {});

    ~network_http_session() override;

    network_http_session(const network_http_session&) = delete;
    auto operator=(const network_http_session&) -> network_http_session& = delete;
    network_http_session(network_http_session&&) noexcept;
    auto operator=(network_http_session&&) noexcept -> network_http_session&;

    auto send(const http_request& request) -> result<http_response> override;

    /**
     * @brief Check if the HTTP backend is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Map an HTTP client failure message to a transport error code
 *
 * Only failures that provably happened before the request left the client
 * (refused connection, unresolvable host) map to connection_refused.
 * Timeouts map to connection_timeout. Anything else may have reached the
 * server and maps to connection_lost.
 */
[[nodiscard]] auto classify_send_failure(std::string_view message) -> error_code;

/**
 * @brief Factory function to create the production session
 */
[[nodiscard]] auto make_network_http_session(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
    std::map<std::string, std::string> default_headers = {})
    -> std::shared_ptr<http_session>;

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_HTTP_NETWORK_HTTP_SESSION_H
