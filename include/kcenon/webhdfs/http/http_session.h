// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file http_session.h
 * @brief HTTP session abstraction consumed by the transport
 *
 * The session is built outside the core (it owns authentication, TLS and
 * connection pooling) and injected into the transport. Request bodies are
 * pulled through a body_source so uploads are streamed chunk by chunk;
 * response bodies are exposed through a scoped body_reader that releases
 * the underlying connection when destroyed.
 */

#ifndef KCENON_WEBHDFS_HTTP_HTTP_SESSION_H
#define KCENON_WEBHDFS_HTTP_HTTP_SESSION_H

#include "kcenon/webhdfs/core/types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::webhdfs {

/**
 * @brief Pull-style request body
 *
 * Fills the given buffer and returns the number of bytes written; 0 marks
 * the end of the body. An error aborts the request.
 */
using body_source = std::function<result<std::size_t>(std::span<std::byte>)>;

/**
 * @brief Forward-only response body
 */
class body_reader {
public:
    virtual ~body_reader() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read, 0 at end of body
     */
    virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief body_reader over an in-memory payload
 */
class buffered_body_reader : public body_reader {
public:
    explicit buffered_body_reader(std::vector<uint8_t> data)
        : data_(std::move(data)) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

private:
    std::vector<uint8_t> data_;
    std::size_t position_ = 0;
};

/**
 * @brief HTTP request handed to the session
 */
struct http_request {
    std::string method;
    std::string url;
    std::map<std::string, std::string> headers;

    /// Empty when the request carries no body
    body_source body;
};

/**
 * @brief HTTP response returned by the session
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::unique_ptr<body_reader> body;

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string>;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_redirect() const noexcept -> bool {
        return status_code == 301 || status_code == 302 ||
               status_code == 303 || status_code == 307 || status_code == 308;
    }

    [[nodiscard]] auto is_server_error() const noexcept -> bool {
        return status_code >= 500 && status_code < 600;
    }

    /**
     * @brief Drain the remaining body into a string
     */
    [[nodiscard]] auto read_body_string() -> result<std::string>;
};

/**
 * @brief Pre-authenticated HTTP session
 *
 * Implementations must not follow redirects: the transport drives the
 * namenode/datanode exchange itself. Connection-level failures are reported
 * with the network error codes (connection_refused, connection_timeout, ...).
 *
 * @note Implementations must be safe for concurrent send() calls.
 */
class http_session {
public:
    virtual ~http_session() = default;

    virtual auto send(const http_request& request) -> result<http_response> = 0;
};

/**
 * @brief Drain a body source into memory (for backends without streaming)
 * @param source Body source to drain
 * @param block_size Size of each pull
 */
[[nodiscard]] auto drain_body_source(const body_source& source,
                                     std::size_t block_size = 64 * 1024)
    -> result<std::vector<uint8_t>>;

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_HTTP_HTTP_SESSION_H
