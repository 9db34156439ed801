// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file write_stream.h
 * @brief Push-style writer feeding a streaming CREATE or APPEND request
 */

#ifndef KCENON_WEBHDFS_CLIENT_WRITE_STREAM_H
#define KCENON_WEBHDFS_CLIENT_WRITE_STREAM_H

#include "kcenon/webhdfs/core/types.h"
#include "kcenon/webhdfs/http/http_session.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::webhdfs {

/**
 * @brief Writer whose data is consumed by a request running on its own thread
 *
 * The request function is started on a background thread with a
 * body_source that pulls the chunks given to write(). close() signals the
 * end of the data, waits for the request and reports its outcome. A stream
 * destroyed without close() aborts the request: the body source fails with
 * error_code::aborted and nothing is committed.
 *
 * @code
 * auto writer = client.write("/data/out.txt", {.overwrite = true});
 * writer.value()->write("hello ");
 * writer.value()->write("world");
 * auto committed = writer.value()->close();
 * @endcode
 */
class write_stream {
public:
    /// Function issuing the request; it must pull the body until EOF
    using request_function = std::function<result<void>(body_source)>;

    /**
     * @param path Remote path (for logging)
     * @param request Request to run on the background thread
     * @param queue_depth Maximum number of buffered chunks
     */
    write_stream(std::string path, request_function request, std::size_t queue_depth = 16);

    ~write_stream();

    write_stream(const write_stream&) = delete;
    auto operator=(const write_stream&) -> write_stream& = delete;

    /**
     * @brief Queue data for the request
     *
     * Blocks while the queue is full. Fails with the request's error when
     * the request has already finished.
     */
    [[nodiscard]] auto write(std::span<const uint8_t> data) -> result<void>;

    [[nodiscard]] auto write(std::string_view data) -> result<void>;

    /**
     * @brief Finish the body and wait for the request
     * @return Outcome of the request (repeated calls return the same outcome)
     */
    [[nodiscard]] auto close() -> result<void>;

    /**
     * @brief Abort the request without committing
     */
    void abort();

    [[nodiscard]] auto path() const -> const std::string&;

    [[nodiscard]] auto bytes_written() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CLIENT_WRITE_STREAM_H
