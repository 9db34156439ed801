// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file read_stream.h
 * @brief Scoped forward-only reader over a remote file
 */

#ifndef KCENON_WEBHDFS_CLIENT_READ_STREAM_H
#define KCENON_WEBHDFS_CLIENT_READ_STREAM_H

#include "kcenon/webhdfs/core/types.h"
#include "kcenon/webhdfs/http/http_session.h"
#include "kcenon/webhdfs/transfer/progress_tracker.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kcenon::webhdfs {

/**
 * @brief Forward-only sequence of byte blocks from an OPEN request
 *
 * The stream owns the response of the data phase. Destroying it releases
 * the connection whether or not the data was fully consumed. When a
 * progress callback is attached it receives the cumulative byte count after
 * every chunk and a single -1 once the stream ends or is closed.
 *
 * @code
 * auto stream = client.read("/data/events.log");
 * while (true) {
 *     auto chunk = stream.value().next_chunk();
 *     if (!chunk || chunk.value().empty()) break;
 *     consume(chunk.value());
 * }
 * @endcode
 */
class read_stream {
public:
    read_stream(std::string path,
                http_response response,
                std::size_t chunk_size,
                progress_callback progress = {});

    ~read_stream();

    read_stream(const read_stream&) = delete;
    auto operator=(const read_stream&) -> read_stream& = delete;
    read_stream(read_stream&&) noexcept;
    auto operator=(read_stream&&) noexcept -> read_stream&;

    /**
     * @brief Read the next block
     *
     * Every block except the last holds exactly chunk_size bytes.
     *
     * @return Next block, empty at the end of the file
     */
    [[nodiscard]] auto next_chunk() -> result<std::vector<uint8_t>>;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read, 0 at the end of the file
     */
    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t>;

    /**
     * @brief Read the remaining content
     */
    [[nodiscard]] auto read_all() -> result<std::vector<uint8_t>>;

    /**
     * @brief Release the connection and emit the terminal progress signal
     */
    void close();

    [[nodiscard]] auto path() const -> const std::string&;

    [[nodiscard]] auto bytes_read() const -> uint64_t;

    [[nodiscard]] auto is_finished() const -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CLIENT_READ_STREAM_H
