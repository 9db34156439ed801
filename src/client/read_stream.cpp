// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file read_stream.cpp
 * @brief Scoped remote reader implementation
 */

#include "kcenon/webhdfs/client/read_stream.h"

#include <cstring>

namespace kcenon::webhdfs {

struct read_stream::impl {
    std::string path;
    http_response response;
    std::size_t chunk_size;
    progress_callback progress;
    uint64_t bytes_read = 0;
    bool finished = false;
    bool closed = false;

    impl(std::string p, http_response r, std::size_t size, progress_callback cb)
        : path(std::move(p)),
          response(std::move(r)),
          chunk_size(size == 0 ? 1 : size),
          progress(std::move(cb)) {}

    auto pull(std::span<std::byte> buffer) -> result<std::size_t> {
        if (finished || closed || !response.body) {
            finished = true;
            return std::size_t{0};
        }
        auto count = response.body->read(buffer);
        if (!count.has_value()) {
            return count;
        }
        if (count.value() == 0) {
            finished = true;
        }
        bytes_read += count.value();
        return count;
    }

    void release() {
        if (closed) {
            return;
        }
        closed = true;
        response.body.reset();
        if (progress) {
            progress(path, progress_done);
        }
    }
};

read_stream::read_stream(std::string path,
                         http_response response,
                         std::size_t chunk_size,
                         progress_callback progress)
    : impl_(std::make_unique<impl>(std::move(path), std::move(response),
                                   chunk_size, std::move(progress))) {}

read_stream::~read_stream() {
    if (impl_) {
        impl_->release();
    }
}

read_stream::read_stream(read_stream&&) noexcept = default;

auto read_stream::operator=(read_stream&& other) noexcept -> read_stream& {
    if (this != &other) {
        if (impl_) {
            impl_->release();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

auto read_stream::next_chunk() -> result<std::vector<uint8_t>> {
    std::vector<uint8_t> chunk(impl_->chunk_size);
    std::size_t filled = 0;

    while (filled < chunk.size()) {
        auto count = impl_->pull(std::span<std::byte>(
            reinterpret_cast<std::byte*>(chunk.data()) + filled, chunk.size() - filled));
        if (!count.has_value()) {
            return unexpected{count.error()};
        }
        if (count.value() == 0) {
            break;
        }
        filled += count.value();
    }

    chunk.resize(filled);
    if (filled > 0 && impl_->progress) {
        impl_->progress(impl_->path, static_cast<int64_t>(impl_->bytes_read));
    }
    if (impl_->finished) {
        impl_->release();
    }
    return chunk;
}

auto read_stream::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto count = impl_->pull(buffer);
    if (!count.has_value()) {
        return count;
    }
    if (count.value() > 0 && impl_->progress) {
        impl_->progress(impl_->path, static_cast<int64_t>(impl_->bytes_read));
    }
    if (impl_->finished) {
        impl_->release();
    }
    return count;
}

auto read_stream::read_all() -> result<std::vector<uint8_t>> {
    std::vector<uint8_t> content;
    while (true) {
        auto chunk = next_chunk();
        if (!chunk.has_value()) {
            return unexpected{chunk.error()};
        }
        if (chunk.value().empty()) {
            break;
        }
        content.insert(content.end(), chunk.value().begin(), chunk.value().end());
    }
    return content;
}

void read_stream::close() {
    impl_->release();
}

auto read_stream::path() const -> const std::string& {
    return impl_->path;
}

auto read_stream::bytes_read() const -> uint64_t {
    return impl_->bytes_read;
}

auto read_stream::is_finished() const -> bool {
    return impl_->finished;
}

}  // namespace kcenon::webhdfs
