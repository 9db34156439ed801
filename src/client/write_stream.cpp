// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file write_stream.cpp
 * @brief Producer/consumer writer implementation
 */

#include "kcenon/webhdfs/client/write_stream.h"

#include "kcenon/webhdfs/core/logging.h"

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace kcenon::webhdfs {

struct write_stream::impl {
    std::string path;
    std::size_t queue_depth;

    std::mutex mutex;
    std::condition_variable data_cv;
    std::condition_variable space_cv;
    std::deque<std::vector<uint8_t>> queue;
    std::size_t front_offset = 0;
    bool input_finished = false;
    bool aborted = false;
    bool request_done = false;
    std::optional<result<void>> outcome;
    uint64_t bytes_written = 0;

    std::thread worker;
    bool joined = false;

    impl(std::string p, std::size_t depth)
        : path(std::move(p)), queue_depth(depth == 0 ? 1 : depth) {}

    auto pull(std::span<std::byte> buffer) -> result<std::size_t> {
        std::unique_lock<std::mutex> lock(mutex);
        data_cv.wait(lock, [this] { return aborted || input_finished || !queue.empty(); });

        if (aborted) {
            return unexpected{error{error_code::aborted, "Write to " + path + " was aborted"}};
        }
        if (queue.empty()) {
            return std::size_t{0};
        }

        auto& front = queue.front();
        auto count = std::min(buffer.size(), front.size() - front_offset);
        std::memcpy(buffer.data(), front.data() + front_offset, count);
        front_offset += count;
        if (front_offset == front.size()) {
            queue.pop_front();
            front_offset = 0;
            space_cv.notify_one();
        }
        return count;
    }

    void start(request_function request) {
        worker = std::thread([this, request = std::move(request)] {
            auto result_value = request([this](std::span<std::byte> buffer) { return pull(buffer); });
            if (!result_value.has_value()) {
                WH_LOG_DEBUG(log_category::client,
                    "Write request for " + path + " ended: " + result_value.error().message);
            }
            std::lock_guard<std::mutex> lock(mutex);
            outcome = std::move(result_value);
            request_done = true;
            space_cv.notify_all();
        });
    }

    void join() {
        if (!joined && worker.joinable()) {
            worker.join();
        }
        joined = true;
    }
};

write_stream::write_stream(std::string path, request_function request, std::size_t queue_depth)
    : impl_(std::make_unique<impl>(std::move(path), queue_depth)) {
    impl_->start(std::move(request));
}

write_stream::~write_stream() {
    if (impl_ && !impl_->joined) {
        abort();
    }
}

auto write_stream::write(std::span<const uint8_t> data) -> result<void> {
    if (data.empty()) {
        return {};
    }

    std::unique_lock<std::mutex> lock(impl_->mutex);
    if (impl_->input_finished) {
        return unexpected{error{error_code::illegal_argument,
            "Write to " + impl_->path + " after close"}};
    }
    impl_->space_cv.wait(lock, [this] {
        return impl_->aborted || impl_->request_done ||
               impl_->queue.size() < impl_->queue_depth;
    });

    if (impl_->aborted) {
        return unexpected{error{error_code::aborted, "Write to " + impl_->path + " was aborted"}};
    }
    if (impl_->request_done) {
        if (impl_->outcome && !impl_->outcome->has_value()) {
            return unexpected{impl_->outcome->error()};
        }
        return unexpected{error{error_code::protocol_error,
            "Request for " + impl_->path + " finished before all data was written"}};
    }

    impl_->queue.emplace_back(data.begin(), data.end());
    impl_->bytes_written += data.size();
    impl_->data_cv.notify_one();
    return {};
}

auto write_stream::write(std::string_view data) -> result<void> {
    return write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

auto write_stream::close() -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->input_finished = true;
    }
    impl_->data_cv.notify_all();
    impl_->join();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->outcome) {
        return unexpected{error{error_code::internal_error,
            "Write request for " + impl_->path + " produced no outcome"}};
    }
    return *impl_->outcome;
}

void write_stream::abort() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->request_done && impl_->joined) {
            return;
        }
        impl_->aborted = true;
    }
    impl_->data_cv.notify_all();
    impl_->space_cv.notify_all();
    impl_->join();
}

auto write_stream::path() const -> const std::string& {
    return impl_->path;
}

auto write_stream::bytes_written() const -> uint64_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->bytes_written;
}

}  // namespace kcenon::webhdfs
