// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file progress_tracker.cpp
 * @brief Progress aggregation implementation
 */

#include "kcenon/webhdfs/transfer/progress_tracker.h"

#include <cstdio>

namespace kcenon::webhdfs {

progress_tracker::progress_tracker(uint64_t expected_bytes, std::size_t expected_files)
    : expected_bytes_(expected_bytes), pending_(expected_files) {}

void progress_tracker::update(const std::string& path, int64_t bytes) {
    writer out;
    std::string line;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        apply_locked(path, bytes);
        if (!writer_) {
            return;
        }
        out = writer_;
        line = render_locked();
    }
    out(line);
}

void progress_tracker::apply_locked(const std::string& path, int64_t bytes) {
    auto it = live_.find(path);
    if (it == live_.end()) {
        if (pending_ > 0) {
            --pending_;
        }
        ++active_;
        it = live_.emplace(path, 0).first;
    }

    if (bytes < 0) {
        finalized_bytes_ += it->second;
        live_.erase(it);
        if (active_ > 0) {
            --active_;
        }
        ++completed_;
    } else {
        it->second = static_cast<uint64_t>(bytes);
    }
}

auto progress_tracker::callback() -> progress_callback {
    return [this](const std::string& path, int64_t bytes) { update(path, bytes); };
}

void progress_tracker::set_writer(writer w) {
    std::lock_guard<std::mutex> lock(mutex_);
    writer_ = std::move(w);
}

auto progress_tracker::live_bytes() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& [path, bytes] : live_) {
        total += bytes;
    }
    return total;
}

auto progress_tracker::transferred_bytes() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = finalized_bytes_;
    for (const auto& [path, bytes] : live_) {
        total += bytes;
    }
    return total;
}

auto progress_tracker::live_paths() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

auto progress_tracker::pending_files() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

auto progress_tracker::active_files() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

auto progress_tracker::completed_files() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

auto progress_tracker::percent() const -> double {
    std::lock_guard<std::mutex> lock(mutex_);
    return percent_locked();
}

auto progress_tracker::render() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return render_locked();
}

auto progress_tracker::percent_locked() const -> double {
    if (expected_bytes_ == 0) {
        return 100.0;
    }
    uint64_t total = finalized_bytes_;
    for (const auto& [path, bytes] : live_) {
        total += bytes;
    }
    return 100.0 * static_cast<double>(total) / static_cast<double>(expected_bytes_);
}

auto progress_tracker::render_locked() const -> std::string {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer),
                  "%3.1f%%\t[ pending: %zu | downloading: %zu | complete: %zu ]",
                  percent_locked(), pending_, active_, completed_);
    return buffer;
}

}  // namespace kcenon::webhdfs
