// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file progress_tracker.h
 * @brief Thread-safe aggregation of per-path transfer progress
 */

#ifndef KCENON_WEBHDFS_TRANSFER_PROGRESS_TRACKER_H
#define KCENON_WEBHDFS_TRANSFER_PROGRESS_TRACKER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace kcenon::webhdfs {

/**
 * @brief Per-path progress signal
 *
 * Called with the cumulative number of bytes moved for the path at every
 * chunk boundary, then exactly once with -1 when the path is finished
 * (successfully or not).
 */
using progress_callback = std::function<void(const std::string& path, int64_t bytes)>;

/// Terminal progress value
inline constexpr int64_t progress_done = -1;

/**
 * @brief Aggregates progress signals from concurrent workers
 *
 * Keeps the live byte count of every path in flight. A terminal signal
 * removes the path from the live set and adds its last byte count to the
 * completed total. File counters follow the pending, active and complete
 * life cycle against the expected file count given at construction.
 *
 * @code
 * progress_tracker tracker(total_bytes, file_count);
 * tracker.set_writer([](const std::string& line) { std::cerr << line << '\r'; });
 * client.download(src, dst, {.progress = tracker.callback()});
 * @endcode
 *
 * @note All methods are thread-safe.
 */
class progress_tracker {
public:
    using writer = std::function<void(const std::string& line)>;

    explicit progress_tracker(uint64_t expected_bytes = 0, std::size_t expected_files = 0);

    /**
     * @brief Merge one progress signal
     * @param path Source path the signal belongs to
     * @param bytes Cumulative bytes, or progress_done
     */
    void update(const std::string& path, int64_t bytes);

    /**
     * @brief Callback forwarding into update()
     *
     * The tracker must outlive every copy of the returned callback.
     */
    [[nodiscard]] auto callback() -> progress_callback;

    /**
     * @brief Receive a rendered status line after every update
     *
     * The writer runs outside the tracker's lock, so it may query the
     * tracker. Workers updating concurrently may call it concurrently.
     */
    void set_writer(writer w);

    /// Sum of byte counts over paths still in flight
    [[nodiscard]] auto live_bytes() const -> uint64_t;

    /// Bytes of live paths plus bytes of finalized paths
    [[nodiscard]] auto transferred_bytes() const -> uint64_t;

    [[nodiscard]] auto live_paths() const -> std::size_t;

    [[nodiscard]] auto pending_files() const -> std::size_t;

    [[nodiscard]] auto active_files() const -> std::size_t;

    [[nodiscard]] auto completed_files() const -> std::size_t;

    /// Percentage of expected bytes moved (100 when nothing is expected)
    [[nodiscard]] auto percent() const -> double;

    /**
     * @brief Render "<pct>%\t[ pending: P | downloading: D | complete: C ]"
     */
    [[nodiscard]] auto render() const -> std::string;

private:
    void apply_locked(const std::string& path, int64_t bytes);
    [[nodiscard]] auto render_locked() const -> std::string;
    [[nodiscard]] auto percent_locked() const -> double;

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> live_;
    uint64_t expected_bytes_;
    uint64_t finalized_bytes_ = 0;
    std::size_t pending_;
    std::size_t active_ = 0;
    std::size_t completed_ = 0;
    writer writer_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_TRANSFER_PROGRESS_TRACKER_H
