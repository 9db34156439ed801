// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file types.h
 * @brief Core type definitions for webhdfs_client
 */

#ifndef KCENON_WEBHDFS_CORE_TYPES_H
#define KCENON_WEBHDFS_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::webhdfs {

/**
 * @brief Error codes for remote filesystem operations
 */
enum class error_code {
    success = 0,

    // Remote filesystem errors (-100 to -139)
    file_not_found = -100,
    already_exists = -101,
    permission_denied = -102,
    illegal_argument = -103,
    not_empty_directory = -104,
    not_a_directory = -105,
    remote_error = -106,

    // Path and configuration errors (-140 to -159)
    invalid_path = -140,
    config_error = -141,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_refused = -161,
    connection_timeout = -162,
    connection_lost = -163,
    server_error = -164,
    standby_endpoint = -165,
    network_error = -166,

    // Protocol errors (-180 to -199)
    protocol_error = -180,

    // Transfer errors (-200 to -219)
    transfer_failed = -200,
    local_io_error = -201,
    aborted = -202,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_available = -221,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::already_exists:
            return "already exists";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::illegal_argument:
            return "illegal argument";
        case error_code::not_empty_directory:
            return "directory not empty";
        case error_code::not_a_directory:
            return "not a directory";
        case error_code::remote_error:
            return "remote error";
        case error_code::invalid_path:
            return "invalid path";
        case error_code::config_error:
            return "configuration error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::server_error:
            return "server error";
        case error_code::standby_endpoint:
            return "endpoint is not the active namenode";
        case error_code::network_error:
            return "network error";
        case error_code::protocol_error:
            return "protocol error";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::local_io_error:
            return "local I/O error";
        case error_code::aborted:
            return "aborted";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_available:
            return "not available";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error code belongs to the transient network group
 *
 * Transient errors are absorbed by the transport's failover and retry loop
 * and only surface as network_error once every endpoint has been tried.
 */
[[nodiscard]] constexpr auto is_transient(error_code code) noexcept -> bool {
    return code == error_code::connection_failed ||
           code == error_code::connection_refused ||
           code == error_code::connection_timeout ||
           code == error_code::connection_lost ||
           code == error_code::server_error ||
           code == error_code::standby_endpoint;
}

/**
 * @brief Check whether an error code reports remote filesystem semantics
 */
[[nodiscard]] constexpr auto is_filesystem_error(error_code code) noexcept -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value > -140;
}

/**
 * @brief Per-path failure recorded by batch operations
 */
struct failure_detail {
    std::string path;
    error_code code = error_code::success;
    std::string message;
};

/**
 * @brief Error type with code, message and optional per-path failures
 */
struct error {
    error_code code;
    std::string message;
    std::vector<failure_detail> failures;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, std::vector<failure_detail> details)
        : code(c), message(std::move(msg)), failures(std::move(details)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CORE_TYPES_H
