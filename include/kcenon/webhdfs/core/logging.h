// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/webhdfs/config/feature_flags.h"

#if WEBHDFS_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::webhdfs {

/**
 * @brief Log categories for the webhdfs client
 */
struct log_category {
    static constexpr std::string_view transport = "webhdfs.transport";
    static constexpr std::string_view resolver = "webhdfs.resolver";
    static constexpr std::string_view transfer = "webhdfs.transfer";
    static constexpr std::string_view client = "webhdfs.client";
    static constexpr std::string_view config = "webhdfs.config";
    static constexpr std::string_view cli = "webhdfs.cli";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_hosts = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks remote paths and endpoint hosts in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string output = input;
        if (config_.mask_hosts) {
            output = mask_urls(output);
        }
        if (config_.mask_paths) {
            output = mask_file_paths(output);
        }
        return output;
    }

    /**
     * @brief Keep the last path component, hide the directories above it
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos || last_sep == 0) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + path.substr(last_sep);
    }

    /**
     * @brief Hide the host of an endpoint URL, keeping scheme and port
     */
    [[nodiscard]] auto mask_host(const std::string& url) const -> std::string {
        if (!config_.mask_hosts || url.empty()) {
            return url;
        }

        auto scheme_end = url.find("://");
        auto host_begin = scheme_end == std::string::npos ? 0 : scheme_end + 3;
        auto host_end = url.find_first_of(":/", host_begin);
        if (host_end == std::string::npos) {
            host_end = url.size();
        }

        auto host = url.substr(host_begin, host_end - host_begin);
        if (host.size() <= config_.visible_chars) {
            return url;
        }
        std::string masked = host.substr(0, config_.visible_chars) +
            std::string(host.size() - config_.visible_chars, config_.mask_char[0]);
        return url.substr(0, host_begin) + masked + url.substr(host_end);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_urls(const std::string& input) const -> std::string {
        static const std::regex url_pattern(R"(https?://[A-Za-z0-9._-]+(:\d+)?)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), url_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_host(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(R"((?:^|\s)((?:\/[A-Za-z0-9._#-]+)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            auto pos = static_cast<size_t>(it->position(1));
            result += input.substr(last_pos, pos - last_pos);
            result += mask_path(it->str(1));
            last_pos = pos + static_cast<size_t>(it->length(1));
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

/**
 * @brief Structured log context for remote operations
 */
struct transfer_log_context {
    std::string path;
    std::optional<std::string> operation;
    std::optional<std::string> endpoint;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> file_count;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!path.empty()) add_field("path", masker ? masker->mask_path(path) : path);
        if (operation) add_field("operation", *operation);
        if (endpoint) add_field("endpoint", masker ? masker->mask_host(*endpoint) : *endpoint);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (attempt) add_uint("attempt", *attempt);
        if (file_count) add_uint("file_count", *file_count);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json_string(const std::string& input) -> std::string {
        std::string output;
        output.reserve(input.size() + 16);
        for (char c : input) {
            switch (c) {
                case '"':  output += "\\\""; break;
                case '\\': output += "\\\\"; break;
                case '\b': output += "\\b";  break;
                case '\f': output += "\\f";  break;
                case '\n': output += "\\n";  break;
                case '\r': output += "\\r";  break;
                case '\t': output += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        output += buf;
                    } else {
                        output += c;
                    }
            }
        }
        return output;
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Logger shared by transport, resolver and transfer engine
 */
class webhdfs_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    webhdfs_logger() = default;
    ~webhdfs_logger() = default;

    webhdfs_logger(const webhdfs_logger&) = delete;
    webhdfs_logger& operator=(const webhdfs_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if WEBHDFS_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if WEBHDFS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if WEBHDFS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    /**
     * @brief Set custom log callback
     *
     * The callback receives every enabled message before it is written.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Silence the stderr fallback writer (callbacks still fire)
     */
    void set_console_output(bool enabled) {
        console_output_.store(enabled);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string line_text = format == log_output_format::json
            ? format_json(level, category, message, context, current_masker)
            : format_text(level, category, message, context, current_masker);

#if WEBHDFS_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
            return;
        }
#endif
        if (console_output_.load()) {
            output_to_stderr(line_text);
        }
    }

    void flush() {
#if WEBHDFS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << transfer_log_context::escape_json_string(masker.mask(std::string(message)))
            << "\"";
        if (context) {
            auto ctx_json = context->to_json_with_masking(&masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#if WEBHDFS_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::warn};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline webhdfs_logger& get_logger() {
    static webhdfs_logger instance;
    return instance;
}

#define WH_LOG(level, category, message) \
    kcenon::webhdfs::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define WH_LOG_CTX(level, category, message, context) \
    kcenon::webhdfs::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define WH_LOG_TRACE(category, message) \
    WH_LOG(kcenon::webhdfs::log_level::trace, category, message)

#define WH_LOG_DEBUG(category, message) \
    WH_LOG(kcenon::webhdfs::log_level::debug, category, message)

#define WH_LOG_INFO(category, message) \
    WH_LOG(kcenon::webhdfs::log_level::info, category, message)

#define WH_LOG_WARN(category, message) \
    WH_LOG(kcenon::webhdfs::log_level::warn, category, message)

#define WH_LOG_ERROR(category, message) \
    WH_LOG(kcenon::webhdfs::log_level::error, category, message)

#define WH_LOG_DEBUG_CTX(category, message, ctx) \
    WH_LOG_CTX(kcenon::webhdfs::log_level::debug, category, message, ctx)

#define WH_LOG_INFO_CTX(category, message, ctx) \
    WH_LOG_CTX(kcenon::webhdfs::log_level::info, category, message, ctx)

#define WH_LOG_WARN_CTX(category, message, ctx) \
    WH_LOG_CTX(kcenon::webhdfs::log_level::warn, category, message, ctx)

#define WH_LOG_ERROR_CTX(category, message, ctx) \
    WH_LOG_CTX(kcenon::webhdfs::log_level::error, category, message, ctx)

}  // namespace kcenon::webhdfs
