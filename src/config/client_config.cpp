// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file client_config.cpp
 * @brief Client configuration parsing
 */

#include "kcenon/webhdfs/config/client_config.h"

#include "kcenon/webhdfs/core/logging.h"

#include <cctype>
#include <charconv>

namespace kcenon::webhdfs {

namespace {

auto trim(const std::string& value) -> std::string {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

auto parse_unsigned(const std::string& key, const std::string& value)
    -> result<uint64_t> {
    auto text = trim(value);
    uint64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return unexpected{error{error_code::config_error,
            "Invalid '" + key + "' option: '" + value + "'"}};
    }
    return parsed;
}

}  // namespace

auto split_urls(const std::string& value) -> std::vector<std::string> {
    std::vector<std::string> urls;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto end = value.find(';', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        auto url = trim(value.substr(start, end - start));
        if (!url.empty()) {
            urls.push_back(std::move(url));
        }
        start = end + 1;
    }
    return urls;
}

auto client_config::validate() const -> result<void> {
    if (urls.empty()) {
        return unexpected{error{error_code::config_error, "No namenode URL configured"}};
    }
    if (!root.empty() && root.front() != '/') {
        return unexpected{error{error_code::config_error,
            "Root directory must be absolute: '" + root + "'"}};
    }
    if (chunk_size == 0) {
        return unexpected{error{error_code::config_error, "Chunk size must be positive"}};
    }
    if (kind.empty()) {
        return unexpected{error{error_code::config_error, "Client kind must not be empty"}};
    }
    return {};
}

auto client_config::from_options(const std::map<std::string, std::string>& options)
    -> result<client_config> {
    client_config config;

    for (const auto& [key, value] : options) {
        if (key == "url") {
            config.urls = split_urls(value);
        } else if (key == "root") {
            config.root = trim(value);
        } else if (key == "timeout") {
            auto seconds = parse_unsigned(key, value);
            if (!seconds.has_value()) {
                return unexpected{seconds.error()};
            }
            config.timeout = std::chrono::seconds(seconds.value());
        } else if (key == "retries") {
            auto retries = parse_unsigned(key, value);
            if (!retries.has_value()) {
                return unexpected{retries.error()};
            }
            config.retry.max_attempts = static_cast<std::size_t>(retries.value()) + 1;
        } else if (key == "retry_delay") {
            auto delay = parse_unsigned(key, value);
            if (!delay.has_value()) {
                return unexpected{delay.error()};
            }
            config.retry.initial_delay = std::chrono::milliseconds(delay.value());
        } else if (key == "chunk_size") {
            auto size = parse_unsigned(key, value);
            if (!size.has_value()) {
                return unexpected{size.error()};
            }
            config.chunk_size = static_cast<std::size_t>(size.value());
        } else if (key == "threads") {
            auto threads = parse_unsigned(key, value);
            if (!threads.has_value()) {
                return unexpected{threads.error()};
            }
            config.threads = static_cast<std::size_t>(threads.value());
        } else if (key == "client") {
            config.kind = trim(value);
        } else {
            config.options[key] = value;
        }
    }

    auto valid = config.validate();
    if (!valid.has_value()) {
        return unexpected{valid.error()};
    }

    WH_LOG_DEBUG(log_category::config,
        "Loaded " + config.kind + " client configuration with " +
        std::to_string(config.urls.size()) + " endpoint(s)");
    return config;
}

}  // namespace kcenon::webhdfs
