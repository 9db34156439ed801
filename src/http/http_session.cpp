// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file http_session.cpp
 * @brief Shared helpers for http_session implementations
 */

#include "kcenon/webhdfs/http/http_session.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace kcenon::webhdfs {

auto buffered_body_reader::read(std::span<std::byte> buffer)
    -> result<std::size_t> {
    auto remaining = data_.size() - position_;
    auto count = std::min(remaining, buffer.size());
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

auto http_response::get_header(const std::string& key) const
    -> std::optional<std::string> {
    auto it = headers.find(key);
    if (it != headers.end()) {
        return it->second;
    }

    auto lower = [](std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return value;
    };

    auto lower_key = lower(key);
    for (const auto& [k, v] : headers) {
        if (lower(k) == lower_key) {
            return v;
        }
    }

    return std::nullopt;
}

auto http_response::read_body_string() -> result<std::string> {
    std::string text;
    if (!body) {
        return text;
    }

    std::vector<std::byte> buffer(16 * 1024);
    while (true) {
        auto read_result = body->read(buffer);
        if (!read_result.has_value()) {
            return unexpected{read_result.error()};
        }
        auto count = read_result.value();
        if (count == 0) {
            break;
        }
        text.append(reinterpret_cast<const char*>(buffer.data()), count);
    }
    return text;
}

auto drain_body_source(const body_source& source, std::size_t block_size)
    -> result<std::vector<uint8_t>> {
    std::vector<uint8_t> payload;
    if (!source) {
        return payload;
    }

    std::vector<std::byte> buffer(block_size);
    while (true) {
        auto pulled = source(buffer);
        if (!pulled.has_value()) {
            return unexpected{pulled.error()};
        }
        auto count = pulled.value();
        if (count == 0) {
            break;
        }
        auto* begin = reinterpret_cast<const uint8_t*>(buffer.data());
        payload.insert(payload.end(), begin, begin + count);
    }
    return payload;
}

}  // namespace kcenon::webhdfs
