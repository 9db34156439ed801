// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file url_utils.cpp
 * @brief URL helpers implementation
 */

#include "kcenon/webhdfs/transport/url_utils.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace kcenon::webhdfs::url_utils {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto has_scheme(const std::string& url) -> bool {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

}  // namespace

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto url_decode(const std::string& value) -> std::string {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            auto hi = hex_value(value[i + 1]);
            auto lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        decoded.push_back(value[i]);
    }
    return decoded;
}

auto build_operation_url(const std::string& endpoint,
                         const std::string& path,
                         operation op,
                         const query_params& params) -> std::string {
    std::string base = endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    std::string url = base + api_prefix + url_encode(path, false);
    url += "?op=";
    url += to_string(op);
    for (const auto& [key, value] : params) {
        url += "&" + url_encode(key) + "=" + url_encode(value, false);
    }
    return url;
}

auto origin_of(const std::string& url) -> std::string {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return {};
    }
    auto path_start = url.find('/', scheme_end + 3);
    return path_start == std::string::npos ? url : url.substr(0, path_start);
}

auto resolve_location(const std::string& endpoint,
                      const std::string& location) -> std::optional<std::string> {
    if (location.empty()) {
        return std::nullopt;
    }
    if (has_scheme(location)) {
        auto host_start = location.find("://") + 3;
        if (host_start >= location.size() || location[host_start] == '/') {
            return std::nullopt;
        }
        return location;
    }
    if (location.front() == '/') {
        auto origin = origin_of(endpoint);
        if (origin.empty()) {
            return std::nullopt;
        }
        return origin + location;
    }
    return std::nullopt;
}

}  // namespace kcenon::webhdfs::url_utils
