// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file network_http_session.cpp
 * @brief network_system backed http_session implementation
 */

#include "kcenon/webhdfs/http/network_http_session.h"

#include "kcenon/webhdfs/config/feature_flags.h"

#if WEBHDFS_HAS_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace kcenon::webhdfs {

namespace {

auto contains_any(const std::string& text, std::initializer_list<std::string_view> needles)
    -> bool {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return text.find(needle) != std::string::npos;
    });
}

}  // namespace

auto classify_send_failure(std::string_view message) -> error_code {
    std::string lowered(message);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (contains_any(lowered, {"refused", "host not found", "could not resolve",
                               "failed to resolve", "name or service not known"})) {
        return error_code::connection_refused;
    }
    if (contains_any(lowered, {"timed out", "timeout"})) {
        return error_code::connection_timeout;
    }
    return error_code::connection_lost;
}

struct network_http_session::impl {
#if WEBHDFS_HAS_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    std::map<std::string, std::string> default_headers;
    bool available = false;

    impl(std::chrono::milliseconds timeout, std::map<std::string, std::string> headers)
        : default_headers(std::move(headers)) {
#if WEBHDFS_HAS_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if WEBHDFS_HAS_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body = std::make_unique<buffered_body_reader>(
            std::vector<uint8_t>(resp.body.begin(), resp.body.end()));
        return converted;
    }

    static auto failure(const std::string& method, const std::string& url,
                        const std::string& reason) -> result<http_response> {
        return unexpected{error{classify_send_failure(reason),
            "HTTP " + method + " request to " + url + " failed: " + reason}};
    }
#endif
};

network_http_session::network_http_session(
    std::chrono::milliseconds timeout,
    std::map<std::string, std::string> default_headers)
    : impl_(std::make_unique<impl>(timeout, std::move(default_headers))) {}

network_http_session::~network_http_session() = default;

network_http_session::network_http_session(network_http_session&&) noexcept = default;
auto network_http_session::operator=(network_http_session&&) noexcept
    -> network_http_session& = default;

auto network_http_session::send(const http_request& request)
    -> result<http_response> {
#if WEBHDFS_HAS_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error,
            "HTTP client not initialized"}};
    }

    auto headers = impl_->default_headers;
    for (const auto& [key, value] : request.headers) {
        headers[key] = value;
    }

    auto payload = drain_body_source(request.body);
    if (!payload.has_value()) {
        return unexpected{payload.error()};
    }
    std::string body(payload.value().begin(), payload.value().end());

    const std::map<std::string, std::string> no_query;
    if (request.method == "GET") {
        auto response = impl_->client->get(request.url, no_query, headers);
        if (response.is_err()) {
            return impl_->failure("GET", request.url, response.error().message);
        }
        return impl_->convert_response(response.value());
    }
    if (request.method == "PUT") {
        auto response = impl_->client->put(request.url, body, headers);
        if (response.is_err()) {
            return impl_->failure("PUT", request.url, response.error().message);
        }
        return impl_->convert_response(response.value());
    }
    if (request.method == "POST") {
        auto response = impl_->client->post(request.url, body, headers);
        if (response.is_err()) {
            return impl_->failure("POST", request.url, response.error().message);
        }
        return impl_->convert_response(response.value());
    }
    if (request.method == "DELETE") {
        auto response = impl_->client->del(request.url, headers);
        if (response.is_err()) {
            return impl_->failure("DELETE", request.url, response.error().message);
        }
        return impl_->convert_response(response.value());
    }

    return unexpected{error{error_code::illegal_argument,
        "Unsupported HTTP method: " + request.method}};
#else
    (void)request;
    return unexpected{error{error_code::not_available,
        "HTTP client not available (WEBHDFS_HAS_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_session::is_available() const noexcept -> bool {
    return impl_->available;
}

auto make_network_http_session(std::chrono::milliseconds timeout,
                               std::map<std::string, std::string> default_headers)
    -> std::shared_ptr<http_session> {
    return std::make_shared<network_http_session>(timeout, std::move(default_headers));
}

}  // namespace kcenon::webhdfs
