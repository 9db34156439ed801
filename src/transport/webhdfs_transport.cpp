// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file webhdfs_transport.cpp
 * @brief Failover and retry loop for WebHDFS operations
 */

#include "kcenon/webhdfs/transport/webhdfs_transport.h"

#include "kcenon/webhdfs/core/logging.h"
#include "kcenon/webhdfs/transport/remote_error.h"
#include "kcenon/webhdfs/transport/url_utils.h"

#include <algorithm>
#include <mutex>
#include <thread>

namespace kcenon::webhdfs {

namespace {

/**
 * @brief Outcome of a single sweep or data phase
 *
 * retryable is set when the error is transient and replaying the whole
 * operation cannot duplicate a side effect.
 */
struct attempt_outcome {
    result<http_response> response;
    bool retryable = false;
};

/// Failures that provably happen before the request reaches the server
auto never_delivered(error_code code) -> bool {
    return code == error_code::connection_refused ||
           code == error_code::standby_endpoint;
}

auto make_failure(error_code code, std::string message, bool retryable = false)
    -> attempt_outcome {
    return attempt_outcome{unexpected{error{code, std::move(message)}}, retryable};
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct webhdfs_transport::impl {
    std::shared_ptr<http_session> session;
    transport_config config;

    mutable std::mutex active_mutex;
    std::size_t active = 0;

    impl(std::shared_ptr<http_session> s, transport_config c)
        : session(std::move(s)), config(std::move(c)) {}

    auto current() const -> std::size_t {
        std::lock_guard<std::mutex> lock(active_mutex);
        return active;
    }

    void pin(std::size_t index) {
        std::lock_guard<std::mutex> lock(active_mutex);
        active = index;
    }

    /// Advance past a failed endpoint unless another caller already moved on
    void mark_failed(std::size_t index, const std::string& reason) {
        std::size_t next = 0;
        bool switched = false;
        {
            std::lock_guard<std::mutex> lock(active_mutex);
            if (active == index) {
                active = (index + 1) % config.endpoints.size();
                next = active;
                switched = true;
            }
        }

        if (switched) {
            transfer_log_context ctx;
            ctx.endpoint = config.endpoints[index];
            ctx.error_message = reason;
            WH_LOG_WARN_CTX(log_category::transport,
                "Endpoint failed, switching to " + config.endpoints[next], ctx);
        }
    }

    auto data_phase(operation op,
                    const std::string& endpoint,
                    const http_response& redirect,
                    const body_source& body,
                    bool idempotent) -> attempt_outcome {
        auto location = redirect.get_header("Location");
        if (!location) {
            return make_failure(error_code::protocol_error,
                std::string("Redirect without location for ") + to_string(op));
        }
        auto target = url_utils::resolve_location(endpoint, *location);
        if (!target) {
            return make_failure(error_code::protocol_error,
                "Malformed redirect location: " + *location);
        }

        http_request request;
        request.url = *target;
        if (is_data_operation(op) && op != operation::open) {
            request.method = http_method(op);
            request.headers["Content-Type"] = "application/octet-stream";
            request.body = body;
        } else {
            request.method = "GET";
        }

        WH_LOG_DEBUG(log_category::transport,
            std::string(to_string(op)) + " data phase at " + url_utils::origin_of(*target));

        // A consumed body cannot be replayed
        bool replayable = idempotent && !request.body;

        auto response = session->send(request);
        if (!response.has_value()) {
            const auto& err = response.error();
            if (is_transient(err.code)) {
                return make_failure(error_code::network_error,
                    "Data transfer with " + url_utils::origin_of(*target) +
                    " failed: " + err.message, replayable);
            }
            return attempt_outcome{unexpected{err}, false};
        }

        if (response.value().is_success()) {
            return attempt_outcome{std::move(response), false};
        }

        auto text = response.value().read_body_string();
        auto err = decode_remote_error(response.value().status_code,
                                       text.has_value() ? text.value() : std::string{});
        if (err.code == error_code::server_error) {
            return make_failure(error_code::network_error,
                "Storage node error: " + err.message, replayable);
        }
        return attempt_outcome{unexpected{err}, false};
    }

    auto sweep(operation op,
               const std::string& path,
               const query_params& params,
               const body_source& body,
               bool idempotent) -> attempt_outcome {
        const auto count = config.endpoints.size();
        const auto start = current();
        std::string last_message = "no endpoint available";

        for (std::size_t k = 0; k < count; ++k) {
            const auto index = (start + k) % count;
            const auto& endpoint = config.endpoints[index];

            http_request request;
            request.method = http_method(op);
            request.url = url_utils::build_operation_url(endpoint, path, op, params);

            WH_LOG_TRACE(log_category::transport, request.method + " " + request.url);

            auto response = session->send(request);
            if (!response.has_value()) {
                const auto& err = response.error();
                if (!is_transient(err.code)) {
                    return attempt_outcome{unexpected{err}, false};
                }
                if (!idempotent && !never_delivered(err.code)) {
                    return make_failure(error_code::network_error,
                        std::string(to_string(op)) + " on " + endpoint +
                        " failed and was not retried: " + err.message);
                }
                last_message = endpoint + ": " + err.message;
                mark_failed(index, err.message);
                continue;
            }

            auto& resp = response.value();
            if (resp.is_redirect()) {
                if (!is_data_operation(op) && op != operation::get_file_checksum) {
                    return make_failure(error_code::protocol_error,
                        std::string("Unexpected redirect for ") + to_string(op));
                }
                pin(index);
                return data_phase(op, endpoint, resp, body, idempotent);
            }

            if (resp.is_success()) {
                if (requires_redirect(op)) {
                    return make_failure(error_code::protocol_error,
                        std::string("Missing redirect for ") + to_string(op));
                }
                pin(index);
                return attempt_outcome{std::move(response), false};
            }

            auto text = resp.read_body_string();
            auto err = decode_remote_error(resp.status_code,
                                           text.has_value() ? text.value() : std::string{});
            if (err.code == error_code::standby_endpoint) {
                last_message = endpoint + ": " + err.message;
                mark_failed(index, err.message);
                continue;
            }
            if (err.code == error_code::server_error) {
                if (!idempotent) {
                    return make_failure(error_code::network_error,
                        std::string(to_string(op)) + " on " + endpoint +
                        " failed and was not retried: " + err.message);
                }
                last_message = endpoint + ": " + err.message;
                mark_failed(index, err.message);
                continue;
            }

            pin(index);
            return attempt_outcome{unexpected{err}, false};
        }

        return make_failure(error_code::network_error,
            "All " + std::to_string(count) + " endpoints failed (last: " +
            last_message + ")", idempotent);
    }
};

// ============================================================================
// webhdfs_transport
// ============================================================================

webhdfs_transport::webhdfs_transport(std::shared_ptr<http_session> session,
                                     transport_config config)
    : impl_(std::make_unique<impl>(std::move(session), std::move(config))) {}

webhdfs_transport::~webhdfs_transport() = default;

auto webhdfs_transport::create(std::shared_ptr<http_session> session,
                               transport_config config)
    -> result<std::unique_ptr<webhdfs_transport>> {
    if (!session) {
        return unexpected{error{error_code::config_error, "HTTP session is required"}};
    }
    if (config.endpoints.empty()) {
        return unexpected{error{error_code::config_error,
            "At least one endpoint URL is required"}};
    }
    for (const auto& endpoint : config.endpoints) {
        if (url_utils::origin_of(endpoint).empty()) {
            return unexpected{error{error_code::config_error,
                "Invalid endpoint URL: " + endpoint}};
        }
    }
    if (config.retry.max_attempts == 0) {
        config.retry.max_attempts = 1;
    }

    return std::unique_ptr<webhdfs_transport>(
        new webhdfs_transport(std::move(session), std::move(config)));
}

auto webhdfs_transport::execute(operation op,
                                const std::string& path,
                                const query_params& params,
                                body_source body) -> result<http_response> {
    query_params all_params = params;
    all_params.insert(all_params.end(),
                      impl_->config.default_params.begin(),
                      impl_->config.default_params.end());

    const bool idempotent = is_idempotent(op, params);
    const auto attempts = idempotent ? impl_->config.retry.max_attempts : std::size_t{1};

    for (std::size_t attempt = 1;; ++attempt) {
        auto outcome = impl_->sweep(op, path, all_params, body, idempotent);
        if (outcome.response.has_value() || !outcome.retryable || attempt >= attempts) {
            if (!outcome.response.has_value()) {
                transfer_log_context ctx;
                ctx.path = path;
                ctx.operation = to_string(op);
                ctx.attempt = static_cast<uint32_t>(attempt);
                WH_LOG_DEBUG_CTX(log_category::transport,
                    outcome.response.error().message, ctx);
            }
            return std::move(outcome.response);
        }

        auto delay = calculate_retry_delay(impl_->config.retry, attempt);
        transfer_log_context ctx;
        ctx.path = path;
        ctx.operation = to_string(op);
        ctx.attempt = static_cast<uint32_t>(attempt + 1);
        ctx.error_message = outcome.response.error().message;
        WH_LOG_INFO_CTX(log_category::transport,
            "Retrying in " + std::to_string(delay.count()) + " ms", ctx);

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }
}

auto webhdfs_transport::execute_json(operation op,
                                     const std::string& path,
                                     const query_params& params)
    -> result<nlohmann::json> {
    auto response = execute(op, path, params);
    if (!response.has_value()) {
        return unexpected{response.error()};
    }

    auto text = response.value().read_body_string();
    if (!text.has_value()) {
        return unexpected{text.error()};
    }

    auto parsed = nlohmann::json::parse(text.value(), nullptr, false);
    if (parsed.is_discarded()) {
        return unexpected{error{error_code::protocol_error,
            std::string("Invalid JSON answer for ") + to_string(op)}};
    }
    return parsed;
}

auto webhdfs_transport::active_endpoint() const -> std::string {
    return impl_->config.endpoints[impl_->current()];
}

auto webhdfs_transport::active_index() const -> std::size_t {
    return impl_->current();
}

auto webhdfs_transport::endpoints() const -> const std::vector<std::string>& {
    return impl_->config.endpoints;
}

auto webhdfs_transport::policy() const -> const retry_policy& {
    return impl_->config.retry;
}

}  // namespace kcenon::webhdfs
