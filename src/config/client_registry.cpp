// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file client_registry.cpp
 * @brief Client registry and built-in kinds
 */

#include "kcenon/webhdfs/config/client_registry.h"

#include "kcenon/webhdfs/core/logging.h"

namespace kcenon::webhdfs {

namespace {

auto base_builder(const client_config& config, std::shared_ptr<http_session> session)
    -> webhdfs_client::builder {
    webhdfs_client::builder builder;
    builder.with_config(config);
    if (session) {
        builder.with_session(std::move(session));
    }
    return builder;
}

auto make_insecure(const client_config& config, std::shared_ptr<http_session> session)
    -> result<webhdfs_client> {
    auto builder = base_builder(config, std::move(session));
    auto user = config.options.find("user");
    if (user != config.options.end() && !user->second.empty()) {
        builder.with_default_param("user.name", user->second);
    }
    return builder.build();
}

auto make_token(const client_config& config, std::shared_ptr<http_session> session)
    -> result<webhdfs_client> {
    auto token = config.options.find("token");
    if (token == config.options.end() || token->second.empty()) {
        return unexpected{error{error_code::config_error,
            "Client kind 'token' requires a 'token' option"}};
    }
    auto builder = base_builder(config, std::move(session));
    builder.with_default_param("delegation", token->second);
    return builder.build();
}

}  // namespace

auto client_registry::with_builtin_kinds() -> client_registry {
    client_registry registry;
    registry.register_kind("insecure", make_insecure);
    registry.register_kind("token", make_token);
    return registry;
}

void client_registry::register_kind(const std::string& name, factory make) {
    factories_[name] = std::move(make);
}

auto client_registry::contains(const std::string& name) const -> bool {
    return factories_.find(name) != factories_.end();
}

auto client_registry::kinds() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, make] : factories_) {
        names.push_back(name);
    }
    return names;
}

auto client_registry::create(const client_config& config,
                             std::shared_ptr<http_session> session) const
    -> result<webhdfs_client> {
    auto it = factories_.find(config.kind);
    if (it == factories_.end()) {
        WH_LOG_ERROR(log_category::config, "Unknown client kind '" + config.kind + "'");
        return unexpected{error{error_code::config_error,
            "Unknown client kind '" + config.kind + "'"}};
    }

    auto valid = config.validate();
    if (!valid.has_value()) {
        return unexpected{valid.error()};
    }

    WH_LOG_DEBUG(log_category::config, "Creating '" + config.kind + "' client");
    return it->second(config, std::move(session));
}

}  // namespace kcenon::webhdfs
