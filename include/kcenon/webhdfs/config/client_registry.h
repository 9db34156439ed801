// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file client_registry.h
 * @brief Mapping from client kind to client factory
 */

#ifndef KCENON_WEBHDFS_CONFIG_CLIENT_REGISTRY_H
#define KCENON_WEBHDFS_CONFIG_CLIENT_REGISTRY_H

#include "kcenon/webhdfs/client/webhdfs_client.h"
#include "kcenon/webhdfs/config/client_config.h"
#include "kcenon/webhdfs/core/types.h"
#include "kcenon/webhdfs/http/http_session.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::webhdfs {

/**
 * @brief Creates clients by kind name
 *
 * The registry is a plain value owned by the application; nothing is
 * registered globally. with_builtin_kinds() provides:
 * - "insecure": adds user.name=<user> to every request when the "user"
 *   option is set
 * - "token": requires the "token" option and adds delegation=<token>
 *
 * @code
 * auto registry = client_registry::with_builtin_kinds();
 * auto config = client_config::from_options({{"url", "http://nn:50070"},
 *                                           {"user", "alice"}});
 * auto client = registry.create(config.value());
 * @endcode
 */
class client_registry {
public:
    /// Factory for one kind; session is nullptr to use the default backend
    using factory = std::function<result<webhdfs_client>(
        const client_config&, std::shared_ptr<http_session>)>;

    client_registry() = default;

    /**
     * @brief Registry with the insecure and token kinds
     */
    [[nodiscard]] static auto with_builtin_kinds() -> client_registry;

    /**
     * @brief Register or replace a kind
     */
    void register_kind(const std::string& name, factory make);

    [[nodiscard]] auto contains(const std::string& name) const -> bool;

    /**
     * @brief Registered kind names in sorted order
     */
    [[nodiscard]] auto kinds() const -> std::vector<std::string>;

    /**
     * @brief Create a client for config.kind
     * @return config_error for an unknown kind or an invalid configuration
     */
    [[nodiscard]] auto create(const client_config& config,
                              std::shared_ptr<http_session> session = nullptr) const
        -> result<webhdfs_client>;

private:
    std::map<std::string, factory> factories_;
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CONFIG_CLIENT_REGISTRY_H
