// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file operation.h
 * @brief WebHDFS filesystem operations and their wire properties
 */

#ifndef KCENON_WEBHDFS_TRANSPORT_OPERATION_H
#define KCENON_WEBHDFS_TRANSPORT_OPERATION_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::webhdfs {

/**
 * @brief Ordered query parameters (op is added by the transport)
 */
using query_params = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Filesystem operations understood by the remote endpoint
 */
enum class operation {
    open,
    create,
    append,
    mkdirs,
    rename,
    remove,
    get_file_status,
    list_status,
    get_content_summary,
    set_permission,
    set_owner,
    set_replication,
    set_times,
    get_file_checksum,
};

/**
 * @brief Wire name of the operation (value of the op parameter)
 */
[[nodiscard]] constexpr auto to_string(operation op) -> const char* {
    switch (op) {
        case operation::open: return "OPEN";
        case operation::create: return "CREATE";
        case operation::append: return "APPEND";
        case operation::mkdirs: return "MKDIRS";
        case operation::rename: return "RENAME";
        case operation::remove: return "DELETE";
        case operation::get_file_status: return "GETFILESTATUS";
        case operation::list_status: return "LISTSTATUS";
        case operation::get_content_summary: return "GETCONTENTSUMMARY";
        case operation::set_permission: return "SETPERMISSION";
        case operation::set_owner: return "SETOWNER";
        case operation::set_replication: return "SETREPLICATION";
        case operation::set_times: return "SETTIMES";
        case operation::get_file_checksum: return "GETFILECHECKSUM";
        default: return "UNKNOWN";
    }
}

/**
 * @brief HTTP method used for the operation
 */
[[nodiscard]] constexpr auto http_method(operation op) -> const char* {
    switch (op) {
        case operation::open:
        case operation::get_file_status:
        case operation::list_status:
        case operation::get_content_summary:
        case operation::get_file_checksum:
            return "GET";
        case operation::append:
            return "POST";
        case operation::remove:
            return "DELETE";
        default:
            return "PUT";
    }
}

/**
 * @brief Whether the operation moves file data through a storage node
 *
 * Data operations are issued in two phases: the namenode answers with a
 * redirect and the payload is exchanged with the redirect target.
 */
[[nodiscard]] constexpr auto is_data_operation(operation op) noexcept -> bool {
    return op == operation::open || op == operation::create || op == operation::append;
}

/**
 * @brief Whether the redirect phase is mandatory
 *
 * OPEN and GETFILECHECKSUM may be answered directly by gateways; CREATE and
 * APPEND must always redirect before the body is sent.
 */
[[nodiscard]] constexpr auto requires_redirect(operation op) noexcept -> bool {
    return op == operation::create || op == operation::append;
}

/**
 * @brief Whether the operation may be replayed after a transient failure
 * @param op Operation
 * @param params Query parameters of the request (CREATE is replayable only
 *        with overwrite=true)
 */
[[nodiscard]] inline auto is_idempotent(operation op, const query_params& params) -> bool {
    switch (op) {
        case operation::create:
            for (const auto& [key, value] : params) {
                if (key == "overwrite") {
                    return value == "true";
                }
            }
            return false;
        case operation::append:
        case operation::rename:
        case operation::remove:
            return false;
        default:
            return true;
    }
}

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_TRANSPORT_OPERATION_H
