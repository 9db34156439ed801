// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file remote_error.h
 * @brief Decoding of RemoteException payloads into error codes
 */

#ifndef KCENON_WEBHDFS_TRANSPORT_REMOTE_ERROR_H
#define KCENON_WEBHDFS_TRANSPORT_REMOTE_ERROR_H

#include "kcenon/webhdfs/core/types.h"

#include <string>
#include <string_view>

namespace kcenon::webhdfs {

/**
 * @brief Map a remote exception class name to an error code
 *
 * Accepts both the short name (FileNotFoundException) and the fully
 * qualified Java class name. StandbyException maps to standby_endpoint,
 * which the transport treats as a failover trigger. Unknown names map to
 * remote_error.
 */
[[nodiscard]] auto map_remote_exception(std::string_view exception_name) -> error_code;

/**
 * @brief Decode an unsuccessful HTTP response into an error
 * @param status_code HTTP status of the response
 * @param body Response body (may be empty or non-JSON)
 *
 * A RemoteException JSON payload takes precedence. Without one the status
 * code decides: 401/403 permission_denied, 404 file_not_found, 5xx
 * server_error, anything else remote_error.
 */
[[nodiscard]] auto decode_remote_error(int status_code, const std::string& body) -> error;

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_TRANSPORT_REMOTE_ERROR_H
