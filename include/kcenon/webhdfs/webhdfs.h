/**
 * @file webhdfs.h
 * @brief Main header for the webhdfs_client library
 * @version 0.1.0
 *
 * Include this header to access the client, the transfer engine and the
 * supporting types.
 *
 * @code
 * #include <kcenon/webhdfs/webhdfs.h>
 *
 * using namespace kcenon::webhdfs;
 *
 * auto client = webhdfs_client::builder()
 *     .with_url("http://namenode:9870")
 *     .with_root("/user/alice")
 *     .build();
 *
 * auto summary = client.value().download("models/#LATEST", "./models", {});
 * @endcode
 */

#ifndef KCENON_WEBHDFS_WEBHDFS_H
#define KCENON_WEBHDFS_WEBHDFS_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/webhdfs/core/types.h"
#include "kcenon/webhdfs/core/file_status.h"
#include "kcenon/webhdfs/core/logging.h"

// Configuration
#include "kcenon/webhdfs/config/client_config.h"
#include "kcenon/webhdfs/config/client_registry.h"

// Client
#include "kcenon/webhdfs/client/client_types.h"
#include "kcenon/webhdfs/client/read_stream.h"
#include "kcenon/webhdfs/client/write_stream.h"
#include "kcenon/webhdfs/client/webhdfs_client.h"

// Transport
#include "kcenon/webhdfs/transport/retry_policy.h"
#include "kcenon/webhdfs/transport/webhdfs_transport.h"

// Transfer
#include "kcenon/webhdfs/transfer/progress_tracker.h"
#include "kcenon/webhdfs/transfer/transfer_engine.h"

namespace kcenon::webhdfs {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_WEBHDFS_H
