// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file command_line.h
 * @brief Command line front end for the WebHDFS client
 */

#ifndef KCENON_WEBHDFS_CLI_COMMAND_LINE_H
#define KCENON_WEBHDFS_CLI_COMMAND_LINE_H

#include "kcenon/webhdfs/config/client_config.h"
#include "kcenon/webhdfs/core/types.h"

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::webhdfs {

class webhdfs_client;

namespace cli {

/// Looks up an environment variable
using environment_lookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Environment lookup backed by std::getenv
 */
[[nodiscard]] auto process_environment() -> environment_lookup;

/**
 * @brief Parsed command line
 */
struct cli_options {
    std::string command;
    std::vector<std::string> arguments;

    std::vector<std::string> urls;
    std::optional<std::string> root;
    std::optional<std::string> user;
    std::optional<std::string> token;
    std::optional<std::string> kind;
    std::optional<std::string> timeout;
    std::optional<std::string> retries;
    std::optional<std::size_t> threads;

    bool force = false;
    bool silent = false;
    bool append = false;
    bool recursive = false;
    bool json_log = false;
    bool help = false;
    bool version = false;
    int verbosity = 0;
};

/**
 * @brief Parse arguments (without the program name)
 *
 * Missing --url, --root and --user fall back to WEBHDFS_URL, WEBHDFS_ROOT
 * and WEBHDFS_USER.
 *
 * @return illegal_argument for unknown options, a missing command or a
 *         wrong number of positional arguments
 */
[[nodiscard]] auto parse_command_line(const std::vector<std::string>& args,
                                      const environment_lookup& env) -> result<cli_options>;

/**
 * @brief Client configuration described by the options
 */
[[nodiscard]] auto to_config(const cli_options& options) -> result<client_config>;

/**
 * @brief Streams a command talks to
 */
struct console {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

/**
 * @brief Execute a parsed command against a client
 */
[[nodiscard]] auto run_command(webhdfs_client& client, const cli_options& options,
                               console io) -> result<void>;

/**
 * @brief Usage text
 */
[[nodiscard]] auto usage(const std::string& program) -> std::string;

/**
 * @brief Full program: parse, configure logging, create the client, run
 * @return Process exit status (0 on success, 1 on any error)
 */
[[nodiscard]] auto run_cli(const std::vector<std::string>& args, const environment_lookup& env,
                           console io) -> int;

}  // namespace cli
}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_CLI_COMMAND_LINE_H
