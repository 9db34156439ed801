// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file command_line.cpp
 * @brief Command line parsing and command dispatch
 */

#include "kcenon/webhdfs/cli/command_line.h"

#include "kcenon/webhdfs/client/webhdfs_client.h"
#include "kcenon/webhdfs/config/client_registry.h"
#include "kcenon/webhdfs/core/logging.h"
#include "kcenon/webhdfs/transfer/progress_tracker.h"
#include "kcenon/webhdfs/webhdfs.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace kcenon::webhdfs::cli {

namespace {

constexpr const char* stdio_path = "-";

/// Number of positional arguments each command takes
const std::map<std::string, std::size_t>& command_arity() {
    static const std::map<std::string, std::size_t> arity = {
        {"cat", 1},     {"content", 1}, {"delete", 1}, {"download", 2},
        {"glob", 1},    {"list", 1},    {"mkdir", 1},  {"rename", 2},
        {"status", 1},  {"upload", 2},
    };
    return arity;
}

auto invalid(const std::string& message) -> unexpected {
    return unexpected{error{error_code::illegal_argument, message}};
}

auto parse_count(const std::string& option, const std::string& value)
    -> result<std::size_t> {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return invalid("Option " + option + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return invalid("Option " + option + " is out of range: '" + value + "'");
    }
}

auto join_urls(const std::vector<std::string>& urls) -> std::string {
    std::string joined;
    for (const auto& url : urls) {
        if (!joined.empty()) {
            joined += ';';
        }
        joined += url;
    }
    return joined;
}

auto local_size(const std::string& path, std::size_t& files) -> uint64_t {
    namespace fs = std::filesystem;
    std::error_code ec;
    uint64_t total = 0;
    files = 0;
    if (fs::is_directory(path, ec)) {
        for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                total += it->file_size(ec);
                ++files;
            }
        }
    } else if (fs::is_regular_file(path, ec)) {
        total = fs::file_size(path, ec);
        files = 1;
    }
    return total;
}

/// Without -t or a configured value, every file gets its own worker
auto worker_threads(const webhdfs_client& client, const cli_options& options)
    -> std::optional<std::size_t> {
    if (options.threads) {
        return options.threads;
    }
    return client.config().threads.value_or(0);
}

/**
 * @brief Progress line on the error stream, overwritten in place
 *
 * Workers report concurrently, so each write re-renders the tracker under
 * the display lock and the last line written reflects the final totals.
 */
class progress_display {
public:
    progress_display(std::ostream& err, uint64_t expected_bytes, std::size_t expected_files)
        : err_(err), tracker_(expected_bytes, expected_files) {
        tracker_.set_writer([this](const std::string&) {
            std::lock_guard<std::mutex> lock(mutex_);
            err_ << '\r' << tracker_.render() << std::flush;
            written_ = true;
        });
    }

    ~progress_display() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (written_) {
            err_ << '\n';
        }
    }

    auto callback() -> progress_callback { return tracker_.callback(); }

private:
    std::ostream& err_;
    progress_tracker tracker_;
    std::mutex mutex_;
    bool written_ = false;
};

auto stream_to(read_stream& stream, std::ostream& out) -> result<void> {
    while (true) {
        auto chunk = stream.next_chunk();
        if (!chunk.has_value()) {
            return unexpected{chunk.error()};
        }
        if (chunk.value().empty()) {
            break;
        }
        out.write(reinterpret_cast<const char*>(chunk.value().data()),
                  static_cast<std::streamsize>(chunk.value().size()));
        if (!out) {
            return unexpected{error{error_code::local_io_error, "Unable to write output"}};
        }
    }
    out.flush();
    return {};
}

auto stream_from(std::istream& in, write_stream& writer, std::size_t chunk_size)
    -> result<void> {
    std::vector<char> buffer(chunk_size);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = static_cast<std::size_t>(in.gcount());
        if (count == 0) {
            break;
        }
        auto written = writer.write(std::string_view(buffer.data(), count));
        if (!written.has_value()) {
            writer.abort();
            return written;
        }
    }
    if (in.bad()) {
        writer.abort();
        return unexpected{error{error_code::local_io_error, "Unable to read input"}};
    }
    return writer.close();
}

// ============================================================================
// Commands
// ============================================================================

auto cmd_cat(webhdfs_client& client, const std::string& path, console io) -> result<void> {
    read_options options;
    options.chunk_size = client.config().chunk_size;
    auto stream = client.read(path, options);
    if (!stream.has_value()) {
        return unexpected{stream.error()};
    }
    return stream_to(stream.value(), io.out);
}

auto cmd_download(webhdfs_client& client, const cli_options& options, console io)
    -> result<void> {
    const auto& remote = options.arguments[0];
    const auto& local = options.arguments[1];
    if (local == stdio_path) {
        return cmd_cat(client, remote, io);
    }

    transfer_options transfer;
    transfer.threads = worker_threads(client, options);
    transfer.chunk_size = client.config().chunk_size;
    transfer.overwrite = options.force;

    std::unique_ptr<progress_display> display;
    if (!options.silent) {
        auto summary = client.content(remote);
        if (!summary.has_value()) {
            return unexpected{summary.error()};
        }
        const auto& totals = *summary.value();
        display = std::make_unique<progress_display>(
            io.err, static_cast<uint64_t>(totals.length),
            static_cast<std::size_t>(totals.file_count));
        transfer.progress = display->callback();
    }

    auto outcome = client.download(remote, local, transfer);
    if (!outcome.has_value()) {
        return unexpected{outcome.error()};
    }
    return {};
}

auto cmd_upload(webhdfs_client& client, const cli_options& options, console io)
    -> result<void> {
    const auto& local = options.arguments[0];
    const auto& remote = options.arguments[1];

    if (local == stdio_path || options.append) {
        write_options write;
        write.overwrite = options.force;
        write.append = options.append;
        auto writer = client.write(remote, write);
        if (!writer.has_value()) {
            return unexpected{writer.error()};
        }
        if (local == stdio_path) {
            return stream_from(io.in, *writer.value(), client.config().chunk_size);
        }
        std::ifstream input(local, std::ios::binary);
        if (!input) {
            writer.value()->abort();
            return unexpected{error{error_code::file_not_found,
                "No local file found at '" + local + "'"}};
        }
        return stream_from(input, *writer.value(), client.config().chunk_size);
    }

    transfer_options transfer;
    transfer.threads = worker_threads(client, options);
    transfer.chunk_size = client.config().chunk_size;
    transfer.overwrite = options.force;

    std::unique_ptr<progress_display> display;
    if (!options.silent) {
        std::size_t files = 0;
        auto bytes = local_size(local, files);
        display = std::make_unique<progress_display>(io.err, bytes, files);
        transfer.progress = display->callback();
    }

    auto outcome = client.upload(local, remote, transfer);
    if (!outcome.has_value()) {
        return unexpected{outcome.error()};
    }
    return {};
}

auto cmd_list(webhdfs_client& client, const std::string& path, console io) -> result<void> {
    auto entries = client.list_status(path);
    if (!entries.has_value()) {
        return unexpected{entries.error()};
    }
    for (const auto& [name, status] : entries.value()) {
        io.out << name << (status.is_directory() ? "/" : "") << '\n';
    }
    return {};
}

auto cmd_status(webhdfs_client& client, const std::string& path, console io) -> result<void> {
    auto status = client.status(path);
    if (!status.has_value()) {
        return unexpected{status.error()};
    }
    io.out << status.value()->to_json().dump(2) << '\n';
    return {};
}

auto cmd_content(webhdfs_client& client, const std::string& path, console io) -> result<void> {
    auto summary = client.content(path);
    if (!summary.has_value()) {
        return unexpected{summary.error()};
    }
    io.out << summary.value()->to_json().dump(2) << '\n';
    return {};
}

auto cmd_delete(webhdfs_client& client, const cli_options& options) -> result<void> {
    const auto& path = options.arguments[0];
    auto removed = client.remove(path, options.recursive);
    if (!removed.has_value()) {
        return unexpected{removed.error()};
    }
    if (!removed.value()) {
        return unexpected{error{error_code::file_not_found,
            "Nothing to delete at '" + path + "'"}};
    }
    return {};
}

auto cmd_glob(webhdfs_client& client, const std::string& pattern, console io) -> result<void> {
    auto matches = client.glob(pattern);
    if (!matches.has_value()) {
        return unexpected{matches.error()};
    }
    for (const auto& path : matches.value()) {
        io.out << path << '\n';
    }
    return {};
}

auto to_log_level(int verbosity) -> log_level {
    switch (verbosity) {
        case 0: return log_level::warn;
        case 1: return log_level::info;
        case 2: return log_level::debug;
        default: return log_level::trace;
    }
}

}  // namespace

auto process_environment() -> environment_lookup {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

auto parse_command_line(const std::vector<std::string>& args, const environment_lookup& env)
    -> result<cli_options> {
    cli_options options;
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        auto next_value = [&](const std::string& name) -> result<std::string> {
            if (i + 1 >= args.size()) {
                return invalid("Option " + name + " requires a value");
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
            return options;
        }
        if (arg == "-V" || arg == "--version") {
            options.version = true;
            return options;
        }

        if (arg == "--url" || arg == "--root" || arg == "--user" || arg == "--token" ||
            arg == "--kind" || arg == "--timeout" || arg == "--retries" ||
            arg == "-t" || arg == "--threads") {
            auto value = next_value(arg);
            if (!value.has_value()) {
                return unexpected{value.error()};
            }
            if (arg == "--url") {
                for (auto& url : split_urls(value.value())) {
                    options.urls.push_back(std::move(url));
                }
            } else if (arg == "--root") {
                options.root = value.value();
            } else if (arg == "--user") {
                options.user = value.value();
            } else if (arg == "--token") {
                options.token = value.value();
            } else if (arg == "--kind") {
                options.kind = value.value();
            } else if (arg == "--timeout") {
                options.timeout = value.value();
            } else if (arg == "--retries") {
                options.retries = value.value();
            } else {
                auto count = parse_count(arg, value.value());
                if (!count.has_value()) {
                    return unexpected{count.error()};
                }
                options.threads = count.value();
            }
        } else if (arg == "-f" || arg == "--force") {
            options.force = true;
        } else if (arg == "-s" || arg == "--silent") {
            options.silent = true;
        } else if (arg == "-A" || arg == "--append") {
            options.append = true;
        } else if (arg == "-r" || arg == "--recursive") {
            options.recursive = true;
        } else if (arg == "--json-log") {
            options.json_log = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == 'v' &&
                   arg.find_first_not_of('v', 1) == std::string::npos) {
            options.verbosity += static_cast<int>(arg.size() - 1);
        } else if (arg.size() > 1 && arg[0] == '-') {
            return invalid("Unknown option '" + arg + "'");
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        return invalid("Missing command");
    }
    options.command = positional.front();
    options.arguments.assign(positional.begin() + 1, positional.end());

    auto arity = command_arity().find(options.command);
    if (arity == command_arity().end()) {
        return invalid("Unknown command '" + options.command + "'");
    }
    if (options.arguments.size() != arity->second) {
        return invalid("Command '" + options.command + "' expects " +
                       std::to_string(arity->second) + " argument(s)");
    }
    if (options.recursive && options.command != "delete") {
        return invalid("Option -r only applies to delete");
    }
    if (options.append && options.command != "upload") {
        return invalid("Option -A only applies to upload");
    }

    if (env) {
        if (options.urls.empty()) {
            if (auto url = env("WEBHDFS_URL")) {
                options.urls = split_urls(*url);
            }
        }
        if (!options.root) {
            options.root = env("WEBHDFS_ROOT");
        }
        if (!options.user) {
            options.user = env("WEBHDFS_USER");
        }
    }

    return options;
}

auto to_config(const cli_options& options) -> result<client_config> {
    std::map<std::string, std::string> values;
    if (!options.urls.empty()) {
        values["url"] = join_urls(options.urls);
    }
    if (options.root) {
        values["root"] = *options.root;
    }
    if (options.user) {
        values["user"] = *options.user;
    }
    if (options.token) {
        values["token"] = *options.token;
        values["client"] = "token";
    }
    if (options.kind) {
        values["client"] = *options.kind;
    }
    if (options.timeout) {
        values["timeout"] = *options.timeout;
    }
    if (options.retries) {
        values["retries"] = *options.retries;
    }
    if (options.threads) {
        values["threads"] = std::to_string(*options.threads);
    }
    return client_config::from_options(values);
}

auto run_command(webhdfs_client& client, const cli_options& options, console io)
    -> result<void> {
    const auto& command = options.command;
    WH_LOG_DEBUG(log_category::cli, "Running command '" + command + "'");

    if (command == "download") {
        return cmd_download(client, options, io);
    }
    if (command == "upload") {
        return cmd_upload(client, options, io);
    }
    if (command == "cat") {
        return cmd_cat(client, options.arguments[0], io);
    }
    if (command == "list") {
        return cmd_list(client, options.arguments[0], io);
    }
    if (command == "status") {
        return cmd_status(client, options.arguments[0], io);
    }
    if (command == "content") {
        return cmd_content(client, options.arguments[0], io);
    }
    if (command == "delete") {
        return cmd_delete(client, options);
    }
    if (command == "mkdir") {
        return client.makedirs(options.arguments[0]);
    }
    if (command == "rename") {
        return client.rename(options.arguments[0], options.arguments[1]);
    }
    if (command == "glob") {
        return cmd_glob(client, options.arguments[0], io);
    }
    return invalid("Unknown command '" + command + "'");
}

auto usage(const std::string& program) -> std::string {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options] <command> [arguments]\n"
        << "\n"
        << "Commands:\n"
        << "  download HDFS_PATH LOCAL_PATH   Download a file or directory ('-' for stdout)\n"
        << "  upload LOCAL_PATH HDFS_PATH     Upload a file or directory ('-' for stdin)\n"
        << "  cat HDFS_PATH                   Write a remote file to stdout\n"
        << "  list HDFS_PATH                  List a directory\n"
        << "  status HDFS_PATH                Show file status as JSON\n"
        << "  content HDFS_PATH               Show content summary as JSON\n"
        << "  delete [-r] HDFS_PATH           Delete a path\n"
        << "  mkdir HDFS_PATH                 Create a directory and its parents\n"
        << "  rename SRC DST                  Move a path\n"
        << "  glob PATTERN                    List paths matching a wildcard pattern\n"
        << "\n"
        << "Options:\n"
        << "  --url <url>          Namenode URL, repeatable or ';' separated (env WEBHDFS_URL)\n"
        << "  --root <path>        Root for relative paths (env WEBHDFS_ROOT)\n"
        << "  --user <name>        User name for insecure clusters (env WEBHDFS_USER)\n"
        << "  --token <token>      Delegation token\n"
        << "  --kind <kind>        Client kind (insecure, token)\n"
        << "  --timeout <seconds>  Per-request timeout\n"
        << "  --retries <n>        Retries per request\n"
        << "  -t, --threads <n>    Transfer workers (default 0, one per file)\n"
        << "  -f, --force          Overwrite existing destinations\n"
        << "  -A, --append         Append to an existing remote file on upload\n"
        << "  -s, --silent         Hide transfer progress\n"
        << "  -v                   Increase log verbosity (repeatable)\n"
        << "  --json-log           Log as JSON lines\n"
        << "  -h, --help           Show this help message\n"
        << "  -V, --version        Show version\n";
    return oss.str();
}

auto run_cli(const std::vector<std::string>& args, const environment_lookup& env, console io)
    -> int {
    auto parsed = parse_command_line(args, env);
    if (!parsed.has_value()) {
        io.err << "webhdfs_cli: " << parsed.error().message << "\n\n"
               << usage("webhdfs_cli");
        return 1;
    }
    const auto& options = parsed.value();
    if (options.help) {
        io.out << usage("webhdfs_cli");
        return 0;
    }
    if (options.version) {
        io.out << "webhdfs_cli " << version::to_string() << '\n';
        return 0;
    }

    auto& logger = get_logger();
    logger.set_level(to_log_level(options.verbosity));
    if (options.json_log) {
        logger.set_output_format(log_output_format::json);
    }

    auto config = to_config(options);
    if (!config.has_value()) {
        io.err << "webhdfs_cli: " << config.error().message << '\n';
        return 1;
    }

    auto registry = client_registry::with_builtin_kinds();
    auto client = registry.create(config.value());
    if (!client.has_value()) {
        io.err << "webhdfs_cli: " << client.error().message << '\n';
        return 1;
    }

    auto outcome = run_command(client.value(), options, io);
    if (!outcome.has_value()) {
        WH_LOG_DEBUG(log_category::cli, "Command '" + options.command + "' failed");
        io.err << "webhdfs_cli: " << outcome.error().message << '\n';
        return 1;
    }
    return 0;
}

}  // namespace kcenon::webhdfs::cli
