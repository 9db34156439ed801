// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file webhdfs_client.cpp
 * @brief WebHDFS client implementation
 */

#include "kcenon/webhdfs/client/webhdfs_client.h"

#include "kcenon/webhdfs/core/glob_pattern.h"
#include "kcenon/webhdfs/core/logging.h"
#include "kcenon/webhdfs/core/path_utils.h"
#include "kcenon/webhdfs/http/network_http_session.h"
#include "kcenon/webhdfs/resolver/path_resolver.h"
#include "kcenon/webhdfs/transfer/transfer_engine.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>

namespace kcenon::webhdfs {

namespace {

auto bool_param(bool value) -> std::string {
    return value ? "true" : "false";
}

/// Extract the {"boolean": ...} answer of MKDIRS, RENAME, DELETE, SETREPLICATION
auto boolean_answer(const nlohmann::json& answer, operation op) -> result<bool> {
    auto it = answer.find("boolean");
    if (it == answer.end() || !it->is_boolean()) {
        return unexpected{error{error_code::protocol_error,
            std::string("Missing boolean answer for ") + to_string(op)}};
    }
    return it->get<bool>();
}

auto is_octal_permission(const std::string& permission) -> bool {
    if (permission.empty() || permission.size() > 4) {
        return false;
    }
    return std::all_of(permission.begin(), permission.end(),
                       [](char c) { return c >= '0' && c <= '7'; });
}

/**
 * @brief Index of a part-file name ("part-00001", "part-m-00002.avro")
 */
auto part_index(const std::string& name) -> std::optional<int> {
    std::string_view rest(name);
    if (rest.substr(0, 5) != "part-") {
        return std::nullopt;
    }
    rest.remove_prefix(5);
    if (rest.size() >= 2 && (rest[0] == 'm' || rest[0] == 'r') && rest[1] == '-') {
        rest.remove_prefix(2);
    }
    std::size_t digits = 0;
    while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits > 9) {
        return std::nullopt;
    }
    return std::stoi(std::string(rest.substr(0, digits)));
}

/// posixpath.split semantics: ("a/b", "c") for "a/b/c", ("/", "c") for "/c"
auto split_pattern(const std::string& pattern) -> std::pair<std::string, std::string> {
    auto pos = pattern.rfind('/');
    if (pos == std::string::npos) {
        return {"", pattern};
    }
    std::string head = pattern.substr(0, pos + 1);
    std::string tail = pattern.substr(pos + 1);
    if (head.find_first_not_of('/') != std::string::npos) {
        while (!head.empty() && head.back() == '/') {
            head.pop_back();
        }
    }
    return {head, tail};
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct webhdfs_client::impl {
    client_config config;
    std::unique_ptr<webhdfs_transport> transport;
    path_resolver resolver;

    impl(client_config c, std::unique_ptr<webhdfs_transport> t)
        : config(std::move(c)),
          transport(std::move(t)),
          resolver(config.root, [raw = transport.get()](const std::string& path) {
              return list_raw(*raw, path);
          }) {}

    static auto list_raw(webhdfs_transport& t, const std::string& path)
        -> result<std::vector<file_status>> {
        auto answer = t.execute_json(operation::list_status, path);
        if (!answer.has_value()) {
            return unexpected{answer.error()};
        }
        return parse_listing(answer.value());
    }

    auto status_raw(const std::string& path) -> result<file_status> {
        auto answer = transport->execute_json(operation::get_file_status, path);
        if (!answer.has_value()) {
            return unexpected{answer.error()};
        }
        auto it = answer.value().find("FileStatus");
        if (it == answer.value().end()) {
            return unexpected{error{error_code::protocol_error,
                "GETFILESTATUS answer without FileStatus"}};
        }
        return file_status::from_json(*it);
    }

    auto list_status_raw(const std::string& path) -> result<std::vector<status_entry>> {
        auto listing = list_raw(*transport, path);
        if (!listing.has_value()) {
            return unexpected{listing.error()};
        }

        auto& entries = listing.value();
        if (entries.size() == 1 && entries.front().path_suffix.empty() &&
            !entries.front().is_directory()) {
            return unexpected{error{error_code::not_a_directory,
                "'" + path + "' is not a directory"}};
        }

        std::vector<status_entry> named;
        named.reserve(entries.size());
        for (auto& entry : entries) {
            auto name = entry.path_suffix;
            named.emplace_back(std::move(name), std::move(entry));
        }
        return named;
    }

    /// Execute an operation whose answer carries no payload
    auto execute_void(operation op, const std::string& path, const query_params& params)
        -> result<void> {
        auto response = transport->execute(op, path, params);
        if (!response.has_value()) {
            return unexpected{response.error()};
        }
        return {};
    }

    void walk_into(const std::string& path,
                   const file_status& status,
                   std::size_t level,
                   const walk_options& options,
                   std::vector<walk_entry>& entries,
                   error& failure) {
        auto children = list_status_raw(path);
        if (!children.has_value()) {
            failure = children.error();
            return;
        }

        walk_entry entry;
        entry.path = path;
        entry.status = status;
        for (auto& child : children.value()) {
            if (child.second.is_directory()) {
                entry.directories.push_back(std::move(child));
            } else {
                entry.files.push_back(std::move(child));
            }
        }

        auto subdirectories = entry.directories;
        entries.push_back(std::move(entry));

        if (options.depth != 0 && level >= options.depth) {
            return;
        }
        for (const auto& [name, child_status] : subdirectories) {
            walk_into(path_utils::join(path, name), child_status, level + 1,
                      options, entries, failure);
            if (failure) {
                return;
            }
        }
    }

    auto glob1(const std::string& directory, const std::string& pattern)
        -> result<std::vector<std::string>> {
        auto names = list_status_raw(directory);
        if (!names.has_value()) {
            auto code = names.error().code;
            if (code == error_code::file_not_found || code == error_code::not_a_directory) {
                return std::vector<std::string>{};
            }
            return unexpected{names.error()};
        }

        std::vector<std::string> matched;
        for (const auto& [name, status] : names.value()) {
            if (glob_pattern::is_hidden(name) && !glob_pattern::is_hidden(pattern)) {
                continue;
            }
            if (glob_pattern::matches(name, pattern)) {
                matched.push_back(name);
            }
        }
        return matched;
    }

    auto glob0(const std::string& directory, const std::string& base_name)
        -> result<std::vector<std::string>> {
        auto target = base_name.empty() ? directory : path_utils::join(directory, base_name);
        auto status = status_raw(target);
        if (!status.has_value()) {
            if (status.error().code == error_code::file_not_found) {
                return std::vector<std::string>{};
            }
            return unexpected{status.error()};
        }
        if (base_name.empty() && !status.value().is_directory()) {
            return std::vector<std::string>{};
        }
        return std::vector<std::string>{base_name};
    }

    auto iglob(const std::string& pattern) -> result<std::vector<std::string>> {
        auto [directory, base_name] = split_pattern(pattern);

        if (!glob_pattern::has_magic(pattern)) {
            auto resolved = resolver.resolve(base_name.empty() ? directory : pattern);
            if (!resolved.has_value()) {
                return unexpected{resolved.error()};
            }
            auto found = status_raw(resolved.value());
            if (!found.has_value()) {
                if (found.error().code == error_code::file_not_found) {
                    return std::vector<std::string>{};
                }
                return unexpected{found.error()};
            }
            if (base_name.empty() && !found.value().is_directory()) {
                return std::vector<std::string>{};
            }
            return std::vector<std::string>{pattern};
        }

        if (directory.empty()) {
            auto dot = resolver.resolve(".");
            if (!dot.has_value()) {
                return unexpected{dot.error()};
            }
            return glob1(dot.value(), base_name);
        }

        std::vector<std::string> directories;
        if (directory != pattern && glob_pattern::has_magic(directory)) {
            auto parents = iglob(directory);
            if (!parents.has_value()) {
                return parents;
            }
            directories = std::move(parents.value());
        } else {
            directories.push_back(directory);
        }

        std::vector<std::string> matched;
        for (const auto& dir : directories) {
            auto resolved_dir = resolver.resolve(dir);
            if (!resolved_dir.has_value()) {
                return unexpected{resolved_dir.error()};
            }
            auto names = glob_pattern::has_magic(base_name)
                ? glob1(resolved_dir.value(), base_name)
                : glob0(resolved_dir.value(), base_name);
            if (!names.has_value()) {
                return names;
            }
            for (const auto& name : names.value()) {
                matched.push_back(path_utils::join(dir, name));
            }
        }
        return matched;
    }
};

// ============================================================================
// Builder
// ============================================================================

webhdfs_client::builder::builder() = default;

auto webhdfs_client::builder::with_config(client_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto webhdfs_client::builder::with_url(std::string url) -> builder& {
    config_.urls.push_back(std::move(url));
    return *this;
}

auto webhdfs_client::builder::with_urls(std::vector<std::string> urls) -> builder& {
    config_.urls = std::move(urls);
    return *this;
}

auto webhdfs_client::builder::with_root(std::string root) -> builder& {
    config_.root = std::move(root);
    return *this;
}

auto webhdfs_client::builder::with_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.timeout = timeout;
    return *this;
}

auto webhdfs_client::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto webhdfs_client::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto webhdfs_client::builder::with_threads(std::optional<std::size_t> threads) -> builder& {
    config_.threads = threads;
    return *this;
}

auto webhdfs_client::builder::with_session(std::shared_ptr<http_session> session) -> builder& {
    session_ = std::move(session);
    return *this;
}

auto webhdfs_client::builder::with_default_param(std::string key, std::string value)
    -> builder& {
    default_params_.emplace_back(std::move(key), std::move(value));
    return *this;
}

auto webhdfs_client::builder::build() -> result<webhdfs_client> {
    auto valid = config_.validate();
    if (!valid.has_value()) {
        return unexpected{valid.error()};
    }

    auto session = session_ ? session_ : make_network_http_session(config_.timeout);

    transport_config transport_cfg;
    transport_cfg.endpoints = config_.urls;
    transport_cfg.retry = config_.retry;
    transport_cfg.default_params = default_params_;

    auto transport = webhdfs_transport::create(std::move(session), std::move(transport_cfg));
    if (!transport.has_value()) {
        return unexpected{transport.error()};
    }

    WH_LOG_DEBUG(log_category::client,
        "Created client for " + config_.urls.front() +
        (config_.root.empty() ? std::string{} : " with root " + config_.root));

    return webhdfs_client{std::move(config_), std::move(transport.value())};
}

// ============================================================================
// webhdfs_client
// ============================================================================

webhdfs_client::webhdfs_client(client_config config,
                               std::unique_ptr<webhdfs_transport> transport)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport))) {}

webhdfs_client::~webhdfs_client() = default;

webhdfs_client::webhdfs_client(webhdfs_client&&) noexcept = default;
auto webhdfs_client::operator=(webhdfs_client&&) noexcept -> webhdfs_client& = default;

auto webhdfs_client::resolve(const std::string& path) const -> result<std::string> {
    return impl_->resolver.resolve(path);
}

auto webhdfs_client::status(const std::string& path, bool strict)
    -> result<std::optional<file_status>> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    auto status = impl_->status_raw(resolved.value());
    if (!status.has_value()) {
        if (!strict && status.error().code == error_code::file_not_found) {
            return std::optional<file_status>{};
        }
        return unexpected{status.error()};
    }
    return std::optional<file_status>{std::move(status.value())};
}

auto webhdfs_client::content(const std::string& path, bool strict)
    -> result<std::optional<content_summary>> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    auto answer = impl_->transport->execute_json(operation::get_content_summary,
                                                 resolved.value());
    if (!answer.has_value()) {
        if (!strict && answer.error().code == error_code::file_not_found) {
            return std::optional<content_summary>{};
        }
        return unexpected{answer.error()};
    }

    auto it = answer.value().find("ContentSummary");
    if (it == answer.value().end()) {
        return unexpected{error{error_code::protocol_error,
            "GETCONTENTSUMMARY answer without ContentSummary"}};
    }
    auto summary = content_summary::from_json(*it);
    if (!summary.has_value()) {
        return unexpected{summary.error()};
    }
    return std::optional<content_summary>{summary.value()};
}

auto webhdfs_client::list(const std::string& path) -> result<std::vector<std::string>> {
    auto entries = list_status(path);
    if (!entries.has_value()) {
        return unexpected{entries.error()};
    }

    std::vector<std::string> names;
    names.reserve(entries.value().size());
    for (const auto& [name, status] : entries.value()) {
        names.push_back(name);
    }
    return names;
}

auto webhdfs_client::list_status(const std::string& path)
    -> result<std::vector<status_entry>> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }
    return impl_->list_status_raw(resolved.value());
}

auto webhdfs_client::walk(const std::string& path, const walk_options& options)
    -> result<std::vector<walk_entry>> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    std::vector<walk_entry> entries;
    auto root_status = impl_->status_raw(resolved.value());
    if (!root_status.has_value()) {
        if (options.ignore_missing && root_status.error().code == error_code::file_not_found) {
            return entries;
        }
        return unexpected{root_status.error()};
    }
    if (!root_status.value().is_directory()) {
        return entries;
    }

    error failure;
    impl_->walk_into(resolved.value(), root_status.value(), 1, options, entries, failure);
    if (failure) {
        return unexpected{failure};
    }
    return entries;
}

auto webhdfs_client::parts(const std::string& path, const std::vector<int>& indices)
    -> result<std::vector<status_entry>> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    auto status = impl_->status_raw(resolved.value());
    if (!status.has_value()) {
        return unexpected{status.error()};
    }
    if (!status.value().is_directory()) {
        return std::vector<status_entry>{{resolved.value(), status.value()}};
    }

    auto children = impl_->list_status_raw(resolved.value());
    if (!children.has_value()) {
        return unexpected{children.error()};
    }

    std::map<int, status_entry> part_files;
    for (auto& child : children.value()) {
        auto index = part_index(child.first);
        if (index && !child.second.is_directory()) {
            part_files.emplace(*index, std::move(child));
        }
    }
    if (part_files.empty()) {
        return unexpected{error{error_code::file_not_found,
            "No part-files found in '" + resolved.value() + "'"}};
    }

    std::vector<status_entry> selected;
    if (indices.empty()) {
        for (auto& [index, entry] : part_files) {
            selected.push_back(std::move(entry));
        }
        return selected;
    }

    for (int index : indices) {
        auto it = part_files.find(index);
        if (it == part_files.end()) {
            return unexpected{error{error_code::file_not_found,
                "No part-file with index " + std::to_string(index) +
                " in '" + resolved.value() + "'"}};
        }
        selected.push_back(it->second);
    }
    return selected;
}

auto webhdfs_client::glob(const std::string& pattern) -> result<std::vector<std::string>> {
    if (pattern.empty()) {
        return unexpected{error{error_code::invalid_path, "Empty pattern"}};
    }

    return impl_->iglob(pattern);
}

auto webhdfs_client::checksum(const std::string& path) -> result<file_checksum> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    auto answer = impl_->transport->execute_json(operation::get_file_checksum,
                                                 resolved.value());
    if (!answer.has_value()) {
        return unexpected{answer.error()};
    }
    auto it = answer.value().find("FileChecksum");
    if (it == answer.value().end()) {
        return unexpected{error{error_code::protocol_error,
            "GETFILECHECKSUM answer without FileChecksum"}};
    }
    return file_checksum::from_json(*it);
}

auto webhdfs_client::makedirs(const std::string& path,
                              const std::optional<std::string>& permission) -> result<void> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    query_params params;
    if (permission) {
        if (!is_octal_permission(*permission)) {
            return unexpected{error{error_code::illegal_argument,
                "Invalid permission: '" + *permission + "'"}};
        }
        params.emplace_back("permission", *permission);
    }

    auto answer = impl_->transport->execute_json(operation::mkdirs, resolved.value(), params);
    if (!answer.has_value()) {
        return unexpected{answer.error()};
    }
    auto created = boolean_answer(answer.value(), operation::mkdirs);
    if (!created.has_value()) {
        return unexpected{created.error()};
    }
    if (!created.value()) {
        return unexpected{error{error_code::remote_error,
            "Unable to create directory '" + resolved.value() + "'"}};
    }
    return {};
}

auto webhdfs_client::rename(const std::string& source, const std::string& destination)
    -> result<void> {
    auto src = resolve(source);
    if (!src.has_value()) {
        return unexpected{src.error()};
    }
    auto dst = resolve(destination);
    if (!dst.has_value()) {
        return unexpected{dst.error()};
    }

    std::string target = dst.value();
    auto existing = impl_->status_raw(target);
    if (existing.has_value() && existing.value().is_directory()) {
        target = path_utils::join(target, path_utils::base_name(src.value()));
    } else if (!existing.has_value() && existing.error().code != error_code::file_not_found) {
        return unexpected{existing.error()};
    }

    auto answer = impl_->transport->execute_json(operation::rename, src.value(),
                                                 {{"destination", target}});
    if (!answer.has_value()) {
        return unexpected{answer.error()};
    }
    auto renamed = boolean_answer(answer.value(), operation::rename);
    if (!renamed.has_value()) {
        return unexpected{renamed.error()};
    }
    if (!renamed.value()) {
        return unexpected{error{error_code::remote_error,
            "Unable to rename '" + src.value() + "' to '" + target + "'"}};
    }
    return {};
}

auto webhdfs_client::remove(const std::string& path, bool recursive) -> result<bool> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    auto answer = impl_->transport->execute_json(operation::remove, resolved.value(),
                                                 {{"recursive", bool_param(recursive)}});
    if (!answer.has_value()) {
        return unexpected{answer.error()};
    }
    return boolean_answer(answer.value(), operation::remove);
}

auto webhdfs_client::set_owner(const std::string& path,
                               const std::optional<std::string>& owner,
                               const std::optional<std::string>& group) -> result<void> {
    if (!owner && !group) {
        return unexpected{error{error_code::illegal_argument,
            "Owner or group must be specified"}};
    }
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    query_params params;
    if (owner) {
        params.emplace_back("owner", *owner);
    }
    if (group) {
        params.emplace_back("group", *group);
    }
    return impl_->execute_void(operation::set_owner, resolved.value(), params);
}

auto webhdfs_client::set_permission(const std::string& path, const std::string& permission)
    -> result<void> {
    if (!is_octal_permission(permission)) {
        return unexpected{error{error_code::illegal_argument,
            "Invalid permission: '" + permission + "'"}};
    }
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }
    return impl_->execute_void(operation::set_permission, resolved.value(),
                               {{"permission", permission}});
}

auto webhdfs_client::set_replication(const std::string& path, uint32_t replication)
    -> result<void> {
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    auto answer = impl_->transport->execute_json(operation::set_replication, resolved.value(),
                                                 {{"replication", std::to_string(replication)}});
    if (!answer.has_value()) {
        return unexpected{answer.error()};
    }
    auto changed = boolean_answer(answer.value(), operation::set_replication);
    if (!changed.has_value()) {
        return unexpected{changed.error()};
    }
    if (!changed.value()) {
        return unexpected{error{error_code::remote_error,
            "Unable to set replication of '" + resolved.value() + "'"}};
    }
    return {};
}

auto webhdfs_client::set_times(const std::string& path,
                               std::optional<int64_t> access_time,
                               std::optional<int64_t> modification_time) -> result<void> {
    if (!access_time && !modification_time) {
        return unexpected{error{error_code::illegal_argument,
            "Access or modification time must be specified"}};
    }
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    query_params params;
    if (access_time) {
        params.emplace_back("accesstime", std::to_string(*access_time));
    }
    if (modification_time) {
        params.emplace_back("modificationtime", std::to_string(*modification_time));
    }
    return impl_->execute_void(operation::set_times, resolved.value(), params);
}

auto webhdfs_client::read(const std::string& path, const read_options& options)
    -> result<read_stream> {
    if (options.chunk_size == 0) {
        return unexpected{error{error_code::illegal_argument, "Chunk size must be positive"}};
    }
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    query_params params;
    if (options.offset > 0) {
        params.emplace_back("offset", std::to_string(options.offset));
    }
    if (options.length) {
        params.emplace_back("length", std::to_string(*options.length));
    }
    if (options.buffer_size) {
        params.emplace_back("buffersize", std::to_string(*options.buffer_size));
    }

    auto response = impl_->transport->execute(operation::open, resolved.value(), params);
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return read_stream(resolved.value(), std::move(response.value()),
                       options.chunk_size, options.progress);
}

namespace {

auto write_params(const write_options& options) -> result<query_params> {
    if (options.append && options.overwrite) {
        return unexpected{error{error_code::illegal_argument,
            "Cannot both overwrite and append"}};
    }
    if (options.append && (options.permission || options.blocksize || options.replication)) {
        return unexpected{error{error_code::illegal_argument,
            "Cannot change file properties while appending"}};
    }
    if (options.permission && !is_octal_permission(*options.permission)) {
        return unexpected{error{error_code::illegal_argument,
            "Invalid permission: '" + *options.permission + "'"}};
    }

    query_params params;
    if (!options.append) {
        params.emplace_back("overwrite", bool_param(options.overwrite));
    }
    if (options.permission) {
        params.emplace_back("permission", *options.permission);
    }
    if (options.blocksize) {
        params.emplace_back("blocksize", std::to_string(*options.blocksize));
    }
    if (options.replication) {
        params.emplace_back("replication", std::to_string(*options.replication));
    }
    if (options.buffer_size) {
        params.emplace_back("buffersize", std::to_string(*options.buffer_size));
    }
    return params;
}

}  // namespace

auto webhdfs_client::write(const std::string& path, const write_options& options)
    -> result<std::unique_ptr<write_stream>> {
    auto params = write_params(options);
    if (!params.has_value()) {
        return unexpected{params.error()};
    }
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    auto op = options.append ? operation::append : operation::create;
    auto* transport = impl_->transport.get();
    auto request = [transport, op, target = resolved.value(),
                    query = std::move(params.value())](body_source body) -> result<void> {
        auto response = transport->execute(op, target, query, std::move(body));
        if (!response.has_value()) {
            return unexpected{response.error()};
        }
        return {};
    };

    return std::make_unique<write_stream>(resolved.value(), std::move(request),
                                          options.queue_depth);
}

auto webhdfs_client::write(const std::string& path,
                           std::span<const uint8_t> data,
                           const write_options& options) -> result<void> {
    auto params = write_params(options);
    if (!params.has_value()) {
        return unexpected{params.error()};
    }
    auto resolved = resolve(path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    std::size_t offset = 0;
    body_source body = [data, &offset](std::span<std::byte> buffer) -> result<std::size_t> {
        auto count = std::min(buffer.size(), data.size() - offset);
        if (count > 0) {
            std::memcpy(buffer.data(), data.data() + offset, count);
            offset += count;
        }
        return count;
    };

    auto op = options.append ? operation::append : operation::create;
    auto response = impl_->transport->execute(op, resolved.value(), params.value(),
                                              std::move(body));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return {};
}

auto webhdfs_client::write(const std::string& path,
                           std::string_view data,
                           const write_options& options) -> result<void> {
    return write(path, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()), options);
}

auto webhdfs_client::upload(const std::string& local_path,
                            const std::string& remote_path,
                            const transfer_options& options) -> result<transfer_summary> {
    transfer_engine engine(*this);
    return engine.upload(local_path, remote_path, options);
}

auto webhdfs_client::download(const std::string& remote_path,
                              const std::string& local_path,
                              const transfer_options& options) -> result<transfer_summary> {
    transfer_engine engine(*this);
    return engine.download(remote_path, local_path, options);
}

auto webhdfs_client::config() const -> const client_config& {
    return impl_->config;
}

auto webhdfs_client::transport() -> webhdfs_transport& {
    return *impl_->transport;
}

}  // namespace kcenon::webhdfs
