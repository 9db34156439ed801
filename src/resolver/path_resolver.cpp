// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file path_resolver.cpp
 * @brief Path resolution implementation
 */

#include "kcenon/webhdfs/resolver/path_resolver.h"

#include "kcenon/webhdfs/core/logging.h"
#include "kcenon/webhdfs/core/path_utils.h"

#include <string_view>

namespace kcenon::webhdfs {

path_resolver::path_resolver(std::string root, directory_lister lister)
    : root_(std::move(root)), lister_(std::move(lister)) {}

auto path_resolver::resolve(const std::string& path) const -> result<std::string> {
    if (path.empty()) {
        return unexpected{error{error_code::invalid_path, "Empty path"}};
    }

    std::string joined;
    if (path.front() == '/') {
        joined = path;
    } else {
        if (root_.empty()) {
            return unexpected{error{error_code::config_error,
                "Relative path '" + path + "' requires a root directory"}};
        }
        if (root_.front() != '/') {
            return unexpected{error{error_code::config_error,
                "Root directory must be absolute: '" + root_ + "'"}};
        }
        joined = path_utils::join(root_, path);
    }

    auto segments = path_utils::split(joined);
    std::size_t marker_index = segments.size();
    std::size_t marker_count = 0;
    const std::string_view marker(latest_marker);
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].find(marker) == std::string::npos) {
            continue;
        }
        if (segments[i] != marker) {
            return unexpected{error{error_code::config_error,
                "Marker must be a whole path segment: '" + segments[i] + "'"}};
        }
        ++marker_count;
        marker_index = i;
    }

    if (marker_count > 1) {
        return unexpected{error{error_code::config_error,
            "Only one " + std::string(marker) + " marker is supported per path"}};
    }

    if (marker_count == 0) {
        return path_utils::normalize(joined);
    }

    std::string prefix;
    for (std::size_t i = 0; i < marker_index; ++i) {
        prefix += '/';
        prefix += segments[i];
    }
    auto parent = path_utils::normalize(prefix.empty() ? std::string("/") : prefix);
    if (!parent.has_value()) {
        return unexpected{parent.error()};
    }

    auto latest = resolve_latest(parent.value());
    if (!latest.has_value()) {
        return unexpected{latest.error()};
    }

    std::string substituted = path_utils::join(parent.value(), latest.value());
    for (std::size_t i = marker_index + 1; i < segments.size(); ++i) {
        substituted += '/';
        substituted += segments[i];
    }

    auto canonical = path_utils::normalize(substituted);
    if (canonical.has_value()) {
        WH_LOG_DEBUG(log_category::resolver,
            "Resolved '" + path + "' to '" + canonical.value() + "'");
    }
    return canonical;
}

auto path_resolver::resolve_latest(const std::string& parent) const -> result<std::string> {
    if (!lister_) {
        return unexpected{error{error_code::config_error,
            "Marker resolution requires a directory listing"}};
    }

    auto children = lister_(parent);
    if (!children.has_value()) {
        return unexpected{children.error()};
    }

    const auto& entries = children.value();
    if (entries.size() == 1 && entries.front().path_suffix.empty()) {
        return unexpected{error{error_code::not_a_directory,
            "Marker parent is not a directory: '" + parent + "'"}};
    }
    if (entries.empty()) {
        return unexpected{error{error_code::file_not_found,
            "No children under '" + parent + "' to resolve " + latest_marker}};
    }

    const file_status* newest = &entries.front();
    for (const auto& entry : entries) {
        if (entry.modification_time > newest->modification_time) {
            newest = &entry;
        }
    }
    return newest->path_suffix;
}

}  // namespace kcenon::webhdfs
