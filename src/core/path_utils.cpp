// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file path_utils.cpp
 * @brief Remote path manipulation helpers
 */

#include "kcenon/webhdfs/core/path_utils.h"

namespace kcenon::webhdfs::path_utils {

auto split(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            segments.emplace_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

auto normalize(std::string_view path) -> result<std::string> {
    if (path.empty() || path.front() != '/') {
        return unexpected{error{error_code::invalid_path,
            "Path is not absolute: '" + std::string(path) + "'"}};
    }

    std::vector<std::string> stack;
    for (auto& segment : split(path)) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (stack.empty()) {
                return unexpected{error{error_code::invalid_path,
                    "Path escapes the filesystem root: '" + std::string(path) + "'"}};
            }
            stack.pop_back();
            continue;
        }
        stack.push_back(std::move(segment));
    }

    if (stack.empty()) {
        return std::string("/");
    }

    std::string canonical;
    for (const auto& segment : stack) {
        canonical += '/';
        canonical += segment;
    }
    return canonical;
}

auto join(std::string_view lhs, std::string_view rhs) -> std::string {
    if (!rhs.empty() && rhs.front() == '/') {
        return std::string(rhs);
    }
    if (rhs.empty()) {
        return std::string(lhs);
    }
    std::string joined(lhs);
    if (joined.empty() || joined.back() != '/') {
        joined += '/';
    }
    joined += rhs;
    return joined;
}

auto parent(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    auto pos = path.rfind('/');
    if (pos == std::string_view::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return std::string(path.substr(0, pos));
}

auto base_name(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    if (path == "/") {
        return {};
    }
    auto pos = path.rfind('/');
    return std::string(pos == std::string_view::npos ? path : path.substr(pos + 1));
}

auto relative_to(std::string_view descendant, std::string_view ancestor) -> std::string {
    if (ancestor == "/") {
        return descendant.size() > 1 ? std::string(descendant.substr(1)) : std::string{};
    }
    if (descendant.size() <= ancestor.size() ||
        descendant.substr(0, ancestor.size()) != ancestor ||
        descendant[ancestor.size()] != '/') {
        return {};
    }
    return std::string(descendant.substr(ancestor.size() + 1));
}

}  // namespace kcenon::webhdfs::path_utils
