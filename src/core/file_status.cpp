// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file file_status.cpp
 * @brief JSON mapping of server-reported attributes
 */

#include "kcenon/webhdfs/core/file_status.h"

#include <type_traits>

namespace kcenon::webhdfs {

namespace {

template <typename T>
auto field_or(const nlohmann::json& object, const char* key, T fallback) -> T {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) {
            return it->template get<std::string>();
        }
        if (it->is_number()) {
            return it->dump();
        }
        return fallback;
    } else {
        if (!it->is_number()) {
            return fallback;
        }
        return it->template get<T>();
    }
}

auto protocol_failure(const std::string& message) -> unexpected {
    return unexpected{error{error_code::protocol_error, message}};
}

}  // namespace

auto file_status::to_json() const -> nlohmann::json {
    return nlohmann::json{
        {"pathSuffix", path_suffix},
        {"type", to_string(type)},
        {"length", length},
        {"modificationTime", modification_time},
        {"accessTime", access_time},
        {"permission", permission},
        {"owner", owner},
        {"group", group},
        {"replication", replication},
        {"blockSize", block_size},
    };
}

auto file_status::from_json(const nlohmann::json& object) -> result<file_status> {
    if (!object.is_object()) {
        return protocol_failure("FileStatus is not an object");
    }
    auto type_it = object.find("type");
    if (type_it == object.end() || !type_it->is_string()) {
        return protocol_failure("FileStatus without type");
    }

    file_status status;
    auto type_name = type_it->get<std::string>();
    if (type_name == "DIRECTORY") {
        status.type = file_type::directory;
    } else if (type_name == "SYMLINK") {
        status.type = file_type::symlink;
    } else if (type_name == "FILE") {
        status.type = file_type::file;
    } else {
        return protocol_failure("Unknown file type: " + type_name);
    }

    status.path_suffix = field_or<std::string>(object, "pathSuffix", "");
    status.length = field_or<uint64_t>(object, "length", 0);
    status.modification_time = field_or<int64_t>(object, "modificationTime", 0);
    status.access_time = field_or<int64_t>(object, "accessTime", 0);
    status.permission = field_or<std::string>(object, "permission", "");
    status.owner = field_or<std::string>(object, "owner", "");
    status.group = field_or<std::string>(object, "group", "");
    status.replication = field_or<uint32_t>(object, "replication", 0);
    status.block_size = field_or<uint64_t>(object, "blockSize", 0);
    return status;
}

auto content_summary::to_json() const -> nlohmann::json {
    return nlohmann::json{
        {"length", length},
        {"fileCount", file_count},
        {"directoryCount", directory_count},
        {"quota", quota},
        {"spaceConsumed", space_consumed},
        {"spaceQuota", space_quota},
    };
}

auto content_summary::from_json(const nlohmann::json& object) -> result<content_summary> {
    if (!object.is_object()) {
        return protocol_failure("ContentSummary is not an object");
    }

    content_summary summary;
    summary.length = field_or<uint64_t>(object, "length", 0);
    summary.file_count = field_or<uint64_t>(object, "fileCount", 0);
    summary.directory_count = field_or<uint64_t>(object, "directoryCount", 0);
    summary.quota = field_or<int64_t>(object, "quota", -1);
    summary.space_consumed = field_or<uint64_t>(object, "spaceConsumed", 0);
    summary.space_quota = field_or<int64_t>(object, "spaceQuota", -1);
    return summary;
}

auto file_checksum::from_json(const nlohmann::json& object) -> result<file_checksum> {
    if (!object.is_object() || !object.contains("algorithm")) {
        return protocol_failure("FileChecksum without algorithm");
    }

    file_checksum checksum;
    checksum.algorithm = field_or<std::string>(object, "algorithm", "");
    checksum.bytes = field_or<std::string>(object, "bytes", "");
    checksum.length = field_or<uint64_t>(object, "length", 0);
    return checksum;
}

auto parse_listing(const nlohmann::json& answer) -> result<std::vector<file_status>> {
    auto outer = answer.find("FileStatuses");
    if (outer == answer.end() || !outer->is_object()) {
        return protocol_failure("LISTSTATUS answer without FileStatuses");
    }
    auto inner = outer->find("FileStatus");
    if (inner == outer->end() || !inner->is_array()) {
        return protocol_failure("LISTSTATUS answer without FileStatus array");
    }

    std::vector<file_status> entries;
    entries.reserve(inner->size());
    for (const auto& item : *inner) {
        auto parsed = file_status::from_json(item);
        if (!parsed.has_value()) {
            return unexpected{parsed.error()};
        }
        entries.push_back(std::move(parsed.value()));
    }
    return entries;
}

}  // namespace kcenon::webhdfs
