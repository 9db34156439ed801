// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file remote_error.cpp
 * @brief RemoteException decoding
 */

#include "kcenon/webhdfs/transport/remote_error.h"

#include <nlohmann/json.hpp>

#include <array>
#include <utility>

namespace kcenon::webhdfs {

namespace {

constexpr std::array<std::pair<std::string_view, error_code>, 8> exception_table{{
    {"FileNotFoundException", error_code::file_not_found},
    {"FileAlreadyExistsException", error_code::already_exists},
    {"AccessControlException", error_code::permission_denied},
    {"SecurityException", error_code::permission_denied},
    {"IllegalArgumentException", error_code::illegal_argument},
    {"PathIsNotEmptyDirectoryException", error_code::not_empty_directory},
    {"ParentNotDirectoryException", error_code::not_a_directory},
    {"StandbyException", error_code::standby_endpoint},
}};

auto strip_package(std::string_view name) -> std::string_view {
    auto pos = name.rfind('.');
    if (pos == std::string_view::npos) {
        return name;
    }
    return name.substr(pos + 1);
}

auto code_from_status(int status_code) -> error_code {
    if (status_code == 401 || status_code == 403) {
        return error_code::permission_denied;
    }
    if (status_code == 404) {
        return error_code::file_not_found;
    }
    if (status_code >= 500 && status_code < 600) {
        return error_code::server_error;
    }
    return error_code::remote_error;
}

}  // namespace

auto map_remote_exception(std::string_view exception_name) -> error_code {
    auto short_name = strip_package(exception_name);
    for (const auto& [name, code] : exception_table) {
        if (name == short_name) {
            return code;
        }
    }
    return error_code::remote_error;
}

auto decode_remote_error(int status_code, const std::string& body) -> error {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("RemoteException")) {
        const auto& remote = parsed["RemoteException"];
        std::string name;
        std::string message;
        if (remote.is_object()) {
            if (remote.contains("exception") && remote["exception"].is_string()) {
                name = remote["exception"].get<std::string>();
            } else if (remote.contains("javaClassName") && remote["javaClassName"].is_string()) {
                name = remote["javaClassName"].get<std::string>();
            }
            if (remote.contains("message") && remote["message"].is_string()) {
                message = remote["message"].get<std::string>();
            }
        }

        auto code = name.empty() ? code_from_status(status_code) : map_remote_exception(name);
        if (message.empty()) {
            message = name.empty() ? std::string(to_string(code)) : name;
        }
        return error{code, message};
    }

    auto code = code_from_status(status_code);
    std::string message = "HTTP " + std::to_string(status_code);
    if (!body.empty() && body.size() <= 512) {
        message += ": " + body;
    }
    return error{code, message};
}

}  // namespace kcenon::webhdfs
