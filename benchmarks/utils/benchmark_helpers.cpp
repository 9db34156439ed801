/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <kcenon/webhdfs/core/path_utils.h>
#include <kcenon/webhdfs/transport/url_utils.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::webhdfs::benchmark {

namespace {

constexpr const char* datanode_url = "http://bench-dn:50075";

auto make_response(int status, std::string body,
                   std::map<std::string, std::string> headers = {}) -> http_response {
    http_response response;
    response.status_code = status;
    response.headers = std::move(headers);
    response.body = std::make_unique<buffered_body_reader>(
        std::vector<uint8_t>(body.begin(), body.end()));
    return response;
}

auto json_response(const nlohmann::json& body, int status = 200) -> http_response {
    return make_response(status, body.dump(), {{"Content-Type", "application/json"}});
}

auto not_found(const std::string& path) -> http_response {
    return json_response(nlohmann::json{{"RemoteException", {
        {"exception", "FileNotFoundException"},
        {"message", "File does not exist: " + path}}}}, 404);
}

auto file_status(const std::string& suffix, bool directory, std::size_t length)
    -> nlohmann::json {
    return nlohmann::json{
        {"pathSuffix", suffix},
        {"type", directory ? "DIRECTORY" : "FILE"},
        {"length", directory ? 0 : length},
        {"modificationTime", 0},
        {"accessTime", 0},
        {"permission", directory ? "755" : "644"},
        {"owner", "bench"},
        {"group", "supergroup"},
        {"replication", directory ? 0 : 3},
        {"blockSize", directory ? 0 : 134217728}};
}

}  // namespace

// ============================================================================
// test_data_generator
// ============================================================================

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

// ============================================================================
// temp_file_manager
// ============================================================================

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("webhdfs_benchmarks_" + std::to_string(std::random_device{}()));
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_file(
    const std::string& name,
    const std::vector<std::byte>& data) -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::create_random_file(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    auto data = test_data_generator::generate_random_data(size, seed);
    return create_file(name, data);
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// ============================================================================
// memory_cluster
// ============================================================================

memory_cluster::memory_cluster() {
    directories_.insert("/");
}

auto memory_cluster::send(const http_request& request) -> result<http_response> {
    auto origin = url_utils::origin_of(request.url);
    auto rest = request.url.substr(origin.size());
    auto query_pos = rest.find('?');
    auto path = rest.substr(0, query_pos);
    std::string prefix = url_utils::api_prefix;
    if (path.compare(0, prefix.size(), prefix) == 0) {
        path = path.substr(prefix.size());
    }
    path = url_utils::url_decode(path);
    if (path.empty()) {
        path = "/";
    }

    std::map<std::string, std::string> params;
    if (query_pos != std::string::npos) {
        std::istringstream query(rest.substr(query_pos + 1));
        std::string pair;
        while (std::getline(query, pair, '&')) {
            auto eq = pair.find('=');
            if (eq != std::string::npos) {
                params[url_utils::url_decode(pair.substr(0, eq))] =
                    url_utils::url_decode(pair.substr(eq + 1));
            }
        }
    }
    auto op = params["op"];

    if (origin == datanode_url) {
        return datanode(op, path, params, request);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return namenode(op, path, params, request.url);
}

auto memory_cluster::file_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

auto memory_cluster::namenode(const std::string& op, const std::string& path,
                              const std::map<std::string, std::string>& params,
                              const std::string& url) -> http_response {
    bool is_dir = directories_.count(path) > 0;
    auto file = files_.find(path);
    bool is_file = file != files_.end();
    auto redirect = [&]() {
        return make_response(307, "", {{"Location",
            std::string(datanode_url) + url.substr(url_utils::origin_of(url).size())}});
    };

    if (op == "GETFILESTATUS") {
        if (!is_dir && !is_file) {
            return not_found(path);
        }
        return json_response(nlohmann::json{{"FileStatus",
            file_status("", is_dir, is_file ? file->second.size() : 0)}});
    }

    if (op == "LISTSTATUS") {
        if (!is_dir && !is_file) {
            return not_found(path);
        }
        nlohmann::json entries = nlohmann::json::array();
        if (is_file) {
            entries.push_back(file_status("", false, file->second.size()));
        } else {
            for (const auto& d : directories_) {
                if (d != "/" && path_utils::parent(d) == path) {
                    entries.push_back(file_status(path_utils::base_name(d), true, 0));
                }
            }
            for (const auto& [p, data] : files_) {
                if (path_utils::parent(p) == path) {
                    entries.push_back(file_status(path_utils::base_name(p), false, data.size()));
                }
            }
        }
        return json_response(nlohmann::json{{"FileStatuses", {{"FileStatus", entries}}}});
    }

    if (op == "MKDIRS") {
        make_parents(path);
        return json_response(nlohmann::json{{"boolean", true}});
    }

    if (op == "CREATE" || op == "OPEN") {
        if (op == "OPEN" && !is_file) {
            return not_found(path);
        }
        return redirect();
    }

    if (op == "RENAME") {
        auto destination = params.find("destination");
        if (!is_file || destination == params.end() || files_.count(destination->second) > 0) {
            return json_response(nlohmann::json{{"boolean", false}});
        }
        files_[destination->second] = std::move(file->second);
        files_.erase(path);
        return json_response(nlohmann::json{{"boolean", true}});
    }

    if (op == "DELETE") {
        bool removed = files_.erase(path) > 0 || directories_.erase(path) > 0;
        std::string prefix = path + "/";
        std::erase_if(files_, [&](const auto& entry) {
            return entry.first.compare(0, prefix.size(), prefix) == 0;
        });
        std::erase_if(directories_, [&](const std::string& d) {
            return d.compare(0, prefix.size(), prefix) == 0;
        });
        return json_response(nlohmann::json{{"boolean", removed}});
    }

    return json_response(nlohmann::json{{"RemoteException", {
        {"exception", "IllegalArgumentException"},
        {"message", "Unsupported operation " + op}}}}, 400);
}

auto memory_cluster::datanode(const std::string& op, const std::string& path,
                              const std::map<std::string, std::string>& params,
                              const http_request& request) -> result<http_response> {
    if (op == "CREATE") {
        std::vector<uint8_t> data;
        if (request.body) {
            auto drained = drain_body_source(request.body);
            if (!drained.has_value()) {
                return unexpected{drained.error()};
            }
            data = std::move(drained.value());
        }
        std::lock_guard<std::mutex> lock(mutex_);
        make_parents(path_utils::parent(path));
        files_[path] = std::string(data.begin(), data.end());
        return make_response(201, "");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto file = files_.find(path);
    if (file == files_.end()) {
        return not_found(path);
    }
    const auto& data = file->second;
    std::size_t offset = 0;
    if (auto p = params.find("offset"); p != params.end()) {
        offset = std::min<std::size_t>(std::stoull(p->second), data.size());
    }
    std::size_t length = data.size() - offset;
    if (auto p = params.find("length"); p != params.end()) {
        length = std::min<std::size_t>(std::stoull(p->second), length);
    }
    return make_response(200, data.substr(offset, length));
}

void memory_cluster::make_parents(const std::string& path) {
    for (auto p = path; !p.empty() && p != "/"; p = path_utils::parent(p)) {
        directories_.insert(p);
    }
}

// ============================================================================
// Utility functions
// ============================================================================

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace kcenon::webhdfs::benchmark
