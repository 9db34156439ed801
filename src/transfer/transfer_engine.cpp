// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file transfer_engine.cpp
 * @brief Batch transfer implementation
 */

#include "kcenon/webhdfs/transfer/transfer_engine.h"

#include "kcenon/webhdfs/adapters/thread_pool_adapter.h"
#include "kcenon/webhdfs/client/webhdfs_client.h"
#include "kcenon/webhdfs/core/logging.h"
#include "kcenon/webhdfs/core/path_utils.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <span>

namespace kcenon::webhdfs {

namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> temp_sequence{0};

auto temp_suffix() -> std::string {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return ".temp-" + std::to_string(micros) + "-" +
           std::to_string(temp_sequence.fetch_add(1, std::memory_order_relaxed));
}

/// Local path without trailing separators, so that "dir/" names "dir"
auto strip_trailing_separators(const std::string& path) -> fs::path {
    std::string text = path;
    while (text.size() > 1 && (text.back() == '/' || text.back() == '\\')) {
        text.pop_back();
    }
    return fs::path(text);
}

/// Best-effort removal of an uncommitted upload
void discard_remote_temp(webhdfs_client& client, const std::string& temp_path) {
    auto removed = client.remove(temp_path, false);
    if (!removed.has_value()) {
        WH_LOG_DEBUG(log_category::transfer,
            "Unable to remove temporary file '" + temp_path + "': " + removed.error().message);
    }
}

/**
 * @brief Shared state of one batch
 */
struct batch_context {
    const std::vector<transfer_task>& tasks;
    std::atomic<std::size_t> next_task{0};
    std::atomic<uint64_t> transferred_bytes{0};

    std::mutex mutex;
    std::vector<failure_detail> failures;
    std::vector<bool> committed;

    explicit batch_context(const std::vector<transfer_task>& t)
        : tasks(t), committed(t.size(), false) {}
};

/**
 * @brief Reports cumulative progress at chunk boundaries
 */
class chunk_reporter {
public:
    chunk_reporter(const transfer_options& options, std::string path)
        : callback_(options.progress), path_(std::move(path)) {}

    void report(uint64_t cumulative) {
        if (callback_) {
            callback_(path_, static_cast<int64_t>(cumulative));
        }
    }

    void finish() {
        if (callback_ && !finished_) {
            finished_ = true;
            callback_(path_, progress_done);
        }
    }

private:
    const progress_callback& callback_;
    std::string path_;
    bool finished_ = false;
};

}  // namespace

transfer_engine::transfer_engine(webhdfs_client& client) : client_(client) {}

auto transfer_engine::worker_count(std::optional<std::size_t> threads,
                                   std::size_t tasks) -> std::size_t {
    if (tasks == 0) {
        return 1;
    }
    if (!threads) {
        return 1;
    }
    if (*threads == 0) {
        return tasks;
    }
    return std::min(*threads, tasks);
}

auto transfer_engine::remote_temp_path(const std::string& final_path) -> std::string {
    return path_utils::join(path_utils::parent(final_path),
                            "." + path_utils::base_name(final_path) + temp_suffix());
}

auto transfer_engine::local_temp_path(const std::string& final_path) -> std::string {
    fs::path target(final_path);
    auto temp_name = target.filename().string() + temp_suffix();
    return (target.parent_path() / temp_name).string();
}

// ============================================================================
// Upload
// ============================================================================

auto transfer_engine::upload(const std::string& local_path,
                             const std::string& remote_path,
                             const transfer_options& options) -> result<transfer_summary> {
    if (options.chunk_size == 0) {
        return unexpected{error{error_code::illegal_argument, "Chunk size must be positive"}};
    }

    auto source = strip_trailing_separators(local_path);
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return unexpected{error{error_code::file_not_found,
            "No local file found at '" + local_path + "'"}};
    }

    auto resolved = client_.resolve(remote_path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }

    std::string destination = resolved.value();
    auto existing = client_.status(destination, false);
    if (!existing.has_value()) {
        return unexpected{existing.error()};
    }
    if (existing.value() && existing.value()->is_directory()) {
        destination = path_utils::join(destination, source.filename().string());
        existing = client_.status(destination, false);
        if (!existing.has_value()) {
            return unexpected{existing.error()};
        }
    }
    if (existing.value() && !options.overwrite) {
        return unexpected{error{error_code::already_exists,
            "Remote path '" + destination + "' already exists"}};
    }

    std::vector<transfer_task> tasks;
    if (fs::is_directory(source, ec)) {
        for (fs::recursive_directory_iterator it(source, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            auto relative = fs::relative(it->path(), source, ec).generic_string();
            transfer_task task;
            task.source = it->path().string();
            task.destination = path_utils::join(destination, relative);
            task.direction = transfer_direction::upload;
            task.size = it->file_size(ec);
            tasks.push_back(std::move(task));
        }
        if (ec) {
            return unexpected{error{error_code::local_io_error,
                "Unable to enumerate '" + local_path + "': " + ec.message()}};
        }
        if (tasks.empty()) {
            return unexpected{error{error_code::illegal_argument,
                "No files to upload found in '" + local_path + "'"}};
        }
    } else {
        transfer_task task;
        task.source = source.string();
        task.destination = destination;
        task.direction = transfer_direction::upload;
        task.size = fs::file_size(source, ec);
        if (ec) {
            return unexpected{error{error_code::local_io_error,
                "Unable to read '" + local_path + "': " + ec.message()}};
        }
        tasks.push_back(std::move(task));
    }

    std::sort(tasks.begin(), tasks.end(),
              [](const transfer_task& a, const transfer_task& b) { return a.source < b.source; });

    transfer_log_context ctx;
    ctx.path = destination;
    ctx.operation = "upload";
    ctx.file_count = tasks.size();
    WH_LOG_INFO_CTX(log_category::transfer, "Starting upload of '" + local_path + "'", ctx);

    return run_batch(tasks, options);
}

auto transfer_engine::upload_file(const transfer_task& task, const transfer_options& options)
    -> result<uint64_t> {
    chunk_reporter reporter(options, task.source);

    std::ifstream input(task.source, std::ios::binary);
    if (!input) {
        reporter.finish();
        return unexpected{error{error_code::local_io_error,
            "Unable to open '" + task.source + "'"}};
    }

    auto parent = path_utils::parent(task.destination);
    auto created = client_.makedirs(parent);
    if (!created.has_value()) {
        reporter.finish();
        return unexpected{created.error()};
    }

    auto temp_path = remote_temp_path(task.destination);

    std::vector<char> chunk(options.chunk_size);
    std::size_t chunk_length = 0;
    std::size_t chunk_offset = 0;
    uint64_t sent = 0;

    body_source body = [&](std::span<std::byte> buffer) -> result<std::size_t> {
        if (chunk_offset == chunk_length) {
            input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            chunk_length = static_cast<std::size_t>(input.gcount());
            chunk_offset = 0;
            if (chunk_length == 0) {
                if (input.bad()) {
                    return unexpected{error{error_code::local_io_error,
                        "Read error on '" + task.source + "'"}};
                }
                return std::size_t{0};
            }
        }

        auto count = std::min(buffer.size(), chunk_length - chunk_offset);
        std::memcpy(buffer.data(), chunk.data() + chunk_offset, count);
        chunk_offset += count;
        sent += count;
        if (chunk_offset == chunk_length) {
            reporter.report(sent);
        }
        return count;
    };

    query_params params{{"overwrite", "true"}};
    if (options.permission) {
        params.emplace_back("permission", *options.permission);
    }

    auto written = client_.transport().execute(operation::create, temp_path, params,
                                               std::move(body));
    if (!written.has_value()) {
        discard_remote_temp(client_, temp_path);
        reporter.finish();
        return unexpected{written.error()};
    }

    if (options.overwrite) {
        auto removed = client_.remove(task.destination, false);
        if (!removed.has_value()) {
            discard_remote_temp(client_, temp_path);
            reporter.finish();
            return unexpected{removed.error()};
        }
    }

    auto renamed = client_.transport().execute_json(operation::rename, temp_path,
                                                    {{"destination", task.destination}});
    bool committed = renamed.has_value() && renamed.value().value("boolean", false);
    if (!committed) {
        discard_remote_temp(client_, temp_path);
        reporter.finish();
        if (!renamed.has_value()) {
            return unexpected{renamed.error()};
        }
        return unexpected{error{error_code::remote_error,
            "Unable to commit '" + temp_path + "' to '" + task.destination + "'"}};
    }

    reporter.finish();
    return sent;
}

// ============================================================================
// Download
// ============================================================================

auto transfer_engine::download(const std::string& remote_path,
                               const std::string& local_path,
                               const transfer_options& options) -> result<transfer_summary> {
    if (options.chunk_size == 0) {
        return unexpected{error{error_code::illegal_argument, "Chunk size must be positive"}};
    }

    auto resolved = client_.resolve(remote_path);
    if (!resolved.has_value()) {
        return unexpected{resolved.error()};
    }
    auto source_status = client_.status(resolved.value());
    if (!source_status.has_value()) {
        return unexpected{source_status.error()};
    }
    const auto& source = *source_status.value();

    std::error_code ec;
    auto destination = strip_trailing_separators(local_path);
    if (fs::is_directory(destination, ec)) {
        auto name = path_utils::base_name(resolved.value());
        if (!name.empty()) {
            destination /= name;
        }
    }
    if (fs::exists(destination, ec) && !options.overwrite) {
        return unexpected{error{error_code::already_exists,
            "Local path '" + destination.string() + "' already exists"}};
    }

    std::vector<transfer_task> tasks;
    if (source.is_directory()) {
        auto entries = client_.walk(resolved.value());
        if (!entries.has_value()) {
            return unexpected{entries.error()};
        }
        for (const auto& entry : entries.value()) {
            for (const auto& [name, status] : entry.files) {
                auto remote_file = path_utils::join(entry.path, name);
                transfer_task task;
                task.source = remote_file;
                task.destination =
                    (destination / fs::path(path_utils::relative_to(remote_file, resolved.value())))
                        .string();
                task.direction = transfer_direction::download;
                task.size = status.length;
                tasks.push_back(std::move(task));
            }
        }
        if (tasks.empty()) {
            fs::create_directories(destination, ec);
            if (ec) {
                return unexpected{error{error_code::local_io_error,
                    "Unable to create '" + destination.string() + "': " + ec.message()}};
            }
        }
    } else {
        transfer_task task;
        task.source = resolved.value();
        task.destination = destination.string();
        task.direction = transfer_direction::download;
        task.size = source.length;
        tasks.push_back(std::move(task));
    }

    std::sort(tasks.begin(), tasks.end(),
              [](const transfer_task& a, const transfer_task& b) { return a.source < b.source; });

    transfer_log_context ctx;
    ctx.path = resolved.value();
    ctx.operation = "download";
    ctx.file_count = tasks.size();
    WH_LOG_INFO_CTX(log_category::transfer,
        "Starting download to '" + destination.string() + "'", ctx);

    return run_batch(tasks, options);
}

auto transfer_engine::download_file(const transfer_task& task, const transfer_options& options)
    -> result<uint64_t> {
    chunk_reporter reporter(options, task.source);

    std::error_code ec;
    fs::path target(task.destination);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            reporter.finish();
            return unexpected{error{error_code::local_io_error,
                "Unable to create '" + target.parent_path().string() + "': " + ec.message()}};
        }
    }

    read_options read_opts;
    read_opts.chunk_size = options.chunk_size;
    auto stream = client_.read(task.source, read_opts);
    if (!stream.has_value()) {
        reporter.finish();
        return unexpected{stream.error()};
    }

    auto temp_path = local_temp_path(task.destination);
    auto fail = [&](error err) -> result<uint64_t> {
        std::error_code remove_ec;
        fs::remove(temp_path, remove_ec);
        reporter.finish();
        return unexpected{std::move(err)};
    };

    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return fail(error{error_code::local_io_error,
                "Unable to open '" + temp_path + "' for writing"});
        }

        while (true) {
            auto chunk = stream.value().next_chunk();
            if (!chunk.has_value()) {
                output.close();
                return fail(chunk.error());
            }
            if (chunk.value().empty()) {
                break;
            }
            output.write(reinterpret_cast<const char*>(chunk.value().data()),
                         static_cast<std::streamsize>(chunk.value().size()));
            if (!output) {
                output.close();
                return fail(error{error_code::local_io_error,
                    "Write error on '" + temp_path + "'"});
            }
            reporter.report(stream.value().bytes_read());
        }

        output.close();
        if (!output) {
            return fail(error{error_code::local_io_error,
                "Unable to flush '" + temp_path + "'"});
        }
    }

    auto received = stream.value().bytes_read();
    stream.value().close();

    fs::rename(temp_path, task.destination, ec);
    if (ec) {
        return fail(error{error_code::local_io_error,
            "Unable to commit '" + temp_path + "' to '" + task.destination + "': " +
            ec.message()});
    }

    reporter.finish();
    return received;
}

// ============================================================================
// Batch execution
// ============================================================================

auto transfer_engine::run_batch(const std::vector<transfer_task>& tasks,
                                const transfer_options& options) -> result<transfer_summary> {
    auto start_time = std::chrono::steady_clock::now();
    batch_context ctx(tasks);

    auto worker = [this, &ctx, &options]() {
        while (true) {
            auto index = ctx.next_task.fetch_add(1);
            if (index >= ctx.tasks.size()) {
                return;
            }
            const auto& task = ctx.tasks[index];
            auto outcome = task.direction == transfer_direction::upload
                ? upload_file(task, options)
                : download_file(task, options);

            if (outcome.has_value()) {
                ctx.transferred_bytes.fetch_add(outcome.value());
                std::lock_guard<std::mutex> lock(ctx.mutex);
                ctx.committed[index] = true;
                continue;
            }

            transfer_log_context log_ctx;
            log_ctx.path = task.source;
            log_ctx.operation = task.direction == transfer_direction::upload ? "upload" : "download";
            log_ctx.error_message = outcome.error().message;
            WH_LOG_ERROR_CTX(log_category::transfer, "File transfer failed", log_ctx);

            std::lock_guard<std::mutex> lock(ctx.mutex);
            ctx.failures.push_back(
                failure_detail{task.source, outcome.error().code, outcome.error().message});
        }
    };

    if (!tasks.empty()) {
        auto workers = worker_count(options.threads, tasks.size());
        auto pool = adapters::transfer_pool_factory::create(workers);
        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            futures.push_back(pool->submit(worker));
        }
        for (auto& future : futures) {
            future.get();
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    transfer_summary summary;
    summary.bytes = ctx.transferred_bytes.load();
    summary.elapsed = elapsed;
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (ctx.committed[i]) {
            summary.committed.push_back(tasks[i].destination);
        }
    }
    summary.files = summary.committed.size();

    transfer_log_context log_ctx;
    log_ctx.file_count = summary.files;
    log_ctx.bytes_transferred = summary.bytes;
    log_ctx.duration_ms = static_cast<uint64_t>(elapsed.count());

    if (!ctx.failures.empty()) {
        std::sort(ctx.failures.begin(), ctx.failures.end(),
                  [](const failure_detail& a, const failure_detail& b) { return a.path < b.path; });
        auto message = std::to_string(ctx.failures.size()) + " of " +
                       std::to_string(tasks.size()) + " file(s) failed to transfer:";
        for (const auto& failure : ctx.failures) {
            message += "\n  " + failure.path + ": " + failure.message;
        }
        log_ctx.error_message = message;
        WH_LOG_ERROR_CTX(log_category::transfer, "Batch transfer finished with failures", log_ctx);
        return unexpected{error{error_code::transfer_failed, message, std::move(ctx.failures)}};
    }

    WH_LOG_INFO_CTX(log_category::transfer, "Batch transfer complete", log_ctx);
    return summary;
}

}  // namespace kcenon::webhdfs
