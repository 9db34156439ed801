/**
 * @file bench_transfer_throughput.cpp
 * @brief Benchmarks for upload, download and streaming read throughput
 *
 * Runs against an in-memory cluster, so the numbers reflect the client's
 * chunking, temp-file commit and worker pool overhead.
 */

#include <benchmark/benchmark.h>

#include <kcenon/webhdfs/webhdfs.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>
#include <memory>

namespace kcenon::webhdfs::benchmark {

namespace {

auto make_client(std::shared_ptr<memory_cluster> cluster) -> result<webhdfs_client> {
    return webhdfs_client::builder()
        .with_url(memory_cluster::namenode_url)
        .with_root("/bench")
        .with_retry_policy(retry_policy::immediate())
        .with_session(std::move(cluster))
        .build();
}

}  // namespace

/**
 * @brief Single file upload with overwrite, parameterized by file and chunk size
 */
static void BM_Upload_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("upload.bin", file_size, 42);

    auto cluster = std::make_shared<memory_cluster>();
    auto client = make_client(cluster);
    if (!client) {
        state.SkipWithError("Failed to build client");
        return;
    }

    transfer_options options;
    options.chunk_size = chunk_size;
    options.overwrite = true;

    for (auto _ : state) {
        auto uploaded = client.value().upload(source.string(), "upload.bin", options);
        if (!uploaded) {
            state.SkipWithError("Upload failed");
            return;
        }
        ::benchmark::DoNotOptimize(uploaded.value().bytes);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(file_size) + " / chunk " + format_bytes(chunk_size));
}

BENCHMARK(BM_Upload_SingleFile)
    ->Args({sizes::small_file, sizes::min_chunk})
    ->Args({sizes::medium_file, sizes::min_chunk})
    ->Args({sizes::medium_file, sizes::default_chunk})
    ->Args({sizes::large_file, sizes::default_chunk})
    ->Args({sizes::large_file, sizes::max_chunk})
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Single file download into a fresh local path
 */
static void BM_Download_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("source.bin", file_size, 7);

    auto cluster = std::make_shared<memory_cluster>();
    auto client = make_client(cluster);
    if (!client || !client.value().upload(source.string(), "download.bin")) {
        state.SkipWithError("Failed to seed cluster");
        return;
    }

    auto target = temp_files.base_dir() / "downloaded.bin";
    transfer_options options;
    options.chunk_size = sizes::default_chunk;

    for (auto _ : state) {
        auto downloaded = client.value().download("download.bin", target.string(), options);
        if (!downloaded) {
            state.SkipWithError("Download failed");
            return;
        }

        state.PauseTiming();
        std::error_code ec;
        std::filesystem::remove(target, ec);
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(file_size));
}

BENCHMARK(BM_Download_SingleFile)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file)
    ->Arg(sizes::large_file)
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Directory upload of many small files, parameterized by worker count
 */
static void BM_Upload_Batch(::benchmark::State& state) {
    const auto threads = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t file_count = 64;
    constexpr std::size_t file_size = 64 * sizes::KB;

    temp_file_manager temp_files;
    for (std::size_t i = 0; i < file_count; ++i) {
        temp_files.create_random_file("batch/part-" + std::to_string(i) + ".bin", file_size,
                                      static_cast<uint32_t>(i + 1));
    }
    auto source = temp_files.base_dir() / "batch";

    auto cluster = std::make_shared<memory_cluster>();
    auto client = make_client(cluster);
    if (!client) {
        state.SkipWithError("Failed to build client");
        return;
    }

    transfer_options options;
    options.threads = threads;

    for (auto _ : state) {
        state.PauseTiming();
        if (!client.value().remove("batch", true)) {
            state.SkipWithError("Cleanup failed");
            return;
        }
        state.ResumeTiming();

        auto uploaded = client.value().upload(source.string(), "batch", options);
        if (!uploaded) {
            state.SkipWithError("Batch upload failed");
            return;
        }
        ::benchmark::DoNotOptimize(uploaded.value().files);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_count * file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["files"] = static_cast<double>(file_count);
}

BENCHMARK(BM_Upload_Batch)
    ->Arg(1)
    ->Arg(4)
    ->Arg(16)
    ->Arg(0)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Streaming read, parameterized by chunk size
 */
static void BM_ReadStream_Chunks(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("stream.bin", sizes::medium_file, 3);

    auto cluster = std::make_shared<memory_cluster>();
    auto client = make_client(cluster);
    if (!client || !client.value().upload(source.string(), "stream.bin")) {
        state.SkipWithError("Failed to seed cluster");
        return;
    }

    read_options options;
    options.chunk_size = chunk_size;
    uint64_t chunks = 0;

    for (auto _ : state) {
        auto stream = client.value().read("stream.bin", options);
        if (!stream) {
            state.SkipWithError("Open failed");
            return;
        }
        chunks = 0;
        while (true) {
            auto chunk = stream.value().next_chunk();
            if (!chunk) {
                state.SkipWithError("Read failed");
                return;
            }
            if (chunk.value().empty()) {
                break;
            }
            ++chunks;
            ::benchmark::DoNotOptimize(chunk.value().data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::medium_file) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["chunks"] = static_cast<double>(chunks);
}

BENCHMARK(BM_ReadStream_Chunks)
    ->Arg(4 * sizes::KB)
    ->Arg(sizes::min_chunk)
    ->Arg(sizes::default_chunk)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::webhdfs::benchmark

BENCHMARK_MAIN();
