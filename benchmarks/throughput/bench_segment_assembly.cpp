/**
 * @file bench_segment_assembly.cpp
 * @brief Benchmarks for segment checksumming and reassembly
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_fetch/core/checksum.h>
#include <kcenon/media_fetch/core/chunk_plan.h>
#include <kcenon/media_fetch/core/segment_assembler.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

namespace kcenon::media_fetch::benchmark {

/**
 * @brief Benchmark for CRC32 over a downloaded block
 */
static void BM_Checksum_Crc32(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for SHA-256 of a committed file
 */
static void BM_Checksum_Sha256File(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto file = temp_files.create_file("sha_source.bin",
                                       test_data_generator::generate_random_data(size, 42));

    for (auto _ : state) {
        auto digest = checksum::sha256_file(file);
        if (!digest) {
            state.SkipWithError("Failed to hash file");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for concatenating and verifying segment files
 */
static void BM_SegmentAssembler_Finalize(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_count = static_cast<uint32_t>(state.range(1));

    temp_file_manager temp_files;
    const auto data = test_data_generator::generate_random_data(file_size, 42);
    const auto plan = plan_segments(file_size, chunk_count);
    const auto final_path = temp_files.base_dir() / "assembled.mkv";

    for (auto _ : state) {
        state.PauseTiming();
        segment_assembler assembler(final_path, file_size, static_cast<uint32_t>(plan.size()));
        bool ok = true;
        for (const auto& range : plan) {
            auto bytes = std::span<const std::byte>(data).subspan(
                static_cast<std::size_t>(range.start), static_cast<std::size_t>(range.size()));

            segment_record record;
            record.range = range;
            record.file = temp_files.base_dir() /
                          segment_file_name(final_path.filename().string(), range.index);
            std::ofstream out(record.file, std::ios::binary);
            out.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
            out.close();
            record.bytes_written = range.size();
            record.crc32 = checksum::crc32(bytes);

            ok = ok && assembler.add_segment(std::move(record)).has_value();
        }
        if (!ok) {
            state.SkipWithError("Failed to register segment");
            return;
        }
        state.ResumeTiming();

        auto result = assembler.finalize();
        if (!result) {
            state.SkipWithError("Failed to finalize");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    std::error_code ec;
    std::filesystem::remove(final_path, ec);

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(plan.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for segment planning
 */
static void BM_PlanSegments(::benchmark::State& state) {
    const auto chunk_count = static_cast<uint32_t>(state.range(0));

    for (auto _ : state) {
        auto plan = plan_segments(uint64_t{4} * 1024 * 1024 * 1024 + 7, chunk_count);
        ::benchmark::DoNotOptimize(plan);
    }
}

BENCHMARK(BM_Checksum_Crc32)
    ->Arg(64 * sizes::KB)
    ->Arg(static_cast<int64_t>(sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_Sha256File)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_SegmentAssembler_Finalize)
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), 3})
    ->Args({static_cast<int64_t>(sizes::large_file), 3})
    ->Args({static_cast<int64_t>(sizes::large_file), 8})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_PlanSegments)->Arg(3)->Arg(16)->Arg(64);

}  // namespace kcenon::media_fetch::benchmark
