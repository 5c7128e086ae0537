/**
 * @file bench_chunk_producer.cpp
 * @brief Benchmarks for chunk production and digest computation
 */

#include <benchmark/benchmark.h>

#include <kcenon/blob_transfer/core/buffer_allocator.h>
#include <kcenon/blob_transfer/core/checksum.h>
#include <kcenon/blob_transfer/core/chunk_producer.h>

#include <cstddef>
#include <memory>
#include <random>
#include <vector>

namespace kcenon::blob_transfer::benchmark {

namespace {

constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

auto random_bytes(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dist(gen));
    }
    return data;
}

}  // namespace

/**
 * @brief Chunking a memory source end to end, including the running MD5
 */
static void BM_ChunkProducer_Memory(::benchmark::State& state) {
    const auto total = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));
    const auto source_bytes = random_bytes(total, 42);

    for (auto _ : state) {
        state.PauseTiming();
        buffer_allocator arena(chunk_size, 2);
        chunk_producer producer(std::make_unique<memory_source>(source_bytes, "bench"),
                                arena, chunk_size);
        state.ResumeTiming();

        while (producer.has_next()) {
            auto piece = producer.next();
            if (!piece) {
                state.SkipWithError("chunk production failed");
                return;
            }
            ::benchmark::DoNotOptimize(piece.value().data().data());
        }
        auto digest = producer.digest_base64();
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_MD5(::benchmark::State& state) {
    const auto data = random_bytes(static_cast<std::size_t>(state.range(0)), 7);

    for (auto _ : state) {
        auto digest = checksum::md5_base64(data);
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(state.range(0) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Zero-page detection over an all-zero chunk (worst case: full scan)
 */
static void BM_Checksum_IsAllZero(::benchmark::State& state) {
    const std::vector<std::byte> zeros(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(checksum::is_all_zero(zeros));
    }

    state.SetBytesProcessed(state.range(0) * static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkProducer_Memory)
    ->Args({static_cast<int64_t>(16 * MB), static_cast<int64_t>(512 * KB)})
    ->Args({static_cast<int64_t>(16 * MB), static_cast<int64_t>(4 * MB)})
    ->Args({static_cast<int64_t>(64 * MB), static_cast<int64_t>(4 * MB)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_MD5)
    ->Arg(static_cast<int64_t>(64 * KB))
    ->Arg(static_cast<int64_t>(1 * MB))
    ->Arg(static_cast<int64_t>(4 * MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_IsAllZero)
    ->Arg(static_cast<int64_t>(512 * KB))
    ->Arg(static_cast<int64_t>(4 * MB))
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::blob_transfer::benchmark
