/**
 * @file bench_multipart_encoder.cpp
 * @brief Benchmarks for archive upload body encoding and hashing
 */

#include <benchmark/benchmark.h>

#include <cavesync/remote_project/core/checksum.h>
#include <cavesync/remote_project/http/multipart_body.h>

#include <random>

namespace cavesync::remote_project::benchmark {

namespace {

auto random_archive(std::size_t size) -> byte_buffer {
    std::mt19937 gen(42);
    byte_buffer data(size);
    for (auto& b : data) {
        b = static_cast<uint8_t>(gen() & 0xFF);
    }
    return data;
}

}  // namespace

/**
 * @brief Full build: boundary generation, collision scan and encoding
 */
static void BM_MultipartEncoder_Build(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const std::vector<multipart_part> parts = {
        multipart_part::text("message", "Surveyed the north branch"),
        multipart_part::file("artifact", random_archive(size), "application/octet-stream",
                             "cave-1.tml"),
    };

    multipart_encoder encoder;
    for (auto _ : state) {
        auto body = encoder.build(parts);
        if (!body) {
            state.SkipWithError("Failed to build multipart body");
            return;
        }
        ::benchmark::DoNotOptimize(body.value().bytes.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Encoding alone, with a fixed boundary
 */
static void BM_MultipartEncoder_Encode(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const std::vector<multipart_part> parts = {
        multipart_part::text("message", "msg"),
        multipart_part::file("artifact", random_archive(size), "application/octet-stream",
                             "cave-1.tml"),
    };
    const auto boundary = multipart_encoder::generate_boundary();

    for (auto _ : state) {
        auto bytes = multipart_encoder::encode(parts, boundary);
        if (!bytes) {
            state.SkipWithError("Failed to encode multipart body");
            return;
        }
        ::benchmark::DoNotOptimize(bytes.value().data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_MultipartEncoder_GenerateBoundary(::benchmark::State& state) {
    for (auto _ : state) {
        ::benchmark::DoNotOptimize(multipart_encoder::generate_boundary());
    }
}

static void BM_Checksum_Sha256(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto data = random_archive(size);

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(checksum::sha256(std::span<const uint8_t>(data)));
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

// Archive sizes: 4KB, 256KB, 4MB, 32MB
BENCHMARK(BM_MultipartEncoder_Build)
    ->Arg(4 * 1024)
    ->Arg(256 * 1024)
    ->Arg(4 * 1024 * 1024)
    ->Arg(32 * 1024 * 1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_MultipartEncoder_Encode)
    ->Arg(4 * 1024)
    ->Arg(256 * 1024)
    ->Arg(4 * 1024 * 1024)
    ->Arg(32 * 1024 * 1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_MultipartEncoder_GenerateBoundary);

BENCHMARK(BM_Checksum_Sha256)
    ->Arg(4 * 1024)
    ->Arg(4 * 1024 * 1024)
    ->Arg(32 * 1024 * 1024)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace cavesync::remote_project::benchmark

BENCHMARK_MAIN();
