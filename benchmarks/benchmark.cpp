#include <benchmark/benchmark.h>
#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "../canvaschunk/include/canvaschunk/chunk_fetcher.hpp"
#include "../canvaschunk/include/canvaschunk/chunk_variants.hpp"
#include "../canvaschunk/include/canvaschunk/chunks/big_chunk.hpp"
#include "../canvaschunk/include/canvaschunk/chunks/chunk_pz.hpp"
#include "../canvaschunk/include/canvaschunk/palettes.hpp"
#include "../canvaschunk/include/canvaschunk/transport.hpp"

using namespace canvaschunk;

// ============================================================================
// Payload Generators
// ============================================================================

/// Packed 4-bit content: long runs of one color, painted pixels every @p stride bytes
static std::vector<std::byte> generate_packed_pixels(std::size_t size, std::size_t stride, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::byte> data(size, std::byte{0x00});
    for (std::size_t i = 0; i < size; i += stride) {
        data[i] = static_cast<std::byte>(dist(rng));
    }
    return data;
}

// ============================================================================
// Tiling Benchmarks
// ============================================================================

static void BM_Tiling_BigChunk(benchmark::State& state) {
    // Parameters: rectangle side in pixels
    const int64_t extent = state.range(0);

    std::size_t chunks = 0;
    for (auto _ : state) {
        auto tiling = BigChunk::get_intersecting(-extent / 2, -extent / 2, extent, extent);
        if (!tiling.is_ok()) {
            state.SkipWithError(("Tiling failed " + tiling.error().message).c_str());
            return;
        }
        chunks = tiling.value().chunks.size();
        benchmark::DoNotOptimize(tiling);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(chunks));
}

static void BM_Tiling_AnyChunk(benchmark::State& state) {
    const int64_t extent = state.range(0);

    std::size_t chunks = 0;
    for (auto _ : state) {
        auto tiling = get_intersecting_any(VariantKind::ChunkPzi, 0, 0, extent, extent);
        if (!tiling.is_ok()) {
            state.SkipWithError(("Tiling failed " + tiling.error().message).c_str());
            return;
        }
        chunks = tiling.value().chunks.size();
        benchmark::DoNotOptimize(tiling);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(chunks));
}

// ============================================================================
// Decode Benchmarks
// ============================================================================

static void BM_Decode_BigChunk(benchmark::State& state) {
    // Parameters: chunk x (1042 exercises the off-canvas skip)
    const BigChunk chunk(state.range(0), 0);
    const auto payload = generate_packed_pixels(BigChunk::payload_size, 61, 1);

    for (auto _ : state) {
        auto tile = BigChunk::decode(payload, palettes::pixelcanvas, chunk.pixel_origin());
        if (!tile.is_ok()) {
            state.SkipWithError(("Decode failed " + tile.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(tile);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(payload.size()));
}

static void BM_Decode_ChunkPz(benchmark::State& state) {
    // Parameters: stride between painted bytes (smaller = less compressible)
    const auto raw = generate_packed_pixels(ChunkPz::raw_size, static_cast<std::size_t>(state.range(0)), 2);
    auto text = ChunkPz::encode(raw);
    if (!text.is_ok()) {
        state.SkipWithError(("Encode failed " + text.error().message).c_str());
        return;
    }

    for (auto _ : state) {
        auto tile = ChunkPz::decode(text.value(), palettes::pixelzone, PixelOrigin{});
        if (!tile.is_ok()) {
            state.SkipWithError(("Decode failed " + tile.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(tile);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.value().size()));
    state.counters["message_bytes"] = static_cast<double>(text.value().size());
}

static void BM_Encode_ChunkPz(benchmark::State& state) {
    const auto raw = generate_packed_pixels(ChunkPz::raw_size, static_cast<std::size_t>(state.range(0)), 3);

    for (auto _ : state) {
        auto text = ChunkPz::encode(raw);
        if (!text.is_ok()) {
            state.SkipWithError(("Encode failed " + text.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(text);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(raw.size()));
}

// ============================================================================
// Fetcher Benchmarks
// ============================================================================

static void BM_Fetch_BigChunkMosaic(benchmark::State& state) {
    // Parameters: worker threads
    const auto worker_threads = static_cast<std::size_t>(state.range(0));

    auto tiling = get_intersecting_any(VariantKind::BigChunk, -1920, -1920, 3840, 3840);
    if (!tiling.is_ok()) {
        state.SkipWithError(("Tiling failed " + tiling.error().message).c_str());
        return;
    }
    auto& chunks = tiling.value().chunks;

    MemoryTransport transport;
    const auto payload = generate_packed_pixels(BigChunk::payload_size, 61, 4);
    for (const auto& chunk : chunks) {
        auto request = request_descriptor(chunk);
        if (!request.is_ok()) {
            state.SkipWithError(("Request failed " + request.error().message).c_str());
            return;
        }
        transport.add(request_target(request.value()), std::span<const std::byte>(payload));
    }

    ChunkFetcher::Config config;
    config.worker_threads = worker_threads;
    ChunkFetcher fetcher(config);

    for (auto _ : state) {
        for (auto& chunk : chunks) {
            set_raster(chunk, nullptr);
        }
        auto results = fetcher.fetch_all(chunks, transport);
        for (const auto& result : results) {
            if (!result.is_ok()) {
                state.SkipWithError(("Fetch failed " + result.error().message).c_str());
                return;
            }
        }
        benchmark::DoNotOptimize(results);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(chunks.size()));
}

// ============================================================================
// Registration
// ============================================================================

// Params: rectangle side
BENCHMARK(BM_Tiling_BigChunk)
    ->Arg(960)
    ->Arg(10000)
    ->Arg(100000)
    ->Name("CanvasChunk/Tiling/BigChunk")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Tiling_AnyChunk)
    ->Arg(500)
    ->Arg(10000)
    ->Name("CanvasChunk/Tiling/AnyChunk")
    ->Unit(benchmark::kMicrosecond);

// Params: chunk x
BENCHMARK(BM_Decode_BigChunk)
    ->Arg(0)
    ->Arg(1042)     // mostly off canvas
    ->Name("CanvasChunk/Decode/BigChunk")
    ->Unit(benchmark::kMillisecond);

// Params: stride between painted bytes
BENCHMARK(BM_Decode_ChunkPz)
    ->Arg(997)
    ->Arg(31)
    ->Name("CanvasChunk/Decode/ChunkPz")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_Encode_ChunkPz)
    ->Arg(997)
    ->Arg(31)
    ->Name("CanvasChunk/Encode/ChunkPz")
    ->Unit(benchmark::kMillisecond);

// Params: worker threads
BENCHMARK(BM_Fetch_BigChunkMosaic)
    ->Arg(1)
    ->Arg(4)
    ->Name("CanvasChunk/Fetch/BigChunkMosaic")
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK_MAIN();
