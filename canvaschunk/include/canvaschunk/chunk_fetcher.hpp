#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <vector>
#include "chunk_cache.hpp"
#include "chunk_variants.hpp"
#include "config.hpp"
#include "palettes.hpp"
#include "transport.hpp"
#include "types/result.hpp"

namespace canvaschunk {

/// @brief Settings of a ChunkFetcher
struct FetcherConfig {
    std::size_t worker_threads = 0;  ///< 0 = auto-detect
    bool log_failures = false;       ///< Print one line per failed chunk to std::cerr
    ServiceEndpoints endpoints;
    PaletteSet palettes;
};

/// @brief Fetches and decodes chunks on a persistent worker pool
///
/// Design Philosophy:
/// - Embarrassingly parallel: a chunk's fetch and decode depend on nothing but
///   its own payload, so chunks are spread over all workers and complete in
///   any order.
/// - Failure isolation: every chunk gets its own Result. A failed fetch or
///   decode never stops or alters the processing of the other chunks.
/// - Per-Job Coordination: each fetch_all() call has its own synchronization
///   state; the worker threads are shared between calls.
///
/// Per chunk, in order:
/// 1. Out-of-bounds chunks are never requested (OutOfBounds).
/// 2. BoundedBoard chunks are not fetched per chunk (UnsupportedFeature);
///    the caller loads the board itself.
/// 3. With a cache, a cached raster is attached without fetching.
/// 4. The request descriptor goes to the transport, the payload to load().
/// 5. With a cache, the new raster is inserted.
///
/// @note Thread-safe: multiple threads can call fetch_all concurrently
/// @note The transport's fetch() is called from several threads at once
class ChunkFetcher {
public:
    using Config = FetcherConfig;

    explicit ChunkFetcher(Config config = {});
    ~ChunkFetcher();

    ChunkFetcher(const ChunkFetcher&) = delete;
    ChunkFetcher& operator=(const ChunkFetcher&) = delete;

    /// @brief Fetch and decode every chunk
    /// @param chunks Chunks to load; each is modified only by its own task
    /// @param results One slot per chunk, receives that chunk's outcome
    /// @param transport External fetcher, must be safe to call concurrently
    /// @param cache Optional raster cache shared with other calls
    /// @return Ok once every chunk has been processed, whatever the per-chunk outcomes
    /// @retval InvalidArgument @p results and @p chunks differ in size, or @p cache
    ///         is bound to a PaletteSet other than Config::palettes
    template <ChunkTransport Transport>
    [[nodiscard]] Result<void> fetch_all(
        std::span<AnyChunk> chunks,
        std::span<Result<void>> results,
        const Transport& transport,
        ChunkCache* cache = nullptr) noexcept;

    /// @brief Same as above, returning the per-chunk results in input order
    template <ChunkTransport Transport>
    [[nodiscard]] std::vector<Result<void>> fetch_all(
        std::span<AnyChunk> chunks,
        const Transport& transport,
        ChunkCache* cache = nullptr);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] std::size_t worker_count() const noexcept { return threads_.size(); }

private:
    using WorkerTask = std::function<void()>;

    Config config_;

    // Shared thread pool state
    std::vector<std::thread> threads_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<WorkerTask> pending_tasks_;
    bool stop_threads_ = false;

    std::mutex log_mutex_;

    void worker_loop();

    /// @brief Per-job state shared between calling thread and worker threads
    struct JobState {
        std::mutex mutex;             // Protects tasks_remaining
        std::condition_variable cv;   // Signals calling thread
        std::size_t tasks_remaining{0};
    };

    template <ChunkTransport Transport>
    void process_chunk(
        AnyChunk& chunk,
        Result<void>& result,
        const Transport& transport,
        ChunkCache* cache) noexcept;

    template <ChunkTransport Transport>
    void process_task(
        std::span<AnyChunk> chunks,
        std::span<Result<void>> results,
        const Transport& transport,
        ChunkCache* cache,
        std::size_t chunks_per_task,
        std::size_t task_idx,
        std::shared_ptr<JobState> job_state) noexcept;

    void log_failure(const AnyChunk& chunk, const Error& error) noexcept;
};

} // namespace canvaschunk

#define CANVASCHUNK_CHUNK_FETCHER_HEADER
#include "impl/chunk_fetcher_impl.hpp"
