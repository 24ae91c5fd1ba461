// This file contains the implementation of ChunkFetcher.
// Do not include this file directly - it is included by chunk_fetcher.hpp

#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifndef CANVASCHUNK_CHUNK_FETCHER_HEADER
#include "../chunk_fetcher.hpp" // for linters
#endif

namespace canvaschunk {

// ============================================================================
// ChunkFetcher Implementation
// ============================================================================
//
// Work Distribution:
// ------------------
// The chunks of one fetch_all() call are cut into at most worker_threads + 1
// contiguous ranges. Ranges 1..n go to the shared queue, range 0 runs on the
// calling thread. Transport latency dominates, so a chunk is one unit of
// work: fetch, then decode, then cache.
//
// Invariants:
// -----------
// - Worker threads are persistent and reused across fetch_all() calls
// - chunks[i] and results[i] are touched by exactly one task
// - tasks_remaining == 0 implies every chunk of the job has a result
// - Job state is destroyed only after all tasks of the job finished
//
// ============================================================================

inline ChunkFetcher::ChunkFetcher(Config config)
    : config_(std::move(config)) {
    if (config_.worker_threads == 0) {
        config_.worker_threads = std::thread::hardware_concurrency();
        if (config_.worker_threads == 0) config_.worker_threads = 1;
    }

    // Spawn persistent worker threads
    for (std::size_t i = 0; i < config_.worker_threads; ++i) {
        threads_.emplace_back(&ChunkFetcher::worker_loop, this);
    }
}

inline ChunkFetcher::~ChunkFetcher() {
    // Signal all workers to stop and wait for them to finish
    {
        std::lock_guard lock(queue_mutex_);
        stop_threads_ = true;
    }
    queue_cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

inline void ChunkFetcher::worker_loop() {
    while (true) {
        WorkerTask task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return stop_threads_ || !pending_tasks_.empty();
            });

            // Exit if shutdown requested and no work remains
            if (stop_threads_ && pending_tasks_.empty()) return;

            task = std::move(pending_tasks_.front());
            pending_tasks_.pop_front();
        }

        if (task) {
            task();
        }
    }
}

inline void ChunkFetcher::log_failure(const AnyChunk& chunk, const Error& error) noexcept {
    const ChunkKey key = key_of(chunk);
    std::lock_guard lock(log_mutex_);
    std::cerr << "ChunkFetcher: " << to_string(key.kind) << " (" << key.x << ", " << key.y
              << ") failed: " << to_string(error.code) << ": " << error.message << std::endl;
}

template <ChunkTransport Transport>
void ChunkFetcher::process_chunk(
    AnyChunk& chunk,
    Result<void>& result,
    const Transport& transport,
    ChunkCache* cache) noexcept {

    auto run = [&]() -> Result<void> {
        if (!is_in_bounds(chunk)) {
            const ChunkKey key = key_of(chunk);
            return Err(Error::Code::OutOfBounds,
                       "Chunk (" + std::to_string(key.x) + ", " + std::to_string(key.y) +
                       ") is outside the canvas");
        }
        if (kind_of(chunk) == VariantKind::BoundedBoard) {
            return Err(Error::Code::UnsupportedFeature,
                       "Bounded board is fetched as a single resource by the caller");
        }

        const ChunkKey key = key_of(chunk);
        if (cache != nullptr) {
            if (auto cached = cache->find(key)) {
                set_raster(chunk, std::move(cached));
                return Ok();
            }
        }

        auto request = request_descriptor(chunk, config_.endpoints);
        if (!request) {
            return request.error();
        }

        auto payload = transport.fetch(request.value());
        if (!payload) {
            return payload.error();
        }

        auto loaded = load(chunk, payload.value(), config_.palettes);
        if (!loaded) {
            return loaded;
        }

        if (cache != nullptr) {
            return cache->insert(key, raster_of(chunk));
        }
        return Ok();
    };

    try {
        result = run();
    } catch (const std::bad_alloc&) {
        // Short enough to stay in the string's inline buffer
        result = Error(Error::Code::MemoryError, "Out of memory");
    }

    if (!result && config_.log_failures) {
        log_failure(chunk, result.error());
    }
}

template <ChunkTransport Transport>
void ChunkFetcher::process_task(
    std::span<AnyChunk> chunks,
    std::span<Result<void>> results,
    const Transport& transport,
    ChunkCache* cache,
    std::size_t chunks_per_task,
    std::size_t task_idx,
    std::shared_ptr<JobState> job_state) noexcept {

    // RAII helper to ensure counter is always decremented
    struct TaskGuard {
        std::shared_ptr<JobState> state;
        ~TaskGuard() {
            std::lock_guard lock(state->mutex);
            state->tasks_remaining--;
            state->cv.notify_one();
        }
    };
    TaskGuard guard{job_state};

    const std::size_t begin = task_idx * chunks_per_task;
    for (std::size_t i = begin; i < begin + chunks_per_task && i < chunks.size(); ++i) {
        process_chunk(chunks[i], results[i], transport, cache);
    }
}

template <ChunkTransport Transport>
Result<void> ChunkFetcher::fetch_all(
    std::span<AnyChunk> chunks,
    std::span<Result<void>> results,
    const Transport& transport,
    ChunkCache* cache) noexcept {

    if (chunks.size() != results.size()) [[unlikely]] {
        return Err(Error::Code::InvalidArgument,
                   "Result span size does not match chunk count");
    }
    if (cache != nullptr && cache->palettes() != config_.palettes) [[unlikely]] {
        return Err(Error::Code::InvalidArgument,
                   "Chunk cache holds rasters decoded with another palette set");
    }
    if (chunks.empty()) return Ok();

    const std::size_t num_real_workers = config_.worker_threads + 1; // Including calling thread
    const std::size_t chunks_per_task = (chunks.size() + num_real_workers - 1) / num_real_workers;
    const std::size_t total_tasks = (chunks.size() + chunks_per_task - 1) / chunks_per_task;

    std::shared_ptr<JobState> job_state;
    try {
        job_state = std::make_shared<JobState>();
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate job state");
    }
    job_state->tasks_remaining = total_tasks;

    // Task 0 always runs on the calling thread
    std::size_t queued = 1;
    if (total_tasks > 1) {
        {
            std::lock_guard lock(queue_mutex_);
            try {
                for (; queued < total_tasks; ++queued) {
                    // transport and cache are captured by reference: we wait
                    // for every task before returning
                    pending_tasks_.push_back(
                        [this, chunks, results, &transport, cache, chunks_per_task, task_idx = queued, job_state]() {
                            process_task(chunks, results, transport, cache,
                                         chunks_per_task, task_idx, job_state);
                        });
                }
            } catch (const std::bad_alloc&) {
                // Tasks that could not be queued run on the calling thread below
            }
        }
        queue_cv_.notify_all(); // Wake all worker threads
    }

    process_task(chunks, results, transport, cache, chunks_per_task, 0, job_state);
    for (std::size_t task_idx = queued; task_idx < total_tasks; ++task_idx) {
        process_task(chunks, results, transport, cache, chunks_per_task, task_idx, job_state);
    }

    // Tasks hold references to transport and cache: wait for all of them
    {
        std::unique_lock lock(job_state->mutex);
        job_state->cv.wait(lock, [&] {
            return job_state->tasks_remaining == 0;
        });
    }

    return Ok();
}

template <ChunkTransport Transport>
std::vector<Result<void>> ChunkFetcher::fetch_all(
    std::span<AnyChunk> chunks,
    const Transport& transport,
    ChunkCache* cache) {

    std::vector<Result<void>> results(chunks.size());
    auto status = fetch_all(chunks, std::span<Result<void>>(results), transport, cache);
    if (!status) {
        for (auto& r : results) {
            r = status.error();
        }
    }
    return results;
}

} // namespace canvaschunk
