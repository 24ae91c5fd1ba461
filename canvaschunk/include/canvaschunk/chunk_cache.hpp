#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <new>
#include <unordered_map>
#include <utility>
#include "palettes.hpp"
#include "raster_tile.hpp"
#include "types/chunk_key.hpp"
#include "types/result.hpp"

namespace canvaschunk {

/// Decoded rasters keyed by chunk identity
/// All members are thread-safe. Rasters are shared, never copied: a cached
/// tile may be attached to any number of chunks.
///
/// A cache holds rasters decoded with one PaletteSet (BigChunk tiles have the
/// palette baked into their RGB pixels, indexed tiles point at it), so the key
/// carries no palette. ChunkFetcher refuses a cache bound to another set.
class ChunkCache {
public:
    explicit ChunkCache(PaletteSet palettes = {}) noexcept : palettes_(palettes) {}

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    /// Cached raster for a key, or null
    [[nodiscard]] std::shared_ptr<const RasterTile> find(const ChunkKey& key) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(key);
        return it != entries_.end() ? it->second : nullptr;
    }

    /// Insert or replace the raster for a key
    /// @retval InvalidArgument Null raster
    [[nodiscard]] Result<void> insert(const ChunkKey& key, std::shared_ptr<const RasterTile> raster) noexcept {
        if (!raster) [[unlikely]] {
            return Err(Error::Code::InvalidArgument, "Cannot cache a null raster");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            entries_.insert_or_assign(key, std::move(raster));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to grow chunk cache");
        }
        return Ok();
    }

    /// @return Whether an entry was removed
    bool erase(const ChunkKey& key) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }

    void clear() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    /// Palettes every cached raster was decoded with
    [[nodiscard]] const PaletteSet& palettes() const noexcept { return palettes_; }

    [[nodiscard]] bool contains(const ChunkKey& key) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.contains(key);
    }

private:
    const PaletteSet palettes_;
    mutable std::mutex mutex_;
    std::unordered_map<ChunkKey, std::shared_ptr<const RasterTile>, ChunkKeyHash> entries_;
};

} // namespace canvaschunk
