#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <thread>
#include <unordered_set>
#include <variant>
#include <vector>

#include "../canvaschunk/include/canvaschunk/chunk_cache.hpp"
#include "../canvaschunk/include/canvaschunk/chunk_variants.hpp"

using namespace canvaschunk;

// ============================================================================
// Helper Functions
// ============================================================================

std::shared_ptr<const RasterTile> make_tile(uint8_t value) {
    auto tile = RasterTile::create(2, 2, ColorMode::RGB8, std::vector<uint8_t>(12, value));
    EXPECT_TRUE(tile.is_ok());
    return std::make_shared<const RasterTile>(std::move(tile).value());
}

// ============================================================================
// Chunk keys
// ============================================================================

TEST(ChunkKey, EqualityIncludesKind) {
    const ChunkKey a{VariantKind::ChunkPz, 3, 4};
    EXPECT_EQ(a, (ChunkKey{VariantKind::ChunkPz, 3, 4}));
    EXPECT_NE(a, (ChunkKey{VariantKind::ChunkPzi, 3, 4}));
    EXPECT_NE(a, (ChunkKey{VariantKind::ChunkPz, 4, 3}));
}

TEST(ChunkKey, HashConsistentWithEquality) {
    const ChunkKeyHash hash;
    EXPECT_EQ(hash(ChunkKey{VariantKind::BigChunk, -7, 9}), hash(ChunkKey{VariantKind::BigChunk, -7, 9}));

    std::unordered_set<ChunkKey> keys;
    for (int64_t y = -3; y <= 3; ++y) {
        for (int64_t x = -3; x <= 3; ++x) {
            keys.insert(ChunkKey{VariantKind::BigChunk, x, y});
            keys.insert(ChunkKey{VariantKind::BigChunkVariantB, x, y});
        }
    }
    EXPECT_EQ(keys.size(), 2u * 7 * 7);
    EXPECT_EQ(keys.count(ChunkKey{VariantKind::BigChunk, 0, 0}), 1u);
    EXPECT_EQ(keys.count(ChunkKey{VariantKind::ChunkPz, 0, 0}), 0u);
}

TEST(ChunkKey, KindNames) {
    EXPECT_STREQ(to_string(VariantKind::BigChunk), "BigChunk");
    EXPECT_STREQ(to_string(VariantKind::BoundedBoard), "BoundedBoard");
}

// ============================================================================
// AnyChunk dispatch
// ============================================================================

TEST(AnyChunk, IntersectingMatchesTypedTiling) {
    auto any = get_intersecting_any(VariantKind::ChunkPz, -4096, -4096, 1500, 600);
    auto typed = ChunkPz::get_intersecting(-4096, -4096, 1500, 600);
    ASSERT_TRUE(any.is_ok());
    ASSERT_TRUE(typed.is_ok());
    EXPECT_EQ(any.value().columns, typed.value().columns);
    EXPECT_EQ(any.value().rows, typed.value().rows);
    ASSERT_EQ(any.value().chunks.size(), typed.value().chunks.size());

    for (std::size_t i = 0; i < typed.value().chunks.size(); ++i) {
        const AnyChunk& chunk = any.value().chunks[i];
        EXPECT_EQ(kind_of(chunk), VariantKind::ChunkPz);
        EXPECT_EQ(key_of(chunk), typed.value().chunks[i].key());
        EXPECT_EQ(pixel_origin_of(chunk), typed.value().chunks[i].pixel_origin());
    }
}

TEST(AnyChunk, IntersectingPropagatesErrors) {
    auto any = get_intersecting_any(VariantKind::BigChunk, 0, 0, 0, 0);
    ASSERT_TRUE(any.is_error());
    EXPECT_EQ(any.error().code, Error::Code::InvalidArgument);
}

TEST(AnyChunk, BoundedBoardWithInfo) {
    BoardInfo info;
    info.width = 64;
    info.height = 32;
    auto any = get_intersecting_any(VariantKind::BoundedBoard, 0, 0, 10, 10, &info);
    ASSERT_TRUE(any.is_ok());
    ASSERT_EQ(any.value().chunks.size(), 1u);
    EXPECT_EQ(tile_size_of(any.value().chunks[0]).value(), (TileSize{64, 32}));

    auto unconfigured = get_intersecting_any(VariantKind::BoundedBoard, 0, 0, 10, 10);
    ASSERT_TRUE(unconfigured.is_ok());
    auto size = tile_size_of(unconfigured.value().chunks[0]);
    ASSERT_TRUE(size.is_error());
    EXPECT_EQ(size.error().code, Error::Code::NotConfigured);
}

TEST(AnyChunk, MakeChunk) {
    const AnyChunk chunk = make_chunk(VariantKind::BigChunkVariantB, ChunkCoord{5, -5});
    ASSERT_TRUE(std::holds_alternative<BigChunkVariantB>(chunk));
    EXPECT_EQ(key_of(chunk), (ChunkKey{VariantKind::BigChunkVariantB, 5, -5}));
    EXPECT_EQ(tile_size_of(chunk).value(), (TileSize{960, 960}));
    EXPECT_TRUE(is_in_bounds(chunk));
    EXPECT_FALSE(is_loaded(chunk));

    const AnyChunk board = make_chunk(VariantKind::BoundedBoard, ChunkCoord{9, 9});
    EXPECT_EQ(key_of(board), (ChunkKey{VariantKind::BoundedBoard, 0, 0}));
}

TEST(AnyChunk, RequestDescriptors) {
    auto http = request_descriptor(make_chunk(VariantKind::ChunkPzi, ChunkCoord{1, 2}));
    ASSERT_TRUE(http.is_ok());
    EXPECT_TRUE(std::holds_alternative<HttpGet>(http.value()));

    auto socket = request_descriptor(make_chunk(VariantKind::ChunkPz, ChunkCoord{1, 2}));
    ASSERT_TRUE(socket.is_ok());
    EXPECT_TRUE(std::holds_alternative<SocketMessage>(socket.value()));

    auto none = request_descriptor(make_chunk(VariantKind::BoundedBoard, ChunkCoord{}));
    ASSERT_TRUE(none.is_ok());
    EXPECT_TRUE(std::holds_alternative<NoRequest>(none.value()));

    auto out = request_descriptor(make_chunk(VariantKind::ChunkPz, ChunkCoord{-1, 0}));
    ASSERT_TRUE(out.is_error());
    EXPECT_EQ(out.error().code, Error::Code::OutOfBounds);
}

TEST(AnyChunk, LoadUsesPaletteSet) {
    const Palette custom{{{9, 9, 9}}, Palette::Fill::Repeat};
    PaletteSet palette_set;
    palette_set.bounded_board = &custom;

    BoardInfo info;
    info.width = 2;
    info.height = 2;
    AnyChunk chunk{std::in_place_type<BoundedBoard>, info};

    const std::vector<std::byte> payload(4, std::byte{3});
    ASSERT_TRUE(load(chunk, payload, palette_set).is_ok());
    ASSERT_TRUE(is_loaded(chunk));
    EXPECT_EQ(raster_of(chunk)->palette(), &custom);
    EXPECT_EQ(raster_of(chunk)->rgb_at(0, 0).value(), (Rgb{9, 9, 9}));
}

TEST(AnyChunk, SetRasterSharesTile) {
    AnyChunk a = make_chunk(VariantKind::BigChunk, ChunkCoord{0, 0});
    AnyChunk b = make_chunk(VariantKind::BigChunk, ChunkCoord{0, 0});
    const auto tile = make_tile(1);
    set_raster(a, tile);
    set_raster(b, tile);
    EXPECT_EQ(raster_of(a).get(), raster_of(b).get());
}

// ============================================================================
// Chunk cache
// ============================================================================

TEST(ChunkCache, InsertFindErase) {
    ChunkCache cache;
    const ChunkKey key{VariantKind::ChunkPz, 1, 1};
    EXPECT_EQ(cache.find(key), nullptr);

    const auto tile = make_tile(5);
    ASSERT_TRUE(cache.insert(key, tile).is_ok());
    EXPECT_TRUE(cache.contains(key));
    EXPECT_EQ(cache.find(key).get(), tile.get());
    EXPECT_FALSE(cache.contains(ChunkKey{VariantKind::ChunkPzi, 1, 1}));

    EXPECT_TRUE(cache.erase(key));
    EXPECT_FALSE(cache.erase(key));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(ChunkCache, InsertReplaces) {
    ChunkCache cache;
    const ChunkKey key{VariantKind::BigChunk, 0, 0};
    ASSERT_TRUE(cache.insert(key, make_tile(1)).is_ok());
    const auto second = make_tile(2);
    ASSERT_TRUE(cache.insert(key, second).is_ok());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.find(key).get(), second.get());
}

TEST(ChunkCache, RejectsNullRaster) {
    ChunkCache cache;
    auto inserted = cache.insert(ChunkKey{}, nullptr);
    ASSERT_TRUE(inserted.is_error());
    EXPECT_EQ(inserted.error().code, Error::Code::InvalidArgument);
}

TEST(ChunkCache, ConcurrentInserts) {
    ChunkCache cache;
    const auto tile = make_tile(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, &tile, t] {
            for (int64_t i = 0; i < 100; ++i) {
                EXPECT_TRUE(cache.insert(ChunkKey{VariantKind::ChunkPz, i, t}, tile).is_ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(cache.size(), 400u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}
