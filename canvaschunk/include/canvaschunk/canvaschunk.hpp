#pragma once

/// Main header for the canvas chunk library
///
/// Maps pixel rectangles of collaborative canvases onto each service's chunk
/// grid, builds the per-chunk requests and decodes the service payloads into
/// raster tiles.
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - One chunk class per service, static dispatch when the service is known
/// - AnyChunk for heterogeneous lists chosen at runtime
/// - Network transport left to the caller via the ChunkTransport concept
/// - Parallel fetch and decode with per-chunk error isolation
///
/// Example usage:
/// ```cpp
/// #include <canvaschunk/canvaschunk.hpp>
///
/// using namespace canvaschunk;
///
/// auto tiling = ChunkPz::get_intersecting(-4096, -4096, 1024, 512);
/// if (tiling) {
///     // tiling.value().columns == 2, tiling.value().rows == 1
///     for (auto& chunk : tiling.value().chunks) {
///         auto request = chunk.request_descriptor();
///         // send request_target(request.value()) over the socket,
///         // then feed the response text to chunk.load(...)
///     }
/// }
/// ```

#include "types/result.hpp"
#include "types/chunk_key.hpp"
#include "types/palette.hpp"
#include "types/request.hpp"
#include "palettes.hpp"
#include "config.hpp"
#include "raster_tile.hpp"
#include "tiling.hpp"
#include "decompressors/decompressor_lzstring.hpp"
#include "decompressors/decompressor_lz4.hpp"
#include "compressors/compressor_lzstring.hpp"
#include "compressors/compressor_lz4.hpp"
#include "decoders/json_byte_list.hpp"
#include "decoders/packed_pixels.hpp"
#include "decoders/image_container.hpp"
#include "chunks/chunk_common.hpp"
#include "chunks/big_chunk.hpp"
#include "chunks/chunk_pz.hpp"
#include "chunks/chunk_pzi.hpp"
#include "chunks/bounded_board.hpp"
#include "chunk_variants.hpp"
#include "transport.hpp"
#include "chunk_cache.hpp"
#include "chunk_fetcher.hpp"
