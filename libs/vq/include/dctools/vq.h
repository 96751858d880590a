#pragma once

#include "dctools/binutil.h"
#include "dctools/pixel.h"

#include <array>
#include <cstddef>
#include <vector>

namespace dctools::vq {

// One codebook entry: a 2x2 block in raster order (TL, TR, BL, BR).
using Block = std::array<pixel::Color, 4>;

struct Codebook {
    std::vector<Block> blocks;
};

// codebook_size returns the number of codebook entries stored in a VQ
// texture. Plain VQ always carries 256. SMALLVQ scales with the larger
// texture dimension: <=16 -> 16, <=32 -> 32, <=64 -> 128, otherwise 256.
size_t codebook_size(int width, int height, bool small);

// read_codebook decodes `entries` blocks of four samples of `format`.
Codebook read_codebook(binutil::Reader& r, pixel::PixelFormat format, size_t entries);

// decode_level reads one level of block indices at the reader position and
// expands it. The index bytes are in twiddled block order; a 1x1 level is a
// single index whose top-left colour is used.
// Throws DecodeError(IndexOutOfRange) for an index past the codebook.
pixel::Image decode_level(binutil::Reader& r, const Codebook& codebook, int width, int height);

// decode_vq decodes a codebook followed by a single level of indices.
pixel::Image decode_vq(binutil::Bytes data, int width, int height,
                       pixel::PixelFormat format, bool small);

} // namespace dctools::vq
