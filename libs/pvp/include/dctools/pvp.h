#pragma once

#include "dctools/binutil.h"
#include "dctools/pixel.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dctools::pvp {

// Palette is an ordered list of decoded colours (16 or 256 in practice).
struct Palette {
    pixel::PixelFormat format = pixel::PixelFormat::ARGB1555;
    std::vector<pixel::Color> colors;
};

// load_palette parses a PVPL file:
//   "PVPL", u32 section size, u16 format (low nibble), u32 reserved,
//   u16 entry count, then entry count samples of the declared format.
// Throws DecodeError(BadMagic) on a wrong signature, UnsupportedFormat on an
// unknown format code and TruncatedInput when the entries do not fit.
Palette load_palette(binutil::Bytes data);

// read_palette decodes count samples of format at the reader's position.
// Used both by load_palette and for palettes stored inline in a PVR.
Palette read_palette(binutil::Reader& r, pixel::PixelFormat format, size_t count);

// resolve_index is a bounds-checked lookup.
// Throws DecodeError(IndexOutOfRange) when index >= palette size.
pixel::Color resolve_index(const Palette& palette, size_t index);

} // namespace dctools::pvp
