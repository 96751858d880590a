#pragma once

#include "dctools/binutil.h"
#include "dctools/pixel.h"
#include "dctools/pvp.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dctools::pvr {

// PowerVR storage layouts (second byte of the PVRT texture type).
enum class DataFormat : uint8_t {
    Twiddled = 0x01,
    TwiddledMM = 0x02,
    VQ = 0x03,
    VQMM = 0x04,
    Palettize4 = 0x05,
    Palettize4MM = 0x06,
    Palettize8 = 0x07,
    Palettize8MM = 0x08,
    Rectangle = 0x09,
    RectangleMM = 0x0A,
    Stride = 0x0B,
    StrideMM = 0x0C, // recognised, not decodable
    TwiddledRectangle = 0x0D,
    ABGR = 0x0E,
    ABGRMM = 0x0F,
    SmallVQ = 0x10,
    SmallVQMM = 0x11,
    TwiddledMMAlias = 0x12,
};

struct TextureHeader {
    pixel::PixelFormat pixel_format = pixel::PixelFormat::ARGB1555;
    DataFormat data_format = DataFormat::Twiddled;
    uint16_t width = 0;
    uint16_t height = 0;
    uint32_t data_size = 0; // declared size of everything after the size field
};

struct GbixSection {
    uint32_t global_index = 0;
    uint32_t size = 0;
};

struct HeaderInfo {
    std::optional<GbixSection> gbix;
    TextureHeader header;
    size_t pvrt_offset = 0;
};

struct Options {
    // Palette for PALETTIZE formats. When unset the palette is read inline,
    // right after the texture header, in the texture's pixel format.
    std::optional<pvp::Palette> palette;
    // Row pitch in pixels for STRIDE textures. 0 means the texture width.
    uint32_t stride = 0;
    // Return every mip level instead of only the full-resolution one.
    bool mipmaps = false;
};

struct Texture {
    std::optional<GbixSection> gbix;
    TextureHeader header;
    // Decoded levels, smallest first. Holds only the full-resolution level
    // unless Options::mipmaps was set.
    std::vector<pixel::Image> levels;
    // Set when the colours are raw YUV422/BUMP samples (see pixel.h).
    bool unconverted = false;

    const pixel::Image& image() const { return levels.back(); }
};

// parse_data_format validates a raw data-format code.
// Throws DecodeError(UnsupportedFormat) for unknown codes.
DataFormat parse_data_format(uint8_t code);

bool has_mipmaps(DataFormat format);
bool is_vq(DataFormat format);
bool is_palettized(DataFormat format);
std::string data_format_name(DataFormat format);

// is_pvr reports whether data starts with a GBIX or PVRT signature.
bool is_pvr(binutil::Bytes data);

// read_header parses the optional GBIX section and the PVRT header without
// touching pixel data.
HeaderInfo read_header(binutil::Bytes data);

// decode parses a PVR file and decodes its pixel data to RGBA.
// Throws DecodeError: BadMagic, UnsupportedFormat, TruncatedInput,
// IndexOutOfRange.
Texture decode(binutil::Bytes data, const Options& opts = {});

// decode_pvr returns the full-resolution image and the GBIX global index.
std::pair<pixel::Image, std::optional<uint32_t>> decode_pvr(binutil::Bytes data);

} // namespace dctools::pvr
