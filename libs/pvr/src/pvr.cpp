#include "dctools/pvr.h"
#include "dctools/twiddle.h"
#include "dctools/vq.h"

#include <algorithm>
#include <cstring>
#include <format>

namespace dctools::pvr {

using pixel::Image;
using pixel::PixelFormat;

// --- Format tables ---

DataFormat parse_data_format(uint8_t code) {
    if (code < static_cast<uint8_t>(DataFormat::Twiddled) ||
        code > static_cast<uint8_t>(DataFormat::TwiddledMMAlias))
        throw DecodeError(ErrorKind::UnsupportedFormat,
            std::format("pvr: unsupported data format 0x{:02X}", code));
    return static_cast<DataFormat>(code);
}

bool has_mipmaps(DataFormat format) {
    switch (format) {
        case DataFormat::TwiddledMM:
        case DataFormat::VQMM:
        case DataFormat::Palettize4MM:
        case DataFormat::Palettize8MM:
        case DataFormat::RectangleMM:
        case DataFormat::StrideMM:
        case DataFormat::ABGRMM:
        case DataFormat::SmallVQMM:
        case DataFormat::TwiddledMMAlias:
            return true;
        default:
            return false;
    }
}

bool is_vq(DataFormat format) {
    return format == DataFormat::VQ || format == DataFormat::VQMM ||
           format == DataFormat::SmallVQ || format == DataFormat::SmallVQMM;
}

bool is_palettized(DataFormat format) {
    return format == DataFormat::Palettize4 || format == DataFormat::Palettize4MM ||
           format == DataFormat::Palettize8 || format == DataFormat::Palettize8MM;
}

std::string data_format_name(DataFormat format) {
    switch (format) {
        case DataFormat::Twiddled: return "TWIDDLED";
        case DataFormat::TwiddledMM: return "TWIDDLED_MM";
        case DataFormat::VQ: return "VQ";
        case DataFormat::VQMM: return "VQ_MM";
        case DataFormat::Palettize4: return "PALETTIZE4";
        case DataFormat::Palettize4MM: return "PALETTIZE4_MM";
        case DataFormat::Palettize8: return "PALETTIZE8";
        case DataFormat::Palettize8MM: return "PALETTIZE8_MM";
        case DataFormat::Rectangle: return "RECTANGLE";
        case DataFormat::RectangleMM: return "RECTANGLE_MM";
        case DataFormat::Stride: return "STRIDE";
        case DataFormat::StrideMM: return "STRIDE_MM";
        case DataFormat::TwiddledRectangle: return "TWIDDLED_RECTANGLE";
        case DataFormat::ABGR: return "ABGR";
        case DataFormat::ABGRMM: return "ABGR_MM";
        case DataFormat::SmallVQ: return "SMALLVQ";
        case DataFormat::SmallVQMM: return "SMALLVQ_MM";
        case DataFormat::TwiddledMMAlias: return "TWIDDLED_MM_ALIAS";
    }
    return std::format("0x{:02X}", static_cast<unsigned>(format));
}

// --- Header ---

bool is_pvr(binutil::Bytes data) {
    binutil::Reader r(data, "pvr");
    return r.peek_signature(0, "GBIX") || r.peek_signature(0, "PVRT");
}

static HeaderInfo read_header(binutil::Reader& r) {
    HeaderInfo info;

    if (r.peek_signature(r.tell(), "GBIX")) {
        size_t start = r.tell();
        r.skip(4);
        GbixSection gbix;
        gbix.size = r.read_u32();
        gbix.global_index = r.read_u32();
        info.gbix = gbix;
        // PVRT follows the section, aligned to 8 bytes.
        size_t next = start + 8 + static_cast<size_t>(gbix.size);
        size_t aligned = (next + 7) & ~size_t{7};
        if (!r.peek_signature(aligned, "PVRT"))
            throw DecodeError(ErrorKind::BadMagic,
                std::format("pvr: no PVRT at offset {} after GBIX", aligned));
        r.seek(aligned);
    }

    info.pvrt_offset = r.tell();
    auto sig = r.read_signature();
    if (sig != "PVRT")
        throw DecodeError(ErrorKind::BadMagic,
            std::format("pvr: expected PVRT at offset {}, got '{}'", info.pvrt_offset, sig));

    auto& h = info.header;
    h.data_size = r.read_u32();
    if (h.data_size < 8)
        throw DecodeError(ErrorKind::TruncatedInput,
            std::format("pvr: declared data size {} is smaller than the texture header", h.data_size));

    uint8_t pixel_code = r.read_u8();
    uint8_t data_code = r.read_u8();
    r.skip(2);
    h.width = r.read_u16();
    h.height = r.read_u16();

    h.pixel_format = pixel::parse_pixel_format(pixel_code);
    h.data_format = parse_data_format(data_code);
    if (h.width == 0 || h.height == 0)
        throw DecodeError(ErrorKind::UnsupportedFormat,
            std::format("pvr: invalid dimensions {}x{}", h.width, h.height));
    return info;
}

HeaderInfo read_header(binutil::Bytes data) {
    binutil::Reader r(data, "pvr");
    return read_header(r);
}

// --- Level decoders ---

namespace {

struct LevelSize {
    int width;
    int height;
};

// Mip chain from 1x1 (or 1xN) up to the full size, smallest first. Levels
// are stored back to back in that order.
std::vector<LevelSize> level_sizes(const TextureHeader& h) {
    if (!has_mipmaps(h.data_format))
        return {{h.width, h.height}};

    int levels = 1;
    while ((std::max(h.width, h.height) >> levels) > 0) levels++;

    std::vector<LevelSize> sizes;
    for (int k = levels - 1; k >= 0; k--)
        sizes.push_back({std::max(1, h.width >> k), std::max(1, h.height >> k)});
    return sizes;
}

uint32_t read_sample(binutil::Bytes data, size_t index, size_t sample) {
    size_t off = index * sample;
    if (sample == 4) {
        uint32_t v;
        std::memcpy(&v, data.data() + off, 4);
        return v;
    }
    uint16_t v;
    std::memcpy(&v, data.data() + off, 2);
    return v;
}

size_t pixel_count(LevelSize s) {
    return static_cast<size_t>(s.width) * static_cast<size_t>(s.height);
}

Image decode_twiddled(binutil::Reader& r, PixelFormat format, LevelSize s) {
    size_t sample = pixel::sample_size(format);
    size_t count = pixel_count(s);
    auto data = r.read_bytes(count * sample);

    Image img(s.width, s.height);
    for (int y = 0; y < s.height; y++) {
        for (int x = 0; x < s.width; x++) {
            uint32_t idx = twiddle::twiddled_index(static_cast<uint32_t>(x), static_cast<uint32_t>(y),
                                                   static_cast<uint32_t>(s.width),
                                                   static_cast<uint32_t>(s.height));
            twiddle::check_index(idx, count, "pvr: twiddled pixel");
            img.set(x, y, pixel::decode_pixel(format, read_sample(data, idx, sample)));
        }
    }
    return img;
}

// Row-major samples with `pitch` samples per row. ABGR levels swap the red
// and blue channels of the decoded colour.
Image decode_linear(binutil::Reader& r, PixelFormat format, LevelSize s, size_t pitch, bool abgr) {
    size_t sample = pixel::sample_size(format);
    size_t count = pitch * static_cast<size_t>(s.height - 1) + static_cast<size_t>(s.width);
    auto data = r.read_bytes(count * sample);

    Image img(s.width, s.height);
    for (int y = 0; y < s.height; y++) {
        for (int x = 0; x < s.width; x++) {
            size_t idx = static_cast<size_t>(y) * pitch + static_cast<size_t>(x);
            auto c = pixel::decode_pixel(format, read_sample(data, idx, sample));
            if (abgr) std::swap(c.r, c.b);
            img.set(x, y, c);
        }
    }
    return img;
}

// Palettized levels are twiddled. With 4-bit indices two pixels share a
// byte, the even storage index in the low nibble.
Image decode_palettized(binutil::Reader& r, const pvp::Palette& pal, LevelSize s, int bits) {
    size_t count = pixel_count(s);
    size_t bytes = bits == 4 ? (count + 1) / 2 : count;
    auto data = r.read_bytes(bytes);

    Image img(s.width, s.height);
    for (int y = 0; y < s.height; y++) {
        for (int x = 0; x < s.width; x++) {
            uint32_t idx = twiddle::twiddled_index(static_cast<uint32_t>(x), static_cast<uint32_t>(y),
                                                   static_cast<uint32_t>(s.width),
                                                   static_cast<uint32_t>(s.height));
            twiddle::check_index(idx, count, "pvr: palettized pixel");
            size_t entry;
            if (bits == 4) {
                uint8_t b = data[idx >> 1];
                entry = (idx & 1) ? (b >> 4) : (b & 0x0F);
            } else {
                entry = data[idx];
            }
            img.set(x, y, pvp::resolve_index(pal, entry));
        }
    }
    return img;
}

size_t level_bytes(DataFormat format, PixelFormat pf, LevelSize s) {
    size_t count = pixel_count(s);
    if (is_vq(format))
        return (s.width == 1 && s.height == 1) ? 1
               : static_cast<size_t>(std::max(1, s.width / 2)) * static_cast<size_t>(std::max(1, s.height / 2));
    if (format == DataFormat::Palettize4 || format == DataFormat::Palettize4MM)
        return (count + 1) / 2;
    if (format == DataFormat::Palettize8 || format == DataFormat::Palettize8MM)
        return count;
    return count * pixel::sample_size(pf);
}

} // namespace

// --- Decode ---

Texture decode(binutil::Bytes data, const Options& opts) {
    binutil::Reader hr(data, "pvr");
    auto info = read_header(hr);
    const auto& h = info.header;

    // The declared size bounds the body, but never past the buffer.
    size_t body_start = hr.tell();
    size_t declared_end = info.pvrt_offset + 8 + static_cast<size_t>(h.data_size);
    size_t body_end = std::min(data.size(), declared_end);
    binutil::Reader r(data.subspan(body_start, body_end - body_start), "pvr");

    Texture tex;
    tex.gbix = info.gbix;
    tex.header = h;

    const auto sizes = level_sizes(h);
    PixelFormat color_format = h.pixel_format;

    std::optional<vq::Codebook> codebook;
    std::optional<pvp::Palette> inline_palette;
    int palette_bits = 0;

    switch (h.data_format) {
        case DataFormat::VQ:
        case DataFormat::VQMM:
        case DataFormat::SmallVQ:
        case DataFormat::SmallVQMM: {
            bool small = h.data_format == DataFormat::SmallVQ || h.data_format == DataFormat::SmallVQMM;
            codebook = vq::read_codebook(r, h.pixel_format, vq::codebook_size(h.width, h.height, small));
            break;
        }
        case DataFormat::Palettize4:
        case DataFormat::Palettize4MM:
        case DataFormat::Palettize8:
        case DataFormat::Palettize8MM:
            palette_bits = (h.data_format == DataFormat::Palettize4 ||
                            h.data_format == DataFormat::Palettize4MM) ? 4 : 8;
            if (!opts.palette)
                inline_palette = pvp::read_palette(r, h.pixel_format, size_t{1} << palette_bits);
            color_format = opts.palette ? opts.palette->format : h.pixel_format;
            break;
        case DataFormat::StrideMM:
            throw DecodeError(ErrorKind::UnsupportedFormat,
                "pvr: STRIDE_MM textures cannot be decoded");
        case DataFormat::Stride:
            if (opts.stride != 0 && opts.stride < h.width)
                throw DecodeError(ErrorKind::UnsupportedFormat,
                    std::format("pvr: stride {} is smaller than width {}", opts.stride, h.width));
            break;
        case DataFormat::Twiddled:
        case DataFormat::TwiddledMM:
        case DataFormat::TwiddledMMAlias:
        case DataFormat::TwiddledRectangle:
        case DataFormat::Rectangle:
        case DataFormat::RectangleMM:
        case DataFormat::ABGR:
        case DataFormat::ABGRMM:
            break;
    }

    const pvp::Palette* palette = opts.palette ? &*opts.palette
                                               : (inline_palette ? &*inline_palette : nullptr);

    for (size_t i = 0; i < sizes.size(); i++) {
        const auto s = sizes[i];
        bool last = i + 1 == sizes.size();
        if (!last && !opts.mipmaps) {
            r.skip(level_bytes(h.data_format, h.pixel_format, s));
            continue;
        }

        switch (h.data_format) {
            case DataFormat::Twiddled:
            case DataFormat::TwiddledMM:
            case DataFormat::TwiddledMMAlias:
            case DataFormat::TwiddledRectangle:
                tex.levels.push_back(decode_twiddled(r, h.pixel_format, s));
                break;
            case DataFormat::VQ:
            case DataFormat::VQMM:
            case DataFormat::SmallVQ:
            case DataFormat::SmallVQMM:
                tex.levels.push_back(vq::decode_level(r, *codebook, s.width, s.height));
                break;
            case DataFormat::Palettize4:
            case DataFormat::Palettize4MM:
            case DataFormat::Palettize8:
            case DataFormat::Palettize8MM:
                tex.levels.push_back(decode_palettized(r, *palette, s, palette_bits));
                break;
            case DataFormat::Rectangle:
            case DataFormat::RectangleMM:
                tex.levels.push_back(decode_linear(r, h.pixel_format, s, static_cast<size_t>(s.width), false));
                break;
            case DataFormat::Stride: {
                size_t pitch = opts.stride != 0 ? opts.stride : static_cast<size_t>(s.width);
                tex.levels.push_back(decode_linear(r, h.pixel_format, s, pitch, false));
                break;
            }
            case DataFormat::ABGR:
            case DataFormat::ABGRMM:
                tex.levels.push_back(decode_linear(r, h.pixel_format, s, static_cast<size_t>(s.width), true));
                break;
            case DataFormat::StrideMM:
                break; // rejected above
        }
    }

    tex.unconverted = !pixel::is_converted(color_format);
    return tex;
}

std::pair<Image, std::optional<uint32_t>> decode_pvr(binutil::Bytes data) {
    auto tex = decode(data);
    std::optional<uint32_t> global_index;
    if (tex.gbix) global_index = tex.gbix->global_index;
    return {std::move(tex.levels.back()), global_index};
}

} // namespace dctools::pvr
