#include "dctools/pixel.h"
#include "dctools/error.h"

#include <format>

namespace dctools::pixel {

namespace {

// Expand an n-bit channel to 8 bits, filling the low bits with the top bits
// of the same channel.
uint8_t expand5(uint32_t v) {
    v <<= 3;
    return static_cast<uint8_t>(v | (v >> 5));
}

uint8_t expand6(uint32_t v) {
    v <<= 2;
    return static_cast<uint8_t>(v | (v >> 6));
}

uint8_t expand4(uint32_t v) {
    v <<= 4;
    return static_cast<uint8_t>(v | (v >> 4));
}

DecodeError unsupported(PixelFormat format) {
    return DecodeError(ErrorKind::UnsupportedFormat,
        std::format("pixel: unsupported pixel format 0x{:02X}", static_cast<unsigned>(format)));
}

} // namespace

PixelFormat parse_pixel_format(uint8_t code) {
    if (code > static_cast<uint8_t>(PixelFormat::ARGB8888))
        throw unsupported(static_cast<PixelFormat>(code));
    return static_cast<PixelFormat>(code);
}

Color decode_pixel(PixelFormat format, uint32_t raw) {
    switch (format) {
        case PixelFormat::ARGB1555:
            return {expand5((raw >> 10) & 0x1F), expand5((raw >> 5) & 0x1F),
                    expand5(raw & 0x1F), static_cast<uint8_t>((raw & 0x8000) ? 0xFF : 0x00)};
        case PixelFormat::RGB565:
            return {expand5((raw >> 11) & 0x1F), expand6((raw >> 5) & 0x3F),
                    expand5(raw & 0x1F), 0xFF};
        case PixelFormat::ARGB4444:
            return {expand4((raw >> 8) & 0xF), expand4((raw >> 4) & 0xF),
                    expand4(raw & 0xF), expand4((raw >> 12) & 0xF)};
        case PixelFormat::RGB555:
            return {expand5((raw >> 10) & 0x1F), expand5((raw >> 5) & 0x1F),
                    expand5(raw & 0x1F), 0xFF};
        case PixelFormat::ARGB8888: // also YUV420, see header
            return {static_cast<uint8_t>(raw >> 16), static_cast<uint8_t>(raw >> 8),
                    static_cast<uint8_t>(raw), static_cast<uint8_t>(raw >> 24)};
        case PixelFormat::YUV422:
        case PixelFormat::BUMP:
            return {static_cast<uint8_t>(raw >> 8), static_cast<uint8_t>(raw), 0, 0xFF};
    }
    throw unsupported(format);
}

size_t sample_size(PixelFormat format) {
    return format == PixelFormat::ARGB8888 ? 4 : 2;
}

bool is_converted(PixelFormat format) {
    return format != PixelFormat::YUV422 && format != PixelFormat::BUMP;
}

std::string pixel_format_name(PixelFormat format) {
    switch (format) {
        case PixelFormat::ARGB1555: return "ARGB1555";
        case PixelFormat::RGB565: return "RGB565";
        case PixelFormat::ARGB4444: return "ARGB4444";
        case PixelFormat::YUV422: return "YUV422";
        case PixelFormat::BUMP: return "BUMP";
        case PixelFormat::RGB555: return "RGB555";
        case PixelFormat::ARGB8888: return "ARGB8888";
    }
    return std::format("0x{:02X}", static_cast<unsigned>(format));
}

} // namespace dctools::pixel
