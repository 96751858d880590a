#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dctools::pixel {

// PowerVR colour formats (low byte of the PVRT texture type).
enum class PixelFormat : uint8_t {
    ARGB1555 = 0x00,
    RGB565 = 0x01,
    ARGB4444 = 0x02,
    YUV422 = 0x03,
    BUMP = 0x04,
    RGB555 = 0x05,
    ARGB8888 = 0x06,
    // Shares code 0x06 with ARGB8888. Which one a file means depends on the
    // data format it is paired with; the decoders always read ARGB8888.
    YUV420 = 0x06,
};

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;

    bool operator==(const Color&) const = default;
};

// RGBA pixel buffer (4 bytes per pixel, row-major, top-to-bottom).
struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // RGBA, size = width * height * 4

    Image() = default;
    Image(int w, int h)
        : width(w), height(h),
          pixels(static_cast<size_t>(w) * static_cast<size_t>(h) * 4) {}

    void set(int x, int y, Color c) {
        size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
        pixels[off] = c.r; pixels[off+1] = c.g; pixels[off+2] = c.b; pixels[off+3] = c.a;
    }

    Color get(int x, int y) const {
        size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
        return {pixels[off], pixels[off+1], pixels[off+2], pixels[off+3]};
    }
};

// parse_pixel_format validates a raw format code.
// Throws DecodeError(UnsupportedFormat) for codes outside 0x00-0x06.
PixelFormat parse_pixel_format(uint8_t code);

// decode_pixel expands one raw sample (16 bits, or 32 for ARGB8888) to
// 8 bits per channel. Throws DecodeError(UnsupportedFormat) for an
// unrecognised format value.
Color decode_pixel(PixelFormat format, uint32_t raw);

// sample_size is the width in bytes of one stored sample: 4 for ARGB8888,
// 2 for everything else.
size_t sample_size(PixelFormat format);

// is_converted is false for YUV422 and BUMP. Their samples are passed
// through as r = high byte, g = low byte, b = 0, a = 255.
bool is_converted(PixelFormat format);

std::string pixel_format_name(PixelFormat format);

} // namespace dctools::pixel
