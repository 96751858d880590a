#include "dctools/pvr.h"
#include "dctools/twiddle.h"

#include <gtest/gtest.h>

#include <cstring>
#include <sstream>

using namespace dctools;
using namespace dctools::binutil;
using pixel::Color;
using pixel::PixelFormat;
using pvr::DataFormat;

namespace {

// Helper to build a PVR file in memory:
//   [GBIX section]
//   "PVRT", data size, pixel format, data format, 2 pad bytes, width, height
//   body
std::string build_pvr(PixelFormat pf, DataFormat df, uint16_t w, uint16_t h,
                      const std::string& body, std::optional<uint32_t> gbix = std::nullopt) {
    std::ostringstream out;
    if (gbix) {
        write_signature(out, "GBIX");
        write_u32(out, 8);
        write_u32(out, *gbix);
        write_u32(out, 0);
    }
    write_signature(out, "PVRT");
    write_u32(out, 8 + static_cast<uint32_t>(body.size()));
    write_u8(out, static_cast<uint8_t>(pf));
    write_u8(out, static_cast<uint8_t>(df));
    write_u16(out, 0);
    write_u16(out, w);
    write_u16(out, h);
    out << body;
    return out.str();
}

std::string u16s(const std::vector<uint16_t>& v) {
    std::ostringstream out;
    for (auto x : v) write_u16(out, x);
    return out.str();
}

std::string u32s(const std::vector<uint32_t>& v) {
    std::ostringstream out;
    for (auto x : v) write_u32(out, x);
    return out.str();
}

ErrorKind decode_error_kind(const std::string& data, const pvr::Options& opts = {}) {
    try {
        pvr::decode(as_bytes(data), opts);
    } catch (const DecodeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected DecodeError";
    return ErrorKind::BadMagic;
}

// Distinct RGB565 value for texel n.
uint16_t sample(uint32_t n) { return static_cast<uint16_t>(0x0841 * (n + 1)); }

} // namespace

TEST(Pvr, RectangleRgb565RoundTrip) {
    std::vector<uint16_t> raw = {0xF800, 0x07E0, 0x001F, 0x1234};
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Rectangle, 2, 2, u16s(raw));

    auto [img, global_index] = pvr::decode_pvr(as_bytes(data));
    EXPECT_FALSE(global_index.has_value());
    ASSERT_EQ(img.width, 2);
    ASSERT_EQ(img.height, 2);
    for (int i = 0; i < 4; i++)
        EXPECT_EQ(img.get(i % 2, i / 2), pixel::decode_pixel(PixelFormat::RGB565, raw[static_cast<size_t>(i)]));
}

TEST(Pvr, GbixPrefix) {
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Rectangle, 1, 1, u16s({0xFFFF}), 1234);
    auto info = pvr::read_header(as_bytes(data));
    ASSERT_TRUE(info.gbix.has_value());
    EXPECT_EQ(info.gbix->global_index, 1234u);
    EXPECT_EQ(info.pvrt_offset, 16u);
    EXPECT_EQ(info.header.width, 1);

    auto [img, global_index] = pvr::decode_pvr(as_bytes(data));
    ASSERT_TRUE(global_index.has_value());
    EXPECT_EQ(*global_index, 1234u);
    EXPECT_EQ(img.get(0, 0), (Color{255, 255, 255, 255}));
}

TEST(Pvr, GbixWithoutPvrtIsBadMagic) {
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Rectangle, 1, 1, u16s({0}), 7);
    data[16] = 'X';
    EXPECT_EQ(decode_error_kind(data), ErrorKind::BadMagic);
}

TEST(Pvr, GbixAtEndOfBufferIsBadMagic) {
    std::ostringstream out;
    write_signature(out, "GBIX");
    write_u32(out, 8);
    write_u32(out, 42);
    write_u32(out, 0);
    EXPECT_EQ(decode_error_kind(out.str()), ErrorKind::BadMagic);

    // Section size pointing past the end of the buffer.
    std::ostringstream past;
    write_signature(past, "GBIX");
    write_u32(past, 64);
    write_u32(past, 42);
    write_u32(past, 0);
    EXPECT_EQ(decode_error_kind(past.str()), ErrorKind::BadMagic);
}

TEST(Pvr, BadMagic) {
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Rectangle, 1, 1, u16s({0}));
    data.replace(0, 4, "NOPE");
    EXPECT_EQ(decode_error_kind(data), ErrorKind::BadMagic);
    EXPECT_FALSE(pvr::is_pvr(as_bytes(std::string("PVMH"))));
    EXPECT_TRUE(pvr::is_pvr(as_bytes(std::string("PVRT"))));
    EXPECT_TRUE(pvr::is_pvr(as_bytes(std::string("GBIX"))));
}

TEST(Pvr, UnsupportedCodes) {
    auto bad_pixel = build_pvr(static_cast<PixelFormat>(0x07), DataFormat::Rectangle, 1, 1, u16s({0}));
    EXPECT_EQ(decode_error_kind(bad_pixel), ErrorKind::UnsupportedFormat);
    auto bad_data = build_pvr(PixelFormat::RGB565, static_cast<DataFormat>(0x13), 1, 1, u16s({0}));
    EXPECT_EQ(decode_error_kind(bad_data), ErrorKind::UnsupportedFormat);
    auto stride_mm = build_pvr(PixelFormat::RGB565, DataFormat::StrideMM, 1, 1, u16s({0}));
    EXPECT_EQ(decode_error_kind(stride_mm), ErrorKind::UnsupportedFormat);
}

TEST(Pvr, TruncatedBody) {
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Rectangle, 2, 2, u16s({1, 2, 3}));
    EXPECT_EQ(decode_error_kind(data), ErrorKind::TruncatedInput);
}

TEST(Pvr, DeclaredSizeBoundsTheBody) {
    // Declared size covers only three samples even though four follow.
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Rectangle, 2, 2, u16s({1, 2, 3, 4}));
    uint32_t short_size = 8 + 6;
    std::memcpy(data.data() + 4, &short_size, 4);
    EXPECT_EQ(decode_error_kind(data), ErrorKind::TruncatedInput);

    // An oversized declaration is clamped to the buffer.
    auto big = build_pvr(PixelFormat::RGB565, DataFormat::Rectangle, 2, 2, u16s({1, 2, 3, 4}));
    uint32_t huge = 0x100000;
    std::memcpy(big.data() + 4, &huge, 4);
    EXPECT_NO_THROW(pvr::decode(as_bytes(big)));
}

TEST(Pvr, TwiddledArgb4444) {
    std::vector<uint16_t> raw(16);
    for (uint32_t i = 0; i < 16; i++) raw[i] = static_cast<uint16_t>(0xF000 | (i << 4) | i);
    auto data = build_pvr(PixelFormat::ARGB4444, DataFormat::Twiddled, 4, 4, u16s(raw));

    auto tex = pvr::decode(as_bytes(data));
    ASSERT_EQ(tex.levels.size(), 1u);
    for (uint32_t y = 0; y < 4; y++)
        for (uint32_t x = 0; x < 4; x++)
            EXPECT_EQ(tex.image().get(static_cast<int>(x), static_cast<int>(y)),
                      pixel::decode_pixel(PixelFormat::ARGB4444, raw[twiddle::to_morton(x, y)]));
}

TEST(Pvr, TwiddledRectangle) {
    std::vector<uint16_t> raw(8);
    for (uint32_t i = 0; i < 8; i++) raw[i] = sample(i);
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::TwiddledRectangle, 2, 4, u16s(raw));

    auto img = pvr::decode(as_bytes(data)).image();
    ASSERT_EQ(img.width, 2);
    ASSERT_EQ(img.height, 4);
    // Two 2x2 tiles stacked vertically.
    EXPECT_EQ(img.get(1, 1), pixel::decode_pixel(PixelFormat::RGB565, raw[3]));
    EXPECT_EQ(img.get(0, 2), pixel::decode_pixel(PixelFormat::RGB565, raw[4]));
    EXPECT_EQ(img.get(1, 3), pixel::decode_pixel(PixelFormat::RGB565, raw[7]));
}

TEST(Pvr, TwiddledMipmapChain) {
    // 1x1, 2x2, 4x4 back to back
    std::vector<uint16_t> raw;
    uint32_t n = 0;
    for (uint32_t count : {1u, 4u, 16u})
        for (uint32_t i = 0; i < count; i++) raw.push_back(sample(n++));
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::TwiddledMM, 4, 4, u16s(raw));

    pvr::Options opts;
    opts.mipmaps = true;
    auto tex = pvr::decode(as_bytes(data), opts);
    ASSERT_EQ(tex.levels.size(), 3u);
    EXPECT_EQ(tex.levels[0].width, 1);
    EXPECT_EQ(tex.levels[1].width, 2);
    EXPECT_EQ(tex.levels[2].width, 4);
    EXPECT_EQ(tex.levels[0].get(0, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(0)));
    EXPECT_EQ(tex.levels[1].get(0, 1), pixel::decode_pixel(PixelFormat::RGB565, sample(1 + 2)));
    EXPECT_EQ(tex.levels[2].get(3, 3), pixel::decode_pixel(PixelFormat::RGB565, sample(5 + 15)));

    // Without the mip chain only the full level comes back, identical.
    auto full = pvr::decode(as_bytes(data));
    ASSERT_EQ(full.levels.size(), 1u);
    EXPECT_EQ(full.image().pixels, tex.levels[2].pixels);
}

TEST(Pvr, TwoLevelMipmapChainFillsDeclaredSize) {
    // 2x2 TWIDDLED_MM: exactly five samples, 1x1 then 2x2.
    std::vector<uint16_t> raw = {sample(0), sample(1), sample(2), sample(3), sample(4)};
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::TwiddledMM, 2, 2, u16s(raw));

    auto [img, global_index] = pvr::decode_pvr(as_bytes(data));
    ASSERT_EQ(img.width, 2);
    EXPECT_EQ(img.get(0, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(1)));
    EXPECT_EQ(img.get(1, 1), pixel::decode_pixel(PixelFormat::RGB565, sample(4)));

    pvr::Options opts;
    opts.mipmaps = true;
    auto tex = pvr::decode(as_bytes(data), opts);
    ASSERT_EQ(tex.levels.size(), 2u);
    EXPECT_EQ(tex.levels[0].get(0, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(0)));
}

TEST(Pvr, Palettize4MipmapChain) {
    std::vector<uint16_t> pal(16);
    for (uint32_t i = 0; i < 16; i++) pal[i] = sample(i);
    std::string body = u16s(pal);
    body += '\x01';             // 1x1: entry 1
    body += "\x32\x54";         // 2x2: entries 2, 3, 4, 5
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Palettize4MM, 2, 2, body);

    pvr::Options opts;
    opts.mipmaps = true;
    auto tex = pvr::decode(as_bytes(data), opts);
    ASSERT_EQ(tex.levels.size(), 2u);
    EXPECT_EQ(tex.levels[0].get(0, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(1)));
    EXPECT_EQ(tex.levels[1].get(0, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(2)));
    EXPECT_EQ(tex.levels[1].get(1, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(3)));
    EXPECT_EQ(tex.levels[1].get(0, 1), pixel::decode_pixel(PixelFormat::RGB565, sample(4)));
    EXPECT_EQ(tex.levels[1].get(1, 1), pixel::decode_pixel(PixelFormat::RGB565, sample(5)));
}

TEST(Pvr, Vq) {
    // 4x4 VQ: 256-entry codebook, 4 block indices in twiddled order.
    std::vector<uint16_t> book(256 * 4, 0);
    for (uint16_t t = 0; t < 4; t++) {
        book[7 * 4 + t] = sample(t);
        book[9 * 4 + t] = sample(10 + t);
    }
    std::string body = u16s(book);
    body += std::string("\x07\x09\x07\x09", 4); // blocks (0,0) (1,0) (0,1) (1,1)
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::VQ, 4, 4, body);

    auto img = pvr::decode(as_bytes(data)).image();
    EXPECT_EQ(img.get(0, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(0)));
    EXPECT_EQ(img.get(1, 1), pixel::decode_pixel(PixelFormat::RGB565, sample(3)));
    EXPECT_EQ(img.get(2, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(10)));
    EXPECT_EQ(img.get(3, 3), pixel::decode_pixel(PixelFormat::RGB565, sample(13)));
}

TEST(Pvr, SmallVqMipmaps) {
    // 4x4 SMALLVQ_MM: 16-entry codebook, then 1x1 (1 byte), 2x2 (1 byte), 4x4 (4 bytes).
    std::vector<uint16_t> book(16 * 4);
    for (uint32_t i = 0; i < book.size(); i++) book[i] = sample(i);
    std::string body = u16s(book);
    body += std::string("\x02\x03\x04\x05\x06\x07", 6);
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::SmallVQMM, 4, 4, body);

    pvr::Options opts;
    opts.mipmaps = true;
    auto tex = pvr::decode(as_bytes(data), opts);
    ASSERT_EQ(tex.levels.size(), 3u);
    EXPECT_EQ(tex.levels[0].get(0, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(2 * 4)));
    EXPECT_EQ(tex.levels[1].get(1, 0), pixel::decode_pixel(PixelFormat::RGB565, sample(3 * 4 + 1)));
    EXPECT_EQ(tex.levels[2].get(0, 2), pixel::decode_pixel(PixelFormat::RGB565, sample(6 * 4)));
}

TEST(Pvr, Palettize4InlinePalette) {
    std::vector<uint16_t> pal(16);
    for (uint32_t i = 0; i < 16; i++) pal[i] = sample(i);
    std::string body = u16s(pal);
    // Storage index i holds palette entry (15 - i); low nibble first.
    for (uint32_t i = 0; i < 16; i += 2)
        body += static_cast<char>((15 - i) | ((15 - (i + 1)) << 4));
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Palettize4, 4, 4, body);

    auto img = pvr::decode(as_bytes(data)).image();
    for (uint32_t y = 0; y < 4; y++)
        for (uint32_t x = 0; x < 4; x++)
            EXPECT_EQ(img.get(static_cast<int>(x), static_cast<int>(y)),
                      pixel::decode_pixel(PixelFormat::RGB565, sample(15 - twiddle::to_morton(x, y))));
}

TEST(Pvr, Palettize8ExternalPalette) {
    pvp::Palette pal;
    pal.format = PixelFormat::ARGB8888;
    pal.colors = {{1, 2, 3, 4}, {5, 6, 7, 8}, {9, 10, 11, 12}, {13, 14, 15, 16}};
    auto data = build_pvr(PixelFormat::ARGB8888, DataFormat::Palettize8, 2, 2,
                          std::string("\x00\x01\x02\x03", 4));

    pvr::Options opts;
    opts.palette = pal;
    auto img = pvr::decode(as_bytes(data), opts).image();
    EXPECT_EQ(img.get(0, 0), pal.colors[0]);
    EXPECT_EQ(img.get(1, 0), pal.colors[1]);
    EXPECT_EQ(img.get(0, 1), pal.colors[2]);
    EXPECT_EQ(img.get(1, 1), pal.colors[3]);
}

TEST(Pvr, PaletteIndexOutOfRange) {
    pvp::Palette pal;
    pal.format = PixelFormat::RGB565;
    pal.colors = {{1, 2, 3, 255}};
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Palettize8, 2, 2,
                          std::string("\x00\x00\x05\x00", 4));
    pvr::Options opts;
    opts.palette = pal;
    EXPECT_EQ(decode_error_kind(data, opts), ErrorKind::IndexOutOfRange);
}

TEST(Pvr, StrideRowPitch) {
    // 2x2 texture with a 3-sample row pitch.
    auto data = build_pvr(PixelFormat::RGB565, DataFormat::Stride, 2, 2,
                          u16s({sample(0), sample(1), 0, sample(2), sample(3)}));
    pvr::Options opts;
    opts.stride = 3;
    auto img = pvr::decode(as_bytes(data), opts).image();
    EXPECT_EQ(img.get(0, 1), pixel::decode_pixel(PixelFormat::RGB565, sample(2)));
    EXPECT_EQ(img.get(1, 1), pixel::decode_pixel(PixelFormat::RGB565, sample(3)));

    opts.stride = 1;
    EXPECT_EQ(decode_error_kind(data, opts), ErrorKind::UnsupportedFormat);
}

TEST(Pvr, AbgrSwapsRedAndBlue) {
    auto data = build_pvr(PixelFormat::ARGB8888, DataFormat::ABGR, 1, 1, u32s({0x80112233}));
    auto img = pvr::decode(as_bytes(data)).image();
    EXPECT_EQ(img.get(0, 0), (Color{0x33, 0x22, 0x11, 0x80}));
}

TEST(Pvr, YuvIsFlaggedUnconverted) {
    auto data = build_pvr(PixelFormat::YUV422, DataFormat::Rectangle, 1, 1, u16s({0x1080}));
    auto tex = pvr::decode(as_bytes(data));
    EXPECT_TRUE(tex.unconverted);
    auto rgb = build_pvr(PixelFormat::RGB565, DataFormat::Rectangle, 1, 1, u16s({0x1080}));
    EXPECT_FALSE(pvr::decode(as_bytes(rgb)).unconverted);
}

TEST(Pvr, FormatNames) {
    EXPECT_EQ(pvr::data_format_name(DataFormat::SmallVQMM), "SMALLVQ_MM");
    EXPECT_TRUE(pvr::has_mipmaps(DataFormat::TwiddledMMAlias));
    EXPECT_FALSE(pvr::has_mipmaps(DataFormat::TwiddledRectangle));
    EXPECT_TRUE(pvr::is_vq(DataFormat::SmallVQ));
    EXPECT_TRUE(pvr::is_palettized(DataFormat::Palettize8MM));
}
