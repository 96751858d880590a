#include "dctools/vq.h"
#include "dctools/twiddle.h"

#include <gtest/gtest.h>

#include <sstream>

using namespace dctools;
using namespace dctools::binutil;
using pixel::Color;
using pixel::PixelFormat;

namespace {

// RGB565 codebook where every texel of every entry has a distinct value.
void write_codebook(std::ostream& out, size_t entries) {
    for (size_t i = 0; i < entries; i++)
        for (uint16_t t = 0; t < 4; t++)
            write_u16(out, static_cast<uint16_t>((i * 4 + t) * 0x0101));
}

Color texel(size_t entry, uint16_t t) {
    return pixel::decode_pixel(PixelFormat::RGB565, static_cast<uint16_t>((entry * 4 + t) * 0x0101));
}

} // namespace

TEST(Vq, SmallCodebookSizes) {
    EXPECT_EQ(vq::codebook_size(16, 16, true), 16u);
    EXPECT_EQ(vq::codebook_size(8, 8, true), 16u);
    EXPECT_EQ(vq::codebook_size(32, 32, true), 32u);
    EXPECT_EQ(vq::codebook_size(64, 64, true), 128u);
    EXPECT_EQ(vq::codebook_size(128, 128, true), 256u);
    EXPECT_EQ(vq::codebook_size(16, 16, false), 256u);
}

TEST(Vq, CodebookBlocksAreRasterOrder) {
    std::ostringstream out;
    write_u16(out, 0xF800); // TL red
    write_u16(out, 0x07E0); // TR green
    write_u16(out, 0x001F); // BL blue
    write_u16(out, 0xFFFF); // BR white
    auto data = out.str();
    Reader r(as_bytes(data));
    auto cb = vq::read_codebook(r, PixelFormat::RGB565, 1);
    ASSERT_EQ(cb.blocks.size(), 1u);
    EXPECT_EQ(cb.blocks[0][0], (Color{255, 0, 0, 255}));
    EXPECT_EQ(cb.blocks[0][1], (Color{0, 255, 0, 255}));
    EXPECT_EQ(cb.blocks[0][2], (Color{0, 0, 255, 255}));
    EXPECT_EQ(cb.blocks[0][3], (Color{255, 255, 255, 255}));
}

TEST(Vq, DecodeSmallVq8x8) {
    // 8x8 texture: 4x4 blocks, 16-entry codebook. Block at (bx, by) uses
    // codebook entry (bx + by * 4), stored at its twiddled position.
    std::ostringstream out;
    write_codebook(out, 16);
    std::vector<uint8_t> indices(16);
    for (uint32_t by = 0; by < 4; by++)
        for (uint32_t bx = 0; bx < 4; bx++)
            indices[twiddle::to_morton(bx, by)] = static_cast<uint8_t>(bx + by * 4);
    out.write(reinterpret_cast<const char*>(indices.data()), 16);
    auto data = out.str();

    auto img = vq::decode_vq(as_bytes(data), 8, 8, PixelFormat::RGB565, true);
    ASSERT_EQ(img.width, 8);
    ASSERT_EQ(img.height, 8);
    for (int y = 0; y < 8; y++) {
        for (int x = 0; x < 8; x++) {
            size_t entry = static_cast<size_t>(x / 2 + (y / 2) * 4);
            auto t = static_cast<uint16_t>((x & 1) + (y & 1) * 2);
            EXPECT_EQ(img.get(x, y), texel(entry, t)) << x << "," << y;
        }
    }
}

TEST(Vq, OneByOneLevelUsesTopLeft) {
    std::ostringstream out;
    write_codebook(out, 2);
    write_u8(out, 1);
    auto data = out.str();
    Reader r(as_bytes(data));
    auto cb = vq::read_codebook(r, PixelFormat::RGB565, 2);
    auto img = vq::decode_level(r, cb, 1, 1);
    EXPECT_EQ(img.get(0, 0), texel(1, 0));
    EXPECT_EQ(r.remaining(), 0u);
}

TEST(Vq, IndexPastCodebookIsOutOfRange) {
    std::ostringstream out;
    write_codebook(out, 16);
    for (int i = 0; i < 16; i++) write_u8(out, i == 5 ? 16 : 0);
    auto data = out.str();
    try {
        vq::decode_vq(as_bytes(data), 8, 8, PixelFormat::RGB565, true);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IndexOutOfRange);
    }
}

TEST(Vq, MissingIndicesAreTruncated) {
    std::ostringstream out;
    write_codebook(out, 16);
    write_u8(out, 0);
    auto data = out.str();
    try {
        vq::decode_vq(as_bytes(data), 8, 8, PixelFormat::RGB565, true);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TruncatedInput);
    }
}
