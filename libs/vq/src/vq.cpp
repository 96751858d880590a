#include "dctools/vq.h"
#include "dctools/twiddle.h"

#include <algorithm>

namespace dctools::vq {

size_t codebook_size(int width, int height, bool small) {
    if (!small) return 256;
    int dim = std::max(width, height);
    if (dim <= 16) return 16;
    if (dim <= 32) return 32;
    if (dim <= 64) return 128;
    return 256;
}

Codebook read_codebook(binutil::Reader& r, pixel::PixelFormat format, size_t entries) {
    bool wide = pixel::sample_size(format) == 4;
    Codebook cb;
    cb.blocks.resize(entries);
    for (auto& block : cb.blocks) {
        for (auto& c : block) {
            uint32_t raw = wide ? r.read_u32() : r.read_u16();
            c = pixel::decode_pixel(format, raw);
        }
    }
    return cb;
}

pixel::Image decode_level(binutil::Reader& r, const Codebook& codebook, int width, int height) {
    pixel::Image img(width, height);

    if (width == 1 && height == 1) {
        uint8_t idx = r.read_u8();
        twiddle::check_index(idx, codebook.blocks.size(), "vq: codebook");
        img.set(0, 0, codebook.blocks[idx][0]);
        return img;
    }

    auto bw = static_cast<uint32_t>(std::max(1, width / 2));
    auto bh = static_cast<uint32_t>(std::max(1, height / 2));
    size_t count = static_cast<size_t>(bw) * bh;
    auto indices = r.read_bytes(count);

    for (uint32_t by = 0; by < bh; by++) {
        for (uint32_t bx = 0; bx < bw; bx++) {
            uint32_t pos = twiddle::twiddled_index(bx, by, bw, bh);
            twiddle::check_index(pos, count, "vq: block");
            uint8_t idx = indices[pos];
            twiddle::check_index(idx, codebook.blocks.size(), "vq: codebook");

            const auto& block = codebook.blocks[idx];
            for (int i = 0; i < 4; i++) {
                int x = static_cast<int>(bx * 2) + (i & 1);
                int y = static_cast<int>(by * 2) + (i >> 1);
                if (x < width && y < height)
                    img.set(x, y, block[static_cast<size_t>(i)]);
            }
        }
    }
    return img;
}

pixel::Image decode_vq(binutil::Bytes data, int width, int height,
                       pixel::PixelFormat format, bool small) {
    binutil::Reader r(data, "vq");
    auto cb = read_codebook(r, format, codebook_size(width, height, small));
    return decode_level(r, cb, width, height);
}

} // namespace dctools::vq
