#include "dctools/twiddle.h"
#include "dctools/error.h"

#include <algorithm>
#include <format>

namespace dctools::twiddle {

namespace {

// Spread the low 16 bits of v to the even bit positions of the result.
uint32_t spread_bits(uint32_t v) {
    v &= 0x0000FFFF;
    v = (v | (v << 8)) & 0x00FF00FF;
    v = (v | (v << 4)) & 0x0F0F0F0F;
    v = (v | (v << 2)) & 0x33333333;
    v = (v | (v << 1)) & 0x55555555;
    return v;
}

uint32_t compact_bits(uint32_t v) {
    v &= 0x55555555;
    v = (v | (v >> 1)) & 0x33333333;
    v = (v | (v >> 2)) & 0x0F0F0F0F;
    v = (v | (v >> 4)) & 0x00FF00FF;
    v = (v | (v >> 8)) & 0x0000FFFF;
    return v;
}

} // namespace

uint32_t to_morton(uint32_t x, uint32_t y) {
    return spread_bits(x) | (spread_bits(y) << 1);
}

std::pair<uint32_t, uint32_t> from_morton(uint32_t index) {
    return {compact_bits(index), compact_bits(index >> 1)};
}

// Rectangles are not one morton square of side max(width, height). They are
// square tiles of side min(width, height) laid along the longer axis. For
// wide levels the two agree; for tall levels only the tile layout stays
// below width * height.
uint32_t twiddled_index(uint32_t x, uint32_t y, uint32_t width, uint32_t height) {
    if (width == height)
        return to_morton(x, y);

    uint32_t side = std::min(width, height);
    if (side == 0)
        return to_morton(x, y);
    uint32_t tile = (width > height) ? x / side : y / side;
    return tile * side * side + to_morton(x % side, y % side);
}

void check_index(size_t index, size_t limit, const char* what) {
    if (index >= limit)
        throw DecodeError(ErrorKind::IndexOutOfRange,
            std::format("{}: index {} out of range (limit {})", what, index, limit));
}

} // namespace dctools::twiddle
