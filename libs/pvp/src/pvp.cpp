#include "dctools/pvp.h"
#include "dctools/twiddle.h"

#include <format>

namespace dctools::pvp {

Palette read_palette(binutil::Reader& r, pixel::PixelFormat format, size_t count) {
    Palette pal;
    pal.format = format;
    pal.colors.reserve(count);

    bool wide = pixel::sample_size(format) == 4;
    for (size_t i = 0; i < count; i++) {
        uint32_t raw = wide ? r.read_u32() : r.read_u16();
        pal.colors.push_back(pixel::decode_pixel(format, raw));
    }
    return pal;
}

Palette load_palette(binutil::Bytes data) {
    binutil::Reader r(data, "pvp");

    auto sig = r.read_signature();
    if (sig != "PVPL")
        throw DecodeError(ErrorKind::BadMagic,
            std::format("pvp: expected PVPL signature, got '{}'", sig));

    r.read_u32(); // section size
    uint16_t type = r.read_u16();
    r.read_u32(); // reserved
    uint16_t count = r.read_u16();

    auto format = pixel::parse_pixel_format(static_cast<uint8_t>(type & 0x0F));
    return read_palette(r, format, count);
}

pixel::Color resolve_index(const Palette& palette, size_t index) {
    twiddle::check_index(index, palette.colors.size(), "pvp: palette");
    return palette.colors[index];
}

} // namespace dctools::pvp
