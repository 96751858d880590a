#include "dctools/nj.h"

#include <cstdlib>
#include <format>
#include <iterator>

namespace dctools::nj {

namespace {

// Chunk head ranges. Bits chunks are 0x01-0x07.
constexpr uint8_t chunk_null = 0x00;
constexpr uint8_t chunk_tiny_first = 0x08;
constexpr uint8_t chunk_material_first = 0x10;
constexpr uint8_t chunk_vertex_first = 0x20;
constexpr uint8_t chunk_strip_first = 0x40;
constexpr uint8_t chunk_end = 0xFF;

// Bits chunks
constexpr uint8_t bits_blend_alpha = 0x01;
constexpr uint8_t bits_mipmap_d_adjust = 0x02;
constexpr uint8_t bits_specular_exponent = 0x03;
constexpr uint8_t bits_cache_list = 0x04;
constexpr uint8_t bits_draw_list = 0x05;

// Tiny chunks
constexpr uint8_t tiny_texture_id = 0x08;
constexpr uint8_t tiny_texture_id2 = 0x09;

// Strip chunk types (offset from 0x40) and their vertex layouts.
struct StripLayout {
    float uv_scale; // 0 when the strip carries no UVs
    bool normal;
    bool color;
    bool uv2 = false;
};

constexpr float uvn_scale = 255.0f;
constexpr float uvh_scale = 1023.0f;

constexpr StripLayout strip_layouts[] = {
    {0.0f, false, false},      // 0x40 Strip
    {uvn_scale, false, false}, // 0x41 StripUVN
    {uvh_scale, false, false}, // 0x42 StripUVH
    {0.0f, true, false},       // 0x43 StripVN
    {uvn_scale, true, false},  // 0x44 StripUVNVN
    {uvh_scale, true, false},  // 0x45 StripUVHVN
    {0.0f, false, true},       // 0x46 StripD8
    {uvn_scale, false, true},  // 0x47 StripUVND8
    {uvh_scale, false, true},  // 0x48 StripUVHD8
    {0.0f, false, false},      // 0x49 Strip2
    {uvn_scale, false, false, true}, // 0x4A StripUVN2
    {uvh_scale, false, false, true}, // 0x4B StripUVH2
};

ColorF argb_to_color(uint32_t v) {
    return {static_cast<float>((v >> 16) & 0xFF) / 255.0f,
            static_cast<float>((v >> 8) & 0xFF) / 255.0f,
            static_cast<float>(v & 0xFF) / 255.0f,
            static_cast<float>(v >> 24) / 255.0f};
}

// Running interpreter state. Every strip chunk snapshots the material.
struct ChunkState {
    Material material;
};

void apply_bits(ChunkState& state, PolyList& out, uint8_t head, uint8_t flag, size_t pos) {
    auto& m = state.material;
    switch (head) {
        case bits_blend_alpha:
            m.blend_src = static_cast<BlendFactor>((flag >> 3) & 0x07);
            m.blend_dst = static_cast<BlendFactor>(flag & 0x07);
            break;
        case bits_mipmap_d_adjust:
            m.mipmap_d_adjust = flag & 0x0F;
            break;
        case bits_specular_exponent:
            m.specular_exponent = flag & 0x1F;
            break;
        case bits_cache_list:
            out.cached_lists.push_back(flag);
            break;
        case bits_draw_list:
            out.drawn_lists.push_back(flag);
            break;
        default:
            out.warnings.push_back({"unknown_chunk",
                std::format("unknown bits chunk 0x{:02X} at offset {}", head, pos)});
            break;
    }
}

void apply_tiny(ChunkState& state, PolyList& out, uint8_t head, uint8_t flag, uint16_t data, size_t pos) {
    if (head != tiny_texture_id && head != tiny_texture_id2) {
        out.warnings.push_back({"unknown_chunk",
            std::format("unknown tiny chunk 0x{:02X} at offset {}", head, pos)});
        return;
    }
    auto& m = state.material;
    m.mipmap_d_adjust = flag & 0x0F;
    m.clamp_v = (flag & 0x10) != 0;
    m.clamp_u = (flag & 0x20) != 0;
    m.flip_v = (flag & 0x40) != 0;
    m.flip_u = (flag & 0x80) != 0;
    m.texture_id = data & 0x1FFF;
    m.super_sample = (data & 0x2000) != 0;
    m.filter = static_cast<uint8_t>(data >> 14);
}

void apply_material(ChunkState& state, uint8_t head, uint8_t flag, binutil::Reader& body) {
    auto& m = state.material;
    m.blend_src = static_cast<BlendFactor>((flag >> 3) & 0x07);
    m.blend_dst = static_cast<BlendFactor>(flag & 0x07);

    uint8_t kind = head - chunk_material_first;
    if (kind & 0x01) m.diffuse = argb_to_color(body.read_u32());
    if (kind & 0x02) m.ambient = argb_to_color(body.read_u32());
    if (kind & 0x04) {
        uint32_t v = body.read_u32();
        m.specular = argb_to_color(v);
        m.specular_exponent = static_cast<uint8_t>(v >> 24);
    }
}

void apply_strip_flags(ChunkState& state, uint8_t flag) {
    auto& m = state.material;
    m.ignore_light = (flag & 0x01) != 0;
    m.ignore_specular = (flag & 0x02) != 0;
    m.ignore_ambient = (flag & 0x04) != 0;
    m.blending = (flag & 0x08) != 0;
    m.double_sided = (flag & 0x10) != 0;
    m.flat_shading = (flag & 0x20) != 0;
    m.environment_map = (flag & 0x40) != 0;
}

std::vector<Strip> read_strips(binutil::Reader& body, const StripLayout& layout) {
    uint16_t header = body.read_u16();
    int count = header & 0x3FFF;
    int user_words = header >> 14;

    std::vector<Strip> strips;
    strips.reserve(static_cast<size_t>(count));
    for (int s = 0; s < count; s++) {
        int16_t length = body.read_i16();
        Strip strip;
        strip.reversed = length < 0;
        int n = std::abs(static_cast<int>(length));
        strip.vertices.reserve(static_cast<size_t>(n));

        for (int i = 0; i < n; i++) {
            StripVertex v;
            v.index = body.read_u16();
            if (layout.uv_scale != 0.0f) {
                float u = body.read_i16();
                float t = body.read_i16();
                v.uv = {u / layout.uv_scale, t / layout.uv_scale};
                if (layout.uv2) {
                    float u2 = body.read_i16();
                    float t2 = body.read_i16();
                    v.uv2 = std::array<float, 2>{u2 / layout.uv_scale, t2 / layout.uv_scale};
                }
            }
            if (layout.normal) {
                Vec3 nrm;
                for (auto& c : nrm) c = static_cast<float>(body.read_i16()) / 32767.0f;
                v.normal = nrm;
            }
            if (layout.color) {
                uint32_t lo = body.read_u16();
                uint32_t hi = body.read_u16();
                v.color = pixel::decode_pixel(pixel::PixelFormat::ARGB8888, (hi << 16) | lo);
            }
            // User words belong to the triangle completed by this vertex.
            if (i >= 2) body.skip(static_cast<size_t>(user_words) * 2);
            strip.vertices.push_back(v);
        }
        strips.push_back(std::move(strip));
    }
    return strips;
}

} // namespace

PolyList interpret(binutil::Bytes data, size_t offset) {
    binutil::Reader r(data, "nj: poly chunk");
    r.seek(offset);

    PolyList out;
    ChunkState state;

    for (;;) {
        size_t pos = r.tell();
        uint8_t head = r.read_u8();
        if (head == chunk_end) break;
        uint8_t flag = r.read_u8();

        if (head == chunk_null) continue;

        if (head < chunk_tiny_first) {
            apply_bits(state, out, head, flag, pos);
            continue;
        }

        if (head < chunk_material_first) {
            apply_tiny(state, out, head, flag, r.read_u16(), pos);
            continue;
        }

        // Remaining chunks carry a size: 32-bit words for vertex chunks,
        // 16-bit words otherwise.
        uint16_t size = r.read_u16();

        if (head < chunk_vertex_first) {
            binutil::Reader body(r.read_bytes(static_cast<size_t>(size) * 2), "nj: material chunk");
            apply_material(state, head, flag, body);
            continue;
        }

        if (head < chunk_strip_first) {
            r.skip(static_cast<size_t>(size) * 4);
            out.warnings.push_back({"vertex_chunk_in_poly_list",
                std::format("vertex chunk 0x{:02X} at offset {} in polygon list skipped", head, pos)});
            continue;
        }

        auto body_bytes = r.read_bytes(static_cast<size_t>(size) * 2);
        size_t type = head - chunk_strip_first;
        if (type >= std::size(strip_layouts)) {
            out.warnings.push_back({"unknown_strip_type",
                std::format("strip chunk 0x{:02X} at offset {} has an unknown vertex layout", head, pos)});
            continue;
        }

        apply_strip_flags(state, flag);
        binutil::Reader body(body_bytes, "nj: strip chunk");
        Batch batch;
        batch.material = state.material;
        batch.strips = read_strips(body, strip_layouts[type]);
        out.batches.push_back(std::move(batch));
    }

    return out;
}

std::vector<std::array<size_t, 3>> triangulate(const Strip& strip) {
    std::vector<std::array<size_t, 3>> tris;
    const auto& v = strip.vertices;
    if (v.size() < 3) return tris;

    tris.reserve(v.size() - 2);
    for (size_t i = 0; i + 2 < v.size(); i++) {
        bool flip = (i % 2 == 1) != strip.reversed;
        std::array<size_t, 3> t = flip ? std::array<size_t, 3>{i + 1, i, i + 2}
                                       : std::array<size_t, 3>{i, i + 1, i + 2};
        if (v[t[0]].index == v[t[1]].index || v[t[1]].index == v[t[2]].index ||
            v[t[0]].index == v[t[2]].index)
            continue;
        tris.push_back(t);
    }
    return tris;
}

} // namespace dctools::nj
