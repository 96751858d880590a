#include "dctools/nj.h"

#include <algorithm>
#include <format>
#include <iterator>
#include <unordered_set>

namespace dctools::nj {

// --- NJTL ---

std::vector<std::string> read_texture_table(binutil::Reader& r) {
    size_t origin = r.tell();
    uint32_t table = r.read_u32();
    uint32_t count = r.read_u32();

    // Collect name pointers first; the strings may be stored anywhere.
    r.seek(origin + table);
    std::vector<uint32_t> name_ptrs;
    name_ptrs.reserve(std::min<size_t>(count, r.remaining() / 12));
    for (uint32_t i = 0; i < count; i++) {
        name_ptrs.push_back(r.read_u32());
        r.skip(8); // attributes, texture address
    }

    std::vector<std::string> names;
    names.reserve(name_ptrs.size());
    for (auto ptr : name_ptrs) {
        r.seek(origin + ptr);
        names.push_back(r.read_asciiz());
    }
    return names;
}

// --- Vertex lists ---

namespace {

constexpr uint8_t vertex_first = 0x20;
constexpr uint8_t vertex_end = 0xFF;

enum class NormalKind { None, Vec3, Vec4, Packed };
enum class ExtraKind { None, D8, UF, NF, S5, S4, IN };

struct VertexLayout {
    bool position4;
    NormalKind normal;
    ExtraKind extra;
};

// Indexed by type - 0x20.
constexpr VertexLayout vertex_layouts[] = {
    {true, NormalKind::None, ExtraKind::None},     // 0x20 SH
    {true, NormalKind::Vec4, ExtraKind::None},     // 0x21 VN_SH
    {false, NormalKind::None, ExtraKind::None},    // 0x22 CV
    {false, NormalKind::None, ExtraKind::D8},      // 0x23 CV_D8
    {false, NormalKind::None, ExtraKind::UF},      // 0x24 CV_UF
    {false, NormalKind::None, ExtraKind::NF},      // 0x25 CV_NF
    {false, NormalKind::None, ExtraKind::S5},      // 0x26 CV_S5
    {false, NormalKind::None, ExtraKind::S4},      // 0x27 CV_S4
    {false, NormalKind::None, ExtraKind::IN},      // 0x28 CV_IN
    {false, NormalKind::Vec3, ExtraKind::None},    // 0x29 CV_VN
    {false, NormalKind::Vec3, ExtraKind::D8},      // 0x2A CV_VN_D8
    {false, NormalKind::Vec3, ExtraKind::UF},      // 0x2B CV_VN_UF
    {false, NormalKind::Vec3, ExtraKind::NF},      // 0x2C CV_VN_NF
    {false, NormalKind::Vec3, ExtraKind::S5},      // 0x2D CV_VN_S5
    {false, NormalKind::Vec3, ExtraKind::S4},      // 0x2E CV_VN_S4
    {false, NormalKind::Vec3, ExtraKind::IN},      // 0x2F CV_VN_IN
    {false, NormalKind::Packed, ExtraKind::None},  // 0x30 CV_VNX
    {false, NormalKind::Packed, ExtraKind::D8},    // 0x31 CV_VNX_D8
    {false, NormalKind::Packed, ExtraKind::UF},    // 0x32 CV_VNX_UF
};

Vec3 read_vec3(binutil::Reader& r) {
    Vec3 v;
    for (auto& c : v) c = r.read_f32();
    return v;
}

// 10:10:10 signed components, x in the high bits.
Vec3 unpack_normal(uint32_t v) {
    auto component = [](uint32_t bits) {
        int32_t s = static_cast<int32_t>(bits & 0x3FF);
        if (s & 0x200) s -= 0x400;
        return static_cast<float>(s) / 511.0f;
    };
    return {component(v >> 20), component(v >> 10), component(v)};
}

Vertex read_vertex(binutil::Reader& r, const VertexLayout& layout) {
    Vertex v;
    v.position = read_vec3(r);
    if (layout.position4) r.skip(4);

    switch (layout.normal) {
        case NormalKind::None:
            break;
        case NormalKind::Vec3:
            v.normal = read_vec3(r);
            break;
        case NormalKind::Vec4:
            v.normal = read_vec3(r);
            r.skip(4);
            break;
        case NormalKind::Packed:
            v.normal = unpack_normal(r.read_u32());
            break;
    }

    switch (layout.extra) {
        case ExtraKind::None:
            break;
        case ExtraKind::D8:
            v.color = pixel::decode_pixel(pixel::PixelFormat::ARGB8888, r.read_u32());
            break;
        case ExtraKind::UF:
            v.user_flags = r.read_u32();
            break;
        case ExtraKind::NF: {
            uint32_t nf = r.read_u32();
            v.user_flags = nf;
            v.weight = static_cast<float>((nf >> 16) & 0xFF) / 255.0f;
            break;
        }
        case ExtraKind::S5:
            v.color = pixel::decode_pixel(pixel::PixelFormat::RGB565, r.read_u16());
            v.specular = pixel::decode_pixel(pixel::PixelFormat::RGB565, r.read_u16());
            break;
        case ExtraKind::S4:
            v.color = pixel::decode_pixel(pixel::PixelFormat::ARGB4444, r.read_u16());
            v.specular = pixel::decode_pixel(pixel::PixelFormat::RGB565, r.read_u16());
            break;
        case ExtraKind::IN: {
            auto d = static_cast<uint8_t>(r.read_u16() >> 8);
            auto s = static_cast<uint8_t>(r.read_u16() >> 8);
            v.color = pixel::Color{d, d, d, 255};
            v.specular = pixel::Color{s, s, s, 255};
            break;
        }
    }
    return v;
}

} // namespace

std::vector<Vertex> read_vertices(binutil::Bytes data, size_t offset, std::vector<Warning>& warnings) {
    binutil::Reader r(data, "nj: vertex chunk");
    r.seek(offset);

    std::vector<Vertex> vertices;
    for (;;) {
        size_t pos = r.tell();
        uint8_t type = r.read_u8();
        if (type == vertex_end) break;
        r.skip(1); // flag
        uint16_t size = r.read_u16();
        binutil::Reader body(r.read_bytes(static_cast<size_t>(size) * 4), "nj: vertex chunk");

        size_t layout = static_cast<size_t>(type) - vertex_first;
        if (type < vertex_first || layout >= std::size(vertex_layouts)) {
            warnings.push_back({"unknown_vertex_type",
                std::format("vertex chunk 0x{:02X} at offset {} skipped", type, pos)});
            continue;
        }

        uint16_t index_offset = body.read_u16();
        uint16_t count = body.read_u16();
        size_t end = static_cast<size_t>(index_offset) + count;
        if (vertices.size() < end) vertices.resize(end);
        for (size_t i = 0; i < count; i++)
            vertices[index_offset + i] = read_vertex(body, vertex_layouts[layout]);
    }
    return vertices;
}

// --- Meshes ---

Mesh read_mesh(binutil::Bytes data, size_t offset, std::vector<Warning>& warnings) {
    binutil::Reader r(data, "nj: model");
    r.seek(offset);

    uint32_t vlist = r.read_u32();
    uint32_t plist = r.read_u32();
    Mesh mesh;
    mesh.center = read_vec3(r);
    mesh.radius = r.read_f32();

    if (vlist != 0)
        mesh.vertices = read_vertices(data, vlist, warnings);
    if (plist != 0) {
        mesh.polygons = interpret(data, plist);
        for (const auto& w : mesh.polygons.warnings)
            warnings.push_back(w);
    }
    return mesh;
}

// --- Bones ---

std::vector<Bone> read_bones(binutil::Bytes data, size_t root, std::vector<Warning>& warnings) {
    binutil::Reader r(data, "nj: bone");

    // Work-list entry: where the bone lives and how to link it once read.
    struct Pending {
        size_t offset;
        int parent;
        int prev;      // bone whose child or sibling this is
        bool as_child;
    };

    std::vector<Bone> bones;
    std::unordered_set<size_t> visited;
    std::vector<Pending> work = {{root, -1, -1, false}};

    while (!work.empty()) {
        Pending p = work.back();
        work.pop_back();

        if (!visited.insert(p.offset).second)
            throw DecodeError(ErrorKind::CyclicReference,
                std::format("nj: bone at offset {} is reached twice", p.offset));

        r.seek(p.offset);
        Bone b;
        b.offset = p.offset;
        b.flags = r.read_u32();
        uint32_t model = r.read_u32();

        // Suppressed fields are still read to keep the cursor aligned.
        Vec3 position = read_vec3(r);
        std::array<int32_t, 3> rotation;
        for (auto& a : rotation) a = r.read_i32();
        Vec3 scale = read_vec3(r);
        if (!(b.flags & bone_ignore_position)) b.position = position;
        if (!(b.flags & bone_ignore_rotation)) b.rotation = rotation;
        if (!(b.flags & bone_ignore_scale)) b.scale = scale;

        uint32_t child = r.read_u32();
        uint32_t sibling = r.read_u32();

        if (model != 0)
            b.mesh = read_mesh(data, model, warnings);

        int idx = static_cast<int>(bones.size());
        b.parent = p.parent;
        if (p.prev >= 0) {
            if (p.as_child) bones[static_cast<size_t>(p.prev)].child = idx;
            else bones[static_cast<size_t>(p.prev)].sibling = idx;
        }
        bones.push_back(std::move(b));

        // Sibling pushed first so the child subtree is read before it.
        if (sibling != 0) work.push_back({sibling, p.parent, idx, false});
        if (child != 0) work.push_back({child, idx, idx, true});
    }
    return bones;
}

// --- File ---

Model read(binutil::Bytes data) {
    binutil::Reader r(data, "nj");
    Model model;
    bool have_bones = false;

    do {
        auto tag = r.read_signature();
        uint32_t size = r.read_u32();
        if (model.sections.empty() && tag != "NJTL" && tag != "NJCM")
            throw DecodeError(ErrorKind::BadMagic,
                std::format("nj: expected NJTL or NJCM, got '{}'", tag));

        size_t offset = r.tell();
        auto payload = r.read_bytes(size);
        model.sections.push_back({tag, offset, size});

        if (tag == "NJTL") {
            binutil::Reader tr(payload, "nj: NJTL");
            model.texture_names = read_texture_table(tr);
        } else if (tag == "NJCM") {
            if (have_bones) {
                model.warnings.push_back({"extra_model",
                    std::format("additional NJCM section at offset {} ignored", offset)});
                continue;
            }
            model.bones = read_bones(payload, 0, model.warnings);
            have_bones = true;
        } else if (tag != "NMDM" && tag != "POF0") {
            model.warnings.push_back({"unknown_section",
                std::format("unknown section '{}' at offset {} skipped", tag, offset)});
        }
    } while (r.remaining() >= 8);

    return model;
}

std::string texture_name(const Model& model, const Material& material) {
    if (material.texture_id >= model.texture_names.size()) return {};
    return model.texture_names[material.texture_id];
}

double bams_to_degrees(int32_t angle) {
    return static_cast<double>(angle) * 360.0 / 65536.0;
}

} // namespace dctools::nj
