#pragma once

#include "dctools/binutil.h"
#include "dctools/pixel.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dctools::nj {

using Vec3 = std::array<float, 3>;
using ColorF = std::array<float, 4>; // r, g, b, a in 0..1

struct Warning { std::string code, message; };

// Section is one tagged block of the file. offset is the payload start;
// pointers inside a section are relative to it.
struct Section {
    std::string tag;
    size_t offset = 0;
    uint32_t size = 0;
};

// --- Bones ---

constexpr uint32_t bone_ignore_position = 0x01;
constexpr uint32_t bone_ignore_rotation = 0x02;
constexpr uint32_t bone_ignore_scale = 0x04;
constexpr uint32_t bone_hide = 0x08;
constexpr uint32_t bone_break = 0x10;
constexpr uint32_t bone_zxy_rotation = 0x20;
constexpr uint32_t bone_skip = 0x40;
constexpr uint32_t bone_shape_skip = 0x80;

// --- Vertices ---

struct Vertex {
    Vec3 position = {0.0f, 0.0f, 0.0f};
    std::optional<Vec3> normal;
    std::optional<pixel::Color> color;
    std::optional<pixel::Color> specular;
    std::optional<uint32_t> user_flags;
    std::optional<float> weight; // skin weight from Ninja flags, 0..1
};

// --- Polygon chunks ---

// Blend factors as stored in the 3-bit source/destination fields.
enum class BlendFactor : uint8_t {
    Zero = 0,
    One = 1,
    OtherColor = 2,
    InverseOtherColor = 3,
    SourceAlpha = 4,
    InverseSourceAlpha = 5,
    DestAlpha = 6,
    InverseDestAlpha = 7,
};

// Material is the interpreter state captured when a strip chunk is emitted.
struct Material {
    uint16_t texture_id = 0;
    ColorF diffuse = {1.0f, 1.0f, 1.0f, 1.0f};
    ColorF ambient = {0.0f, 0.0f, 0.0f, 1.0f};
    ColorF specular = {1.0f, 1.0f, 1.0f, 1.0f};
    uint8_t specular_exponent = 0;
    BlendFactor blend_src = BlendFactor::SourceAlpha;
    BlendFactor blend_dst = BlendFactor::InverseSourceAlpha;
    uint8_t mipmap_d_adjust = 0;

    // Texture addressing and filtering (tiny chunk)
    bool clamp_u = false;
    bool clamp_v = false;
    bool flip_u = false;
    bool flip_v = false;
    bool super_sample = false;
    uint8_t filter = 0;

    // Strip flags
    bool ignore_light = false;
    bool ignore_specular = false;
    bool ignore_ambient = false;
    bool blending = false; // use alpha
    bool double_sided = false;
    bool flat_shading = false;
    bool environment_map = false;

    bool operator==(const Material&) const = default;
};

struct StripVertex {
    uint16_t index = 0;
    std::array<float, 2> uv = {0.0f, 0.0f};
    std::optional<std::array<float, 2>> uv2; // second UV set (0x4A, 0x4B strips)
    std::optional<Vec3> normal;
    std::optional<pixel::Color> color;
};

struct Strip {
    bool reversed = false; // negative length in the stream
    std::vector<StripVertex> vertices;
};

struct Batch {
    Material material;
    std::vector<Strip> strips;
};

struct PolyList {
    std::vector<Batch> batches;
    std::vector<uint8_t> cached_lists; // polygon-list cache chunks, recorded only
    std::vector<uint8_t> drawn_lists;  // polygon-list draw chunks, recorded only
    std::vector<Warning> warnings;
};

// --- Model ---

struct Mesh {
    Vec3 center = {0.0f, 0.0f, 0.0f};
    float radius = 0.0f;
    std::vector<Vertex> vertices;
    PolyList polygons;
};

// Bone is one node of the hierarchy. Bones live in a flat array in
// depth-first order (child before sibling); links are indices, -1 if absent.
struct Bone {
    size_t offset = 0; // within the NJCM payload
    uint32_t flags = 0;
    Vec3 position = {0.0f, 0.0f, 0.0f};
    std::array<int32_t, 3> rotation = {0, 0, 0}; // BAMS, 0x10000 = 360 degrees
    Vec3 scale = {1.0f, 1.0f, 1.0f};
    std::optional<Mesh> mesh;
    int parent = -1;
    int child = -1;
    int sibling = -1;
};

struct Model {
    std::vector<Section> sections;
    std::vector<std::string> texture_names;
    std::vector<Bone> bones;
    std::vector<Warning> warnings;
};

// read_texture_table reads an NJTL table at the reader's position, which is
// the origin of every pointer in it. Names are returned in table order.
// Throws DecodeError(TruncatedInput) for pointers outside the buffer.
std::vector<std::string> read_texture_table(binutil::Reader& r);

// read_vertices walks a vertex chunk list at offset. Vertices land at
// index_offset + i of each chunk.
std::vector<Vertex> read_vertices(binutil::Bytes data, size_t offset, std::vector<Warning>& warnings);

// interpret runs the polygon chunk stream at offset until the end chunk.
PolyList interpret(binutil::Bytes data, size_t offset);

// read_mesh reads a chunk model (vertex list, polygon list, bounds) at offset.
Mesh read_mesh(binutil::Bytes data, size_t offset, std::vector<Warning>& warnings);

// read_bones walks the bone hierarchy of an NJCM payload starting at root.
// Throws DecodeError(CyclicReference) when a child or sibling pointer leads
// to an already visited bone.
std::vector<Bone> read_bones(binutil::Bytes data, size_t root, std::vector<Warning>& warnings);

// read parses a whole Ninja file (NJTL, NJCM and bookkeeping sections).
// Throws DecodeError: BadMagic, TruncatedInput, CyclicReference.
Model read(binutil::Bytes data);

// triangulate converts a strip into triangles, as positions into
// strip.vertices, honouring the winding flag. Degenerate triangles are
// dropped.
std::vector<std::array<size_t, 3>> triangulate(const Strip& strip);

// texture_name resolves a material's texture id through the NJTL table.
// Returns an empty string when the id is out of range.
std::string texture_name(const Model& model, const Material& material);

double bams_to_degrees(int32_t angle);

} // namespace dctools::nj
