#include "dctools/nj.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"
#include "../common/input.h"

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;
using namespace dctools;

namespace {

json vec3_to_json(const nj::Vec3& v) {
    return json::array({v[0], v[1], v[2]});
}

json rgba_to_json(const nj::ColorF& c) {
    return json::array({c[0], c[1], c[2], c[3]});
}

json flags_to_json(uint32_t flags) {
    static constexpr std::array<std::pair<uint32_t, const char*>, 8> names = {{
        {nj::bone_ignore_position, "ignorePosition"},
        {nj::bone_ignore_rotation, "ignoreRotation"},
        {nj::bone_ignore_scale, "ignoreScale"},
        {nj::bone_hide, "hide"},
        {nj::bone_break, "break"},
        {nj::bone_zxy_rotation, "zxyRotation"},
        {nj::bone_skip, "skip"},
        {nj::bone_shape_skip, "shapeSkip"},
    }};
    json out = json::array();
    for (const auto& [bit, name] : names)
        if (flags & bit) out.push_back(name);
    return out;
}

json material_to_json(const nj::Model& model, const nj::Material& m) {
    json j = {
        {"textureId", m.texture_id},
        {"texture", nj::texture_name(model, m)},
        {"diffuse", rgba_to_json(m.diffuse)},
        {"ambient", rgba_to_json(m.ambient)},
        {"specular", rgba_to_json(m.specular)},
        {"specularExponent", m.specular_exponent},
        {"blendSrc", static_cast<int>(m.blend_src)},
        {"blendDst", static_cast<int>(m.blend_dst)},
        {"blending", m.blending},
        {"doubleSided", m.double_sided},
        {"ignoreLight", m.ignore_light},
        {"flatShading", m.flat_shading},
        {"environmentMap", m.environment_map},
        {"clampU", m.clamp_u},
        {"clampV", m.clamp_v},
        {"flipU", m.flip_u},
        {"flipV", m.flip_v},
        {"filter", m.filter},
    };
    return j;
}

json strip_to_json(const nj::Strip& s) {
    json verts = json::array();
    for (const auto& v : s.vertices) {
        json jv = {v.index, v.uv[0], v.uv[1]};
        if (v.uv2) {
            jv.push_back((*v.uv2)[0]);
            jv.push_back((*v.uv2)[1]);
        }
        verts.push_back(std::move(jv));
    }
    return {{"reversed", s.reversed}, {"vertices", verts}};
}

json mesh_to_json(const nj::Model& model, const nj::Mesh& mesh, bool with_strips) {
    json batches = json::array();
    size_t triangles = 0;
    for (const auto& b : mesh.polygons.batches) {
        size_t batch_tris = 0;
        json strips = json::array();
        for (const auto& s : b.strips) {
            batch_tris += nj::triangulate(s).size();
            if (with_strips) strips.push_back(strip_to_json(s));
        }
        triangles += batch_tris;

        json jb = {
            {"material", material_to_json(model, b.material)},
            {"strips", b.strips.size()},
            {"triangles", batch_tris},
        };
        if (with_strips) jb["stripData"] = strips;
        batches.push_back(std::move(jb));
    }

    size_t weighted = static_cast<size_t>(std::count_if(mesh.vertices.begin(), mesh.vertices.end(),
        [](const nj::Vertex& v) { return v.weight.has_value(); }));

    return {
        {"center", vec3_to_json(mesh.center)},
        {"radius", mesh.radius},
        {"vertices", mesh.vertices.size()},
        {"weightedVertices", weighted},
        {"triangles", triangles},
        {"batches", batches},
    };
}

json build_json(const nj::Model& model, const std::string& filename, bool with_strips) {
    json sections = json::array();
    for (const auto& s : model.sections)
        sections.push_back({{"tag", s.tag}, {"offset", s.offset}, {"size", s.size}});

    json bones = json::array();
    size_t meshes = 0;
    for (size_t i = 0; i < model.bones.size(); i++) {
        const auto& b = model.bones[i];
        json jb = {
            {"index", i},
            {"offset", b.offset},
            {"flags", flags_to_json(b.flags)},
            {"parent", b.parent},
            {"child", b.child},
            {"sibling", b.sibling},
            {"position", vec3_to_json(b.position)},
            {"rotation", json::array({nj::bams_to_degrees(b.rotation[0]),
                                      nj::bams_to_degrees(b.rotation[1]),
                                      nj::bams_to_degrees(b.rotation[2])})},
            {"scale", vec3_to_json(b.scale)},
        };
        if (b.mesh) {
            jb["mesh"] = mesh_to_json(model, *b.mesh, with_strips);
            meshes++;
        }
        bones.push_back(std::move(jb));
    }

    json warnings = json::array();
    for (const auto& w : model.warnings)
        warnings.push_back({{"code", w.code}, {"message", w.message}});

    return {
        {"schemaVersion", 1},
        {"filename", filename},
        {"sections", sections},
        {"textures", model.texture_names},
        {"boneCount", model.bones.size()},
        {"meshCount", meshes},
        {"bones", bones},
        {"warnings", warnings},
    };
}

void print_usage() {
    cli::print("Usage: nj_info [flags] [input.nj]");
    cli::print("Parses a Ninja model (NJTL/NJCM) and prints its structure as JSON:");
    cli::print("sections, texture names, bone tree, meshes and materials.");
    cli::print("Reads from file argument or stdin (use - or omit argument).");
    cli::print("");
    cli::print("Flags:");
    cli::print("  --strips   Include strip vertex indices and UVs");
    cli::print("  --pretty   Pretty-print JSON output");
    cli::print("  -v, -vv    Verbose / debug logging");
}

} // namespace

int main(int argc, char* argv[]) {
    bool pretty = false;
    bool with_strips = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
        } else if (std::strcmp(argv[i], "--strips") == 0) {
            with_strips = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    cli::set_verbosity(verbosity);

    cli::Input in;
    try {
        in = cli::read_input(positional);
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
    LOGI("Reading", in.name);

    nj::Model model;
    try {
        model = nj::read(binutil::as_bytes(in.data));
    } catch (const DecodeError& e) {
        LOGE("parsing", in.name + ":", error_kind_name(e.kind()), e.what());
        return 1;
    }

    cli::report_warnings(in.name, model.warnings);

    std::string filename = in.from_stdin ? in.name : fs::path(in.name).filename().string();
    auto doc = build_json(model, filename, with_strips);

    if (pretty)
        std::cout << std::setw(2) << doc << '\n';
    else
        std::cout << doc << '\n';

    LOGI("Bones:", model.bones.size(), "Textures:", model.texture_names.size());
    return 0;
}
