#include "dctools/pvm.h"
#include "dctools/pvp.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "../common/cli_logger.h"
#include "../common/input.h"

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;
using namespace dctools;

static void print_usage() {
    std::cerr << "Usage: pvm_extract [flags] <input.pvm> [output_dir]\n\n"
              << "Decodes every texture of a PVM archive to PNG and writes manifest.json.\n"
              << "Entries that fail to decode are skipped with a warning and the exit\n"
              << "status is 2.\n\n"
              << "Flags:\n"
              << "  -p <file.pvp>   External palette for PALETTIZE entries\n"
              << "  --raw           Also write each entry's PVRT block as <name>.pvr\n"
              << "  --pretty        Pretty-print manifest.json\n"
              << "  -v, -vv         Verbose / debug logging\n";
}

// Entry names come from the archive; keep them to safe file-name characters.
static std::string file_stem(const pvm::Entry& e) {
    std::string name = e.name && !e.name->empty() ? *e.name : std::format("tex_{:03}", e.index);
    for (auto& c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.')
            c = '_';
    }
    return name;
}

static json entry_json(const pvm::Entry& e) {
    json j;
    j["index"] = e.index;
    if (e.name) j["name"] = *e.name;
    if (e.format) j["format"] = e.format->code;
    if (e.width) j["width"] = *e.width;
    if (e.height) j["height"] = *e.height;
    if (e.global_index) j["globalIndex"] = *e.global_index;
    j["size"] = e.data.size();
    return j;
}

int main(int argc, char* argv[]) {
    std::string palette_path;
    bool raw = false;
    bool pretty = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            palette_path = argv[++i];
        } else if (std::strcmp(argv[i], "--raw") == 0) {
            raw = true;
        } else if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
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

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    cli::Input in;
    pvr::Options opts;
    try {
        in = cli::read_input(positional);
        if (!palette_path.empty()) {
            auto pal_data = cli::read_file(palette_path);
            opts.palette = pvp::load_palette(binutil::as_bytes(pal_data));
        }
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }

    pvm::Archive archive;
    try {
        archive = pvm::read(binutil::as_bytes(in.data));
    } catch (const DecodeError& e) {
        LOGE("parsing", in.name + ":", error_kind_name(e.kind()), e.what());
        return 1;
    }

    fs::path output_dir = positional.size() >= 2 ? fs::path(positional[1])
                                                 : fs::path(cli::output_path(in.name, "_pvm"));
    json textures = json::array();
    int written = 0;

    try {
        fs::create_directories(output_dir);

        for (const auto& e : archive.entries) {
            auto j = entry_json(e);
            std::string stem = file_stem(e);

            if (raw) {
                std::ofstream f(output_dir / (stem + ".pvr"), std::ios::binary);
                if (!f) throw std::runtime_error("creating " + stem + ".pvr");
                f.write(reinterpret_cast<const char*>(e.data.data()),
                        static_cast<std::streamsize>(e.data.size()));
            }

            // One bad entry does not stop the rest of the archive.
            try {
                auto tex = pvm::decode_entry(e, opts);
                const auto& img = tex.image();
                auto png = (output_dir / (stem + ".png")).string();
                if (!stbi_write_png(png.c_str(), img.width, img.height, 4, img.pixels.data(), img.width * 4))
                    throw std::runtime_error("writing " + png);

                j["pixelFormat"] = pixel::pixel_format_name(tex.header.pixel_format);
                j["dataFormat"] = pvr::data_format_name(tex.header.data_format);
                j["file"] = stem + ".png";
                if (tex.unconverted) {
                    j["unconverted"] = true;
                    LOGW_ONCE(pixel::pixel_format_name(tex.header.pixel_format),
                              pixel::pixel_format_name(tex.header.pixel_format),
                              "entries are written unconverted");
                }
                LOGI("Entry", e.index, stem, std::format("{}x{}", img.width, img.height));
                written++;
            } catch (const DecodeError& err) {
                LOGW("skipping entry", e.index, stem + ":", error_kind_name(err.kind()), err.what());
                j["error"] = err.what();
            }
            textures.push_back(std::move(j));
        }

        json doc = {
            {"schemaVersion", 1},
            {"filename", fs::path(in.name).filename().string()},
            {"flags", archive.flags},
            {"textures", textures},
        };
        std::ofstream mf(output_dir / "manifest.json");
        if (!mf) throw std::runtime_error("failed to create manifest.json");
        if (pretty)
            mf << std::setw(2) << doc << '\n';
        else
            mf << doc << '\n';
    } catch (const std::exception& e) {
        LOGE("writing output:", e.what());
        return 1;
    }

    std::cerr << "PVM: " << in.name << " (" << archive.entries.size() << " entries, "
              << written << " written)\n";
    std::cerr << "Output: " << output_dir.string() << '\n';
    return written == static_cast<int>(archive.entries.size()) ? 0 : 2;
}
