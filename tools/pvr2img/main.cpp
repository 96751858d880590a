#include "dctools/pvm.h"
#include "dctools/pvp.h"
#include "dctools/pvr.h"

#include <algorithm>
#include <cstring>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "../common/cli_logger.h"
#include "../common/input.h"

using namespace dctools;

static void print_usage() {
    std::cerr << "Usage: pvr2img [flags] <input.pvr|input.pvm>\n\n"
              << "Converts a PVR texture (or one entry of a PVM archive) to PNG.\n"
              << "Reads from file argument or stdin (use - or omit argument).\n\n"
              << "Flags:\n"
              << "  -o <path>       Output PNG path (use - for stdout)\n"
              << "  -p <file.pvp>   External palette for PALETTIZE textures\n"
              << "  --stride <n>    Row pitch in pixels for STRIDE textures\n"
              << "  --index <n>     PVM entry to convert (default 0)\n"
              << "  --mipmaps       Also write every mip level as <out>_mip<n>.png\n"
              << "  -v, -vv         Verbose / debug logging\n";
}

static void write_png_to_stream(std::ostream& out, const pixel::Image& img) {
    stbi_write_png_to_func(
        [](void* ctx, void* data, int size) {
            static_cast<std::ostream*>(ctx)->write(static_cast<const char*>(data), size);
        },
        &out, img.width, img.height, 4, img.pixels.data(), img.width * 4);
}

static void write_png_file(const std::string& path, const pixel::Image& img) {
    if (!stbi_write_png(path.c_str(), img.width, img.height, 4, img.pixels.data(), img.width * 4))
        throw std::runtime_error("writing " + path);
}

int main(int argc, char* argv[]) {
    std::string output;
    std::string palette_path;
    pvr::Options opts;
    size_t index = 0;
    int verbosity = 0;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
                output = argv[++i];
            } else if (std::strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
                palette_path = argv[++i];
            } else if (std::strcmp(argv[i], "--stride") == 0 && i + 1 < argc) {
                opts.stride = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (std::strcmp(argv[i], "--index") == 0 && i + 1 < argc) {
                index = std::stoul(argv[++i]);
            } else if (std::strcmp(argv[i], "--mipmaps") == 0) {
                opts.mipmaps = true;
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
    } catch (const std::exception&) {
        LOGE("invalid numeric argument");
        print_usage();
        return 1;
    }

    cli::set_verbosity(verbosity);

    cli::Input in;
    try {
        in = cli::read_input(positional);
        if (!palette_path.empty()) {
            auto pal_data = cli::read_file(palette_path);
            opts.palette = pvp::load_palette(binutil::as_bytes(pal_data));
            LOGI("Palette:", palette_path, opts.palette->colors.size(), "colours");
        }
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }

    auto bytes = binutil::as_bytes(in.data);
    pvr::Texture tex;
    try {
        // A buffer that is not a PVM is treated as a single PVR.
        if (pvm::is_pvm(bytes)) {
            auto archive = pvm::read(bytes);
            LOGI("PVM:", in.name, archive.entries.size(), "entries");
            if (index >= archive.entries.size())
                throw std::runtime_error(std::format("entry {} out of range ({} entries)",
                                                     index, archive.entries.size()));
            const auto& entry = archive.entries[index];
            if (entry.name) LOGI("Entry:", *entry.name);
            tex = pvm::decode_entry(entry, opts);
        } else {
            tex = pvr::decode(bytes, opts);
        }
    } catch (const DecodeError& e) {
        LOGE("decoding", in.name + ":", error_kind_name(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        LOGE("decoding", in.name + ":", e.what());
        return 1;
    }

    const auto& h = tex.header;
    std::cerr << "PVR: " << in.name << " (" << pixel::pixel_format_name(h.pixel_format) << ", "
              << pvr::data_format_name(h.data_format) << ", " << h.width << "x" << h.height << ")\n";
    if (tex.gbix) LOGI("Global index:", tex.gbix->global_index);
    if (tex.unconverted)
        LOGW(pixel::pixel_format_name(h.pixel_format), "samples are written unconverted");

    try {
        if (output == "-" || (in.from_stdin && output.empty())) {
            write_png_to_stream(std::cout, tex.image());
        } else {
            std::string out_path = output.empty() ? cli::output_path(in.name, ".png") : output;
            write_png_file(out_path, tex.image());
            std::cerr << "Output: " << out_path << '\n';

            if (opts.mipmaps && tex.levels.size() > 1) {
                std::string stem = cli::output_path(out_path, "");
                for (size_t i = 0; i + 1 < tex.levels.size(); i++) {
                    const auto& level = tex.levels[i];
                    std::string level_path = std::format("{}_mip{}.png", stem, i);
                    write_png_file(level_path, level);
                    LOGI("Mip level", i, std::format("{}x{}", level.width, level.height), level_path);
                }
            }
        }
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }

    return 0;
}
