#include "dctools/pvm.h"
#include "dctools/pvp.h"
#include "dctools/pvr.h"

#include <nlohmann/json.hpp>

#include <algorithm>
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

static json header_json(const pvr::HeaderInfo& info) {
    const auto& h = info.header;
    json j = {
        {"pixelFormat", pixel::pixel_format_name(h.pixel_format)},
        {"pixelFormatCode", static_cast<int>(h.pixel_format)},
        {"dataFormat", pvr::data_format_name(h.data_format)},
        {"dataFormatCode", static_cast<int>(h.data_format)},
        {"width", h.width},
        {"height", h.height},
        {"dataSize", h.data_size},
        {"mipmaps", pvr::has_mipmaps(h.data_format)},
        {"pvrtOffset", info.pvrt_offset},
    };
    if (info.gbix)
        j["globalIndex"] = info.gbix->global_index;
    return j;
}

static json pvr_json(binutil::Bytes data, const std::string& filename) {
    auto info = pvr::read_header(data);
    LOGI("PVR:", filename, pvr::data_format_name(info.header.data_format));
    json doc = {{"schemaVersion", 1}, {"filename", filename}, {"type", "PVR"}};
    doc["texture"] = header_json(info);
    return doc;
}

static json pvm_json(binutil::Bytes data, const std::string& filename) {
    auto archive = pvm::read(data);
    LOGI("PVM:", filename, archive.entries.size(), "entries");

    json textures = json::array();
    for (const auto& e : archive.entries) {
        json j = {{"index", e.index}};
        if (e.name) j["name"] = *e.name;
        if (e.format) j["format"] = e.format->code;
        if (e.width) j["width"] = *e.width;
        if (e.height) j["height"] = *e.height;
        if (e.global_index) j["globalIndex"] = *e.global_index;
        j["size"] = e.data.size();
        try {
            j["texture"] = header_json(pvr::read_header(e.data));
        } catch (const DecodeError& err) {
            LOGW("entry", e.index, error_kind_name(err.kind()), err.what());
            j["error"] = err.what();
        }
        textures.push_back(std::move(j));
    }

    return {
        {"schemaVersion", 1},
        {"filename", filename},
        {"type", "PVM"},
        {"flags", archive.flags},
        {"textures", textures},
    };
}

static json pvp_json(binutil::Bytes data, const std::string& filename) {
    auto pal = pvp::load_palette(data);
    LOGI("PVP:", filename, pal.colors.size(), "colours");
    return {
        {"schemaVersion", 1},
        {"filename", filename},
        {"type", "PVP"},
        {"pixelFormat", pixel::pixel_format_name(pal.format)},
        {"entries", pal.colors.size()},
    };
}

static void print_usage() {
    cli::print("Usage: pvr_info [flags] [input.pvr|input.pvm|input.pvp]");
    cli::print("Prints texture headers, PVM tables and palette summaries as JSON.");
    cli::print("Reads from file argument or stdin (use - or omit argument).");
    cli::print("");
    cli::print("Flags:");
    cli::print("  --pretty   Pretty-print JSON output");
    cli::print("  -v, -vv    Verbose / debug logging");
}

int main(int argc, char* argv[]) {
    bool pretty = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--pretty") == 0) {
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

    cli::Input in;
    try {
        in = cli::read_input(positional);
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
    LOGD("Input size (bytes):", in.data.size());

    auto bytes = binutil::as_bytes(in.data);
    std::string filename = in.from_stdin ? in.name : fs::path(in.name).filename().string();
    json doc;
    try {
        binutil::Reader sniff(bytes, "pvr_info");
        if (pvm::is_pvm(bytes))
            doc = pvm_json(bytes, filename);
        else if (sniff.peek_signature(0, "PVPL"))
            doc = pvp_json(bytes, filename);
        else
            doc = pvr_json(bytes, filename);
    } catch (const DecodeError& e) {
        LOGE("parsing", in.name + ":", error_kind_name(e.kind()), e.what());
        return 1;
    }

    if (pretty)
        std::cout << std::setw(2) << doc << '\n';
    else
        std::cout << doc << '\n';
    return 0;
}
