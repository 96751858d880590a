#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace dctools::cli {

// Input holds a whole file (or stdin) in memory. The decoders return views
// into data, so it must outlive every decoded entry.
struct Input {
    std::string name;
    std::string data;
    bool from_stdin = false;
};

// read_input reads the first positional argument, or stdin when there is
// none or it is "-".
inline Input read_input(const std::vector<std::string>& positional) {
    Input in;
    in.from_stdin = positional.empty() || positional[0] == "-";
    std::ostringstream buf;

    if (in.from_stdin) {
        buf << std::cin.rdbuf();
        in.name = "stdin";
    } else {
        std::ifstream f(positional[0], std::ios::binary);
        if (!f) throw std::runtime_error("cannot open " + positional[0]);
        buf << f.rdbuf();
        in.name = positional[0];
    }
    in.data = buf.str();
    return in;
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + path);
    std::ostringstream buf;
    buf << f.rdbuf();
    return buf.str();
}

// output_path derives "<dir>/<stem><suffix>" from an input path.
inline std::string output_path(const std::string& input, const std::string& suffix) {
    std::filesystem::path p(input);
    return (p.parent_path() / p.stem()).string() + suffix;
}

} // namespace dctools::cli
