#pragma once

#include "dctools/binutil.h"
#include "dctools/pvr.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dctools::pvm {

// Per-file flags selecting which entry fields are present.
constexpr uint16_t flag_global_index = 0x01;
constexpr uint16_t flag_dimensions = 0x02;
constexpr uint16_t flag_format = 0x04;
constexpr uint16_t flag_name = 0x08;

constexpr size_t name_size = 28;

struct EntryFormat {
    uint16_t raw = 0;
    uint8_t code = 0; // high byte of raw
};

struct Entry {
    uint16_t index = 0;
    std::optional<std::string> name;
    std::optional<EntryFormat> format;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<uint32_t> global_index;
    // The entry's PVRT block (header included). Points into the buffer
    // passed to read(), which must outlive it.
    binutil::Bytes data;
};

struct Archive {
    uint32_t header_size = 0;
    uint16_t flags = 0;
    std::vector<Entry> entries;
};

bool is_pvm(binutil::Bytes data);

// decode_size_field unpacks the entry size field:
// width = 1 << ((size & 0xF) + 2), height = 1 << (((size >> 4) & 0xF) + 2).
std::pair<int, int> decode_size_field(uint16_t size);

// read parses the PVMH table and slices out one PVRT block per entry, in
// table order. Pixel data is not decoded.
// Throws DecodeError: BadMagic, TruncatedInput, EntryCountMismatch.
Archive read(binutil::Bytes data);

// decode_entry decodes one entry's PVRT block.
pvr::Texture decode_entry(const Entry& entry, const pvr::Options& opts = {});

} // namespace dctools::pvm
