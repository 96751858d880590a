#include "dctools/pvm.h"

#include <format>

namespace dctools::pvm {

bool is_pvm(binutil::Bytes data) {
    binutil::Reader r(data, "pvm");
    return r.peek_signature(0, "PVMH");
}

std::pair<int, int> decode_size_field(uint16_t size) {
    return {1 << ((size & 0xF) + 2), 1 << (((size >> 4) & 0xF) + 2)};
}

Archive read(binutil::Bytes data) {
    binutil::Reader r(data, "pvm");

    auto sig = r.read_signature();
    if (sig != "PVMH")
        throw DecodeError(ErrorKind::BadMagic,
            std::format("pvm: invalid magic '{}' (expected PVMH)", sig));

    Archive archive;
    archive.header_size = r.read_u32();
    archive.flags = r.read_u16();
    uint16_t count = r.read_u16();

    archive.entries.reserve(count);
    for (uint16_t i = 0; i < count; i++) {
        Entry e;
        e.index = r.read_u16();
        if (archive.flags & flag_name)
            e.name = r.read_fixed_string(name_size);
        if (archive.flags & flag_format) {
            uint16_t raw = r.read_u16();
            e.format = EntryFormat{.raw = raw, .code = static_cast<uint8_t>(raw >> 8)};
        }
        if (archive.flags & flag_dimensions) {
            auto [w, h] = decode_size_field(r.read_u16());
            e.width = w;
            e.height = h;
        }
        if (archive.flags & flag_global_index)
            e.global_index = r.read_u32();
        archive.entries.push_back(std::move(e));
    }

    // Blocks follow the table in entry order, possibly with padding or a
    // GBIX section in between.
    size_t pos = r.tell();
    size_t found = 0;
    for (auto& e : archive.entries) {
        while (pos < data.size() && !r.peek_signature(pos, "PVRT")) pos++;
        if (pos >= data.size()) break;

        r.seek(pos + 4);
        uint32_t block_size = r.read_u32();
        r.seek(pos);
        e.data = r.read_bytes(8 + static_cast<size_t>(block_size));
        pos = r.tell();
        found++;
    }

    if (found < archive.entries.size())
        throw DecodeError(ErrorKind::EntryCountMismatch,
            std::format("pvm: header declares {} textures, found {} PVRT blocks",
                        archive.entries.size(), found));
    return archive;
}

pvr::Texture decode_entry(const Entry& entry, const pvr::Options& opts) {
    return pvr::decode(entry.data, opts);
}

} // namespace dctools::pvm
