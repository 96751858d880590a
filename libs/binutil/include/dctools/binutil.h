#pragma once

#include "dctools/error.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dctools::binutil {

// Dreamcast data is little-endian and values are copied straight out of the
// buffer. Fail at compile time on anything else.
static_assert(std::endian::native == std::endian::little,
              "dctools requires a little-endian platform");

using Bytes = std::span<const uint8_t>;

inline Bytes as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

// Reader is a cursor over an immutable byte buffer. Every read and seek is
// bounds-checked and throws DecodeError(TruncatedInput) when it would leave
// the buffer. The buffer must outlive the reader and any span it returns.
class Reader {
public:
    explicit Reader(Bytes data, std::string_view context = "binutil")
        : data_(data), context_(context) {}

    Bytes data() const { return data_; }
    size_t size() const { return data_.size(); }
    size_t tell() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }

    void seek(size_t pos) {
        if (pos > data_.size())
            throw DecodeError(ErrorKind::TruncatedInput,
                std::format("{}: seek to offset {} beyond end of {}-byte buffer",
                            context_, pos, data_.size()));
        pos_ = pos;
    }

    void skip(size_t n) {
        require(n, "skip");
        pos_ += n;
    }

    uint8_t read_u8() {
        require(1, "read u8");
        return data_[pos_++];
    }

    uint16_t read_u16() { return read_pod<uint16_t>("read u16"); }
    int16_t read_i16() { return read_pod<int16_t>("read i16"); }
    uint32_t read_u32() { return read_pod<uint32_t>("read u32"); }
    int32_t read_i32() { return read_pod<int32_t>("read i32"); }
    float read_f32() { return read_pod<float>("read f32"); }

    Bytes read_bytes(size_t n) {
        require(n, "read bytes");
        auto out = data_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

    std::string read_signature() {
        auto b = read_bytes(4);
        return {reinterpret_cast<const char*>(b.data()), 4};
    }

    // peek_signature reports whether the bytes at pos equal sig without
    // moving the cursor. Out-of-range positions simply do not match.
    bool peek_signature(size_t pos, std::string_view sig) const {
        if (pos > data_.size() || data_.size() - pos < sig.size()) return false;
        return std::memcmp(data_.data() + pos, sig.data(), sig.size()) == 0;
    }

    std::string read_fixed_string(size_t size) {
        auto b = read_bytes(size);
        std::string s(reinterpret_cast<const char*>(b.data()), size);
        auto nul = s.find('\0');
        if (nul != std::string::npos) s.resize(nul);
        return s;
    }

    std::string read_asciiz() {
        std::string s;
        while (pos_ < data_.size()) {
            char c = static_cast<char>(data_[pos_++]);
            if (c == '\0') return s;
            s += c;
        }
        throw DecodeError(ErrorKind::TruncatedInput,
            std::format("{}: unterminated string", context_));
    }

private:
    void require(size_t n, const char* what) const {
        if (n > data_.size() - pos_)
            throw DecodeError(ErrorKind::TruncatedInput,
                std::format("{}: failed to {} at offset {} ({} bytes left, {} needed)",
                            context_, what, pos_, data_.size() - pos_, n));
    }

    template <typename T>
    T read_pod(const char* what) {
        require(sizeof(T), what);
        T v;
        std::memcpy(&v, data_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        return v;
    }

    Bytes data_;
    std::string_view context_;
    size_t pos_ = 0;
};

// --- Write helpers (throw on failure) ---

inline void write_u8(std::ostream& w, uint8_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 1))
        throw std::runtime_error("binutil: failed to write u8");
}

inline void write_u16(std::ostream& w, uint16_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 2))
        throw std::runtime_error("binutil: failed to write u16");
}

inline void write_i16(std::ostream& w, int16_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 2))
        throw std::runtime_error("binutil: failed to write i16");
}

inline void write_u32(std::ostream& w, uint32_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 4))
        throw std::runtime_error("binutil: failed to write u32");
}

inline void write_i32(std::ostream& w, int32_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 4))
        throw std::runtime_error("binutil: failed to write i32");
}

inline void write_f32(std::ostream& w, float v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 4))
        throw std::runtime_error("binutil: failed to write f32");
}

inline void write_signature(std::ostream& w, std::string_view sig) {
    if (sig.size() != 4 || !w.write(sig.data(), 4))
        throw std::runtime_error("binutil: failed to write signature");
}

// write_fixed_string writes s NUL-padded (or truncated) to exactly size bytes.
inline void write_fixed_string(std::ostream& w, std::string_view s, size_t size) {
    std::string buf(size, '\0');
    std::memcpy(buf.data(), s.data(), std::min(s.size(), size));
    if (!w.write(buf.data(), static_cast<std::streamsize>(size)))
        throw std::runtime_error("binutil: failed to write fixed string");
}

inline void write_asciiz(std::ostream& w, std::string_view s) {
    if (!s.empty() && !w.write(s.data(), static_cast<std::streamsize>(s.size())))
        throw std::runtime_error("binutil: failed to write asciiz string");
    write_u8(w, 0);
}

inline void write_zeros(std::ostream& w, size_t n) {
    for (size_t i = 0; i < n; i++) write_u8(w, 0);
}

} // namespace dctools::binutil
