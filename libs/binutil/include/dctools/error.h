#pragma once

#include <stdexcept>
#include <string>

namespace dctools {

enum class ErrorKind {
    BadMagic,
    UnsupportedFormat,
    TruncatedInput,
    IndexOutOfRange,
    CyclicReference,
    EntryCountMismatch,
};

constexpr const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadMagic: return "BadMagic";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::TruncatedInput: return "TruncatedInput";
        case ErrorKind::IndexOutOfRange: return "IndexOutOfRange";
        case ErrorKind::CyclicReference: return "CyclicReference";
        case ErrorKind::EntryCountMismatch: return "EntryCountMismatch";
    }
    return "Unknown";
}

// DecodeError is thrown by every decoder. The first error ends the decode
// call; no partial result is returned alongside it.
class DecodeError : public std::runtime_error {
public:
    DecodeError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace dctools
