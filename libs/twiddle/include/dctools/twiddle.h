#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

namespace dctools::twiddle {

// to_morton interleaves the low 16 bits of x (even bit positions) and y
// (odd bit positions) into one linear storage index.
uint32_t to_morton(uint32_t x, uint32_t y);

// from_morton is the exact inverse of to_morton: returns {x, y}.
std::pair<uint32_t, uint32_t> from_morton(uint32_t index);

// twiddled_index maps (x, y) in a width x height level to its storage index.
// Square levels are one morton square. Rectangular levels are a strip of
// square tiles of side min(width, height), each twiddled on its own and
// stored one after another along the longer axis.
uint32_t twiddled_index(uint32_t x, uint32_t y, uint32_t width, uint32_t height);

// check_index throws DecodeError(IndexOutOfRange) when index >= limit.
// `what` names the container in the error message.
void check_index(size_t index, size_t limit, const char* what);

} // namespace dctools::twiddle
