#pragma once

#include "common/types.h"
#include <cstddef>
#include <cstdint>

namespace solcore {
namespace svm {

using namespace solcore::common;

/**
 * Little-endian field helpers shared by the instruction and account codecs.
 * Readers check the range before touching memory and report failure instead
 * of reading past `size`.
 */
namespace byte_io {

/// True when [offset, offset + length) lies inside a buffer of `size` bytes
inline bool in_bounds(size_t size, size_t offset, size_t length) noexcept {
    return offset <= size && length <= size - offset;
}

inline bool read_u8(const uint8_t* data, size_t size, size_t offset, uint8_t& out) noexcept {
    if (!in_bounds(size, offset, 1)) {
        return false;
    }
    out = data[offset];
    return true;
}

inline bool read_u32_le(const uint8_t* data, size_t size, size_t offset, uint32_t& out) noexcept {
    if (!in_bounds(size, offset, 4)) {
        return false;
    }
    out = 0;
    for (int i = 0; i < 4; ++i) {
        out |= static_cast<uint32_t>(data[offset + i]) << (i * 8);
    }
    return true;
}

inline void append_u32_le(Bytes& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

} // namespace byte_io

} // namespace svm
} // namespace solcore
