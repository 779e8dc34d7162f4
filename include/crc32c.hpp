/*
    CRC-32C (Castagnoli polynomial) with the masking used by the frame
    checksums.

    A bare CRC stored next to the data it covers is weak against data that
    itself contains CRCs, so each stored checksum is rotated right by 15 bits
    and offset by a constant before it is written.
*/

#pragma once

#include <cstdint>
#include <cstddef>


//------------------------------------------------------------------------------
// Constants

static const uint32_t kCrcMaskDelta = 0xa282ead8u;


//------------------------------------------------------------------------------
// CRC32C

// Continue a running CRC32C over more data.  Start with crc = 0.
uint32_t Crc32cExtend(uint32_t crc, const void* data, size_t bytes);

inline uint32_t Crc32c(const void* data, size_t bytes) {
    return Crc32cExtend(0, data, bytes);
}

inline uint32_t MaskCrc(uint32_t crc) {
    return ((crc >> 15) | (crc << 17)) + kCrcMaskDelta;
}

inline uint32_t UnmaskCrc(uint32_t masked_crc) {
    uint32_t rot = masked_crc - kCrcMaskDelta;
    return ((rot >> 17) | (rot << 15));
}

inline uint32_t MaskedCrc32c(const void* data, size_t bytes) {
    return MaskCrc(Crc32c(data, bytes));
}
