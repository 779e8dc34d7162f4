#include "crc32c.hpp"

#include "tools.hpp"

#include <mutex>


//------------------------------------------------------------------------------
// Tables

// Reflected Castagnoli polynomial
static const uint32_t kCastagnoliPoly = 0x82f63b78u;

// Slicing-by-4 tables, built once on first use
static uint32_t m_crc_tables[4][256];
static std::once_flag m_crc_tables_once;

static void InitCrcTables()
{
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ ((crc & 1) ? kCastagnoliPoly : 0);
        }
        m_crc_tables[0][i] = crc;
    }

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = m_crc_tables[0][i];
        for (int t = 1; t < 4; ++t) {
            crc = m_crc_tables[0][crc & 0xff] ^ (crc >> 8);
            m_crc_tables[t][i] = crc;
        }
    }
}


//------------------------------------------------------------------------------
// CRC32C

uint32_t Crc32cExtend(uint32_t crc, const void* data, size_t bytes)
{
    std::call_once(m_crc_tables_once, InitCrcTables);

    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    uint32_t l = ~crc;

    while (bytes >= 4) {
        l ^= read_uint32_le(ptr);
        l = m_crc_tables[3][l & 0xff] ^
            m_crc_tables[2][(l >> 8) & 0xff] ^
            m_crc_tables[1][(l >> 16) & 0xff] ^
            m_crc_tables[0][l >> 24];
        ptr += 4;
        bytes -= 4;
    }

    while (bytes > 0) {
        l = m_crc_tables[0][(l ^ *ptr) & 0xff] ^ (l >> 8);
        ++ptr;
        --bytes;
    }

    return ~l;
}
