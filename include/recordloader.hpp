/*
    File format constants.
*/

#pragma once

#include <cstdint>

// Library version
#define RECORDLOADER_VERSION 3

// Container files found by the directory indexer: <stem>.tfrecord
#define RECORDLOADER_CONTAINER_SUFFIX ".tfrecord"

// Sibling index written for each container: <stem>.tfindex
#define RECORDLOADER_INDEX_SUFFIX ".tfindex"

// Placeholder replaced by the split name in data/index path patterns
#define RECORDLOADER_SPLIT_PLACEHOLDER "{}"

/*
    Container file format (no file header, frames back to back):
        <payload length (8 bytes, little-endian)>
        <masked crc32c of the 8 length bytes (4 bytes, little-endian)>
        <payload (length bytes)>
        <masked crc32c of the payload (4 bytes, little-endian)>

    Only a frame boundary may coincide with the end of the file.
*/

// Length field plus its checksum
static const int kFrameHeaderBytes = 8 + 4;

// Payload checksum
static const int kFrameFooterBytes = 4;

// Total framing overhead per record
static const int kFrameOverheadBytes = kFrameHeaderBytes + kFrameFooterBytes;

/*
    Index file format (text, one line per record in file order):
        <frame offset> <frame length>\n

    Frame length includes the framing overhead.  Readers only use the first
    column, and also accept index files that carry a single column.
*/

// Initial size of the per-reader payload arena
static const uint32_t kInitialArenaBytes = 1024 * 1024;

