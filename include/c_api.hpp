#pragma once

#include <cstdint>

/*
    Flat C interface for foreign-language callers (ctypes, cffi).

    Strings may be nullptr where they are optional.  Handles are owned by the
    caller and must be released with the matching destroy function.
*/

extern "C" {

//------------------------------------------------------------------------------
// Record Reader

// compression: nullptr, "none" or "gzip".  shard_count = 0 disables sharding.
// Returns nullptr on failure.
void* record_reader_create(
    const char* data_path,
    const char* index_path,
    const char* compression,
    uint32_t shard_index,
    uint32_t shard_count,
    uint64_t seed);

void record_reader_destroy(void* record_reader);

/*
    Returns 1 and sets payload/bytes for the next record, 0 at end of stream,
    or -1 on error.  The payload is valid until the next call.
*/
int32_t record_reader_next(
    void* record_reader,
    const uint8_t** payload,
    uint64_t* bytes);

// Records in the loaded index, or 0 without one
uint64_t record_reader_indexed_count(void* record_reader);


//------------------------------------------------------------------------------
// Index

bool record_index_build(
    const char* data_path,
    const char* index_path,
    const char* compression);

bool record_index_directory(const char* directory_path, int32_t worker_count);

bool record_index_verify(
    const char* data_path,
    const char* index_path,
    const char* compression);

} // extern "C"
