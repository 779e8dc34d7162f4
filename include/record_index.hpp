/*
    Side index for container files.

    The index is derived data: it can always be rebuilt by scanning the
    container, and readers fall back to a sequential scan without one.
*/

#pragma once

#include "record_frame.hpp"

#include <cstdint>
#include <string>
#include <vector>


//------------------------------------------------------------------------------
// IndexEntry

struct IndexEntry {
    // Byte offset of the frame in the (decompressed) container
    int64_t Offset = 0;

    // Full frame length including framing overhead.
    // -1 when the index file only carried offsets.
    int64_t Length = -1;
};


//------------------------------------------------------------------------------
// ShardRange

// Half-open range of record positions [Begin, End)
struct ShardRange {
    uint64_t Begin = 0;
    uint64_t End = 0;

    uint64_t GetCount() const { return End - Begin; }
};

/*
    Splits record_count records into shard_count contiguous ranges using
    floor(N * i / W) boundaries.  Every record lands in exactly one shard and
    shard sizes differ by at most one.
*/
bool ComputeShardRange(
    uint64_t record_count,
    uint32_t shard_index,
    uint32_t shard_count,
    ShardRange& range_out);


//------------------------------------------------------------------------------
// Index Files

/*
    Scans the container from offset 0 and collects one entry per frame.

    Returns the status that ended the scan: EndOfStream for a clean scan, or
    the protocol error hit at entries_out.size() (entries before it are kept).
*/
FrameStatus ScanContainer(
    const std::string& data_file_path,
    CompressionType compression,
    std::vector<IndexEntry>& entries_out);

// Writes "<offset> <length>\n" lines
bool WriteIndexFile(const std::string& index_file_path, const std::vector<IndexEntry>& entries);

// Accepts one or more whitespace separated columns per line.  Only the first
// column is required; the second is kept as Length when present.
bool ReadIndexFile(const std::string& index_file_path, std::vector<IndexEntry>& entries_out);

/*
    Scan + write.  On a parse failure a diagnostic is logged, the entries
    collected before the bad frame are still written, and false is returned.
*/
bool BuildIndex(
    const std::string& data_file_path,
    const std::string& index_file_path,
    CompressionType compression = CompressionType::None);

// Checks that the index matches a full scan of the container
bool VerifyIndex(
    const std::string& data_file_path,
    const std::string& index_file_path,
    CompressionType compression = CompressionType::None);


//------------------------------------------------------------------------------
// Directory Indexing

// <dir>/a/b.tfrecord -> <dir>/a/b.tfindex
std::string GetIndexPathForContainer(const std::string& data_file_path);

// Recursively lists files ending in RECORDLOADER_CONTAINER_SUFFIX, sorted
bool FindContainerFiles(const std::string& directory_path, std::vector<std::string>& files_out);

/*
    Writes a sibling index for every container file under the directory,
    indexing files in parallel.  Returns false if any file failed; the other
    files are still indexed.
*/
bool IndexDirectory(const std::string& directory_path, int worker_count = 0);
