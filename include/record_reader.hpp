/*
    Record stream reader.

    Reads raw payloads out of one container file in one of three modes:

    (1) No index: every frame from offset 0 to the end of the file.

    (2) Index, no shard: a uniformly random record is picked as the starting
        point, the reader runs to the end of the file and then wraps around
        from offset 0 up to the starting record.  Every record is visited
        exactly once; only the rotation point is random.  This desynchronizes
        several readers of the same file without a shuffle buffer.

    (3) Index and shard (i, W): only the records in
        [floor(N*i/W), floor(N*(i+1)/W)) are read, once, in order.

    Any protocol error ends the stream.  Re-open to read again.
*/

#pragma once

#include "record_frame.hpp"
#include "record_index.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>


//------------------------------------------------------------------------------
// RecordReaderConfig

struct RecordReaderConfig {
    std::string DataPath;

    // Optional: empty means no index
    std::string IndexPath;

    // "none" (or empty) or "gzip"
    std::string Compression;

    // Shard selection.  ShardCount = 0 disables sharding.
    uint32_t ShardIndex = 0;
    uint32_t ShardCount = 0;

    // Seed for the random starting record (index without shard).
    // Give each worker a different seed, for example from DeriveSeed().
    uint64_t Seed = 0;
};


//------------------------------------------------------------------------------
// RecordReader

// This is not thread-safe so do not call methods from multiple threads.
class RecordReader {
public:
    ~RecordReader() {
        Close();
    }

    // Configuration errors (bad compression tag or shard) are reported here,
    // before any file is touched.
    bool Open(const RecordReaderConfig& config);
    void Close();

    /*
        Reads the next payload.

        Ok: payload_out is valid until the next call.
        EndOfStream: the pass is complete.
        Anything else: a protocol error.  The stream stays failed.
    */
    FrameStatus Next(const uint8_t*& payload_out, uint64_t& bytes_out);

    // Map-style access to record_index through the index.  Does not disturb
    // the position of Next().
    FrameStatus ReadRecordAt(uint64_t record_index, const uint8_t*& payload_out, uint64_t& bytes_out);

    bool HasIndex() const { return index_loaded_; }

    // Records in the index, or 0 without one
    uint64_t GetIndexedRecordCount() const { return index_.size(); }

    // Records this pass will yield, or 0 if unknown (no index)
    uint64_t GetPassRecordCount() const { return pass_record_count_; }

    // Offset of the first record this pass reads
    uint64_t GetStartOffset() const { return segments_.empty() ? 0 : segments_[0].Begin; }

    const std::string& GetDataPath() const { return config_.DataPath; }

private:
    // Byte range [Begin, End) of the container
    struct Segment {
        uint64_t Begin = 0;
        uint64_t End = 0;
    };

    RecordReaderConfig config_;
    CompressionType compression_ = CompressionType::None;

    std::unique_ptr<RecordInput> input_;
    FrameArena arena_;

    std::vector<IndexEntry> index_;
    bool index_loaded_ = false;

    std::mt19937_64 rng_;

    std::vector<Segment> segments_;
    size_t segment_index_ = 0;
    bool segment_started_ = false;

    uint64_t pass_record_count_ = 0;

    // Sticky error status once the stream failed
    FrameStatus failed_status_ = FrameStatus::Ok;

    bool PlanSegments();
    bool StartSegment(const Segment& segment);
};
