/*
    Writes container files.

    Files are write-once: one writer session produces the whole file, frames
    are appended in call order, and nothing is ever rewritten in place.
*/

#pragma once

#include "features.hpp"
#include "record_input.hpp"

#include <zlib.h>

#include <cstdint>
#include <fstream>
#include <string>


//------------------------------------------------------------------------------
// Serialization

// Encodes a flat record.  Keys are written in sorted order so that the same
// record always produces the same bytes.
bool SerializeExample(const FeatureMap& features, std::string& serialized_out);

// Encodes a context record plus per-field value sequences
bool SerializeSequenceExample(
    const FeatureMap& context,
    const FeatureListMap& feature_lists,
    std::string& serialized_out);


//------------------------------------------------------------------------------
// RecordWriter

class RecordWriter {
public:
    ~RecordWriter() {
        Close();
    }

    bool Open(
        const std::string& data_file_path,
        CompressionType compression = CompressionType::None);

    // Append one frame around an already encoded payload
    bool WriteRecord(const void* payload, uint64_t bytes);

    bool WriteExample(const FeatureMap& features);

    bool WriteSequenceExample(
        const FeatureMap& context,
        const FeatureListMap& feature_lists);

    // Flushes and closes the file.  Returns false if any buffered write failed.
    bool Close();

    uint64_t GetRecordCount() const { return record_count_; }

    // Logical (uncompressed) bytes written so far
    uint64_t GetBytesWritten() const { return bytes_written_; }

private:
    std::string data_file_path_;
    CompressionType compression_ = CompressionType::None;

    std::ofstream file_;
    gzFile gz_file_ = nullptr;

    uint64_t record_count_ = 0;
    uint64_t bytes_written_ = 0;

    std::string serialized_;

    bool WriteBytes(const void* data, uint64_t bytes);
};
