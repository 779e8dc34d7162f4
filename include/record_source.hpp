/*
    Pull-based pipeline stages producing decoded records.

    Every stage is lazy and single threaded: nothing happens until Next() is
    called, and a caller stops iteration simply by not calling it again.
*/

#pragma once

#include "feature_decoder.hpp"
#include "record_reader.hpp"

#include <functional>
#include <memory>


//------------------------------------------------------------------------------
// RecordSource

enum class SourceStatus {
    // record_out holds the next record
    Ok,

    // No more records
    Exhausted,

    // A fatal error for this stream was logged
    Error
};

const char* SourceStatusToString(SourceStatus status);

class RecordSource {
public:
    virtual ~RecordSource() {}

    virtual SourceStatus Next(DecodedRecord& record_out) = 0;
};

// Opens a fresh stream from the start.  Returns nullptr if it cannot.
using RecordSourceFactory = std::function<std::unique_ptr<RecordSource>()>;

// Post-decode mapping applied by TransformSource
using RecordTransform = std::function<void(DecodedRecord& record)>;


//------------------------------------------------------------------------------
// FileRecordSource

struct FileSourceConfig {
    RecordReaderConfig Reader;

    // Sequence records are decoded with both descriptions
    bool Sequence = false;
    FeatureDescription Description;
    FeatureDescription SequenceDescription;
};

// Reader + decoder over one container file
class FileRecordSource : public RecordSource {
public:
    bool Open(const FileSourceConfig& config);

    SourceStatus Next(DecodedRecord& record_out) override;

    // Decoded records yielded so far in this pass
    uint64_t GetRecordCount() const { return record_count_; }

    RecordReader& GetReader() { return reader_; }

private:
    FileSourceConfig config_;
    RecordReader reader_;
    FeatureDecoder decoder_;

    uint64_t record_count_ = 0;
    bool failed_ = false;
};

// Factory that opens a new FileRecordSource each time it is invoked
RecordSourceFactory MakeFileSourceFactory(const FileSourceConfig& config);


//------------------------------------------------------------------------------
// TransformSource

class TransformSource : public RecordSource {
public:
    TransformSource(std::unique_ptr<RecordSource> upstream, RecordTransform transform)
        : upstream_(std::move(upstream))
        , transform_(std::move(transform))
    {
    }

    SourceStatus Next(DecodedRecord& record_out) override;

private:
    std::unique_ptr<RecordSource> upstream_;
    RecordTransform transform_;
};
