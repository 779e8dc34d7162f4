#include "record_source.hpp"

#include "tools.hpp"


//------------------------------------------------------------------------------
// RecordSource

const char* SourceStatusToString(SourceStatus status)
{
    switch (status) {
    case SourceStatus::Ok: return "Ok";
    case SourceStatus::Exhausted: return "Exhausted";
    case SourceStatus::Error: return "Error";
    }
    return "Unknown";
}


//------------------------------------------------------------------------------
// FileRecordSource

bool FileRecordSource::Open(const FileSourceConfig& config)
{
    config_ = config;
    record_count_ = 0;
    failed_ = false;

    if (config_.Sequence) {
        decoder_.SetSequenceDescription(config_.Description, config_.SequenceDescription);
    } else {
        decoder_.SetDescription(config_.Description);
    }

    return reader_.Open(config_.Reader);
}

SourceStatus FileRecordSource::Next(DecodedRecord& record_out)
{
    if (failed_) {
        return SourceStatus::Error;
    }

    const uint8_t* payload = nullptr;
    uint64_t bytes = 0;
    FrameStatus frame_status = reader_.Next(payload, bytes);
    if (frame_status == FrameStatus::EndOfStream) {
        return SourceStatus::Exhausted;
    }
    if (frame_status != FrameStatus::Ok) {
        failed_ = true;
        return SourceStatus::Error;
    }

    DecodeStatus decode_status = decoder_.Decode(payload, bytes, record_out);
    if (decode_status != DecodeStatus::Ok) {
        LOG_ERROR() << "FileRecordSource: " << DecodeStatusToString(decode_status) << " in record "
            << record_count_ << " of " << config_.Reader.DataPath << ": " << decoder_.GetLastError();
        failed_ = true;
        return SourceStatus::Error;
    }

    ++record_count_;
    return SourceStatus::Ok;
}

// Golden ratio increment between pass seeds
static const uint64_t kSeedStride = 0x9e3779b97f4a7c15ULL;

RecordSourceFactory MakeFileSourceFactory(const FileSourceConfig& config)
{
    uint64_t open_count = 0;

    return [config, open_count]() mutable -> std::unique_ptr<RecordSource> {
        // Each reopen gets a new random starting record
        FileSourceConfig pass_config = config;
        pass_config.Reader.Seed = config.Reader.Seed + kSeedStride * open_count++;

        std::unique_ptr<FileRecordSource> source(new FileRecordSource);
        if (!source->Open(pass_config)) {
            return nullptr;
        }
        return std::move(source);
    };
}


//------------------------------------------------------------------------------
// TransformSource

SourceStatus TransformSource::Next(DecodedRecord& record_out)
{
    SourceStatus status = upstream_->Next(record_out);
    if (status == SourceStatus::Ok && transform_) {
        transform_(record_out);
    }
    return status;
}
