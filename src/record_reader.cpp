#include "record_reader.hpp"

#include "tools.hpp"


//------------------------------------------------------------------------------
// RecordReader

bool RecordReader::Open(const RecordReaderConfig& config)
{
    Close();

    config_ = config;

    // Configuration checks come first so that nothing is opened on error
    if (!ParseCompressionType(config_.Compression, compression_)) {
        LOG_ERROR() << "RecordReader: Invalid configuration for " << config_.DataPath;
        return false;
    }
    if (config_.ShardCount > 0) {
        if (config_.ShardIndex >= config_.ShardCount) {
            LOG_ERROR() << "RecordReader: Shard index " << config_.ShardIndex
                << " is out of range (shard_count=" << config_.ShardCount << ")";
            return false;
        }
        if (config_.IndexPath.empty()) {
            LOG_ERROR() << "RecordReader: Sharding " << config_.DataPath << " requires an index file";
            return false;
        }
    }

    if (!config_.IndexPath.empty()) {
        if (!ReadIndexFile(config_.IndexPath, index_)) {
            LOG_ERROR() << "RecordReader: Failed to read index file at " << config_.IndexPath;
            Close();
            return false;
        }
        index_loaded_ = true;
    }

    input_ = CreateRecordInput(compression_);
    if (!input_->Open(config_.DataPath)) {
        LOG_ERROR() << "RecordReader: Failed to open data file at " << config_.DataPath;
        Close();
        return false;
    }

    if (arena_.GetCapacity() == 0) {
        arena_.Reserve(kInitialArenaBytes);
    }

    rng_.seed(config_.Seed);

    if (!PlanSegments()) {
        Close();
        return false;
    }

    return true;
}

void RecordReader::Close()
{
    if (input_) {
        input_->Close();
        input_ = nullptr;
    }
    index_.clear();
    index_loaded_ = false;
    segments_.clear();
    segment_index_ = 0;
    segment_started_ = false;
    pass_record_count_ = 0;
    failed_status_ = FrameStatus::Ok;
}

bool RecordReader::PlanSegments()
{
    // End of file is measured once per pass.  For gzip this is the
    // decompressed size, not the size on disk.
    const uint64_t file_bytes = input_->GetSize();
    const uint64_t record_count = index_.size();

    for (const auto& entry : index_) {
        if (static_cast<uint64_t>( entry.Offset ) >= file_bytes) {
            LOG_ERROR() << "RecordReader: Index offset " << entry.Offset << " is past the end of "
                << config_.DataPath << " (" << file_bytes << " bytes)";
            return false;
        }
    }

    Segment segment;

    if (!index_loaded_) {
        segment.Begin = 0;
        segment.End = file_bytes;
        segments_.push_back(segment);
        pass_record_count_ = 0;
    } else if (config_.ShardCount == 0) {
        if (record_count == 0) {
            return true;
        }

        std::uniform_int_distribution<uint64_t> pick(0, record_count - 1);
        const uint64_t start_record = pick(rng_);
        const uint64_t start_offset = static_cast<uint64_t>( index_[start_record].Offset );

        segment.Begin = start_offset;
        segment.End = file_bytes;
        segments_.push_back(segment);

        if (start_offset > 0) {
            segment.Begin = 0;
            segment.End = start_offset;
            segments_.push_back(segment);
        }

        pass_record_count_ = record_count;

        LOG_DEBUG() << "RecordReader: " << config_.DataPath << " starts at record " << start_record
            << " of " << record_count << " (offset " << start_offset << ")";
    } else {
        ShardRange range;
        if (!ComputeShardRange(record_count, config_.ShardIndex, config_.ShardCount, range)) {
            return false;
        }
        if (range.GetCount() == 0) {
            return true;
        }

        segment.Begin = static_cast<uint64_t>( index_[range.Begin].Offset );
        segment.End = range.End < record_count ? static_cast<uint64_t>( index_[range.End].Offset ) : file_bytes;
        segments_.push_back(segment);

        pass_record_count_ = range.GetCount();
    }

    return true;
}

bool RecordReader::StartSegment(const Segment& segment)
{
    if (!input_->Seek(segment.Begin)) {
        LOG_ERROR() << "RecordReader: Failed to seek to offset " << segment.Begin << " in " << config_.DataPath;
        return false;
    }
    return true;
}

FrameStatus RecordReader::Next(const uint8_t*& payload_out, uint64_t& bytes_out)
{
    payload_out = nullptr;
    bytes_out = 0;

    if (failed_status_ != FrameStatus::Ok) {
        return failed_status_;
    }
    if (!input_) {
        return FrameStatus::ReadFailed;
    }

    while (segment_index_ < segments_.size()) {
        const Segment& segment = segments_[segment_index_];

        if (!segment_started_) {
            if (!StartSegment(segment)) {
                failed_status_ = FrameStatus::ReadFailed;
                return failed_status_;
            }
            segment_started_ = true;
        }

        const uint64_t offset = input_->Tell();
        if (offset >= segment.End) {
            ++segment_index_;
            segment_started_ = false;
            continue;
        }

        FrameStatus status = ReadFrame(input_.get(), arena_, payload_out, bytes_out);
        if (status == FrameStatus::Ok) {
            return status;
        }

        // The segment end is not reached yet, so a clean end here means the
        // file is shorter than the index says.
        if (status == FrameStatus::EndOfStream) {
            status = FrameStatus::Truncated;
        }

        LOG_ERROR() << "RecordReader: " << FrameStatusToString(status) << " record at offset "
            << offset << " in " << config_.DataPath;
        failed_status_ = status;
        return failed_status_;
    }

    return FrameStatus::EndOfStream;
}

FrameStatus RecordReader::ReadRecordAt(uint64_t record_index, const uint8_t*& payload_out, uint64_t& bytes_out)
{
    payload_out = nullptr;
    bytes_out = 0;

    if (!input_) {
        return FrameStatus::ReadFailed;
    }
    if (record_index >= index_.size()) {
        LOG_ERROR() << "RecordReader: Record " << record_index << " is out of range (indexed records="
            << index_.size() << ") in " << config_.DataPath;
        return FrameStatus::ReadFailed;
    }

    const uint64_t saved_offset = input_->Tell();
    const uint64_t offset = static_cast<uint64_t>( index_[record_index].Offset );

    if (!input_->Seek(offset)) {
        return FrameStatus::ReadFailed;
    }

    FrameStatus status = ReadFrame(input_.get(), arena_, payload_out, bytes_out);
    if (status == FrameStatus::EndOfStream) {
        status = FrameStatus::Truncated;
    }
    if (status != FrameStatus::Ok) {
        LOG_ERROR() << "RecordReader: " << FrameStatusToString(status) << " record " << record_index
            << " at offset " << offset << " in " << config_.DataPath;
    }

    if (!input_->Seek(saved_offset)) {
        failed_status_ = FrameStatus::ReadFailed;
        return failed_status_;
    }

    return status;
}
