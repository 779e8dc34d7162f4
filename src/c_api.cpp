#include "c_api.hpp"

#include "record_index.hpp"
#include "record_reader.hpp"
#include "tools.hpp"

static std::string OptionalString(const char* str)
{
    return str ? std::string(str) : std::string();
}

extern "C" {

//------------------------------------------------------------------------------
// Record Reader

void* record_reader_create(
    const char* data_path,
    const char* index_path,
    const char* compression,
    uint32_t shard_index,
    uint32_t shard_count,
    uint64_t seed)
{
    if (!data_path) {
        LOG_ERROR() << "record_reader_create: data_path is required";
        return nullptr;
    }

    RecordReaderConfig config;
    config.DataPath = data_path;
    config.IndexPath = OptionalString(index_path);
    config.Compression = OptionalString(compression);
    config.ShardIndex = shard_index;
    config.ShardCount = shard_count;
    config.Seed = seed;

    RecordReader* reader = new RecordReader();
    if (!reader->Open(config)) {
        delete reader;
        return nullptr;
    }
    return reader;
}

void record_reader_destroy(void* record_reader) {
    RecordReader* reader = static_cast<RecordReader*>(record_reader);
    if (!reader) {
        return;
    }
    reader->Close();
    delete reader;
}

int32_t record_reader_next(
    void* record_reader,
    const uint8_t** payload,
    uint64_t* bytes)
{
    RecordReader* reader = static_cast<RecordReader*>(record_reader);
    if (!reader || !payload || !bytes) {
        return -1;
    }

    FrameStatus status = reader->Next(*payload, *bytes);
    if (status == FrameStatus::Ok) {
        return 1;
    }
    if (status == FrameStatus::EndOfStream) {
        return 0;
    }
    return -1;
}

uint64_t record_reader_indexed_count(void* record_reader) {
    RecordReader* reader = static_cast<RecordReader*>(record_reader);
    if (!reader) {
        return 0;
    }
    return reader->GetIndexedRecordCount();
}


//------------------------------------------------------------------------------
// Index

bool record_index_build(
    const char* data_path,
    const char* index_path,
    const char* compression)
{
    if (!data_path || !index_path) {
        return false;
    }

    CompressionType type;
    if (!ParseCompressionType(OptionalString(compression), type)) {
        return false;
    }
    return BuildIndex(data_path, index_path, type);
}

bool record_index_directory(const char* directory_path, int32_t worker_count) {
    if (!directory_path) {
        return false;
    }
    return IndexDirectory(directory_path, worker_count);
}

bool record_index_verify(
    const char* data_path,
    const char* index_path,
    const char* compression)
{
    if (!data_path || !index_path) {
        return false;
    }

    CompressionType type;
    if (!ParseCompressionType(OptionalString(compression), type)) {
        return false;
    }
    return VerifyIndex(data_path, index_path, type);
}

} // extern "C"
