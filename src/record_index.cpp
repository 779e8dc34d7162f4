#include "record_index.hpp"

#include "tools.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>


//------------------------------------------------------------------------------
// ShardRange

bool ComputeShardRange(
    uint64_t record_count,
    uint32_t shard_index,
    uint32_t shard_count,
    ShardRange& range_out)
{
    if (shard_count == 0 || shard_index >= shard_count) {
        LOG_ERROR() << "Invalid shard " << shard_index << " of " << shard_count;
        return false;
    }

    // Products are taken in 128 bits so large record counts cannot overflow
    const unsigned __int128 n = record_count;
    range_out.Begin = static_cast<uint64_t>( n * shard_index / shard_count );
    range_out.End = static_cast<uint64_t>( n * (shard_index + 1) / shard_count );
    return true;
}


//------------------------------------------------------------------------------
// Index Files

FrameStatus ScanContainer(
    const std::string& data_file_path,
    CompressionType compression,
    std::vector<IndexEntry>& entries_out)
{
    entries_out.clear();

    std::unique_ptr<RecordInput> input = CreateRecordInput(compression);
    if (!input->Open(data_file_path)) {
        return FrameStatus::ReadFailed;
    }

    FrameArena arena(kInitialArenaBytes);

    for (;;) {
        const uint64_t offset = input->Tell();

        const uint8_t* payload = nullptr;
        uint64_t payload_bytes = 0, frame_bytes = 0;
        FrameStatus status = ReadFrame(input.get(), arena, payload, payload_bytes, &frame_bytes);
        if (status != FrameStatus::Ok) {
            return status;
        }

        IndexEntry entry;
        entry.Offset = static_cast<int64_t>( offset );
        entry.Length = static_cast<int64_t>( frame_bytes );
        entries_out.push_back(entry);
    }
}

bool WriteIndexFile(const std::string& index_file_path, const std::vector<IndexEntry>& entries)
{
    std::ofstream index_file(index_file_path, std::ios::trunc);
    if (!index_file) {
        LOG_ERROR() << "Failed to open index file for writing: " << index_file_path;
        return false;
    }

    for (const auto& entry : entries) {
        index_file << entry.Offset << " " << entry.Length << "\n";
    }

    index_file.close();
    if (index_file.fail()) {
        LOG_ERROR() << "Failed to write index file: " << index_file_path;
        return false;
    }
    return true;
}

static bool ParseIndexField(const std::string& field, int64_t& value_out)
{
    errno = 0;
    char* end = nullptr;
    long long value = strtoll(field.c_str(), &end, 10);
    if (errno != 0 || end == field.c_str() || *end != '\0' || value < 0) {
        return false;
    }
    value_out = static_cast<int64_t>( value );
    return true;
}

bool ReadIndexFile(const std::string& index_file_path, std::vector<IndexEntry>& entries_out)
{
    entries_out.clear();

    std::ifstream index_file(index_file_path);
    if (!index_file) {
        LOG_ERROR() << "Failed to open index file: " << index_file_path;
        return false;
    }

    std::string line, field;
    uint64_t line_number = 0;
    while (std::getline(index_file, line)) {
        ++line_number;

        std::istringstream columns(line);
        if (!(columns >> field)) {
            continue; // Blank line
        }

        IndexEntry entry;
        if (!ParseIndexField(field, entry.Offset)) {
            LOG_ERROR() << "Malformed offset '" << field << "' at line " << line_number << " of " << index_file_path;
            return false;
        }
        if (columns >> field && !ParseIndexField(field, entry.Length)) {
            LOG_ERROR() << "Malformed length '" << field << "' at line " << line_number << " of " << index_file_path;
            return false;
        }

        if (!entries_out.empty() && entry.Offset <= entries_out.back().Offset) {
            LOG_ERROR() << "Index offsets are not increasing at line " << line_number << " of " << index_file_path;
            return false;
        }

        entries_out.push_back(entry);
    }

    if (index_file.bad()) {
        LOG_ERROR() << "Failed to read index file: " << index_file_path;
        return false;
    }

    return true;
}

bool BuildIndex(
    const std::string& data_file_path,
    const std::string& index_file_path,
    CompressionType compression)
{
    std::vector<IndexEntry> entries;
    FrameStatus status = ScanContainer(data_file_path, compression, entries);

    bool success = (status == FrameStatus::EndOfStream);
    if (!success) {
        uint64_t offset = 0;
        if (!entries.empty()) {
            offset = entries.back().Offset + entries.back().Length;
        }
        LOG_ERROR() << "Failed to parse record " << entries.size() << " at offset " << offset
            << " of " << data_file_path << ": " << FrameStatusToString(status)
            << ".  Index stops after " << entries.size() << " records";
        if (status == FrameStatus::ReadFailed && entries.empty()) {
            return false;
        }
    }

    if (!WriteIndexFile(index_file_path, entries)) {
        return false;
    }

    LOG_DEBUG() << "Indexed " << entries.size() << " records from " << data_file_path << " into " << index_file_path;
    return success;
}

bool VerifyIndex(
    const std::string& data_file_path,
    const std::string& index_file_path,
    CompressionType compression)
{
    std::vector<IndexEntry> scanned;
    FrameStatus status = ScanContainer(data_file_path, compression, scanned);
    if (status != FrameStatus::EndOfStream) {
        LOG_ERROR() << "Container " << data_file_path << " is corrupted at record " << scanned.size()
            << ": " << FrameStatusToString(status);
        return false;
    }

    std::vector<IndexEntry> indexed;
    if (!ReadIndexFile(index_file_path, indexed)) {
        return false;
    }

    if (indexed.size() != scanned.size()) {
        LOG_ERROR() << "Index " << index_file_path << " has " << indexed.size()
            << " entries but the container holds " << scanned.size() << " records";
        return false;
    }

    for (size_t i = 0; i < scanned.size(); ++i) {
        if (indexed[i].Offset != scanned[i].Offset) {
            LOG_ERROR() << "Index entry " << i << " points at offset " << indexed[i].Offset
                << " but the record starts at " << scanned[i].Offset;
            return false;
        }
        if (indexed[i].Length >= 0 && indexed[i].Length != scanned[i].Length) {
            LOG_ERROR() << "Index entry " << i << " has length " << indexed[i].Length
                << " but the record is " << scanned[i].Length << " bytes";
            return false;
        }
    }

    return true;
}
