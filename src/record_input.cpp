#include "record_input.hpp"

#include "tools.hpp"

#include <cstring>
#include <climits>
#include <vector>


//------------------------------------------------------------------------------
// CompressionType

bool ParseCompressionType(const std::string& tag, CompressionType& type_out)
{
    if (tag.empty() || tag == "none" || tag == "None") {
        type_out = CompressionType::None;
        return true;
    }
    if (tag == "gzip") {
        type_out = CompressionType::Gzip;
        return true;
    }

    LOG_ERROR() << "Unknown compression type '" << tag << "': expected 'gzip' or none";
    return false;
}

const char* CompressionTypeToString(CompressionType type)
{
    switch (type) {
    case CompressionType::None: return "none";
    case CompressionType::Gzip: return "gzip";
    }
    return "unknown";
}

std::unique_ptr<RecordInput> CreateRecordInput(CompressionType type)
{
    if (type == CompressionType::Gzip) {
        return std::unique_ptr<RecordInput>(new GzipRecordInput);
    }
    return std::unique_ptr<RecordInput>(new MappedRecordInput);
}


//------------------------------------------------------------------------------
// MappedRecordInput

bool MappedRecordInput::Open(const std::string& file_path)
{
    Offset = 0;
    return File.Open(file_path);
}

void MappedRecordInput::Close()
{
    File.Close();
    Offset = 0;
}

bool MappedRecordInput::Seek(uint64_t offset)
{
    if (offset > File.GetSize()) {
        LOG_ERROR() << "MappedRecordInput: Seek to " << offset << " is past the end of the file ("
            << File.GetSize() << " bytes)";
        return false;
    }
    Offset = offset;
    return true;
}

int64_t MappedRecordInput::Read(void* dest, uint64_t bytes)
{
    if (!File.IsValid()) {
        return -1;
    }

    const uint64_t available = File.GetSize() - Offset;
    if (bytes > available) {
        bytes = available;
    }
    if (bytes > 0) {
        memcpy(dest, File.GetData() + Offset, bytes);
        Offset += bytes;
    }
    return static_cast<int64_t>( bytes );
}


//------------------------------------------------------------------------------
// GzipRecordInput

static const unsigned kGzipChunkBytes = 1024 * 1024;

bool GzipRecordInput::Open(const std::string& file_path)
{
    Close();

    FilePath = file_path;
    File = gzopen(file_path.c_str(), "rb");
    if (!File) {
        LOG_ERROR() << "GzipRecordInput: Failed to open file: " << file_path;
        return false;
    }

    gzbuffer(File, kGzipChunkBytes);

    if (!MeasureSize()) {
        Close();
        return false;
    }

    return true;
}

void GzipRecordInput::Close()
{
    if (File) {
        gzclose(File);
        File = nullptr;
    }
    Size = 0;
    Offset = 0;
}

bool GzipRecordInput::MeasureSize()
{
    std::vector<uint8_t> chunk(kGzipChunkBytes);

    uint64_t total = 0;
    for (;;) {
        int r = gzread(File, chunk.data(), kGzipChunkBytes);
        if (r < 0) {
            int errnum = 0;
            LOG_ERROR() << "GzipRecordInput: Failed to decompress " << FilePath
                << ": " << gzerror(File, &errnum);
            return false;
        }
        if (r == 0) {
            break;
        }
        total += static_cast<uint64_t>( r );
    }

    if (gzrewind(File) != 0) {
        LOG_ERROR() << "GzipRecordInput: Failed to rewind " << FilePath;
        return false;
    }

    Size = total;
    Offset = 0;
    return true;
}

bool GzipRecordInput::Seek(uint64_t offset)
{
    if (!File) {
        return false;
    }
    if (offset > Size) {
        LOG_ERROR() << "GzipRecordInput: Seek to " << offset << " is past the end of the stream ("
            << Size << " bytes)";
        return false;
    }

    // zlib emulates seeking by decompressing, and rewinds for backward seeks
    z_off_t r = gzseek(File, static_cast<z_off_t>( offset ), SEEK_SET);
    if (r < 0 || static_cast<uint64_t>( r ) != offset) {
        int errnum = 0;
        LOG_ERROR() << "GzipRecordInput: Failed to seek to " << offset << " in " << FilePath
            << ": " << gzerror(File, &errnum);
        return false;
    }

    Offset = offset;
    return true;
}

int64_t GzipRecordInput::Read(void* dest, uint64_t bytes)
{
    if (!File) {
        return -1;
    }

    uint8_t* ptr = static_cast<uint8_t*>(dest);
    uint64_t total = 0;

    while (total < bytes) {
        uint64_t request = bytes - total;
        if (request > INT_MAX) {
            request = INT_MAX;
        }

        int r = gzread(File, ptr + total, static_cast<unsigned>( request ));
        if (r < 0) {
            int errnum = 0;
            LOG_ERROR() << "GzipRecordInput: Read failed in " << FilePath << ": " << gzerror(File, &errnum);
            return -1;
        }
        if (r == 0) {
            break;
        }
        total += static_cast<uint64_t>( r );
    }

    Offset += total;
    return static_cast<int64_t>( total );
}
