#include "record_frame.hpp"

#include "crc32c.hpp"
#include "tools.hpp"

#include <cstring>


//------------------------------------------------------------------------------
// FrameStatus

const char* FrameStatusToString(FrameStatus status)
{
    switch (status) {
    case FrameStatus::Ok: return "Ok";
    case FrameStatus::EndOfStream: return "EndOfStream";
    case FrameStatus::Truncated: return "Truncated";
    case FrameStatus::LengthCrcMismatch: return "LengthCrcMismatch";
    case FrameStatus::DataCrcMismatch: return "DataCrcMismatch";
    case FrameStatus::ReadFailed: return "ReadFailed";
    }
    return "Unknown";
}


//------------------------------------------------------------------------------
// Encoder

void EncodeFrameHeader(uint64_t payload_bytes, uint8_t* header)
{
    write_uint64_le(header, payload_bytes);
    write_uint32_le(header + 8, MaskedCrc32c(header, 8));
}

void EncodeFrameFooter(const void* payload, uint64_t payload_bytes, uint8_t* footer)
{
    write_uint32_le(footer, MaskedCrc32c(payload, payload_bytes));
}

void EncodeFrame(const void* payload, uint64_t payload_bytes, std::vector<uint8_t>& frame_out)
{
    const size_t start = frame_out.size();
    frame_out.resize(start + kFrameOverheadBytes + payload_bytes);

    uint8_t* frame = frame_out.data() + start;
    EncodeFrameHeader(payload_bytes, frame);
    if (payload_bytes > 0) {
        memcpy(frame + kFrameHeaderBytes, payload, payload_bytes);
    }
    EncodeFrameFooter(payload, payload_bytes, frame + kFrameHeaderBytes + payload_bytes);
}


//------------------------------------------------------------------------------
// FrameArena

uint8_t* FrameArena::Reserve(uint64_t bytes)
{
    if (bytes > Buffer.size()) {
        uint64_t grown = Buffer.size() + Buffer.size() / 2;
        Buffer.resize(grown > bytes ? grown : bytes);
    }
    return Buffer.data();
}


//------------------------------------------------------------------------------
// Decoder

FrameStatus ReadFrame(
    RecordInput* input,
    FrameArena& arena,
    const uint8_t*& payload_out,
    uint64_t& payload_bytes_out,
    uint64_t* frame_bytes_out)
{
    payload_out = nullptr;
    payload_bytes_out = 0;

    uint8_t header[kFrameHeaderBytes];

    int64_t r = input->Read(header, 8);
    if (r < 0) {
        return FrameStatus::ReadFailed;
    }
    if (r == 0) {
        return FrameStatus::EndOfStream;
    }
    if (r != 8) {
        return FrameStatus::Truncated;
    }

    r = input->Read(header + 8, 4);
    if (r < 0) {
        return FrameStatus::ReadFailed;
    }
    if (r != 4) {
        return FrameStatus::Truncated;
    }

    if (read_uint32_le(header + 8) != MaskedCrc32c(header, 8)) {
        return FrameStatus::LengthCrcMismatch;
    }

    const uint64_t length = read_uint64_le(header);

    // Do not allocate for a payload the stream cannot hold
    const uint64_t remaining = input->GetSize() - input->Tell();
    if (remaining < kFrameFooterBytes || length > remaining - kFrameFooterBytes) {
        return FrameStatus::Truncated;
    }

    uint8_t* payload = arena.Reserve(length);
    r = input->Read(payload, length);
    if (r < 0) {
        return FrameStatus::ReadFailed;
    }
    if (static_cast<uint64_t>( r ) != length) {
        return FrameStatus::Truncated;
    }

    uint8_t footer[kFrameFooterBytes];
    r = input->Read(footer, kFrameFooterBytes);
    if (r < 0) {
        return FrameStatus::ReadFailed;
    }
    if (r != kFrameFooterBytes) {
        return FrameStatus::Truncated;
    }

    if (read_uint32_le(footer) != MaskedCrc32c(payload, length)) {
        return FrameStatus::DataCrcMismatch;
    }

    payload_out = payload;
    payload_bytes_out = length;
    if (frame_bytes_out) {
        *frame_bytes_out = kFrameOverheadBytes + length;
    }
    return FrameStatus::Ok;
}


//------------------------------------------------------------------------------
// MemoryRecordInput

bool MemoryRecordInput::Seek(uint64_t offset)
{
    if (offset > Size) {
        return false;
    }
    Offset = offset;
    return true;
}

int64_t MemoryRecordInput::Read(void* dest, uint64_t bytes)
{
    const uint64_t available = Size - Offset;
    if (bytes > available) {
        bytes = available;
    }
    if (bytes > 0) {
        memcpy(dest, Data + Offset, bytes);
        Offset += bytes;
    }
    return static_cast<int64_t>( bytes );
}
