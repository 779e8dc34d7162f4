/*
    Frame codec for container files.

    Frame layout is described in recordloader.hpp.  The length field and the
    payload each carry their own masked CRC32C, and both are checked before a
    payload is handed to the caller.
*/

#pragma once

#include "recordloader.hpp"
#include "record_input.hpp"

#include <cstdint>
#include <string>
#include <vector>


//------------------------------------------------------------------------------
// FrameStatus

enum class FrameStatus {
    // A complete frame was decoded and both checksums matched
    Ok,

    // Clean end of stream: no bytes left where a frame would start
    EndOfStream,

    // The stream ended inside a frame
    Truncated,

    // The checksum over the length field did not match
    LengthCrcMismatch,

    // The checksum over the payload did not match
    DataCrcMismatch,

    // The underlying file could not be read
    ReadFailed
};

const char* FrameStatusToString(FrameStatus status);


//------------------------------------------------------------------------------
// Encoder

void EncodeFrameHeader(uint64_t payload_bytes, uint8_t* header);

void EncodeFrameFooter(const void* payload, uint64_t payload_bytes, uint8_t* footer);

// Appends one complete frame to frame_out
void EncodeFrame(const void* payload, uint64_t payload_bytes, std::vector<uint8_t>& frame_out);


//------------------------------------------------------------------------------
// FrameArena

/*
    Scratch memory for one payload at a time.  Owned by a single reader and
    grown by 1.5x only when a payload does not fit, so steady state reading
    does not allocate.
*/
class FrameArena {
public:
    explicit FrameArena(uint64_t initial_bytes = 0) {
        if (initial_bytes > 0) {
            Buffer.resize(initial_bytes);
        }
    }

    uint8_t* Reserve(uint64_t bytes);

    uint64_t GetCapacity() const { return Buffer.size(); }

private:
    std::vector<uint8_t> Buffer;
};


//------------------------------------------------------------------------------
// Decoder

/*
    Reads the frame starting at the current input position.

    On Ok, payload_out points into the arena and stays valid until the next
    call that uses the same arena.  frame_bytes_out is the full frame size
    including the framing overhead.
*/
FrameStatus ReadFrame(
    RecordInput* input,
    FrameArena& arena,
    const uint8_t*& payload_out,
    uint64_t& payload_bytes_out,
    uint64_t* frame_bytes_out = nullptr);


//------------------------------------------------------------------------------
// MemoryRecordInput

// Serves frames out of a caller-owned buffer
class MemoryRecordInput : public RecordInput {
public:
    MemoryRecordInput(const void* data, uint64_t bytes)
        : Data(static_cast<const uint8_t*>(data))
        , Size(bytes)
    {
    }

    bool Open(const std::string& /*file_path*/) override { Offset = 0; return true; }
    void Close() override { Offset = 0; }

    uint64_t GetSize() const override { return Size; }

    bool Seek(uint64_t offset) override;
    uint64_t Tell() const override { return Offset; }
    int64_t Read(void* dest, uint64_t bytes) override;

private:
    const uint8_t* Data = nullptr;
    uint64_t Size = 0;
    uint64_t Offset = 0;
};
