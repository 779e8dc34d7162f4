#include "record_frame.hpp"

#include "crc32c.hpp"
#include "tools.hpp"

#include <cstring>
#include <string>
#include <vector>

// Example{features{feature{"key": bytes_list{"value"}}}}
static const char kKeyValuePayload[] = "\n\x12\n\x10\n\x03key\x12\t\n\x07\n\x05value";
static const uint64_t kKeyValuePayloadBytes = sizeof(kKeyValuePayload) - 1;

bool TestEncodeLayout() {
    std::vector<uint8_t> frame;
    EncodeFrame(kKeyValuePayload, kKeyValuePayloadBytes, frame);

    if (frame.size() != kFrameOverheadBytes + kKeyValuePayloadBytes) {
        LOG_ERROR() << "TestEncodeLayout: Unexpected frame size " << frame.size();
        return false;
    }
    if (read_uint64_le(frame.data()) != kKeyValuePayloadBytes) {
        LOG_ERROR() << "TestEncodeLayout: Wrong length field";
        return false;
    }
    if (read_uint32_le(frame.data() + 8) != 0x15293d5e) {
        LOG_ERROR() << "TestEncodeLayout: Wrong length crc";
        return false;
    }
    if (memcmp(frame.data() + kFrameHeaderBytes, kKeyValuePayload, kKeyValuePayloadBytes) != 0) {
        LOG_ERROR() << "TestEncodeLayout: Payload not copied verbatim";
        return false;
    }
    if (read_uint32_le(frame.data() + kFrameHeaderBytes + kKeyValuePayloadBytes) != 0xd191b666) {
        LOG_ERROR() << "TestEncodeLayout: Wrong payload crc";
        return false;
    }

    LOG_INFO() << "TestEncodeLayout: Passed";
    return true;
}

bool TestReadSequence() {
    std::vector<std::string> payloads = { "first", "", std::string(5000, 'x'), "last" };

    std::vector<uint8_t> stream;
    for (const auto& payload : payloads) {
        EncodeFrame(payload.data(), payload.size(), stream);
    }

    MemoryRecordInput input(stream.data(), stream.size());
    FrameArena arena(16);

    for (size_t i = 0; i < payloads.size(); ++i) {
        const uint8_t* payload = nullptr;
        uint64_t bytes = 0, frame_bytes = 0;
        FrameStatus status = ReadFrame(&input, arena, payload, bytes, &frame_bytes);
        if (status != FrameStatus::Ok) {
            LOG_ERROR() << "TestReadSequence: Record " << i << " failed: " << FrameStatusToString(status);
            return false;
        }
        if (bytes != payloads[i].size() || (bytes > 0 && memcmp(payload, payloads[i].data(), bytes) != 0)) {
            LOG_ERROR() << "TestReadSequence: Record " << i << " payload mismatch";
            return false;
        }
        if (frame_bytes != kFrameOverheadBytes + bytes) {
            LOG_ERROR() << "TestReadSequence: Record " << i << " frame size mismatch";
            return false;
        }
    }

    if (arena.GetCapacity() < 5000) {
        LOG_ERROR() << "TestReadSequence: Arena did not grow";
        return false;
    }

    const uint8_t* payload = nullptr;
    uint64_t bytes = 0;
    if (ReadFrame(&input, arena, payload, bytes) != FrameStatus::EndOfStream) {
        LOG_ERROR() << "TestReadSequence: Expected clean end of stream";
        return false;
    }

    LOG_INFO() << "TestReadSequence: Passed";
    return true;
}

bool TestTruncation() {
    std::vector<uint8_t> frame;
    EncodeFrame(kKeyValuePayload, kKeyValuePayloadBytes, frame);

    // Every proper prefix except the empty one is a truncated record
    for (size_t cut = 1; cut < frame.size(); ++cut) {
        MemoryRecordInput input(frame.data(), cut);
        FrameArena arena;
        const uint8_t* payload = nullptr;
        uint64_t bytes = 0;
        FrameStatus status = ReadFrame(&input, arena, payload, bytes);
        if (status != FrameStatus::Truncated) {
            LOG_ERROR() << "TestTruncation: Cut at " << cut << " gave " << FrameStatusToString(status);
            return false;
        }
    }

    MemoryRecordInput empty_input(frame.data(), 0);
    FrameArena arena;
    const uint8_t* payload = nullptr;
    uint64_t bytes = 0;
    if (ReadFrame(&empty_input, arena, payload, bytes) != FrameStatus::EndOfStream) {
        LOG_ERROR() << "TestTruncation: Empty input should be a clean end of stream";
        return false;
    }

    LOG_INFO() << "TestTruncation: Passed";
    return true;
}

bool TestCorruption() {
    std::vector<uint8_t> frame;
    EncodeFrame(kKeyValuePayload, kKeyValuePayloadBytes, frame);

    for (size_t i = 0; i < frame.size(); ++i) {
        std::vector<uint8_t> corrupted = frame;
        corrupted[i] ^= 0x01;

        MemoryRecordInput input(corrupted.data(), corrupted.size());
        FrameArena arena;
        const uint8_t* payload = nullptr;
        uint64_t bytes = 0;
        FrameStatus status = ReadFrame(&input, arena, payload, bytes);

        const FrameStatus expected = (i < kFrameHeaderBytes)
            ? FrameStatus::LengthCrcMismatch : FrameStatus::DataCrcMismatch;
        if (status != expected) {
            LOG_ERROR() << "TestCorruption: Flipping byte " << i << " gave "
                << FrameStatusToString(status) << " instead of " << FrameStatusToString(expected);
            return false;
        }
    }

    LOG_INFO() << "TestCorruption: Passed";
    return true;
}

int main() {
    if (!TestEncodeLayout()) {
        return -1;
    }
    if (!TestReadSequence()) {
        return -1;
    }
    if (!TestTruncation()) {
        return -1;
    }
    if (!TestCorruption()) {
        return -1;
    }

    LOG_INFO() << "All tests passed";
    return 0;
}
