/*
    Byte sources for container files.

    The frame decoder only needs sequential reads with occasional seeks, so
    plain files are memory mapped and gzip files are decompressed through
    zlib.  For gzip the logical size is only known after decompressing the
    whole stream once, which Open() does up front.
*/

#pragma once

#include "mapped_file.hpp"

#include <zlib.h>

#include <cstdint>
#include <string>
#include <memory>


//------------------------------------------------------------------------------
// CompressionType

enum class CompressionType {
    None,
    Gzip
};

// Accepts "" / "none" and "gzip".  Anything else is a configuration error.
bool ParseCompressionType(const std::string& tag, CompressionType& type_out);

const char* CompressionTypeToString(CompressionType type);


//------------------------------------------------------------------------------
// RecordInput

class RecordInput {
public:
    virtual ~RecordInput() {}

    virtual bool Open(const std::string& file_path) = 0;
    virtual void Close() = 0;

    // Logical (decompressed) size of the stream
    virtual uint64_t GetSize() const = 0;

    virtual bool Seek(uint64_t offset) = 0;
    virtual uint64_t Tell() const = 0;

    // Returns the number of bytes copied, which is short only at the end of
    // the stream, or -1 on an I/O error.
    virtual int64_t Read(void* dest, uint64_t bytes) = 0;
};

std::unique_ptr<RecordInput> CreateRecordInput(CompressionType type);


//------------------------------------------------------------------------------
// MappedRecordInput

class MappedRecordInput : public RecordInput {
public:
    ~MappedRecordInput() override {
        Close();
    }

    bool Open(const std::string& file_path) override;
    void Close() override;

    uint64_t GetSize() const override { return File.GetSize(); }

    bool Seek(uint64_t offset) override;
    uint64_t Tell() const override { return Offset; }
    int64_t Read(void* dest, uint64_t bytes) override;

private:
    MappedFileReader File;
    uint64_t Offset = 0;
};


//------------------------------------------------------------------------------
// GzipRecordInput

class GzipRecordInput : public RecordInput {
public:
    ~GzipRecordInput() override {
        Close();
    }

    bool Open(const std::string& file_path) override;
    void Close() override;

    uint64_t GetSize() const override { return Size; }

    bool Seek(uint64_t offset) override;
    uint64_t Tell() const override { return Offset; }
    int64_t Read(void* dest, uint64_t bytes) override;

private:
    std::string FilePath;
    gzFile File = nullptr;
    uint64_t Size = 0;
    uint64_t Offset = 0;

    bool MeasureSize();
};
