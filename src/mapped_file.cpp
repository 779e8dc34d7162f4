#include "mapped_file.hpp"

#include "tools.hpp"

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>


//------------------------------------------------------------------------------
// MappedFileReader

bool MappedFileReader::Open(const std::string& name) {
    Close();

    fd_ = open(name.c_str(), O_RDONLY);
    if (fd_ == -1) {
        LOG_ERROR() << "MappedFileReader: Failed to open file: " << name;
        return false;
    }

    struct stat sb;
    if (fstat(fd_, &sb) == -1) {
        LOG_ERROR() << "MappedFileReader: Failed to stat file: " << name;
        Close();
        return false;
    }

    size_ = sb.st_size;

    // Zero-length files cannot be mapped but are valid (empty) inputs
    if (size_ == 0) {
        is_valid_ = true;
        return true;
    }

    void* data = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (data == MAP_FAILED) {
        LOG_ERROR() << "MappedFileReader: Failed to map file: " << name;
        Close();
        return false;
    }

    // Records are mostly consumed front to back
    madvise(data, size_, MADV_SEQUENTIAL);

    data_ = data;
    is_valid_ = true;
    return true;
}

void MappedFileReader::Close() {
    if (data_) {
        munmap((void*)data_, size_);
        data_ = nullptr;
    }
    if (fd_ != -1) {
        close(fd_);
        fd_ = -1;
    }
    size_ = 0;
    is_valid_ = false;
}
