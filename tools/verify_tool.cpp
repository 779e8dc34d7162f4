#include "record_index.hpp"
#include "tools.hpp"

#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    if (argc < 2 || argc > 4) {
        LOG_ERROR() << "Usage: " << argv[0] << " <container> [index] [none|gzip]";
        LOG_FLUSH();
        return 1;
    }

    const std::string data_file_path = argv[1];
    const std::string index_file_path = argc >= 3 ? argv[2] : std::string();

    CompressionType compression = CompressionType::None;
    if (argc == 4 && !ParseCompressionType(argv[3], compression)) {
        LOG_FLUSH();
        return 1;
    }

    int result = 0;

    std::vector<IndexEntry> entries;
    FrameStatus status = ScanContainer(data_file_path, compression, entries);
    if (status != FrameStatus::EndOfStream) {
        LOG_ERROR() << data_file_path << ": " << FrameStatusToString(status)
            << " after " << entries.size() << " valid records";
        result = 2;
    } else {
        LOG_INFO() << data_file_path << ": " << entries.size() << " valid records";
    }

    if (result == 0 && !index_file_path.empty()) {
        if (!VerifyIndex(data_file_path, index_file_path, compression)) {
            result = 2;
        } else {
            LOG_INFO() << index_file_path << ": index matches container";
        }
    }

    LOG_FLUSH();
    return result;
}
