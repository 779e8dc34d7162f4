#include "record_index.hpp"
#include "tools.hpp"

#include <sys/stat.h>

#include <cstdlib>
#include <string>

static void PrintUsage(const char* program)
{
    LOG_ERROR() << "Usage: " << program << " <container" << RECORDLOADER_CONTAINER_SUFFIX
        << "> <index" << RECORDLOADER_INDEX_SUFFIX << "> [none|gzip]";
    LOG_ERROR() << "       " << program << " <directory> [worker_count]";
}

static bool IsDirectory(const std::string& path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

int main(int argc, char* argv[])
{
    int result = 0;

    if (argc >= 2 && IsDirectory(argv[1])) {
        if (argc > 3) {
            PrintUsage(argv[0]);
            result = 1;
        } else {
            const int worker_count = argc == 3 ? std::atoi(argv[2]) : 0;
            if (!IndexDirectory(argv[1], worker_count)) {
                result = 2;
            }
        }
    } else if (argc == 3 || argc == 4) {
        CompressionType compression = CompressionType::None;
        if (argc == 4 && !ParseCompressionType(argv[3], compression)) {
            PrintUsage(argv[0]);
            result = 1;
        } else if (!BuildIndex(argv[1], argv[2], compression)) {
            result = 2;
        }
    } else {
        PrintUsage(argv[0]);
        result = 1;
    }

    LOG_FLUSH();
    return result;
}
