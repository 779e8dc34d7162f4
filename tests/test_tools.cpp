#include <tools.hpp>

#include <atomic>
#include <cstring>
#include <set>
#include <string>
#include <vector>

bool testDeriveSeed() {
    const uint64_t base = DeriveSeed(42, "data/train.tfrecord", 0);

    // Stable for the same inputs
    if (DeriveSeed(42, "data/train.tfrecord", 0) != base) {
        return false;
    }

    // Each input changes the result
    std::set<uint64_t> seeds;
    seeds.insert(base);
    seeds.insert(DeriveSeed(43, "data/train.tfrecord", 0));
    seeds.insert(DeriveSeed(42, "data/valid.tfrecord", 0));
    for (uint32_t worker_index = 1; worker_index < 16; ++worker_index) {
        seeds.insert(DeriveSeed(42, "data/train.tfrecord", worker_index));
    }
    if (seeds.size() != 18) {
        return false;
    }

    LOG_INFO() << "testDeriveSeed: passed";
    return true;
}

bool testFormatSplitPath() {
    if (FormatSplitPath("data/{}.tfrecord", "train") != "data/train.tfrecord") {
        return false;
    }
    if (FormatSplitPath("{}/{}.tfindex", "news") != "news/news.tfindex") {
        return false;
    }
    if (FormatSplitPath("fixed.tfrecord", "train") != "fixed.tfrecord") {
        return false;
    }
    if (!EndsWith("a/b.tfrecord", ".tfrecord") || EndsWith("rec", ".tfrecord")) {
        return false;
    }

    LOG_INFO() << "testFormatSplitPath: passed";
    return true;
}

bool testLittleEndian() {
    uint8_t buffer[8];

    write_uint64_le(buffer, 0x0102030405060708ULL);
    const uint8_t expected64[8] = { 8, 7, 6, 5, 4, 3, 2, 1 };
    if (memcmp(buffer, expected64, 8) != 0 || read_uint64_le(buffer) != 0x0102030405060708ULL) {
        return false;
    }

    write_uint32_le(buffer, 0xa282ead8);
    const uint8_t expected32[4] = { 0xd8, 0xea, 0x82, 0xa2 };
    if (memcmp(buffer, expected32, 4) != 0 || read_uint32_le(buffer) != 0xa282ead8) {
        return false;
    }

    LOG_INFO() << "testLittleEndian: passed";
    return true;
}

bool testLoggerCallback() {
    std::vector<std::string> captured;
    std::mutex captured_mutex;

    Logger::getInstance().SetCallback([&](Logger::LogLevel level, const std::string& message) {
        if (level == Logger::WARN) {
            std::lock_guard<std::mutex> lock(captured_mutex);
            captured.push_back(message);
        }
    });

    LOG_WARN() << "queue under-filled: " << 3;
    LOG_FLUSH();

    Logger::getInstance().SetCallback(nullptr);

    std::lock_guard<std::mutex> lock(captured_mutex);
    if (captured.size() != 1 || captured[0] != "queue under-filled: 3") {
        return false;
    }

    LOG_INFO() << "testLoggerCallback: passed";
    return true;
}

int main() {
    if (!testDeriveSeed()) {
        LOG_ERROR() << "testDeriveSeed failed";
        return -1;
    }

    if (!testFormatSplitPath()) {
        LOG_ERROR() << "testFormatSplitPath failed";
        return -1;
    }

    if (!testLittleEndian()) {
        LOG_ERROR() << "testLittleEndian failed";
        return -1;
    }

    if (!testLoggerCallback()) {
        LOG_ERROR() << "testLoggerCallback failed";
        return -1;
    }

    LOG_INFO() << "All tests passed";
    return 0;
}
