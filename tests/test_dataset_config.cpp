#include "dataset_config.hpp"

#include "tools.hpp"

#include <unistd.h>

#include <fstream>
#include <string>

bool TestFullConfig() {
    const std::string yaml =
        "data_pattern: \"shards/{}.tfrecord\"\n"
        "index_pattern: \"/abs/shards/{}.tfindex\"\n"
        "compression: gzip\n"
        "infinite: false\n"
        "shuffle_queue_size: 256\n"
        "seed: 99\n"
        "splits:\n"
        "  books: 0.8\n"
        "  news: 0.2\n"
        "description:\n"
        "  text: byte\n"
        "  label: int\n"
        "  scores: float\n"
        "sequence_description: [frames, tokens]\n";

    DatasetConfig config;
    if (!config.Parse(yaml, "/data/root")) {
        LOG_ERROR() << "TestFullConfig: Parse failed";
        return false;
    }

    if (config.data_pattern_ != "/data/root/shards/{}.tfrecord" ||
        config.index_pattern_ != "/abs/shards/{}.tfindex") {
        LOG_ERROR() << "TestFullConfig: Patterns not resolved: " << config.data_pattern_ << ", " << config.index_pattern_;
        return false;
    }
    if (config.compression_ != "gzip" || config.infinite_ || config.shuffle_queue_size_ != 256 || config.seed_ != 99) {
        LOG_ERROR() << "TestFullConfig: Scalar fields mismatch";
        return false;
    }
    if (config.splits_.size() != 2 ||
        config.splits_[0].first != "books" || config.splits_[0].second != 0.8 ||
        config.splits_[1].first != "news" || config.splits_[1].second != 0.2) {
        LOG_ERROR() << "TestFullConfig: Splits mismatch";
        return false;
    }

    const auto& fields = config.description_.Fields;
    if (fields.size() != 3 ||
        fields[0].first != "text" || fields[0].second != FeatureType::Byte ||
        fields[1].first != "label" || fields[1].second != FeatureType::Int ||
        fields[2].first != "scores" || fields[2].second != FeatureType::Float) {
        LOG_ERROR() << "TestFullConfig: Description mismatch";
        return false;
    }

    const auto& sequence_fields = config.sequence_description_.Fields;
    if (!config.sequence_ || sequence_fields.size() != 2 ||
        sequence_fields[0].first != "frames" || sequence_fields[0].second != FeatureType::Unspecified ||
        sequence_fields[1].first != "tokens") {
        LOG_ERROR() << "TestFullConfig: Sequence description mismatch";
        return false;
    }

    if (FormatSplitPath(config.data_pattern_, "news") != "/data/root/shards/news.tfrecord") {
        LOG_ERROR() << "TestFullConfig: Split path formatting failed";
        return false;
    }

    LOG_INFO() << "TestFullConfig: Passed";
    return true;
}

bool TestDefaults() {
    DatasetConfig config;
    if (!config.Parse("data_pattern: \"{}.tfrecord\"\nsplits: {train: 1}\n", "")) {
        LOG_ERROR() << "TestDefaults: Parse failed";
        return false;
    }

    if (config.data_pattern_ != "{}.tfrecord" || !config.index_pattern_.empty() ||
        config.compression_ != "none" || !config.infinite_ || config.shuffle_queue_size_ != 0 ||
        config.seed_ != 0 || config.sequence_ || !config.description_.IsEmpty()) {
        LOG_ERROR() << "TestDefaults: Unexpected defaults";
        return false;
    }

    LOG_INFO() << "TestDefaults: Passed";
    return true;
}

bool TestConfigurationErrors() {
    const char* bad_configs[] = {
        // No splits
        "data_pattern: \"{}.tfrecord\"\n",
        // Empty split table
        "data_pattern: \"{}.tfrecord\"\nsplits: {}\n",
        // Non-positive weights
        "data_pattern: \"{}.tfrecord\"\nsplits: {a: 0}\n",
        "data_pattern: \"{}.tfrecord\"\nsplits: {a: 1, b: -0.5}\n",
        // Non-numeric weight
        "data_pattern: \"{}.tfrecord\"\nsplits: {a: lots}\n",
        // Unknown compression
        "data_pattern: \"{}.tfrecord\"\ncompression: zstd\nsplits: {a: 1}\n",
        // Unknown feature type
        "data_pattern: \"{}.tfrecord\"\nsplits: {a: 1}\ndescription: {x: double}\n",
        // Duplicate split
        "data_pattern: \"{}.tfrecord\"\nsplits: {a: 1, a: 2}\n",
    };

    for (const char* yaml : bad_configs) {
        DatasetConfig config;
        if (config.Parse(yaml, "")) {
            LOG_ERROR() << "TestConfigurationErrors: Accepted invalid config:\n" << yaml;
            return false;
        }
    }

    LOG_INFO() << "TestConfigurationErrors: Passed";
    return true;
}

bool TestReadFile() {
    const std::string path = "test_dataset_config.yaml";
    {
        std::ofstream file(path);
        file << "data_pattern: \"parts/{}.tfrecord\"\n"
             << "splits:\n"
             << "  only: 2.5\n";
    }

    DatasetConfig config;
    if (!config.Read(path)) {
        LOG_ERROR() << "TestReadFile: Read failed";
        return false;
    }
    unlink(path.c_str());

    if (config.splits_.size() != 1 || config.splits_[0].second != 2.5) {
        LOG_ERROR() << "TestReadFile: Wrong splits";
        return false;
    }
    if (!EndsWith(config.data_pattern_, "parts/{}.tfrecord")) {
        LOG_ERROR() << "TestReadFile: Wrong data pattern " << config.data_pattern_;
        return false;
    }

    if (config.Read("missing_dataset_config.yaml")) {
        LOG_ERROR() << "TestReadFile: Read a missing file";
        return false;
    }

    LOG_INFO() << "TestReadFile: Passed";
    return true;
}

int main() {
    if (!TestFullConfig()) {
        return -1;
    }
    if (!TestDefaults()) {
        return -1;
    }
    if (!TestConfigurationErrors()) {
        return -1;
    }
    if (!TestReadFile()) {
        return -1;
    }

    LOG_INFO() << "All tests passed";
    return 0;
}
