#pragma once

#include "features.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

//------------------------------------------------------------------------------
// DatasetConfig

/*
    YAML description of a multi-source dataset:

        data_pattern: "shards/{}.tfrecord"
        index_pattern: "shards/{}.tfindex"
        compression: gzip
        infinite: false
        shuffle_queue_size: 1024
        seed: 7
        splits:
          books: 0.8
          news: 0.2
        description:
          text: byte
          label: int
        sequence_description: [frames]

    Relative patterns are resolved against the directory of the YAML file.
*/
struct DatasetConfig {
    bool Read(const std::string& yaml_file_path);

    // base_dir is used to resolve relative patterns (may be empty)
    bool Parse(const std::string& yaml_text, const std::string& base_dir);

    std::string data_pattern_;
    std::string index_pattern_;
    std::string compression_ = "none";

    bool infinite_ = true;
    uint32_t shuffle_queue_size_ = 0;
    uint64_t seed_ = 0;

    // Split name -> weight, in file order
    std::vector<std::pair<std::string, double>> splits_;

    // sequence_ is set when a sequence_description key is present
    bool sequence_ = false;
    FeatureDescription description_;
    FeatureDescription sequence_description_;
};
