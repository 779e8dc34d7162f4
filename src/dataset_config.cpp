#include "dataset_config.hpp"

#include "mapped_file.hpp"
#include "record_input.hpp"
#include "tools.hpp"

#include <cpppath.h>
#include <ryml.hpp>
#include <ryml_std.hpp>

#include <cmath>

//------------------------------------------------------------------------------
// Helpers

static std::string ToString(ryml::csubstr str)
{
    return std::string(str.str, str.len);
}

static std::string ResolvePattern(const std::string& pattern, const std::string& base_dir)
{
    if (pattern.empty() || base_dir.empty() || pattern[0] == '/') {
        return pattern;
    }
    return cpppath::join({base_dir, pattern});
}

static bool ReadDescription(ryml::ConstNodeRef node, const char* name, FeatureDescription& description_out)
{
    description_out = FeatureDescription();

    // "description:" with no value means all fields
    if (node.has_val() && !node.is_seq() && !node.is_map()) {
        if (node.val_is_null() || node.val().empty()) {
            return true;
        }
        LOG_ERROR() << "Invalid " << name << ": expected a list of keys or a map of key: type";
        return false;
    }

    const int num_fields = (int)node.num_children();
    for (int i = 0; i < num_fields; ++i) {
        ryml::ConstNodeRef field = node[i];

        if (node.is_seq()) {
            std::string key;
            ryml::from_chars(field.val(), &key);
            description_out.Add(key);
            continue;
        }

        std::string key = ToString(field.key());
        std::string type_name;
        ryml::from_chars(field.val(), &type_name);

        FeatureType type = FeatureType::Unspecified;
        if (!ParseFeatureType(type_name, type)) {
            LOG_ERROR() << "Invalid " << name << " entry for key '" << key << "'";
            return false;
        }
        description_out.Add(key, type);
    }

    return true;
}


//------------------------------------------------------------------------------
// DatasetConfig

bool DatasetConfig::Read(const std::string& yaml_file_path) {
    MappedFileReader config_reader;
    if (!config_reader.Open(yaml_file_path)) {
        LOG_ERROR() << "Failed to open dataset config at " << yaml_file_path;
        return false;
    }

    if (config_reader.GetSize() == 0) {
        LOG_ERROR() << "Dataset config is empty: " << yaml_file_path;
        return false;
    }

    std::string yaml_text((const char*)config_reader.GetData(), config_reader.GetSize());

    std::string base_dir = cpppath::dirname(yaml_file_path);
    if (!Parse(yaml_text, base_dir)) {
        LOG_ERROR() << "Invalid dataset config: " << yaml_file_path;
        return false;
    }
    return true;
}

bool DatasetConfig::Parse(const std::string& yaml_text, const std::string& base_dir) {
    *this = DatasetConfig();

    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(yaml_text));
    ryml::ConstNodeRef root = tree.crootref();

    if (!root.is_map() || !root.has_child("data_pattern") || !root.has_child("splits")) {
        LOG_ERROR() << "Dataset config must be a map with data_pattern and splits";
        return false;
    }

    ryml::from_chars(root["data_pattern"].val(), &data_pattern_);
    data_pattern_ = ResolvePattern(data_pattern_, base_dir);

    if (root.has_child("index_pattern")) {
        ryml::from_chars(root["index_pattern"].val(), &index_pattern_);
        index_pattern_ = ResolvePattern(index_pattern_, base_dir);
    }

    if (root.has_child("compression")) {
        ryml::ConstNodeRef compression = root["compression"];
        if (!compression.val_is_null()) {
            ryml::from_chars(compression.val(), &compression_);
        }
    }
    CompressionType compression_type;
    if (!ParseCompressionType(compression_, compression_type)) {
        return false;
    }

    if (root.has_child("infinite") && !ryml::from_chars(root["infinite"].val(), &infinite_)) {
        LOG_ERROR() << "Invalid infinite flag: expected true or false";
        return false;
    }
    if (root.has_child("shuffle_queue_size") && !ryml::from_chars(root["shuffle_queue_size"].val(), &shuffle_queue_size_)) {
        LOG_ERROR() << "Invalid shuffle_queue_size: expected a non-negative integer";
        return false;
    }
    if (root.has_child("seed") && !ryml::from_chars(root["seed"].val(), &seed_)) {
        LOG_ERROR() << "Invalid seed: expected a non-negative integer";
        return false;
    }

    ryml::ConstNodeRef splits = root["splits"];
    if (!splits.is_map() || splits.num_children() == 0) {
        LOG_ERROR() << "Invalid splits: expected a non-empty map of split: weight";
        return false;
    }

    const int num_splits = (int)splits.num_children();
    for (int i = 0; i < num_splits; ++i) {
        ryml::ConstNodeRef split = splits[i];
        std::string name = ToString(split.key());

        double weight = 0.0;
        if (!split.has_val() || !ryml::from_chars(split.val(), &weight) ||
            !(weight > 0.0) || !std::isfinite(weight)) {
            LOG_ERROR() << "Invalid weight for split '" << name << "': weights must be positive numbers";
            return false;
        }

        for (const auto& existing : splits_) {
            if (existing.first == name) {
                LOG_ERROR() << "Duplicate split '" << name << "'";
                return false;
            }
        }

        splits_.emplace_back(name, weight);
    }

    if (root.has_child("description") &&
        !ReadDescription(root["description"], "description", description_)) {
        return false;
    }

    if (root.has_child("sequence_description")) {
        sequence_ = true;
        if (!ReadDescription(root["sequence_description"], "sequence_description", sequence_description_)) {
            return false;
        }
    }

    return true;
}
