#include "feature_decoder.hpp"

#include "tools.hpp"

#include <algorithm>
#include <sstream>
#include <vector>


//------------------------------------------------------------------------------
// DecodeStatus

const char* DecodeStatusToString(DecodeStatus status)
{
    switch (status) {
    case DecodeStatus::Ok: return "Ok";
    case DecodeStatus::ParseFailed: return "ParseFailed";
    case DecodeStatus::MissingKey: return "MissingKey";
    case DecodeStatus::TypeMismatch: return "TypeMismatch";
    }
    return "Unknown";
}


//------------------------------------------------------------------------------
// FeatureDecoder

void FeatureDecoder::SetDescription(const FeatureDescription& description)
{
    sequence_ = false;
    context_description_ = description;
    sequence_description_ = FeatureDescription();
}

void FeatureDecoder::SetSequenceDescription(
    const FeatureDescription& context_description,
    const FeatureDescription& sequence_description)
{
    sequence_ = true;
    context_description_ = context_description;
    sequence_description_ = sequence_description;
}

DecodeStatus FeatureDecoder::Decode(const uint8_t* payload, uint64_t bytes, DecodedRecord& record_out)
{
    record_out.Clear();
    last_error_.clear();

    if (bytes > static_cast<uint64_t>( INT32_MAX )) {
        last_error_ = "Record payload is too large to decode";
        LOG_ERROR() << last_error_ << " (" << bytes << " bytes)";
        return DecodeStatus::ParseFailed;
    }

    if (!sequence_) {
        example_.Clear();
        if (!example_.ParseFromArray(payload, static_cast<int>( bytes ))) {
            last_error_ = "Failed to parse record payload as a flat record";
            LOG_ERROR() << last_error_ << " (" << bytes << " bytes)";
            return DecodeStatus::ParseFailed;
        }

        record_out.Kind = RecordKind::Example;
        return ExtractFeatures(example_.features(), context_description_, record_out.Features);
    }

    sequence_example_.Clear();
    if (!sequence_example_.ParseFromArray(payload, static_cast<int>( bytes ))) {
        last_error_ = "Failed to parse record payload as a sequence record";
        LOG_ERROR() << last_error_ << " (" << bytes << " bytes)";
        return DecodeStatus::ParseFailed;
    }

    record_out.Kind = RecordKind::SequenceExample;

    DecodeStatus status = ExtractFeatures(
        sequence_example_.context(),
        context_description_,
        record_out.Features);
    if (status != DecodeStatus::Ok) {
        return status;
    }

    return ExtractFeatureLists(
        sequence_example_.feature_lists(),
        sequence_description_,
        record_out.FeatureLists);
}

template<typename MapT>
DecodeStatus FeatureDecoder::ReportMissingKey(const std::string& key, const MapT& available)
{
    // Map iteration order is unspecified, so sort for a stable message
    std::vector<std::string> keys;
    for (const auto& item : available) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());

    std::ostringstream oss;
    oss << "Key '" << key << "' does not exist (select from [";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << "'" << keys[i] << "'";
    }
    oss << "])";

    last_error_ = oss.str();
    LOG_ERROR() << last_error_;
    return DecodeStatus::MissingKey;
}

DecodeStatus FeatureDecoder::ExtractFeatures(
    const recordloader::proto::Features& features,
    const FeatureDescription& description,
    FeatureMap& features_out)
{
    const auto& feature_map = features.feature();

    if (description.IsEmpty()) {
        for (const auto& item : feature_map) {
            DecodeStatus status = ProcessFeature(item.second, FeatureType::Unspecified, item.first, features_out[item.first]);
            if (status != DecodeStatus::Ok) {
                return status;
            }
        }
        return DecodeStatus::Ok;
    }

    for (const auto& field : description.Fields) {
        auto found = feature_map.find(field.first);
        if (found == feature_map.end()) {
            return ReportMissingKey(field.first, feature_map);
        }

        DecodeStatus status = ProcessFeature(found->second, field.second, field.first, features_out[field.first]);
        if (status != DecodeStatus::Ok) {
            return status;
        }
    }

    return DecodeStatus::Ok;
}

DecodeStatus FeatureDecoder::ExtractFeatureLists(
    const recordloader::proto::FeatureLists& feature_lists,
    const FeatureDescription& description,
    FeatureListMap& lists_out)
{
    const auto& list_map = feature_lists.feature_list();

    auto extract = [this, &lists_out](const std::string& key, const recordloader::proto::FeatureList& list, FeatureType type) {
        std::vector<FeatureValue>& values = lists_out[key];
        values.resize(list.feature_size());
        for (int i = 0; i < list.feature_size(); ++i) {
            DecodeStatus status = ProcessFeature(list.feature(i), type, key, values[i]);
            if (status != DecodeStatus::Ok) {
                return status;
            }
        }
        return DecodeStatus::Ok;
    };

    if (description.IsEmpty()) {
        for (const auto& item : list_map) {
            DecodeStatus status = extract(item.first, item.second, FeatureType::Unspecified);
            if (status != DecodeStatus::Ok) {
                return status;
            }
        }
        return DecodeStatus::Ok;
    }

    for (const auto& field : description.Fields) {
        auto found = list_map.find(field.first);
        if (found == list_map.end()) {
            return ReportMissingKey(field.first, list_map);
        }

        DecodeStatus status = extract(field.first, found->second, field.second);
        if (status != DecodeStatus::Ok) {
            return status;
        }
    }

    return DecodeStatus::Ok;
}

DecodeStatus FeatureDecoder::ProcessFeature(
    const recordloader::proto::Feature& feature,
    FeatureType requested,
    const std::string& key,
    FeatureValue& value_out)
{
    // Each feature holds exactly one of the three list kinds
    FeatureType inferred = FeatureType::Unspecified;
    switch (feature.kind_case()) {
    case recordloader::proto::Feature::kBytesList:
        inferred = FeatureType::Byte;
        break;
    case recordloader::proto::Feature::kFloatList:
        inferred = FeatureType::Float;
        break;
    case recordloader::proto::Feature::kInt64List:
        inferred = FeatureType::Int;
        break;
    case recordloader::proto::Feature::KIND_NOT_SET:
        break;
    }

    if (inferred == FeatureType::Unspecified) {
        last_error_ = "Feature '" + key + "' holds no value list";
        LOG_ERROR() << last_error_;
        return DecodeStatus::ParseFailed;
    }

    if (requested != FeatureType::Unspecified && requested != inferred) {
        last_error_ = std::string("Incompatible type '") + FeatureTypeToString(requested) +
            "' for '" + key + "' (should be '" + FeatureTypeToString(inferred) + "')";
        LOG_ERROR() << last_error_;
        return DecodeStatus::TypeMismatch;
    }

    value_out = FeatureValue();
    value_out.Type = inferred;

    switch (inferred) {
    case FeatureType::Byte:
        if (feature.bytes_list().value_size() > 0) {
            value_out.Bytes = feature.bytes_list().value(0);
        }
        break;
    case FeatureType::Float: {
        const auto& values = feature.float_list().value();
        value_out.Floats.assign(values.begin(), values.end());
        break;
    }
    case FeatureType::Int: {
        const auto& values = feature.int64_list().value();
        value_out.Ints.assign(values.begin(), values.end());
        break;
    }
    case FeatureType::Unspecified:
        break;
    }

    return DecodeStatus::Ok;
}
