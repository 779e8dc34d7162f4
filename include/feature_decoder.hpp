/*
    Maps a feature description onto an encoded record payload.

    Values are produced per declared type:
        byte  -> the first raw byte string of the field
        float -> std::vector<float>
        int   -> std::vector<int64_t>

    Integers are always widened to 64 bits regardless of the stored range.
*/

#pragma once

#include "features.hpp"

#include "example.pb.h"

#include <cstdint>
#include <string>


//------------------------------------------------------------------------------
// DecodeStatus

enum class DecodeStatus {
    Ok,

    // The payload is not a valid encoded record
    ParseFailed,

    // A described field is absent from the record
    MissingKey,

    // A described field holds a different value type than declared
    TypeMismatch
};

const char* DecodeStatusToString(DecodeStatus status);


//------------------------------------------------------------------------------
// FeatureDecoder

// This is not thread-safe.  Use one decoder per reader.
class FeatureDecoder {
public:
    // Decode flat records using this description (may be empty)
    void SetDescription(const FeatureDescription& description);

    // Decode sequence records: context fields and per-step feature lists
    void SetSequenceDescription(
        const FeatureDescription& context_description,
        const FeatureDescription& sequence_description);

    bool IsSequence() const { return sequence_; }

    DecodeStatus Decode(const uint8_t* payload, uint64_t bytes, DecodedRecord& record_out);

    // Human readable reason for the last failed Decode()
    const std::string& GetLastError() const { return last_error_; }

private:
    bool sequence_ = false;
    FeatureDescription context_description_;
    FeatureDescription sequence_description_;

    // Reused between records to avoid reallocating message storage
    recordloader::proto::Example example_;
    recordloader::proto::SequenceExample sequence_example_;

    std::string last_error_;

    DecodeStatus ExtractFeatures(
        const recordloader::proto::Features& features,
        const FeatureDescription& description,
        FeatureMap& features_out);
    DecodeStatus ExtractFeatureLists(
        const recordloader::proto::FeatureLists& feature_lists,
        const FeatureDescription& description,
        FeatureListMap& lists_out);
    DecodeStatus ProcessFeature(
        const recordloader::proto::Feature& feature,
        FeatureType requested,
        const std::string& key,
        FeatureValue& value_out);

    template<typename MapT>
    DecodeStatus ReportMissingKey(const std::string& key, const MapT& available);
};
