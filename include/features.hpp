/*
    Decoded record types shared by the writer, decoder and pipeline stages.
*/

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>


//------------------------------------------------------------------------------
// FeatureType

enum class FeatureType {
    // Not declared: accepted as whatever the payload holds
    Unspecified,

    // Raw byte string ("byte")
    Byte,

    // 32-bit floats ("float")
    Float,

    // 64-bit signed integers ("int")
    Int
};

// Accepts "byte", "float" and "int"
bool ParseFeatureType(const std::string& name, FeatureType& type_out);

const char* FeatureTypeToString(FeatureType type);


//------------------------------------------------------------------------------
// FeatureValue

struct FeatureValue {
    FeatureType Type = FeatureType::Unspecified;

    // Byte: the first value of the bytes list (empty if the list is empty)
    std::string Bytes;

    std::vector<float> Floats;
    std::vector<int64_t> Ints;

    static FeatureValue FromBytes(const std::string& bytes);
    static FeatureValue FromFloats(const std::vector<float>& floats);
    static FeatureValue FromInts(const std::vector<int64_t>& ints);

    bool operator==(const FeatureValue& other) const;
    bool operator!=(const FeatureValue& other) const { return !(*this == other); }
};

using FeatureMap = std::map<std::string, FeatureValue>;
using FeatureListMap = std::map<std::string, std::vector<FeatureValue>>;


//------------------------------------------------------------------------------
// DecodedRecord

enum class RecordKind {
    // Flat name -> value record
    Example,

    // Context record plus per-field sequences of values
    SequenceExample
};

struct DecodedRecord {
    RecordKind Kind = RecordKind::Example;

    // Example features, or the context of a sequence record
    FeatureMap Features;

    // Sequence records only
    FeatureListMap FeatureLists;

    void Clear() {
        Kind = RecordKind::Example;
        Features.clear();
        FeatureLists.clear();
    }
};


//------------------------------------------------------------------------------
// FeatureDescription

/*
    Which fields to extract, in order, with an optional declared type each.
    An empty description means every field present, untyped.
*/
struct FeatureDescription {
    std::vector<std::pair<std::string, FeatureType>> Fields;

    void Add(const std::string& name, FeatureType type = FeatureType::Unspecified) {
        Fields.emplace_back(name, type);
    }

    bool IsEmpty() const { return Fields.empty(); }
};
