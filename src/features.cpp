#include "features.hpp"

#include "tools.hpp"


//------------------------------------------------------------------------------
// FeatureType

bool ParseFeatureType(const std::string& name, FeatureType& type_out)
{
    if (name == "byte") {
        type_out = FeatureType::Byte;
    } else if (name == "float") {
        type_out = FeatureType::Float;
    } else if (name == "int") {
        type_out = FeatureType::Int;
    } else {
        LOG_ERROR() << "Unknown feature type '" << name << "': expected byte, float or int";
        return false;
    }
    return true;
}

const char* FeatureTypeToString(FeatureType type)
{
    switch (type) {
    case FeatureType::Unspecified: return "unspecified";
    case FeatureType::Byte: return "byte";
    case FeatureType::Float: return "float";
    case FeatureType::Int: return "int";
    }
    return "unknown";
}


//------------------------------------------------------------------------------
// FeatureValue

FeatureValue FeatureValue::FromBytes(const std::string& bytes)
{
    FeatureValue value;
    value.Type = FeatureType::Byte;
    value.Bytes = bytes;
    return value;
}

FeatureValue FeatureValue::FromFloats(const std::vector<float>& floats)
{
    FeatureValue value;
    value.Type = FeatureType::Float;
    value.Floats = floats;
    return value;
}

FeatureValue FeatureValue::FromInts(const std::vector<int64_t>& ints)
{
    FeatureValue value;
    value.Type = FeatureType::Int;
    value.Ints = ints;
    return value;
}

bool FeatureValue::operator==(const FeatureValue& other) const
{
    return Type == other.Type &&
        Bytes == other.Bytes &&
        Floats == other.Floats &&
        Ints == other.Ints;
}
