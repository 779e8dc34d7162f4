#include "record_writer.hpp"

#include "record_frame.hpp"
#include "tools.hpp"

#include "example.pb.h"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <climits>


//------------------------------------------------------------------------------
// Serialization

static bool FillFeature(
    const std::string& key,
    const FeatureValue& value,
    recordloader::proto::Feature& feature)
{
    switch (value.Type) {
    case FeatureType::Byte:
        feature.mutable_bytes_list()->add_value(value.Bytes);
        return true;
    case FeatureType::Float:
        feature.mutable_float_list()->mutable_value()->Add(value.Floats.begin(), value.Floats.end());
        return true;
    case FeatureType::Int:
        feature.mutable_int64_list()->mutable_value()->Add(value.Ints.begin(), value.Ints.end());
        return true;
    case FeatureType::Unspecified:
        break;
    }

    LOG_ERROR() << "Cannot encode feature '" << key << "': type must be byte, float or int";
    return false;
}

static bool FillFeatures(const FeatureMap& features, recordloader::proto::Features& proto_features)
{
    auto& feature_map = *proto_features.mutable_feature();
    for (const auto& item : features) {
        if (!FillFeature(item.first, item.second, feature_map[item.first])) {
            return false;
        }
    }
    return true;
}

static bool SerializeDeterministic(
    const google::protobuf::MessageLite& message,
    std::string& serialized_out)
{
    serialized_out.clear();
    {
        google::protobuf::io::StringOutputStream string_stream(&serialized_out);
        google::protobuf::io::CodedOutputStream coded_stream(&string_stream);
        coded_stream.SetSerializationDeterministic(true);
        if (!message.SerializeToCodedStream(&coded_stream)) {
            LOG_ERROR() << "Failed to serialize " << message.GetTypeName();
            return false;
        }
    }
    return true;
}

bool SerializeExample(const FeatureMap& features, std::string& serialized_out)
{
    recordloader::proto::Example example;
    if (!FillFeatures(features, *example.mutable_features())) {
        return false;
    }
    return SerializeDeterministic(example, serialized_out);
}

bool SerializeSequenceExample(
    const FeatureMap& context,
    const FeatureListMap& feature_lists,
    std::string& serialized_out)
{
    recordloader::proto::SequenceExample example;
    if (!FillFeatures(context, *example.mutable_context())) {
        return false;
    }

    auto& list_map = *example.mutable_feature_lists()->mutable_feature_list();
    for (const auto& item : feature_lists) {
        recordloader::proto::FeatureList& list = list_map[item.first];
        for (const auto& value : item.second) {
            if (!FillFeature(item.first, value, *list.add_feature())) {
                return false;
            }
        }
    }

    return SerializeDeterministic(example, serialized_out);
}


//------------------------------------------------------------------------------
// RecordWriter

bool RecordWriter::Open(
    const std::string& data_file_path,
    CompressionType compression)
{
    Close();

    data_file_path_ = data_file_path;
    compression_ = compression;
    record_count_ = 0;
    bytes_written_ = 0;

    if (compression_ == CompressionType::Gzip) {
        gz_file_ = gzopen(data_file_path_.c_str(), "wb");
        if (!gz_file_) {
            LOG_ERROR() << "RecordWriter: Failed to open file: " << data_file_path_;
            return false;
        }
    } else {
        file_.open(data_file_path_, std::ios::binary | std::ios::trunc);
        if (!file_) {
            LOG_ERROR() << "RecordWriter: Failed to open file: " << data_file_path_;
            return false;
        }
    }

    return true;
}

bool RecordWriter::WriteBytes(const void* data, uint64_t bytes)
{
    if (gz_file_) {
        const uint8_t* ptr = static_cast<const uint8_t*>(data);
        uint64_t remaining = bytes;
        while (remaining > 0) {
            unsigned request = remaining > INT_MAX ? INT_MAX : static_cast<unsigned>( remaining );
            int r = gzwrite(gz_file_, ptr, request);
            if (r <= 0) {
                int errnum = 0;
                LOG_ERROR() << "RecordWriter: Failed to write to " << data_file_path_
                    << ": " << gzerror(gz_file_, &errnum);
                return false;
            }
            ptr += r;
            remaining -= static_cast<uint64_t>( r );
        }
    } else {
        if (!file_.is_open()) {
            LOG_ERROR() << "RecordWriter: Write called before Open";
            return false;
        }
        file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>( bytes ));
        if (file_.fail()) {
            LOG_ERROR() << "RecordWriter: Failed to write to " << data_file_path_;
            return false;
        }
    }

    bytes_written_ += bytes;
    return true;
}

bool RecordWriter::WriteRecord(const void* payload, uint64_t bytes)
{
    uint8_t header[kFrameHeaderBytes];
    uint8_t footer[kFrameFooterBytes];
    EncodeFrameHeader(bytes, header);
    EncodeFrameFooter(payload, bytes, footer);

    if (!WriteBytes(header, kFrameHeaderBytes) ||
        (bytes > 0 && !WriteBytes(payload, bytes)) ||
        !WriteBytes(footer, kFrameFooterBytes)) {
        return false;
    }

    ++record_count_;
    return true;
}

bool RecordWriter::WriteExample(const FeatureMap& features)
{
    if (!SerializeExample(features, serialized_)) {
        return false;
    }
    return WriteRecord(serialized_.data(), serialized_.size());
}

bool RecordWriter::WriteSequenceExample(
    const FeatureMap& context,
    const FeatureListMap& feature_lists)
{
    if (!SerializeSequenceExample(context, feature_lists, serialized_)) {
        return false;
    }
    return WriteRecord(serialized_.data(), serialized_.size());
}

bool RecordWriter::Close()
{
    bool success = true;

    if (gz_file_) {
        if (gzclose(gz_file_) != Z_OK) {
            LOG_ERROR() << "RecordWriter: Failed to finish gzip stream: " << data_file_path_;
            success = false;
        }
        gz_file_ = nullptr;
    }

    if (file_.is_open()) {
        file_.close();
        if (file_.fail()) {
            LOG_ERROR() << "RecordWriter: Failed to close file: " << data_file_path_;
            success = false;
        }
    }

    return success;
}
