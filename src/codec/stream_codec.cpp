#include "fswriter/stream_codec.hpp"
#include "fswriter/closer.hpp"
#include "fswriter/errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include <arrow/io/compressed.h>

namespace fswriter {

CompressionCodec::CompressionCodec(arrow::Compression::type type) : type_(type) {
    const std::string name = arrow::util::Codec::GetCodecAsString(type);
    if (type == arrow::Compression::UNCOMPRESSED) {
        throw std::invalid_argument("'uncompressed' is not a transfer encoding");
    }
    if (!arrow::util::Codec::IsAvailable(type)) {
        throw std::invalid_argument("Compression codec " + name + " is not available in this Arrow build");
    }

    auto codec_result = arrow::util::Codec::Create(type);
    if (!codec_result.ok()) {
        throw std::invalid_argument("Failed to create codec " + name + ": " +
                                    codec_result.status().ToString());
    }
    codec_ = std::move(codec_result).ValueOrDie();

    // CompressedOutputStream needs a streaming compressor
    if (!codec_->MakeCompressor().ok()) {
        throw std::invalid_argument("Compression codec " + name + " does not support streaming");
    }
}

std::string CompressionCodec::tag() const {
    return arrow::util::Codec::GetCodecAsString(type_);
}

std::shared_ptr<arrow::io::OutputStream> CompressionCodec::encode_output_stream(
    std::shared_ptr<arrow::io::OutputStream> raw) {
    return value_or_throw(
        arrow::io::CompressedOutputStream::Make(codec_.get(), raw),
        "Failed to open " + tag() + " output stream");
}

std::shared_ptr<arrow::io::InputStream> CompressionCodec::decode_input_stream(
    std::shared_ptr<arrow::io::InputStream> raw) {
    return value_or_throw(
        arrow::io::CompressedInputStream::Make(codec_.get(), raw),
        "Failed to open " + tag() + " input stream");
}

StreamCodecPtr make_codec(const std::string& name) {
    std::string normalized;
    for (char c : name) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (normalized == Base64Codec::TAG) {
        return std::make_shared<Base64Codec>();
    }

    auto type = arrow::util::Codec::GetCompressionType(normalized);
    if (!type.ok()) {
        throw std::invalid_argument("Unknown codec: " + name);
    }
    return std::make_shared<CompressionCodec>(type.ValueOrDie());
}

std::vector<StreamCodecPtr> make_codecs(const std::string& names) {
    std::vector<StreamCodecPtr> codecs;
    std::stringstream ss(names);
    std::string item;
    while (std::getline(ss, item, ',')) {
        bool blank = std::all_of(item.begin(), item.end(),
                                 [](unsigned char c) { return std::isspace(c); });
        if (!blank) {
            codecs.push_back(make_codec(item));
        }
    }
    return codecs;
}

std::shared_ptr<arrow::io::OutputStream> encode_chain(
    std::shared_ptr<arrow::io::OutputStream> raw,
    const std::vector<StreamCodecPtr>& codecs,
    Closer* closer) {

    std::shared_ptr<arrow::io::OutputStream> out = std::move(raw);
    if (closer) {
        closer->register_stream(out);
    }

    for (auto it = codecs.rbegin(); it != codecs.rend(); ++it) {
        out = (*it)->encode_output_stream(out);
        if (closer) {
            closer->register_stream(out);
        }
    }
    return out;
}

std::shared_ptr<arrow::io::InputStream> decode_chain(
    std::shared_ptr<arrow::io::InputStream> raw,
    const std::vector<StreamCodecPtr>& codecs) {

    std::shared_ptr<arrow::io::InputStream> in = std::move(raw);
    for (auto it = codecs.rbegin(); it != codecs.rend(); ++it) {
        in = (*it)->decode_input_stream(in);
    }
    return in;
}

TransferMetadata::TransferMetadata(const std::vector<StreamCodecPtr>& codecs) {
    encodings_.reserve(codecs.size());
    for (const auto& codec : codecs) {
        encodings_.push_back(codec->tag());
    }
}

nlohmann::json TransferMetadata::to_json() const {
    return nlohmann::json{{"transferEncoding", encodings_}};
}

TransferMetadata TransferMetadata::from_json(const nlohmann::json& j) {
    TransferMetadata metadata;
    if (j.contains("transferEncoding")) {
        metadata.encodings_ = j.at("transferEncoding").get<std::vector<std::string>>();
    }
    return metadata;
}

}  // namespace fswriter
