#ifndef FSWRITER_STREAM_CODEC_HPP
#define FSWRITER_STREAM_CODEC_HPP

#include <memory>
#include <string>
#include <vector>

#include <arrow/io/interfaces.h>
#include <arrow/util/compression.h>
#include <nlohmann/json.hpp>

namespace fswriter {

class Closer;

/**
 * A reversible byte-stream transformation applied between a record writer
 * and the bytes at rest.
 *
 * A codec must outlive every stream it creates.
 */
class StreamCodec {
public:
    virtual ~StreamCodec() = default;

    /**
     * Stable name of the encoding, recorded in TransferMetadata.
     */
    virtual std::string tag() const = 0;

    /**
     * Wrap a stream so that bytes written to the result reach `raw` encoded.
     * Closing the returned stream closes `raw`.
     */
    virtual std::shared_ptr<arrow::io::OutputStream> encode_output_stream(
        std::shared_ptr<arrow::io::OutputStream> raw) = 0;

    /**
     * Wrap a stream of encoded bytes so that reads return decoded bytes.
     */
    virtual std::shared_ptr<arrow::io::InputStream> decode_input_stream(
        std::shared_ptr<arrow::io::InputStream> raw) = 0;
};

using StreamCodecPtr = std::shared_ptr<StreamCodec>;

/**
 * Compression through an Arrow codec (gzip, zstd, lz4, brotli, bz2).
 * Only codecs with streaming support can be used.
 */
class CompressionCodec : public StreamCodec {
public:
    /**
     * @throws std::invalid_argument if the codec is unavailable or cannot stream
     */
    explicit CompressionCodec(arrow::Compression::type type);

    std::string tag() const override;

    std::shared_ptr<arrow::io::OutputStream> encode_output_stream(
        std::shared_ptr<arrow::io::OutputStream> raw) override;

    std::shared_ptr<arrow::io::InputStream> decode_input_stream(
        std::shared_ptr<arrow::io::InputStream> raw) override;

    arrow::Compression::type compression_type() const { return type_; }

private:
    arrow::Compression::type type_;
    std::shared_ptr<arrow::util::Codec> codec_;
};

/**
 * Base64 text encoding (RFC 4648, padded, no line breaks).
 */
class Base64Codec : public StreamCodec {
public:
    static constexpr const char* TAG = "base64";

    std::string tag() const override { return TAG; }

    std::shared_ptr<arrow::io::OutputStream> encode_output_stream(
        std::shared_ptr<arrow::io::OutputStream> raw) override;

    std::shared_ptr<arrow::io::InputStream> decode_input_stream(
        std::shared_ptr<arrow::io::InputStream> raw) override;
};

/**
 * Create a codec by name: "base64" or any Arrow compression name.
 * @throws std::invalid_argument for unknown or unusable names
 */
StreamCodecPtr make_codec(const std::string& name);

/**
 * Create codecs from a comma-separated list, keeping configuration order.
 */
std::vector<StreamCodecPtr> make_codecs(const std::string& names);

/**
 * Wrap `raw` in the codecs so that the first codec in `codecs` sees the
 * written bytes first. Codecs are therefore attached in reverse order, with
 * the last codec directly on top of `raw`.
 *
 * When a closer is given, `raw` and every layer are registered with it in
 * acquisition order.
 */
std::shared_ptr<arrow::io::OutputStream> encode_chain(
    std::shared_ptr<arrow::io::OutputStream> raw,
    const std::vector<StreamCodecPtr>& codecs,
    Closer* closer = nullptr);

/**
 * Inverse of encode_chain(): reads from the result return the bytes that
 * were originally written.
 */
std::shared_ptr<arrow::io::InputStream> decode_chain(
    std::shared_ptr<arrow::io::InputStream> raw,
    const std::vector<StreamCodecPtr>& codecs);

/**
 * Transfer encodings applied to a writer's output, in configuration order.
 * Consumers use it to know how to reverse the encoding.
 */
class TransferMetadata {
public:
    TransferMetadata() = default;
    explicit TransferMetadata(const std::vector<StreamCodecPtr>& codecs);

    const std::vector<std::string>& transfer_encodings() const { return encodings_; }
    bool empty() const { return encodings_.empty(); }

    nlohmann::json to_json() const;
    static TransferMetadata from_json(const nlohmann::json& j);

private:
    std::vector<std::string> encodings_;
};

}  // namespace fswriter

#endif  // FSWRITER_STREAM_CODEC_HPP
