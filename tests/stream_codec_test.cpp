#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include <arrow/buffer.h>
#include <arrow/io/memory.h>
#include <arrow/util/compression.h>

#include "fswriter/closer.hpp"
#include "fswriter/errors.hpp"
#include "fswriter/stream_codec.hpp"
#include "test_file_system.hpp"

namespace fswriter {
namespace test {

namespace {

std::string encode(const std::string& data, const std::vector<StreamCodecPtr>& codecs) {
    auto sink = value_or_throw(arrow::io::BufferOutputStream::Create(), "sink");
    Closer closer;
    auto out = encode_chain(sink, codecs, &closer);
    check_status(out->Write(data.data(), static_cast<int64_t>(data.size())), "write");
    closer.close();
    auto buffer = value_or_throw(sink->Finish(), "finish");
    return buffer->ToString();
}

std::string decode(const std::string& encoded, const std::vector<StreamCodecPtr>& codecs) {
    auto source = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(encoded));
    auto in = decode_chain(source, codecs);
    return read_all(*in);
}

bool gzip_available() {
    return arrow::util::Codec::IsAvailable(arrow::Compression::GZIP);
}

}  // namespace

TEST(StreamCodecTest, Base64EncodesWithPadding) {
    std::vector<StreamCodecPtr> codecs{make_codec("base64")};
    EXPECT_EQ(encode("hello", codecs), "aGVsbG8=");
    EXPECT_EQ(encode("", codecs), "");
    EXPECT_EQ(encode("abc", codecs), "YWJj");
}

TEST(StreamCodecTest, Base64EncodesAcrossSmallWrites) {
    auto sink = value_or_throw(arrow::io::BufferOutputStream::Create(), "sink");
    Closer closer;
    auto out = encode_chain(sink, {make_codec("base64")}, &closer);
    for (char c : std::string("hello world")) {
        check_status(out->Write(&c, 1), "write");
    }
    closer.close();
    EXPECT_EQ(value_or_throw(sink->Finish(), "finish")->ToString(), "aGVsbG8gd29ybGQ=");
}

TEST(StreamCodecTest, Base64RoundTripsLargeInput) {
    std::string data;
    for (int i = 0; i < 200000; ++i) {
        data.push_back(static_cast<char>(i % 251));
    }
    std::vector<StreamCodecPtr> codecs{make_codec("base64")};
    EXPECT_EQ(decode(encode(data, codecs), codecs), data);
}

TEST(StreamCodecTest, UnknownCodecThrows) {
    EXPECT_THROW(make_codec("rot13"), std::invalid_argument);
    EXPECT_THROW(make_codec("uncompressed"), std::invalid_argument);
}

TEST(StreamCodecTest, MakeCodecsKeepsConfigurationOrder) {
    auto codecs = make_codecs("base64, ,base64");
    ASSERT_EQ(codecs.size(), 2u);
    EXPECT_EQ(codecs[0]->tag(), "base64");
    EXPECT_TRUE(make_codecs("").empty());
}

TEST(StreamCodecTest, EncodeChainRegistersEveryLayer) {
    auto sink = value_or_throw(arrow::io::BufferOutputStream::Create(), "sink");
    Closer closer;
    encode_chain(sink, {make_codec("base64"), make_codec("base64")}, &closer);
    EXPECT_EQ(closer.size(), 3u);
    closer.close();
    EXPECT_TRUE(sink->closed());
}

TEST(StreamCodecTest, GzipThenBase64AppliesInConfigurationOrder) {
    if (!gzip_available()) {
        GTEST_SKIP() << "gzip is not available in this Arrow build";
    }
    std::vector<StreamCodecPtr> codecs = make_codecs("gzip,base64");
    ASSERT_EQ(codecs.size(), 2u);
    EXPECT_EQ(codecs[0]->tag(), "gzip");
    EXPECT_EQ(codecs[1]->tag(), "base64");

    std::string data(10000, 'x');
    std::string encoded = encode(data, codecs);

    // Outermost layer is base64: only base64 alphabet characters
    EXPECT_EQ(encoded.find_first_not_of(
                  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/="),
              std::string::npos);
    EXPECT_LT(encoded.size(), data.size());

    // Undoing only the base64 layer yields gzip data
    std::string gzip_bytes = decode(encoded, {codecs[1]});
    ASSERT_GE(gzip_bytes.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(gzip_bytes[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(gzip_bytes[1]), 0x8b);

    EXPECT_EQ(decode(encoded, codecs), data);
}

TEST(TransferMetadataTest, ListsTagsInConfigurationOrder) {
    if (!gzip_available()) {
        GTEST_SKIP() << "gzip is not available in this Arrow build";
    }
    TransferMetadata metadata(make_codecs("gzip,base64"));
    EXPECT_EQ(metadata.transfer_encodings(), (std::vector<std::string>{"gzip", "base64"}));
    EXPECT_EQ(metadata.to_json().dump(), R"({"transferEncoding":["gzip","base64"]})");

    auto parsed = TransferMetadata::from_json(metadata.to_json());
    EXPECT_EQ(parsed.transfer_encodings(), metadata.transfer_encodings());
}

TEST(TransferMetadataTest, EmptyWithoutCodecs) {
    TransferMetadata metadata(std::vector<StreamCodecPtr>{});
    EXPECT_TRUE(metadata.empty());
    EXPECT_TRUE(TransferMetadata::from_json(nlohmann::json::object()).empty());
}

}  // namespace test
}  // namespace fswriter
