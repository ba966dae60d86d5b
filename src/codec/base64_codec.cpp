#include "fswriter/stream_codec.hpp"
#include "fswriter/log.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <string_view>

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/base64.h>

namespace fswriter {

namespace {

/**
 * Encodes complete 3-byte groups as they arrive; the trailing partial group
 * is padded and written on Close().
 */
class Base64OutputStream : public arrow::io::OutputStream {
public:
    explicit Base64OutputStream(std::shared_ptr<arrow::io::OutputStream> raw)
        : raw_(std::move(raw)) {}

    ~Base64OutputStream() override {
        if (!closed_) {
            auto status = Close();
            if (!status.ok()) {
                log::warning("Failed to close base64 stream: ", status.ToString());
            }
        }
    }

    using arrow::io::OutputStream::Write;

    arrow::Status Write(const void* data, int64_t nbytes) override {
        if (closed_) {
            return arrow::Status::Invalid("Write on closed base64 stream");
        }
        pending_.append(static_cast<const char*>(data), static_cast<size_t>(nbytes));
        position_ += nbytes;

        size_t complete = pending_.size() - pending_.size() % 3;
        if (complete == 0) {
            return arrow::Status::OK();
        }
        std::string encoded = arrow::util::base64_encode(std::string_view(pending_.data(), complete));
        pending_.erase(0, complete);
        return raw_->Write(encoded.data(), static_cast<int64_t>(encoded.size()));
    }

    arrow::Status Flush() override {
        if (closed_) {
            return arrow::Status::Invalid("Flush on closed base64 stream");
        }
        return raw_->Flush();
    }

    arrow::Status Close() override {
        if (closed_) {
            return arrow::Status::OK();
        }
        closed_ = true;
        if (!pending_.empty()) {
            std::string encoded = arrow::util::base64_encode(pending_);
            pending_.clear();
            ARROW_RETURN_NOT_OK(raw_->Write(encoded.data(), static_cast<int64_t>(encoded.size())));
        }
        return raw_->Close();
    }

    arrow::Result<int64_t> Tell() const override { return position_; }

    bool closed() const override { return closed_; }

private:
    std::shared_ptr<arrow::io::OutputStream> raw_;
    std::string pending_;
    int64_t position_ = 0;
    bool closed_ = false;
};

class Base64InputStream : public arrow::io::InputStream {
public:
    static constexpr int64_t CHUNK_SIZE = 64 * 1024;

    explicit Base64InputStream(std::shared_ptr<arrow::io::InputStream> raw)
        : raw_(std::move(raw)) {}

    arrow::Result<int64_t> Read(int64_t nbytes, void* out) override {
        if (closed_) {
            return arrow::Status::Invalid("Read on closed base64 stream");
        }
        auto* dst = static_cast<uint8_t*>(out);
        int64_t total = 0;
        while (total < nbytes) {
            if (decoded_pos_ == decoded_.size()) {
                if (eof_) {
                    break;
                }
                ARROW_RETURN_NOT_OK(fill());
                continue;
            }
            size_t n = std::min(static_cast<size_t>(nbytes - total), decoded_.size() - decoded_pos_);
            std::memcpy(dst + total, decoded_.data() + decoded_pos_, n);
            decoded_pos_ += n;
            total += static_cast<int64_t>(n);
        }
        position_ += total;
        return total;
    }

    arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override {
        ARROW_ASSIGN_OR_RAISE(auto buffer, arrow::AllocateResizableBuffer(nbytes));
        ARROW_ASSIGN_OR_RAISE(int64_t bytes_read, Read(nbytes, buffer->mutable_data()));
        ARROW_RETURN_NOT_OK(buffer->Resize(bytes_read));
        return std::shared_ptr<arrow::Buffer>(std::move(buffer));
    }

    arrow::Status Close() override {
        if (closed_) {
            return arrow::Status::OK();
        }
        closed_ = true;
        return raw_->Close();
    }

    arrow::Result<int64_t> Tell() const override { return position_; }

    bool closed() const override { return closed_; }

private:
    arrow::Status fill() {
        decoded_.clear();
        decoded_pos_ = 0;

        ARROW_ASSIGN_OR_RAISE(auto chunk, raw_->Read(CHUNK_SIZE));
        if (chunk->size() == 0) {
            eof_ = true;
            if (!encoded_.empty()) {
                return arrow::Status::IOError("Truncated base64 input");
            }
            return arrow::Status::OK();
        }

        encoded_.append(reinterpret_cast<const char*>(chunk->data()), static_cast<size_t>(chunk->size()));
        size_t usable = encoded_.size() - encoded_.size() % 4;
        if (usable > 0) {
            decoded_ = arrow::util::base64_decode(std::string_view(encoded_.data(), usable));
            encoded_.erase(0, usable);
        }
        return arrow::Status::OK();
    }

    std::shared_ptr<arrow::io::InputStream> raw_;
    std::string encoded_;
    std::string decoded_;
    size_t decoded_pos_ = 0;
    int64_t position_ = 0;
    bool eof_ = false;
    bool closed_ = false;
};

}  // namespace

std::shared_ptr<arrow::io::OutputStream> Base64Codec::encode_output_stream(
    std::shared_ptr<arrow::io::OutputStream> raw) {
    return std::make_shared<Base64OutputStream>(std::move(raw));
}

std::shared_ptr<arrow::io::InputStream> Base64Codec::decode_input_stream(
    std::shared_ptr<arrow::io::InputStream> raw) {
    return std::make_shared<Base64InputStream>(std::move(raw));
}

}  // namespace fswriter
