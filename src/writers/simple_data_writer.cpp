#include "fswriter/simple_data_writer.hpp"
#include "fswriter/errors.hpp"

#include <stdexcept>

namespace fswriter {

SimpleDataWriter::SimpleDataWriter(WriterIdentity identity,
                                   Properties& properties,
                                   FileSystemPtr fs,
                                   std::vector<StreamCodecPtr> encoders,
                                   RetryClock retry_clock)
    : StagedDataWriter<std::string>(std::move(identity), properties, std::move(fs),
                                    std::move(encoders), std::move(retry_clock)) {
    const auto& id = fs_writer_.identity();
    auto delimiter = properties.get(
        branch_key(keys::WRITER_RECORD_DELIMITER, id.num_branches, id.branch_id));
    if (delimiter) {
        delimiter_ = parse_delimiter(*delimiter);
    }
    prepend_size_ = properties.get_bool(
        branch_key(keys::WRITER_PREPEND_SIZE, id.num_branches, id.branch_id), false);

    staging_stream();
}

char SimpleDataWriter::parse_delimiter(const std::string& value) {
    if (value.size() == 1) {
        return value[0];
    }
    if (value == "\\n") return '\n';
    if (value == "\\t") return '\t';
    if (value == "\\r") return '\r';
    if (value == "\\0") return '\0';
    throw std::invalid_argument("Record delimiter must be a single byte: '" + value + "'");
}

void SimpleDataWriter::write(const std::string& record) {
    auto& out = staging_stream();

    if (prepend_size_) {
        uint8_t size_bytes[8];
        uint64_t size = record.size();
        for (int i = 7; i >= 0; --i) {
            size_bytes[i] = static_cast<uint8_t>(size & 0xFF);
            size >>= 8;
        }
        check_status(out->Write(size_bytes, sizeof(size_bytes)), "Failed to write record size");
    }

    check_status(out->Write(record.data(), static_cast<int64_t>(record.size())),
                 "Failed to write record");

    if (delimiter_) {
        check_status(out->Write(&*delimiter_, 1), "Failed to write record delimiter");
    }

    ++records_;
}

bool SimpleDataWriter::is_speculative_attempt_safe() const {
    return fs_writer_.has_attempt_id();
}

}  // namespace fswriter
