#ifndef FSWRITER_SIMPLE_DATA_WRITER_HPP
#define FSWRITER_SIMPLE_DATA_WRITER_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "data_writer.hpp"

namespace fswriter {

/**
 * Writes raw byte records to the staging file.
 *
 * Each record is optionally preceded by its length as an 8-byte big-endian
 * integer (writer.prepend.size) and followed by a delimiter byte
 * (writer.record.delimiter; "\n", "\t" and "\0" escapes are recognised).
 * The staging file is created on construction, so committing without
 * records produces an empty file.
 */
class SimpleDataWriter : public StagedDataWriter<std::string> {
public:
    SimpleDataWriter(WriterIdentity identity,
                     Properties& properties,
                     FileSystemPtr fs,
                     std::vector<StreamCodecPtr> encoders = {},
                     RetryClock retry_clock = RetryClock::system());

    void write(const std::string& record) override;

    int64_t records_written() const override { return records_; }

    bool is_speculative_attempt_safe() const override;

    /**
     * Parse a delimiter setting into a single byte.
     * @throws std::invalid_argument if it is not exactly one (escaped) byte
     */
    static char parse_delimiter(const std::string& value);

private:
    std::optional<char> delimiter_;
    bool prepend_size_ = false;
    int64_t records_ = 0;
};

}  // namespace fswriter

#endif  // FSWRITER_SIMPLE_DATA_WRITER_HPP
