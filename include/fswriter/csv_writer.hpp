#ifndef FSWRITER_CSV_WRITER_HPP
#define FSWRITER_CSV_WRITER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "data_writer.hpp"

namespace fswriter {

/**
 * CSV record writer.
 * Writes Arrow RecordBatch rows to the staging file with proper escaping and
 * quoting. The header is taken from the first batch.
 */
class CsvDataWriter : public StagedDataWriter<RecordBatchPtr> {
public:
    CsvDataWriter(WriterIdentity identity,
                  Properties& properties,
                  FileSystemPtr fs,
                  std::vector<StreamCodecPtr> encoders = {},
                  RetryClock retry_clock = RetryClock::system());

    /**
     * Write a batch of rows.
     * The header will be written on the first batch call.
     *
     * @throws std::invalid_argument for a null batch
     * @throws IOError if the staging stream rejects the data
     */
    void write(const RecordBatchPtr& batch) override;

    int64_t records_written() const override { return rows_written_; }

    bool is_speculative_attempt_safe() const override;

    /**
     * Escape a string value for CSV output.
     * Quotes the value if it contains special characters (comma, quote, newline).
     */
    static std::string escape_csv_value(const std::string& value);

private:
    void write_header(const arrow::Schema& schema, std::string& out);

    bool header_written_ = false;
    int64_t rows_written_ = 0;
};

}  // namespace fswriter

#endif  // FSWRITER_CSV_WRITER_HPP
