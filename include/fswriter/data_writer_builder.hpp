#ifndef FSWRITER_DATA_WRITER_BUILDER_HPP
#define FSWRITER_DATA_WRITER_BUILDER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/type_fwd.h>

#include "data_writer.hpp"

namespace fswriter {

/**
 * Assembles record writers from task configuration.
 *
 * The builder resolves the output file name (writer.file.name, or
 * part.<writer id>.<extension>) and the transfer encodings
 * (writer.codec.types) for the selected branch, then creates the writer for
 * the selected format: simple, csv or parquet.
 */
class DataWriterBuilder {
public:
    explicit DataWriterBuilder(Properties& properties);

    DataWriterBuilder& with_writer_id(std::string writer_id);
    DataWriterBuilder& with_branches(int num_branches);
    DataWriterBuilder& for_branch(int branch_id);
    DataWriterBuilder& with_attempt_id(std::string attempt_id);
    DataWriterBuilder& for_partition(std::string partition_key);
    DataWriterBuilder& with_format(std::string format);
    DataWriterBuilder& with_file_system(FileSystemPtr fs);
    DataWriterBuilder& with_schema(std::shared_ptr<arrow::Schema> schema);
    DataWriterBuilder& with_retry_clock(RetryClock clock);

    /**
     * Identity of the writer to be built.
     * @throws std::invalid_argument if the writer id or branch settings are invalid
     */
    WriterIdentity identity() const;

    /** Codecs from the branch's writer.codec.types, in configuration order. */
    std::vector<StreamCodecPtr> encoders() const;

    /**
     * Build a writer for byte records. Only the "simple" format is accepted.
     */
    std::unique_ptr<DataWriter<std::string>> build_simple() const;

    /**
     * Build a writer for Arrow record batches ("csv" or "parquet").
     */
    BatchWriterPtr build_batch_writer() const;

    const std::string& format() const { return format_; }

    /**
     * File extension of a format: txt, csv or parquet.
     * @throws std::invalid_argument for unknown formats
     */
    static std::string extension_for(const std::string& format);

private:
    FileSystemPtr file_system() const;

    Properties& properties_;
    std::string writer_id_;
    int num_branches_ = 1;
    int branch_id_ = 0;
    std::optional<std::string> attempt_id_;
    std::optional<std::string> partition_key_;
    std::string format_ = "simple";
    FileSystemPtr fs_;
    std::shared_ptr<arrow::Schema> schema_;
    RetryClock retry_clock_ = RetryClock::system();
};

}  // namespace fswriter

#endif  // FSWRITER_DATA_WRITER_BUILDER_HPP
