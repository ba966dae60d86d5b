#include "fswriter/data_writer_builder.hpp"
#include "fswriter/csv_writer.hpp"
#include "fswriter/local_file_system.hpp"
#include "fswriter/parquet_writer.hpp"
#include "fswriter/simple_data_writer.hpp"

#include <stdexcept>

namespace fswriter {

DataWriterBuilder::DataWriterBuilder(Properties& properties)
    : properties_(properties) {}

DataWriterBuilder& DataWriterBuilder::with_writer_id(std::string writer_id) {
    writer_id_ = std::move(writer_id);
    return *this;
}

DataWriterBuilder& DataWriterBuilder::with_branches(int num_branches) {
    num_branches_ = num_branches;
    return *this;
}

DataWriterBuilder& DataWriterBuilder::for_branch(int branch_id) {
    branch_id_ = branch_id;
    return *this;
}

DataWriterBuilder& DataWriterBuilder::with_attempt_id(std::string attempt_id) {
    attempt_id_ = std::move(attempt_id);
    return *this;
}

DataWriterBuilder& DataWriterBuilder::for_partition(std::string partition_key) {
    partition_key_ = std::move(partition_key);
    return *this;
}

DataWriterBuilder& DataWriterBuilder::with_format(std::string format) {
    format_ = std::move(format);
    return *this;
}

DataWriterBuilder& DataWriterBuilder::with_file_system(FileSystemPtr fs) {
    fs_ = std::move(fs);
    return *this;
}

DataWriterBuilder& DataWriterBuilder::with_schema(std::shared_ptr<arrow::Schema> schema) {
    schema_ = std::move(schema);
    return *this;
}

DataWriterBuilder& DataWriterBuilder::with_retry_clock(RetryClock clock) {
    retry_clock_ = std::move(clock);
    return *this;
}

std::string DataWriterBuilder::extension_for(const std::string& format) {
    if (format == "simple") {
        return "txt";
    } else if (format == "csv") {
        return "csv";
    } else if (format == "parquet") {
        return "parquet";
    }
    throw std::invalid_argument("Unknown format: " + format);
}

WriterIdentity DataWriterBuilder::identity() const {
    if (writer_id_.empty()) {
        throw std::invalid_argument("Writer id must be set");
    }
    if (num_branches_ < 1) {
        throw std::invalid_argument("Number of branches must be at least 1");
    }
    if (branch_id_ < 0 || branch_id_ >= num_branches_) {
        throw std::invalid_argument("Branch " + std::to_string(branch_id_) +
                                    " is out of range for " + std::to_string(num_branches_) +
                                    " branches");
    }

    WriterIdentity identity;
    identity.id = writer_id_;
    identity.num_branches = num_branches_;
    identity.branch_id = branch_id_;
    identity.attempt_id = attempt_id_;
    identity.partition_key = partition_key_;
    identity.file_name = properties_.get(
        branch_key(keys::WRITER_FILE_NAME, num_branches_, branch_id_),
        "part." + writer_id_ + "." + extension_for(format_));
    return identity;
}

std::vector<StreamCodecPtr> DataWriterBuilder::encoders() const {
    auto names = properties_.get(branch_key(keys::WRITER_CODEC_TYPES, num_branches_, branch_id_));
    if (!names) {
        return {};
    }
    return make_codecs(*names);
}

FileSystemPtr DataWriterBuilder::file_system() const {
    if (fs_) {
        return fs_;
    }
    return std::make_shared<LocalFileSystem>();
}

std::unique_ptr<DataWriter<std::string>> DataWriterBuilder::build_simple() const {
    if (format_ != "simple") {
        throw std::invalid_argument("Format " + format_ + " does not accept byte records");
    }
    return std::make_unique<SimpleDataWriter>(identity(), properties_, file_system(),
                                              encoders(), retry_clock_);
}

BatchWriterPtr DataWriterBuilder::build_batch_writer() const {
    BatchWriterPtr writer;

    if (format_ == "csv") {
        writer = std::make_unique<CsvDataWriter>(identity(), properties_, file_system(),
                                                 encoders(), retry_clock_);
    } else if (format_ == "parquet") {
        writer = std::make_unique<ParquetDataWriter>(identity(), properties_, file_system(),
                                                     encoders(), schema_, nullptr, retry_clock_);
    } else {
        throw std::invalid_argument("Format " + format_ + " does not accept record batches");
    }

    return writer;
}

}  // namespace fswriter
