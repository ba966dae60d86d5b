#include "fswriter/parquet_writer.hpp"
#include "fswriter/errors.hpp"
#include "fswriter/log.hpp"

#include <stdexcept>

#include <arrow/api.h>
#include <arrow/util/compression.h>
#include <parquet/arrow/writer.h>

namespace fswriter {

ParquetDataWriter::ParquetDataWriter(WriterIdentity identity,
                                     Properties& properties,
                                     FileSystemPtr fs,
                                     std::vector<StreamCodecPtr> encoders,
                                     std::shared_ptr<arrow::Schema> schema,
                                     arrow::MemoryPool* memory_pool,
                                     RetryClock retry_clock)
    : StagedDataWriter<RecordBatchPtr>(std::move(identity), properties, std::move(fs),
                                       std::move(encoders), std::move(retry_clock))
    , schema_(std::move(schema))
    , memory_pool_(memory_pool ? memory_pool : arrow::default_memory_pool()) {

    const auto& id = fs_writer_.identity();
    std::string name = properties.get(
        branch_key(keys::WRITER_PARQUET_COMPRESSION, id.num_branches, id.branch_id), "snappy");
    auto compression = arrow::util::Codec::GetCompressionType(name);
    if (!compression.ok()) {
        throw std::invalid_argument("Unknown Parquet compression: " + name);
    }
    compression_ = *compression;

    staging_stream();
    if (schema_) {
        init_file_writer();
    }
}

ParquetDataWriter::~ParquetDataWriter() = default;

void ParquetDataWriter::init_file_writer() {
    if (parquet_file_writer_) {
        return;
    }

    auto writer_props = parquet::WriterProperties::Builder()
        .compression(compression_)
        ->build();

    auto arrow_props = parquet::ArrowWriterProperties::Builder()
        .store_schema()
        ->build();

    parquet_file_writer_ = value_or_throw(
        parquet::arrow::FileWriter::Open(*schema_, memory_pool_, staging_stream(),
                                         writer_props, arrow_props),
        "Failed to create Parquet FileWriter");
}

void ParquetDataWriter::write(const RecordBatchPtr& batch) {
    if (finished_) {
        throw std::logic_error("Cannot write to a finished Parquet writer");
    }
    if (!batch) {
        throw std::invalid_argument("Cannot write null batch");
    }

    if (!schema_) {
        schema_ = batch->schema();
    } else if (!schema_->Equals(*batch->schema(), false)) {
        throw std::invalid_argument("Batch schema " + batch->schema()->ToString() +
                                    " does not match file schema " + schema_->ToString());
    }

    if (batch->num_rows() == 0) {
        return;
    }

    init_file_writer();
    check_status(parquet_file_writer_->WriteRecordBatch(*batch), "Failed to write RecordBatch");
    rows_written_ += batch->num_rows();
}

void ParquetDataWriter::finish_records() {
    if (finished_) {
        return;
    }
    finished_ = true;

    if (!parquet_file_writer_) {
        // Schema still unknown: nothing was written, the staging file stays empty
        if (schema_) {
            init_file_writer();
        } else {
            log::debug("Parquet writer ", fs_writer_.identity().id, " has no schema, leaving empty file");
            return;
        }
    }
    check_status(parquet_file_writer_->Close(), "Failed to close Parquet writer");
}

bool ParquetDataWriter::is_speculative_attempt_safe() const {
    return fs_writer_.has_attempt_id();
}

}  // namespace fswriter
