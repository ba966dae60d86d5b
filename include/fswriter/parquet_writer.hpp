#ifndef FSWRITER_PARQUET_WRITER_HPP
#define FSWRITER_PARQUET_WRITER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include <arrow/memory_pool.h>
#include <arrow/type.h>
#include <arrow/util/type_fwd.h>

#include "data_writer.hpp"

// Forward declarations
namespace parquet {
namespace arrow {
class FileWriter;
}
}

namespace fswriter {

/**
 * Parquet record writer using the Apache Parquet C++ library.
 *
 * Batches are written immediately through a parquet::arrow::FileWriter that
 * sits on top of the encoded staging stream, so memory use stays at one row
 * group. The file footer is written when the writer is committed or closed.
 */
class ParquetDataWriter : public StagedDataWriter<RecordBatchPtr> {
public:
    /**
     * @param schema Schema of the file; if null it is taken from the first batch
     * @param memory_pool Custom Arrow memory pool (nullptr = default pool)
     * @throws std::invalid_argument if writer.parquet.compression is unknown
     */
    ParquetDataWriter(WriterIdentity identity,
                      Properties& properties,
                      FileSystemPtr fs,
                      std::vector<StreamCodecPtr> encoders = {},
                      std::shared_ptr<arrow::Schema> schema = nullptr,
                      arrow::MemoryPool* memory_pool = nullptr,
                      RetryClock retry_clock = RetryClock::system());

    ~ParquetDataWriter() override;

    /**
     * Write a batch of rows. Empty batches are skipped.
     *
     * @throws std::invalid_argument for a null batch or a schema mismatch
     * @throws IOError if Parquet encoding or the staging stream fails
     */
    void write(const RecordBatchPtr& batch) override;

    int64_t records_written() const override { return rows_written_; }

    bool is_speculative_attempt_safe() const override;

    arrow::Compression::type compression() const { return compression_; }

protected:
    void finish_records() override;

private:
    void init_file_writer();

    std::shared_ptr<arrow::Schema> schema_;
    arrow::MemoryPool* memory_pool_ = nullptr;
    arrow::Compression::type compression_;
    std::unique_ptr<parquet::arrow::FileWriter> parquet_file_writer_;
    bool finished_ = false;
    int64_t rows_written_ = 0;
};

}  // namespace fswriter

#endif  // FSWRITER_PARQUET_WRITER_HPP
