#ifndef FSWRITER_DATA_WRITER_HPP
#define FSWRITER_DATA_WRITER_HPP

#include <cstdint>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include <arrow/record_batch.h>

#include "data_descriptor.hpp"
#include "fs_data_writer.hpp"
#include "log.hpp"
#include "properties.hpp"

namespace fswriter {

/**
 * Abstract base class for record writers.
 * Implementations write records of type D to some output format.
 */
template <typename D>
class DataWriter {
public:
    virtual ~DataWriter() = default;

    /**
     * Write a single record.
     */
    virtual void write(const D& record) = 0;

    /**
     * Make the written records visible at the final output location.
     */
    virtual void commit() = 0;

    /**
     * Discard uncommitted output.
     */
    virtual void cleanup() = 0;

    /**
     * Release resources without committing.
     */
    virtual void close() = 0;

    virtual int64_t records_written() const = 0;
    virtual int64_t bytes_written() const = 0;

    virtual DataDescriptor get_data_descriptor() const = 0;

    /**
     * Whether concurrent speculative attempts of this writer can run safely.
     * Writers must opt in explicitly.
     */
    virtual bool is_speculative_attempt_safe() const { return false; }

    /**
     * Snapshot of RecordsWritten and BytesWritten. A field whose accessor
     * throws is left out; this call never throws for that reason.
     */
    Properties get_final_state() const {
        Properties state;

        try {
            state.set_long(keys::RECORDS_WRITTEN, records_written());
        } catch (const std::exception& e) {
            log::warning("Failed to get final state recordsWritten: ", e.what());
        }

        try {
            state.set_long(keys::BYTES_WRITTEN, bytes_written());
        } catch (const std::exception& e) {
            log::warning("Failed to get final state bytesWritten: ", e.what());
        }

        return state;
    }
};

using RecordBatchPtr = std::shared_ptr<arrow::RecordBatch>;
using BatchWriterPtr = std::unique_ptr<DataWriter<RecordBatchPtr>>;

/**
 * DataWriter whose output goes through an FsDataWriter staging file.
 *
 * Implementations write records to the stream from staging_stream() and
 * override finish_records() if buffered state has to reach the stream before
 * it is closed. finish_records() runs at most once per commit() or close()
 * and only while the writer is open.
 */
template <typename D>
class StagedDataWriter : public DataWriter<D> {
public:
    StagedDataWriter(WriterIdentity identity,
                     Properties& properties,
                     FileSystemPtr fs,
                     std::vector<StreamCodecPtr> encoders,
                     RetryClock retry_clock = RetryClock::system())
        : fs_writer_(std::move(identity), properties, std::move(fs), std::move(encoders),
                     [this] { return this->records_written(); }, std::move(retry_clock)) {}

    void commit() override {
        if (fs_writer_.state() == FsDataWriter::State::OPEN) {
            finish_records();
        }
        fs_writer_.commit();
    }

    void cleanup() override {
        fs_writer_.cleanup();
    }

    void close() override {
        if (fs_writer_.state() == FsDataWriter::State::OPEN) {
            finish_records();
        }
        fs_writer_.close();
    }

    int64_t bytes_written() const override {
        return fs_writer_.bytes_written();
    }

    DataDescriptor get_data_descriptor() const override {
        return fs_writer_.data_descriptor();
    }

    const FsDataWriter& fs_writer() const { return fs_writer_; }
    FsDataWriter& fs_writer() { return fs_writer_; }

protected:
    virtual void finish_records() {}

    std::shared_ptr<arrow::io::OutputStream>& staging_stream() {
        if (!stream_) {
            stream_ = fs_writer_.create_staging_output_stream();
        }
        return stream_;
    }

    FsDataWriter fs_writer_;

private:
    std::shared_ptr<arrow::io::OutputStream> stream_;
};

}  // namespace fswriter

#endif  // FSWRITER_DATA_WRITER_HPP
