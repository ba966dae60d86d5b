#ifndef FSWRITER_FS_DATA_WRITER_HPP
#define FSWRITER_FS_DATA_WRITER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <arrow/io/interfaces.h>

#include "closer.hpp"
#include "data_descriptor.hpp"
#include "file_system.hpp"
#include "properties.hpp"
#include "retry.hpp"
#include "stream_codec.hpp"
#include "writer_utils.hpp"

namespace fswriter {

/**
 * File creation parameters, resolved once from configuration with
 * filesystem defaults as fallback.
 */
struct FileProperties {
    int buffer_size = keys::DEFAULT_BUFFER_SIZE;
    int16_t replication_factor = 1;
    int64_t block_size = 0;
    uint32_t file_permission = 0777;
    uint32_t dir_permission = 0777;
    std::optional<std::string> group;
};

/**
 * Staging and promotion engine shared by all file-based record writers.
 *
 * Construction removes a stale staging file left by an earlier attempt and
 * creates the output directory (with retry if configured). Record writers
 * obtain the encoded staging stream from create_staging_output_stream(),
 * write their records, and then call commit() exactly once, or cleanup()
 * to abort.
 *
 * commit() publishes into the task Properties:
 *   - the final output path, appended to writer.final.output.file.paths[.<branch>]
 *   - WriterMetrics JSON under fs_writer_metrics
 *
 * One instance is driven by a single task thread. The promoting rename runs
 * under a mutex shared by all writers in the process, and the output path
 * under a per-writer mutex because commit() rewrites it when record counts
 * are embedded in file names. Neither is a distributed lock.
 */
class FsDataWriter {
public:
    enum class State { OPEN, CLOSED, COMMITTED, ABORTED };

    using RecordCounter = std::function<int64_t()>;

    /**
     * @param identity Writer id, branch, file name and optional attempt/partition
     * @param properties Task configuration; also receives the commit results
     * @param fs Storage service
     * @param encoders Transfer encodings in configuration order
     * @param records_written Record count source, consulted at commit
     * @param retry_clock Time source for the directory creation retry loop
     * @throws IOError if the stale staging file cannot be removed or the
     *         output directory cannot be created within the retry budget
     * @throws std::invalid_argument on invalid configuration
     */
    FsDataWriter(WriterIdentity identity,
                 Properties& properties,
                 FileSystemPtr fs,
                 std::vector<StreamCodecPtr> encoders,
                 RecordCounter records_written,
                 RetryClock retry_clock = RetryClock::system());

    ~FsDataWriter();

    FsDataWriter(const FsDataWriter&) = delete;
    FsDataWriter& operator=(const FsDataWriter&) = delete;

    /**
     * Create the staging file (overwriting) and return a stream that writes
     * through every configured encoder. All layers are released together by
     * close(), commit() or destruction.
     *
     * @throws IOError if the storage service rejects the file
     */
    std::shared_ptr<arrow::io::OutputStream> create_staging_output_stream();

    /**
     * Close the streams and promote the staging file to the output path.
     *
     * @throws IOError if the staging file is missing or a storage call fails
     * @throws std::logic_error if already committed or cleaned up
     */
    void commit();

    /**
     * Delete the staging file if it exists. No effect after commit.
     */
    void cleanup();

    /**
     * Release all streams without committing.
     */
    void close();

    /** Staging file length recorded at commit, 0 before. */
    int64_t bytes_written() const;

    const std::string& staging_file() const { return staging_file_; }
    std::string output_file() const;
    std::string fully_qualified_output_file() const;

    const WriterIdentity& identity() const { return identity_; }
    const FileProperties& file_properties() const { return file_properties_; }
    const std::vector<StreamCodecPtr>& encoders() const { return encoders_; }
    const TransferMetadata& transfer_metadata() const { return transfer_metadata_; }
    const RetryPolicy& retry_policy() const { return retry_policy_; }
    bool include_record_count_in_file_name() const { return include_record_count_; }
    bool has_attempt_id() const { return identity_.attempt_id.has_value(); }
    State state() const { return state_; }

    FileSystem& file_system() { return *fs_; }

    /**
     * (scheme, authority, output directory), wrapped with the partition key
     * when the writer is partition-scoped.
     */
    DataDescriptor data_descriptor() const;

private:
    void set_staging_file_group();
    std::string promote();

    WriterIdentity identity_;
    Properties& properties_;
    FileSystemPtr fs_;
    std::vector<StreamCodecPtr> encoders_;
    RecordCounter records_written_;

    std::string staging_file_;
    std::string output_file_;
    std::string all_output_files_prop_;
    bool include_record_count_ = false;
    FileProperties file_properties_;
    RetryPolicy retry_policy_;
    TransferMetadata transfer_metadata_;

    Closer closer_;
    std::optional<int64_t> bytes_written_;
    State state_ = State::OPEN;
    mutable std::mutex output_mutex_;
};

}  // namespace fswriter

#endif  // FSWRITER_FS_DATA_WRITER_HPP
