#include "fswriter/fs_data_writer.hpp"
#include "fswriter/errors.hpp"
#include "fswriter/log.hpp"
#include "fswriter/writer_metrics.hpp"

#include <stdexcept>

namespace fswriter {

FsDataWriter::FsDataWriter(WriterIdentity identity,
                           Properties& properties,
                           FileSystemPtr fs,
                           std::vector<StreamCodecPtr> encoders,
                           RecordCounter records_written,
                           RetryClock retry_clock)
    : identity_(std::move(identity)),
      properties_(properties),
      fs_(std::move(fs)),
      encoders_(std::move(encoders)),
      records_written_(std::move(records_written)) {

    if (!fs_) {
        throw std::invalid_argument("FsDataWriter requires a file system");
    }
    if (!records_written_) {
        throw std::invalid_argument("FsDataWriter requires a record counter");
    }

    const int branches = identity_.num_branches;
    const int branch = identity_.branch_id;

    PathPair paths = writer_paths(properties_, identity_);
    staging_file_ = paths.staging_path;
    output_file_ = paths.output_path;
    all_output_files_prop_ = branch_key(keys::WRITER_FINAL_OUTPUT_FILE_PATHS, branches, branch);

    // A staging file left behind by a failed attempt would block the retry
    if (fs_->exists(staging_file_)) {
        log::warning("Task staging file ", staging_file_, " already exists, deleting it");
        fs_->remove(staging_file_, false);
    }

    include_record_count_ = properties_.get_bool(
        branch_key(keys::WRITER_INCLUDE_RECORD_COUNT_IN_FILE_NAMES, branches, branch), false);

    file_properties_.buffer_size = properties_.get_int(
        branch_key(keys::WRITER_BUFFER_SIZE, branches, branch), keys::DEFAULT_BUFFER_SIZE);
    file_properties_.replication_factor = properties_.get_short(
        branch_key(keys::WRITER_FILE_REPLICATION_FACTOR, branches, branch),
        fs_->default_replication(output_file_));
    file_properties_.block_size = properties_.get_long(
        branch_key(keys::WRITER_FILE_BLOCK_SIZE, branches, branch),
        fs_->default_block_size(output_file_));
    file_properties_.file_permission = properties_.get_permission(
        branch_key(keys::WRITER_FILE_PERMISSIONS, branches, branch), 0777);
    file_properties_.dir_permission = properties_.get_permission(
        branch_key(keys::WRITER_DIR_PERMISSIONS, branches, branch), 0777);
    file_properties_.group = properties_.get(branch_key(keys::WRITER_GROUP_NAME, branches, branch));

    retry_policy_ = RetryPolicy::from_properties(properties_);
    if (retry_policy_.enabled) {
        log::info("Retry enabled for writer with config: ", retry_policy_.to_string());
    } else {
        log::info("Retry disabled for writer.");
    }

    // Local storage does not create parents on file creation, so the staging
    // directory is prepared the same way as the output directory
    mkdirs_with_recursive_permission_with_retry(
        *fs_, parent_path(staging_file_), file_properties_.dir_permission, retry_policy_, retry_clock);
    mkdirs_with_recursive_permission_with_retry(
        *fs_, parent_path(output_file_), file_properties_.dir_permission, retry_policy_, retry_clock);

    transfer_metadata_ = TransferMetadata(encoders_);

    if (identity_.partition_key) {
        properties_.set(std::string(keys::WRITER_PARTITION_PATH_KEY) + "_" + identity_.id,
                        *identity_.partition_key);
    }
}

FsDataWriter::~FsDataWriter() = default;

std::shared_ptr<arrow::io::OutputStream> FsDataWriter::create_staging_output_stream() {
    if (state_ != State::OPEN) {
        throw std::logic_error("Cannot create a staging stream for a writer that is no longer open");
    }

    auto raw = fs_->create(staging_file_,
                           file_properties_.file_permission,
                           true,
                           file_properties_.buffer_size,
                           file_properties_.replication_factor,
                           file_properties_.block_size);

    return encode_chain(std::move(raw), encoders_, &closer_);
}

void FsDataWriter::set_staging_file_group() {
    if (!file_properties_.group) {
        return;
    }
    if (!fs_->exists(staging_file_)) {
        throw IOError("Staging output file " + staging_file_ + " does not exist");
    }
    fs_->set_group(staging_file_, *file_properties_.group);
}

void FsDataWriter::commit() {
    if (state_ == State::COMMITTED) {
        throw std::logic_error("Writer " + identity_.id + " has already been committed");
    }
    if (state_ == State::ABORTED) {
        throw std::logic_error("Writer " + identity_.id + " has been cleaned up and cannot commit");
    }

    closer_.close();
    state_ = State::CLOSED;

    set_staging_file_group();

    if (!fs_->exists(staging_file_)) {
        throw IOError("File " + staging_file_ + " does not exist");
    }

    FileStatus staging_status = fs_->get_file_status(staging_file_);

    // The file may have been created with the filesystem's default mode
    if (staging_status.permission != file_properties_.file_permission) {
        fs_->set_permission(staging_file_, file_properties_.file_permission);
    }

    bytes_written_ = staging_status.length;

    std::string final_path = promote();

    properties_.append_to_set(all_output_files_prop_, final_path);

    WriterMetrics metrics;
    metrics.writer_id = identity_.id;
    metrics.partition_info = PartitionIdentifier{identity_.partition_key, identity_.branch_id};
    metrics.file_infos.insert(FileInfo{file_name_of(final_path), records_written_()});
    properties_.set(keys::FS_WRITER_METRICS_KEY, metrics.to_json_string());

    state_ = State::COMMITTED;
}

std::string FsDataWriter::promote() {
    // Shared by every writer in the process so that two writers resolving
    // to the same record-count name never rename concurrently
    static std::mutex rename_mutex;
    std::lock_guard<std::mutex> rename_lock(rename_mutex);
    std::lock_guard<std::mutex> lock(output_mutex_);

    // The record count is embedded before the move so that a single atomic
    // rename publishes the final name
    std::string target = output_file_;
    if (include_record_count_) {
        target = file_path_with_record_count(output_file_, records_written_());
    }

    log::info("Moving data from ", staging_file_, " to ", target);
    // Overwrite so that a retried task is not blocked by an earlier commit
    fs_->rename(staging_file_, target, true);
    output_file_ = target;
    return target;
}

void FsDataWriter::cleanup() {
    if (state_ == State::COMMITTED) {
        log::debug("Writer ", identity_.id, " already committed, nothing to clean up");
        return;
    }
    closer_.close();
    if (fs_->exists(staging_file_)) {
        fs_->remove(staging_file_, false);
    }
    state_ = State::ABORTED;
}

void FsDataWriter::close() {
    closer_.close();
    if (state_ == State::OPEN) {
        state_ = State::CLOSED;
    }
}

int64_t FsDataWriter::bytes_written() const {
    return bytes_written_.value_or(0);
}

std::string FsDataWriter::output_file() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return output_file_;
}

std::string FsDataWriter::fully_qualified_output_file() const {
    return fs_->make_qualified(output_file());
}

DataDescriptor FsDataWriter::data_descriptor() const {
    DataDescriptor descriptor;
    descriptor.dataset = DatasetDescriptor{fs_->scheme(), fs_->uri(), parent_path(output_file())};
    descriptor.partition = identity_.partition_key;
    return descriptor;
}

}  // namespace fswriter
