#ifndef FSWRITER_FILE_SYSTEM_HPP
#define FSWRITER_FILE_SYSTEM_HPP

#include <cstdint>
#include <memory>
#include <string>

#include <arrow/io/interfaces.h>

namespace fswriter {

/**
 * Result of a stat call on the storage service.
 */
struct FileStatus {
    std::string path;
    int64_t length = 0;
    uint32_t permission = 0;  ///< Permission bits only (mode & 07777)
    bool is_directory = false;
    std::string group;
};

/**
 * Hierarchical storage service used by the writers.
 *
 * Implementations must provide an atomic rename within a single namespace.
 * Every operation is synchronous and reports failures by throwing IOError.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /**
     * Create a file and return a stream writing to it.
     *
     * @param path File to create
     * @param permission Permission bits requested for the file
     * @param overwrite Truncate an existing file instead of failing
     * @param buffer_size Size of the write buffer in front of the file
     * @param replication Replication factor (advisory for local storage)
     * @param block_size Block size (advisory for local storage)
     */
    virtual std::shared_ptr<arrow::io::OutputStream> create(
        const std::string& path,
        uint32_t permission,
        bool overwrite,
        int buffer_size,
        int16_t replication,
        int64_t block_size) = 0;

    /**
     * Open an existing file for reading.
     */
    virtual std::shared_ptr<arrow::io::InputStream> open(const std::string& path) = 0;

    virtual bool exists(const std::string& path) = 0;

    /**
     * @throws IOError if the path does not exist
     */
    virtual FileStatus get_file_status(const std::string& path) = 0;

    /**
     * Rename src to dst. With overwrite an existing dst file is replaced
     * atomically; without it an existing dst fails the call.
     */
    virtual void rename(const std::string& src, const std::string& dst, bool overwrite) = 0;

    /**
     * Delete a path.
     * @return false if the path did not exist
     */
    virtual bool remove(const std::string& path, bool recursive) = 0;

    /**
     * Create a single directory. The parent must exist.
     * @return false if the directory already existed
     */
    virtual bool mkdir(const std::string& path, uint32_t permission) = 0;

    virtual void set_permission(const std::string& path, uint32_t permission) = 0;
    virtual void set_group(const std::string& path, const std::string& group) = 0;

    virtual int16_t default_replication(const std::string& path) = 0;
    virtual int64_t default_block_size(const std::string& path) = 0;

    /** URI scheme of this storage, for example "file". */
    virtual std::string scheme() const = 0;

    /** Authority URI of this storage, for example "file:///". */
    virtual std::string uri() const = 0;

    /** Fully-qualified form of a path. */
    virtual std::string make_qualified(const std::string& path) const = 0;
};

using FileSystemPtr = std::shared_ptr<FileSystem>;

}  // namespace fswriter

#endif  // FSWRITER_FILE_SYSTEM_HPP
