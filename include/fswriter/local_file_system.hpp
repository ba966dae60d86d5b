#ifndef FSWRITER_LOCAL_FILE_SYSTEM_HPP
#define FSWRITER_LOCAL_FILE_SYSTEM_HPP

#include "file_system.hpp"

namespace fswriter {

/**
 * FileSystem backed by the local POSIX filesystem.
 *
 * Files are opened with open(2) using the requested mode and handed to
 * arrow::io::FileOutputStream behind a BufferedOutputStream. Renames with
 * overwrite use rename(2), which replaces the destination atomically.
 */
class LocalFileSystem : public FileSystem {
public:
    static constexpr int64_t DEFAULT_BLOCK_SIZE = 32 * 1024 * 1024;

    LocalFileSystem() = default;

    std::shared_ptr<arrow::io::OutputStream> create(
        const std::string& path,
        uint32_t permission,
        bool overwrite,
        int buffer_size,
        int16_t replication,
        int64_t block_size) override;

    std::shared_ptr<arrow::io::InputStream> open(const std::string& path) override;

    bool exists(const std::string& path) override;
    FileStatus get_file_status(const std::string& path) override;
    void rename(const std::string& src, const std::string& dst, bool overwrite) override;
    bool remove(const std::string& path, bool recursive) override;
    bool mkdir(const std::string& path, uint32_t permission) override;
    void set_permission(const std::string& path, uint32_t permission) override;
    void set_group(const std::string& path, const std::string& group) override;

    int16_t default_replication(const std::string& path) override;
    int64_t default_block_size(const std::string& path) override;

    std::string scheme() const override;
    std::string uri() const override;
    std::string make_qualified(const std::string& path) const override;
};

}  // namespace fswriter

#endif  // FSWRITER_LOCAL_FILE_SYSTEM_HPP
