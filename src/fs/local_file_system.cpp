#include "fswriter/local_file_system.hpp"
#include "fswriter/errors.hpp"
#include "fswriter/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include <fcntl.h>
#include <grp.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <arrow/io/buffered.h>
#include <arrow/io/file.h>
#include <arrow/memory_pool.h>

namespace fswriter {

namespace {

IOError errno_error(const std::string& what, const std::string& path) {
    return IOError(what + " " + path + ": " + std::strerror(errno));
}

std::string group_name(gid_t gid) {
    std::vector<char> buf(4096);
    struct group grp;
    struct group* result = nullptr;
    int rc;
    while ((rc = getgrgid_r(gid, &grp, buf.data(), buf.size(), &result)) == ERANGE) {
        buf.resize(buf.size() * 2);
    }
    if (rc != 0 || result == nullptr) {
        return std::to_string(gid);
    }
    return result->gr_name;
}

gid_t lookup_group(const std::string& name) {
    std::vector<char> buf(4096);
    struct group grp;
    struct group* result = nullptr;
    int rc;
    while ((rc = getgrnam_r(name.c_str(), &grp, buf.data(), buf.size(), &result)) == ERANGE) {
        buf.resize(buf.size() * 2);
    }
    if (rc != 0 || result == nullptr) {
        throw IOError("Unknown group: " + name);
    }
    return result->gr_gid;
}

}  // namespace

std::shared_ptr<arrow::io::OutputStream> LocalFileSystem::create(
    const std::string& path,
    uint32_t permission,
    bool overwrite,
    int buffer_size,
    int16_t /*replication*/,
    int64_t /*block_size*/) {

    int flags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    if (!overwrite) {
        flags |= O_EXCL;
    }

    int fd = ::open(path.c_str(), flags, static_cast<mode_t>(permission));
    if (fd < 0) {
        throw errno_error("Failed to create file", path);
    }

    auto raw_result = arrow::io::FileOutputStream::Open(fd);
    if (!raw_result.ok()) {
        ::close(fd);
        throw IOError("Failed to open output stream for " + path + ": " +
                      raw_result.status().ToString());
    }
    std::shared_ptr<arrow::io::OutputStream> raw = raw_result.ValueOrDie();

    if (buffer_size <= 0) {
        return raw;
    }

    auto buffered = arrow::io::BufferedOutputStream::Create(
        buffer_size, arrow::default_memory_pool(), raw);
    if (!buffered.ok()) {
        // Release the descriptor owned by the raw stream before failing
        auto close_status = raw->Close();
        if (!close_status.ok()) {
            log::warning("Failed to close ", path, ": ", close_status.ToString());
        }
        throw IOError("Failed to buffer output stream for " + path + ": " +
                      buffered.status().ToString());
    }
    return buffered.ValueOrDie();
}

std::shared_ptr<arrow::io::InputStream> LocalFileSystem::open(const std::string& path) {
    return value_or_throw(arrow::io::ReadableFile::Open(path), "Failed to open " + path);
}

bool LocalFileSystem::exists(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) == 0) {
        return true;
    }
    if (errno == ENOENT || errno == ENOTDIR) {
        return false;
    }
    throw errno_error("Failed to stat", path);
}

FileStatus LocalFileSystem::get_file_status(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        throw errno_error("Failed to stat", path);
    }

    FileStatus status;
    status.path = path;
    status.length = static_cast<int64_t>(st.st_size);
    status.permission = static_cast<uint32_t>(st.st_mode & 07777);
    status.is_directory = S_ISDIR(st.st_mode);
    status.group = group_name(st.st_gid);
    return status;
}

void LocalFileSystem::rename(const std::string& src, const std::string& dst, bool overwrite) {
    struct stat st;
    if (::stat(dst.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        throw IOError("Cannot rename " + src + " onto directory " + dst);
    }

    if (overwrite) {
        if (::rename(src.c_str(), dst.c_str()) != 0) {
            throw IOError("Failed to rename " + src + " to " + dst + ": " + std::strerror(errno));
        }
        return;
    }

    // link(2) fails with EEXIST instead of clobbering the destination
    if (::link(src.c_str(), dst.c_str()) != 0) {
        throw IOError("Failed to rename " + src + " to " + dst + ": " + std::strerror(errno));
    }
    if (::unlink(src.c_str()) != 0) {
        throw errno_error("Failed to remove rename source", src);
    }
}

bool LocalFileSystem::remove(const std::string& path, bool recursive) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return false;
        }
        throw errno_error("Failed to stat", path);
    }

    if (S_ISDIR(st.st_mode)) {
        if (recursive) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            if (ec) {
                throw IOError("Failed to delete " + path + ": " + ec.message());
            }
            return true;
        }
        if (::rmdir(path.c_str()) != 0) {
            throw errno_error("Failed to delete directory", path);
        }
        return true;
    }

    if (::unlink(path.c_str()) != 0) {
        if (errno == ENOENT) {
            return false;
        }
        throw errno_error("Failed to delete", path);
    }
    return true;
}

bool LocalFileSystem::mkdir(const std::string& path, uint32_t permission) {
    if (::mkdir(path.c_str(), static_cast<mode_t>(permission)) == 0) {
        return true;
    }
    if (errno == EEXIST) {
        struct stat st;
        if (::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            return false;
        }
        throw IOError("Path exists and is not a directory: " + path);
    }
    throw errno_error("Failed to create directory", path);
}

void LocalFileSystem::set_permission(const std::string& path, uint32_t permission) {
    if (::chmod(path.c_str(), static_cast<mode_t>(permission)) != 0) {
        throw errno_error("Failed to set permission on", path);
    }
}

void LocalFileSystem::set_group(const std::string& path, const std::string& group) {
    gid_t gid = lookup_group(group);
    if (::chown(path.c_str(), static_cast<uid_t>(-1), gid) != 0) {
        throw errno_error("Failed to set group " + group + " on", path);
    }
}

int16_t LocalFileSystem::default_replication(const std::string& /*path*/) {
    return 1;
}

int64_t LocalFileSystem::default_block_size(const std::string& /*path*/) {
    return DEFAULT_BLOCK_SIZE;
}

std::string LocalFileSystem::scheme() const {
    return "file";
}

std::string LocalFileSystem::uri() const {
    return "file:///";
}

std::string LocalFileSystem::make_qualified(const std::string& path) const {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return "file://" + path;
    }
    return "file://" + absolute.lexically_normal().string();
}

}  // namespace fswriter
