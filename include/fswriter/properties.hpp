#ifndef FSWRITER_PROPERTIES_HPP
#define FSWRITER_PROPERTIES_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fswriter {

/**
 * Configuration keys understood by the writers.
 * Keys marked "branch scoped" are resolved through branch_key().
 */
namespace keys {

inline constexpr const char* WRITER_STAGING_DIR = "writer.staging.dir";          // branch scoped
inline constexpr const char* WRITER_OUTPUT_DIR = "writer.output.dir";            // branch scoped
inline constexpr const char* WRITER_FILE_PATH = "writer.file.path";              // branch scoped
inline constexpr const char* WRITER_FILE_NAME = "writer.file.name";              // branch scoped
inline constexpr const char* WRITER_CODEC_TYPES = "writer.codec.types";          // branch scoped
inline constexpr const char* WRITER_BUFFER_SIZE = "writer.buffer.size";          // branch scoped
inline constexpr const char* WRITER_FILE_REPLICATION_FACTOR = "writer.file.replication.factor";
inline constexpr const char* WRITER_FILE_BLOCK_SIZE = "writer.file.block.size";
inline constexpr const char* WRITER_FILE_PERMISSIONS = "writer.file.permissions";
inline constexpr const char* WRITER_DIR_PERMISSIONS = "writer.dir.permissions";
inline constexpr const char* WRITER_GROUP_NAME = "writer.group.name";
inline constexpr const char* WRITER_INCLUDE_RECORD_COUNT_IN_FILE_NAMES =
    "writer.include.record.count.in.file.names";
inline constexpr const char* WRITER_RECORD_DELIMITER = "writer.record.delimiter";
inline constexpr const char* WRITER_PREPEND_SIZE = "writer.prepend.size";
inline constexpr const char* WRITER_PARQUET_COMPRESSION = "writer.parquet.compression";

// Not branch scoped
inline constexpr const char* WRITER_RETRY_PREFIX = "writer.retry.";
inline constexpr const char* WRITER_RETRY_ENABLED = "writer.retry.enabled";
inline constexpr const char* RETRY_TIME_OUT_MS = "retry_time_out_ms";
inline constexpr const char* RETRY_INTERVAL_MS = "retry_interval_ms";
inline constexpr const char* RETRY_MULTIPLIER = "retry_multiplier";
inline constexpr const char* RETRY_TYPE = "retry_type";

// Written by the writers into the task state
inline constexpr const char* WRITER_FINAL_OUTPUT_FILE_PATHS = "writer.final.output.file.paths";
inline constexpr const char* WRITER_PARTITION_PATH_KEY = "writer.partition.path";
inline constexpr const char* FS_WRITER_METRICS_KEY = "fs_writer_metrics";
inline constexpr const char* RECORDS_WRITTEN = "RecordsWritten";
inline constexpr const char* BYTES_WRITTEN = "BytesWritten";

inline constexpr int DEFAULT_BUFFER_SIZE = 4096;

}  // namespace keys

/**
 * Resolve a per-branch property name.
 * With a single branch the key is used as is, otherwise ".<branch_id>" is appended.
 */
std::string branch_key(const std::string& key, int num_branches, int branch_id);

/**
 * String key/value store used both for writer configuration and as the
 * task-scoped shared property store the writers report into.
 *
 * All accessors are thread-safe. Set-valued properties are stored as
 * comma-separated lists without duplicates, in insertion order.
 */
class Properties {
public:
    Properties() = default;
    Properties(std::initializer_list<std::pair<const std::string, std::string>> init);
    Properties(const Properties& other);
    Properties& operator=(const Properties& other);

    /**
     * Load "key=value" lines from a file. Blank lines and lines starting
     * with '#' are skipped. Existing keys are overwritten.
     *
     * @throws IOError if the file cannot be read
     * @throws std::invalid_argument on a line without '='
     */
    void load(const std::string& path);

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set_long(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    bool contains(const std::string& key) const;
    void remove(const std::string& key);

    std::optional<std::string> get(const std::string& key) const;
    std::string get(const std::string& key, const std::string& default_value) const;

    /**
     * Typed getters. Each returns the default when the key is absent.
     * @throws std::invalid_argument if the stored value does not parse
     */
    bool get_bool(const std::string& key, bool default_value) const;
    int get_int(const std::string& key, int default_value) const;
    int64_t get_long(const std::string& key, int64_t default_value) const;
    int16_t get_short(const std::string& key, int16_t default_value) const;
    double get_double(const std::string& key, double default_value) const;

    /**
     * Read an octal permission string such as "750" or "0644".
     * @throws std::invalid_argument if the value is not octal or exceeds 07777
     */
    uint32_t get_permission(const std::string& key, uint32_t default_value) const;

    /**
     * Append a value to a set-valued property. No-op if already present.
     */
    void append_to_set(const std::string& key, const std::string& value);
    std::vector<std::string> get_set(const std::string& key) const;

    /**
     * Copy of all properties starting with the prefix, with the prefix stripped.
     */
    Properties with_prefix(const std::string& prefix) const;

    size_t size() const;
    std::map<std::string, std::string> snapshot() const;
    nlohmann::json to_json() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> props_;
};

/**
 * Parse an octal permission string.
 * @throws std::invalid_argument if malformed
 */
uint32_t parse_permission(const std::string& value);

/**
 * Format permission bits as a four-digit octal string ("0755").
 */
std::string format_permission(uint32_t mode);

}  // namespace fswriter

#endif  // FSWRITER_PROPERTIES_HPP
