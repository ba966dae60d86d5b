#ifndef FSWRITER_WRITER_UTILS_HPP
#define FSWRITER_WRITER_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "properties.hpp"

namespace fswriter {

/**
 * Identity of one writer instance. Staging and output paths are derived from
 * it deterministically.
 */
struct WriterIdentity {
    std::string id;
    int num_branches = 1;
    int branch_id = 0;
    std::string file_name;
    std::optional<std::string> attempt_id;
    std::optional<std::string> partition_key;
};

/**
 * Staging and output locations of a writer's file.
 */
struct PathPair {
    std::string staging_path;
    std::string output_path;
};

/**
 * Join path components with '/', skipping empty components.
 */
std::string join_path(const std::string& base, const std::string& child);

std::string parent_path(const std::string& path);
std::string file_name_of(const std::string& path);

/**
 * writer.staging.dir[/attempt_id]/writer.file.path[/partition]
 *
 * @throws std::invalid_argument if writer.staging.dir is not set
 */
std::string writer_staging_dir(const Properties& props, const WriterIdentity& identity);

/**
 * writer.output.dir/writer.file.path[/partition]
 *
 * @throws std::invalid_argument if writer.output.dir is not set
 */
std::string writer_output_dir(const Properties& props, const WriterIdentity& identity);

PathPair writer_paths(const Properties& props, const WriterIdentity& identity);

/**
 * Embed a record count in a file path: "dir/part.csv" -> "dir/part.<count>.csv",
 * "dir/part" -> "dir/part.<count>".
 */
std::string file_path_with_record_count(const std::string& path, int64_t record_count);

/**
 * Record count embedded by file_path_with_record_count(), if present.
 */
std::optional<int64_t> record_count_from_file_name(const std::string& path);

}  // namespace fswriter

#endif  // FSWRITER_WRITER_UTILS_HPP
