#ifndef FSWRITER_WRITER_METRICS_HPP
#define FSWRITER_WRITER_METRICS_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace fswriter {

struct PartitionIdentifier {
    std::optional<std::string> partition_key;
    int branch_id = 0;

    bool operator==(const PartitionIdentifier& other) const = default;
};

/**
 * Record count of one committed file.
 */
struct FileInfo {
    std::string file_name;
    int64_t num_records = 0;

    auto operator<=>(const FileInfo& other) const = default;
};

/**
 * Per-commit metrics published to the task state under "fs_writer_metrics".
 *
 * JSON layout:
 *   {"writerId": "...",
 *    "partitionInfo": {"partitionKey": "..." | null, "branchId": 0},
 *    "fileInfos": [{"fileName": "...", "numRecords": 42}]}
 */
struct WriterMetrics {
    std::string writer_id;
    PartitionIdentifier partition_info;
    std::set<FileInfo> file_infos;

    nlohmann::json to_json() const;
    std::string to_json_string() const;

    /**
     * @throws std::invalid_argument if required fields are missing
     */
    static WriterMetrics from_json(const nlohmann::json& j);
    static WriterMetrics from_json_string(const std::string& s);

    bool operator==(const WriterMetrics& other) const = default;
};

}  // namespace fswriter

#endif  // FSWRITER_WRITER_METRICS_HPP
