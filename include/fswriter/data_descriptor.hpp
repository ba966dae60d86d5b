#ifndef FSWRITER_DATA_DESCRIPTOR_HPP
#define FSWRITER_DATA_DESCRIPTOR_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace fswriter {

/**
 * Logical dataset a writer produces: storage platform, storage authority
 * and the directory holding the output files.
 */
struct DatasetDescriptor {
    std::string platform;
    std::string uri;
    std::string name;

    bool operator==(const DatasetDescriptor& other) const = default;
};

/**
 * Dataset description, optionally scoped to one partition.
 */
struct DataDescriptor {
    DatasetDescriptor dataset;
    std::optional<std::string> partition;

    bool is_partition() const { return partition.has_value(); }

    /** Partition name if partition-scoped, otherwise the dataset name. */
    const std::string& name() const { return partition ? *partition : dataset.name; }

    nlohmann::json to_json() const {
        nlohmann::json dataset_json{
            {"platform", dataset.platform},
            {"uri", dataset.uri},
            {"name", dataset.name},
        };
        if (!partition) {
            return dataset_json;
        }
        return nlohmann::json{{"name", *partition}, {"dataset", dataset_json}};
    }

    bool operator==(const DataDescriptor& other) const = default;
};

}  // namespace fswriter

#endif  // FSWRITER_DATA_DESCRIPTOR_HPP
