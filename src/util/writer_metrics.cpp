#include "fswriter/writer_metrics.hpp"

#include <stdexcept>

namespace fswriter {

using json = nlohmann::json;

json WriterMetrics::to_json() const {
    json files = json::array();
    for (const auto& info : file_infos) {
        files.push_back({{"fileName", info.file_name}, {"numRecords", info.num_records}});
    }

    json partition;
    if (partition_info.partition_key) {
        partition["partitionKey"] = *partition_info.partition_key;
    } else {
        partition["partitionKey"] = nullptr;
    }
    partition["branchId"] = partition_info.branch_id;

    return json{
        {"writerId", writer_id},
        {"partitionInfo", partition},
        {"fileInfos", files},
    };
}

std::string WriterMetrics::to_json_string() const {
    return to_json().dump();
}

WriterMetrics WriterMetrics::from_json(const json& j) {
    try {
        WriterMetrics metrics;
        metrics.writer_id = j.at("writerId").get<std::string>();

        const auto& partition = j.at("partitionInfo");
        if (partition.contains("partitionKey") && !partition.at("partitionKey").is_null()) {
            metrics.partition_info.partition_key = partition.at("partitionKey").get<std::string>();
        }
        metrics.partition_info.branch_id = partition.at("branchId").get<int>();

        for (const auto& file : j.at("fileInfos")) {
            metrics.file_infos.insert(
                FileInfo{file.at("fileName").get<std::string>(), file.at("numRecords").get<int64_t>()});
        }
        return metrics;
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed writer metrics: ") + e.what());
    }
}

WriterMetrics WriterMetrics::from_json_string(const std::string& s) {
    json parsed;
    try {
        parsed = json::parse(s);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed writer metrics: ") + e.what());
    }
    return from_json(parsed);
}

}  // namespace fswriter
