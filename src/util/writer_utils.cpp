#include "fswriter/writer_utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace fswriter {

namespace {

bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

std::string required(const Properties& props, const std::string& key) {
    auto value = props.get(key);
    if (!value || value->empty()) {
        throw std::invalid_argument("Missing required property: " + key);
    }
    return *value;
}

std::string with_file_path_and_partition(std::string dir, const Properties& props,
                                         const WriterIdentity& identity) {
    dir = join_path(dir, props.get(branch_key(keys::WRITER_FILE_PATH, identity.num_branches,
                                              identity.branch_id), ""));
    if (identity.partition_key) {
        dir = join_path(dir, *identity.partition_key);
    }
    return dir;
}

}  // namespace

std::string join_path(const std::string& base, const std::string& child) {
    if (child.empty()) {
        return base;
    }
    if (base.empty()) {
        return child;
    }
    std::string trimmed_child = child;
    while (!trimmed_child.empty() && trimmed_child.front() == '/') {
        trimmed_child.erase(0, 1);
    }
    if (base.back() == '/') {
        return base + trimmed_child;
    }
    return base + "/" + trimmed_child;
}

std::string parent_path(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return "";
    }
    if (slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

std::string file_name_of(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string writer_staging_dir(const Properties& props, const WriterIdentity& identity) {
    std::string dir = required(
        props, branch_key(keys::WRITER_STAGING_DIR, identity.num_branches, identity.branch_id));
    if (identity.attempt_id) {
        dir = join_path(dir, *identity.attempt_id);
    }
    return with_file_path_and_partition(dir, props, identity);
}

std::string writer_output_dir(const Properties& props, const WriterIdentity& identity) {
    std::string dir = required(
        props, branch_key(keys::WRITER_OUTPUT_DIR, identity.num_branches, identity.branch_id));
    return with_file_path_and_partition(dir, props, identity);
}

PathPair writer_paths(const Properties& props, const WriterIdentity& identity) {
    if (identity.file_name.empty()) {
        throw std::invalid_argument("Writer " + identity.id + " has no file name");
    }
    return PathPair{
        join_path(writer_staging_dir(props, identity), identity.file_name),
        join_path(writer_output_dir(props, identity), identity.file_name),
    };
}

std::string file_path_with_record_count(const std::string& path, int64_t record_count) {
    const std::string dir = parent_path(path);
    const std::string name = file_name_of(path);

    std::string stem = name;
    std::string extension;
    auto dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        stem = name.substr(0, dot);
        extension = name.substr(dot + 1);
    }

    // "part" becomes "part.<count>", with no trailing dot
    std::string new_name = stem + "." + std::to_string(record_count);
    if (!extension.empty()) {
        new_name += "." + extension;
    }
    return dir.empty() ? new_name : join_path(dir, new_name);
}

std::optional<int64_t> record_count_from_file_name(const std::string& path) {
    std::vector<std::string> parts;
    std::string name = file_name_of(path);
    size_t start = 0;
    while (true) {
        auto dot = name.find('.', start);
        parts.push_back(name.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    std::string candidate;
    if (parts.size() >= 3 && is_digits(parts[parts.size() - 2])) {
        candidate = parts[parts.size() - 2];
    } else if (parts.size() == 2 && is_digits(parts[1])) {
        candidate = parts[1];
    } else {
        return std::nullopt;
    }

    try {
        return std::stoll(candidate);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace fswriter
