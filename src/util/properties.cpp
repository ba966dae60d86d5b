#include "fswriter/properties.hpp"
#include "fswriter/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fswriter {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::vector<std::string> split_set(const std::string& value) {
    std::vector<std::string> items;
    if (value.empty()) {
        return items;
    }
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

int64_t parse_long(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("Property " + key + " is not an integer: " + value);
    }
}

}  // namespace

std::string branch_key(const std::string& key, int num_branches, int branch_id) {
    if (num_branches <= 1) {
        return key;
    }
    return key + "." + std::to_string(branch_id);
}

uint32_t parse_permission(const std::string& value) {
    std::string v = trim(value);
    if (v.empty() || v.size() > 5) {
        throw std::invalid_argument("Invalid permission: '" + value + "'");
    }
    uint32_t mode = 0;
    for (char c : v) {
        if (c < '0' || c > '7') {
            throw std::invalid_argument("Invalid octal permission: '" + value + "'");
        }
        mode = mode * 8 + static_cast<uint32_t>(c - '0');
    }
    if (mode > 07777) {
        throw std::invalid_argument("Permission out of range: '" + value + "'");
    }
    return mode;
}

std::string format_permission(uint32_t mode) {
    std::ostringstream oss;
    oss << std::oct << std::setw(4) << std::setfill('0') << (mode & 07777);
    return oss.str();
}

Properties::Properties(std::initializer_list<std::pair<const std::string, std::string>> init)
    : props_(init) {}

Properties::Properties(const Properties& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    props_ = other.props_;
}

Properties& Properties::operator=(const Properties& other) {
    if (this == &other) {
        return *this;
    }
    std::map<std::string, std::string> copy = other.snapshot();
    std::lock_guard<std::mutex> lock(mutex_);
    props_ = std::move(copy);
    return *this;
}

void Properties::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw IOError("Failed to open properties file: " + path);
    }

    std::map<std::string, std::string> loaded;
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }
        auto eq = stripped.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(
                path + ":" + std::to_string(line_number) + ": expected key=value");
        }
        loaded[trim(stripped.substr(0, eq))] = trim(stripped.substr(eq + 1));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : loaded) {
        props_[entry.first] = std::move(entry.second);
    }
}

void Properties::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    props_[key] = value;
}

void Properties::set(const std::string& key, const char* value) {
    set(key, std::string(value));
}

void Properties::set_long(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Properties::set_bool(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

bool Properties::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return props_.find(key) != props_.end();
}

void Properties::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    props_.erase(key);
}

std::optional<std::string> Properties::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = props_.find(key);
    if (it == props_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Properties::get(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

bool Properties::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    std::string v = trim(*value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true") {
        return true;
    }
    if (v == "false") {
        return false;
    }
    throw std::invalid_argument("Property " + key + " is not a boolean: " + *value);
}

int Properties::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    int64_t parsed = parse_long(key, trim(*value));
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("Property " + key + " is out of int range: " + *value);
    }
    return static_cast<int>(parsed);
}

int64_t Properties::get_long(const std::string& key, int64_t default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    return parse_long(key, trim(*value));
}

int16_t Properties::get_short(const std::string& key, int16_t default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    int64_t parsed = parse_long(key, trim(*value));
    if (parsed < std::numeric_limits<int16_t>::min() || parsed > std::numeric_limits<int16_t>::max()) {
        throw std::invalid_argument("Property " + key + " is out of short range: " + *value);
    }
    return static_cast<int16_t>(parsed);
}

double Properties::get_double(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    try {
        size_t pos = 0;
        std::string v = trim(*value);
        double parsed = std::stod(v, &pos);
        if (pos != v.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("Property " + key + " is not a number: " + *value);
    }
}

uint32_t Properties::get_permission(const std::string& key, uint32_t default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    return parse_permission(*value);
}

void Properties::append_to_set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& current = props_[key];
    auto items = split_set(current);
    if (std::find(items.begin(), items.end(), value) != items.end()) {
        return;
    }
    current = current.empty() ? value : current + "," + value;
}

std::vector<std::string> Properties::get_set(const std::string& key) const {
    auto value = get(key);
    if (!value) {
        return {};
    }
    return split_set(*value);
}

Properties Properties::with_prefix(const std::string& prefix) const {
    Properties result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : props_) {
        if (entry.first.compare(0, prefix.size(), prefix) == 0) {
            result.props_[entry.first.substr(prefix.size())] = entry.second;
        }
    }
    return result;
}

size_t Properties::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return props_.size();
}

std::map<std::string, std::string> Properties::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return props_;
}

nlohmann::json Properties::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& entry : snapshot()) {
        j[entry.first] = entry.second;
    }
    return j;
}

}  // namespace fswriter
