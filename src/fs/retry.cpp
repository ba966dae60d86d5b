#include "fswriter/retry.hpp"
#include "fswriter/errors.hpp"
#include "fswriter/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fswriter {

RetryPolicy RetryPolicy::no_retry() {
    return RetryPolicy{};
}

RetryPolicy RetryPolicy::from_properties(const Properties& props) {
    RetryPolicy policy;
    policy.enabled = props.get_bool(keys::WRITER_RETRY_ENABLED, false);
    if (!policy.enabled) {
        return policy;
    }

    Properties retry = props.with_prefix(keys::WRITER_RETRY_PREFIX);
    policy.timeout = std::chrono::milliseconds(
        retry.get_long(keys::RETRY_TIME_OUT_MS, policy.timeout.count()));
    policy.interval = std::chrono::milliseconds(
        retry.get_long(keys::RETRY_INTERVAL_MS, policy.interval.count()));
    policy.multiplier = retry.get_double(keys::RETRY_MULTIPLIER, policy.multiplier);

    std::string type = retry.get(keys::RETRY_TYPE, "exponential");
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (type == "exponential") {
        policy.type = RetryType::EXPONENTIAL;
    } else if (type == "fixed") {
        policy.type = RetryType::FIXED;
    } else {
        throw std::invalid_argument("Unknown retry type: " + type);
    }

    if (policy.timeout.count() < 0 || policy.interval.count() < 0 || policy.multiplier < 1.0) {
        throw std::invalid_argument("Invalid retry policy: " + policy.to_string());
    }
    return policy;
}

std::chrono::milliseconds RetryPolicy::wait_after(int attempt) const {
    if (type == RetryType::FIXED || attempt <= 1) {
        return interval;
    }
    double wait = static_cast<double>(interval.count()) * std::pow(multiplier, attempt - 1);
    double cap = static_cast<double>(std::max(timeout, interval).count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(wait, cap)));
}

std::string RetryPolicy::to_string() const {
    std::ostringstream oss;
    oss << "{enabled=" << (enabled ? "true" : "false")
        << ", timeout_ms=" << timeout.count()
        << ", interval_ms=" << interval.count()
        << ", multiplier=" << multiplier
        << ", type=" << (type == RetryType::EXPONENTIAL ? "exponential" : "fixed") << "}";
    return oss.str();
}

RetryClock RetryClock::system() {
    RetryClock clock;
    clock.now = [] { return std::chrono::steady_clock::now(); };
    clock.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    return clock;
}

Retryer::Retryer(RetryPolicy policy, RetryClock clock)
    : policy_(policy), clock_(std::move(clock)) {}

void Retryer::run(const std::string& description, const std::function<void()>& operation) {
    attempts_ = 0;
    const auto start = clock_.now();

    while (true) {
        ++attempts_;
        try {
            operation();
            return;
        } catch (const IOError& e) {
            if (!policy_.enabled) {
                throw;
            }

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - start);
            auto remaining = policy_.timeout - elapsed;
            if (remaining.count() <= 0) {
                throw IOError(description + " failed after " + std::to_string(attempts_) +
                              " attempts: " + e.what());
            }

            auto wait = std::min(policy_.wait_after(attempts_), remaining);
            log::warning(description, " failed (attempt ", attempts_, "), retrying in ",
                         wait.count(), " ms: ", e.what());
            clock_.sleep(wait);
        }
    }
}

void mkdirs_with_recursive_permission(FileSystem& fs, const std::string& path, uint32_t permission) {
    if (fs.exists(path)) {
        return;
    }

    // Collect missing ancestors, deepest first
    std::vector<std::string> missing;
    std::filesystem::path p(path);
    while (!p.empty()) {
        std::string current = p.string();
        if (fs.exists(current)) {
            break;
        }
        missing.push_back(current);
        auto parent = p.parent_path();
        if (parent == p) {
            break;
        }
        p = parent;
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        if (fs.mkdir(*it, permission)) {
            // mkdir is subject to the process umask
            fs.set_permission(*it, permission);
        }
    }
}

void mkdirs_with_recursive_permission_with_retry(
    FileSystem& fs,
    const std::string& path,
    uint32_t permission,
    const RetryPolicy& policy,
    RetryClock clock) {

    Retryer retryer(policy, std::move(clock));
    retryer.run("Creating directory " + path, [&] {
        mkdirs_with_recursive_permission(fs, path, permission);
    });
}

}  // namespace fswriter
