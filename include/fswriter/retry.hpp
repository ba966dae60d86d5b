#ifndef FSWRITER_RETRY_HPP
#define FSWRITER_RETRY_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "file_system.hpp"
#include "properties.hpp"

namespace fswriter {

enum class RetryType { EXPONENTIAL, FIXED };

/**
 * Retry policy for transient storage failures.
 *
 * Defaults are the values used when retry is enabled without further
 * configuration: 2 minutes total, 5 seconds base interval, doubling waits.
 */
struct RetryPolicy {
    bool enabled = false;
    std::chrono::milliseconds timeout{120000};
    std::chrono::milliseconds interval{5000};
    double multiplier = 2.0;
    RetryType type = RetryType::EXPONENTIAL;

    /** A policy that runs the operation exactly once. */
    static RetryPolicy no_retry();

    /**
     * Build from "writer.retry.*" properties. Retry stays disabled unless
     * writer.retry.enabled is true.
     *
     * @throws std::invalid_argument on malformed values or an unknown retry_type
     */
    static RetryPolicy from_properties(const Properties& props);

    /**
     * Wait before the attempt following failed attempt number `attempt` (1-based).
     */
    std::chrono::milliseconds wait_after(int attempt) const;

    std::string to_string() const;
};

/**
 * Time source and sleep function used by Retryer; replaceable in tests.
 */
struct RetryClock {
    std::function<std::chrono::steady_clock::time_point()> now;
    std::function<void(std::chrono::milliseconds)> sleep;

    static RetryClock system();
};

/**
 * Runs an operation until it succeeds, retrying IOError failures according
 * to a RetryPolicy. Any other exception is propagated immediately.
 */
class Retryer {
public:
    explicit Retryer(RetryPolicy policy, RetryClock clock = RetryClock::system());

    /**
     * @param description Operation name used in logs and the final error
     * @param operation Callable to run
     * @throws IOError once the retry budget is exhausted, with the last failure message
     */
    void run(const std::string& description, const std::function<void()>& operation);

    /** Number of attempts made by the last run(). */
    int attempts() const { return attempts_; }

private:
    RetryPolicy policy_;
    RetryClock clock_;
    int attempts_ = 0;
};

/**
 * Create a directory and every missing ancestor, applying `permission`
 * explicitly to each directory this call created. Directories that already
 * exist are left untouched.
 *
 * @throws IOError if a directory cannot be created or permissioned
 */
void mkdirs_with_recursive_permission(FileSystem& fs, const std::string& path, uint32_t permission);

/**
 * mkdirs_with_recursive_permission() wrapped in a Retryer.
 */
void mkdirs_with_recursive_permission_with_retry(
    FileSystem& fs,
    const std::string& path,
    uint32_t permission,
    const RetryPolicy& policy,
    RetryClock clock = RetryClock::system());

}  // namespace fswriter

#endif  // FSWRITER_RETRY_HPP
