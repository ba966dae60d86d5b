#ifndef FSWRITER_ERRORS_HPP
#define FSWRITER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include <arrow/result.h>
#include <arrow/status.h>

namespace fswriter {

/**
 * Raised for every storage-level failure: filesystem calls, missing staging
 * files at commit time and exhausted directory-creation retries.
 */
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Throw IOError if an Arrow status is not OK.
 *
 * @param status Status returned by an Arrow call
 * @param context Short description of the failed operation
 */
inline void check_status(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw IOError(context + ": " + status.ToString());
    }
}

/**
 * Unwrap an Arrow result or throw IOError with the given context.
 */
template <typename T>
T value_or_throw(arrow::Result<T> result, const std::string& context) {
    if (!result.ok()) {
        throw IOError(context + ": " + result.status().ToString());
    }
    return std::move(result).ValueOrDie();
}

}  // namespace fswriter

#endif  // FSWRITER_ERRORS_HPP
