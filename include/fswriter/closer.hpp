#ifndef FSWRITER_CLOSER_HPP
#define FSWRITER_CLOSER_HPP

#include <memory>
#include <string>
#include <vector>

#include <arrow/io/interfaces.h>

namespace fswriter {

/**
 * Ordered release list for output streams.
 *
 * Streams are closed in reverse registration order. close() attempts every
 * stream even if some fail, then throws the first failure as IOError.
 * Closing is idempotent and the list is empty afterwards.
 */
class Closer {
public:
    Closer() = default;
    ~Closer();

    Closer(const Closer&) = delete;
    Closer& operator=(const Closer&) = delete;

    /**
     * Register a stream and return it unchanged.
     */
    template <typename Stream>
    std::shared_ptr<Stream> register_stream(std::shared_ptr<Stream> stream) {
        streams_.push_back(stream);
        return stream;
    }

    /**
     * Close all registered streams.
     * @throws IOError with the first close failure
     */
    void close();

    size_t size() const { return streams_.size(); }

private:
    std::vector<std::shared_ptr<arrow::io::OutputStream>> streams_;
};

}  // namespace fswriter

#endif  // FSWRITER_CLOSER_HPP
