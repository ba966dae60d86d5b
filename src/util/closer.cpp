#include "fswriter/closer.hpp"
#include "fswriter/errors.hpp"
#include "fswriter/log.hpp"

#include <optional>

namespace fswriter {

Closer::~Closer() {
    try {
        close();
    } catch (const std::exception& e) {
        log::warning("Failed to release output streams: ", e.what());
    }
}

void Closer::close() {
    std::optional<std::string> first_error;

    // Detach first so a throwing close leaves the closer empty
    auto streams = std::move(streams_);
    streams_.clear();

    for (auto it = streams.rbegin(); it != streams.rend(); ++it) {
        const auto& stream = *it;
        if (!stream || stream->closed()) {
            continue;
        }
        arrow::Status status = stream->Close();
        if (!status.ok() && !first_error) {
            first_error = status.ToString();
        } else if (!status.ok()) {
            log::warning("Suppressed close failure: ", status.ToString());
        }
    }

    if (first_error) {
        throw IOError("Failed to close output stream: " + *first_error);
    }
}

}  // namespace fswriter
