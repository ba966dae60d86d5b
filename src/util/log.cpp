#include "fswriter/log.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace fswriter {
namespace log {

namespace {

std::atomic<Level> current_level{Level::Info};
std::mutex output_mutex;

const char* prefix(Level level) {
    switch (level) {
        case Level::Debug:
            return "Debug: ";
        case Level::Info:
            return "";
        case Level::Warning:
            return "Warning: ";
        case Level::Error:
            return "Error: ";
        default:
            return "";
    }
}

}  // namespace

void set_level(Level level) {
    current_level.store(level);
}

Level get_level() {
    return current_level.load();
}

Level parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

void emit(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    // stdout is reserved for tool output
    if (level >= Level::Warning) {
        std::cerr << prefix(level) << message << std::endl;
    } else {
        std::clog << prefix(level) << message << std::endl;
    }
}

}  // namespace log
}  // namespace fswriter
