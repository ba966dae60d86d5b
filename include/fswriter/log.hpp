#ifndef FSWRITER_LOG_HPP
#define FSWRITER_LOG_HPP

#include <iostream>
#include <sstream>
#include <string>

namespace fswriter {
namespace log {

enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3, Off = 4 };

void set_level(Level level);
Level get_level();

/**
 * Parse a level name ("debug", "info", "warning", "error", "off").
 * @throws std::invalid_argument on unknown names
 */
Level parse_level(const std::string& name);

void emit(Level level, const std::string& message);

template <typename... Args>
void write(Level level, const Args&... args) {
    if (level < get_level()) {
        return;
    }
    std::ostringstream oss;
    (oss << ... << args);
    emit(level, oss.str());
}

template <typename... Args>
void debug(const Args&... args) { write(Level::Debug, args...); }

template <typename... Args>
void info(const Args&... args) { write(Level::Info, args...); }

template <typename... Args>
void warning(const Args&... args) { write(Level::Warning, args...); }

template <typename... Args>
void error(const Args&... args) { write(Level::Error, args...); }

}  // namespace log
}  // namespace fswriter

#endif  // FSWRITER_LOG_HPP
