#pragma once

#include <string>

namespace tether::log {

enum class Level {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

void set_level(Level level);
Level level();

// Writes "[HH:MM:SS] [LEVEL] [component] message" to stderr when the
// level passes the current threshold.
void write(Level level, const std::string& component, const std::string& message);

inline void debug(const std::string& component, const std::string& message) {
    write(Level::Debug, component, message);
}
inline void info(const std::string& component, const std::string& message) {
    write(Level::Info, component, message);
}
inline void warn(const std::string& component, const std::string& message) {
    write(Level::Warn, component, message);
}
inline void error(const std::string& component, const std::string& message) {
    write(Level::Error, component, message);
}

} // namespace tether::log
