#include "tether/log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace tether::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_output_mutex;

const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "?";
}

} // namespace

void set_level(Level level) {
    g_level = level;
}

Level level() {
    return g_level;
}

void write(Level level, const std::string& component, const std::string& message) {
    if (level == Level::Off || level < g_level.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::ostringstream line;
    line << "[" << std::put_time(&tm_buf, "%H:%M:%S") << "] [" << level_name(level) << "] ["
         << component << "] " << message << "\n";

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::flush;
}

} // namespace tether::log
