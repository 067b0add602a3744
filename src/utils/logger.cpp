#include "utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace uuidpp {

namespace {

std::atomic<LogLevel> current_level{LogLevel::Warning};
std::mutex log_mutex;  // Protects log_stream and the writes to it
std::ostream* log_stream = &std::cerr;

} // anonymous namespace

void set_log_level(LogLevel level) {
    current_level.store(level);
}

LogLevel log_level() {
    return current_level.load();
}

void set_log_stream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_stream = &stream;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

void log_event(LogLevel level, const std::string& component, const std::string& details) {
    if (level < current_level.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);

    // Build log message first, then write atomically with lock
    std::ostringstream log_msg;
    log_msg << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
            << to_string(level) << " " << component;
    if (!details.empty()) {
        log_msg << " - " << details;
    }
    log_msg << "\n";

    std::lock_guard<std::mutex> lock(log_mutex);
    *log_stream << log_msg.str() << std::flush;
}

} // namespace uuidpp
