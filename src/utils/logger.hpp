#pragma once

#include <iosfwd>
#include <string>

namespace uuidpp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Fatal = 4
};

// Messages below this level are dropped (default: Warning)
void set_log_level(LogLevel level);
LogLevel log_level();

// Redirect log output (default: std::cerr). The stream must outlive its use.
void set_log_stream(std::ostream& stream);

// Writes "[YYYY-mm-dd HH:MM:SS.mmm] LEVEL component - details" as one line.
// Thread-safe.
void log_event(LogLevel level, const std::string& component, const std::string& details = "");

const char* to_string(LogLevel level);

} // namespace uuidpp
