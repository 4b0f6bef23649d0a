#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace va {

enum class LogLevel {
    trace = 0,
    debug = 1,
    info  = 2,
    warn  = 3,
    error = 4,
    fatal = 5,
    off   = 6
};

/// Parse "trace", "debug", "info", "warn", "error", "fatal" or "off".
/// Unknown names fall back to info.
LogLevel log_level_from_string(const std::string& s);

struct LogConfig {
    LogLevel              min_level = LogLevel::info;
    bool                  enable_console = true;
    bool                  enable_file = false;
    std::filesystem::path log_directory{"logs"};
    std::size_t           max_file_size_mb = 10;
    std::size_t           max_files = 5;
    bool                  async_mode = true;
    std::size_t           buffer_size = 8192;
};

/// Process-wide log sink backed by kcenon logger_system.
///
/// Messages logged before initialize() (or after shutdown()) are dropped,
/// which keeps unit tests quiet unless they opt in.
class Log {
public:
    static void initialize(const LogConfig& config);
    static void shutdown();
    static bool is_initialized();

    static void set_min_level(LogLevel level);

    static void trace(const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void flush();

private:
    static void write(LogLevel level, const std::string& message);
};

} // namespace va
