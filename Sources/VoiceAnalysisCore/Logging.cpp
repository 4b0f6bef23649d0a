#include "Logging.hpp"

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <system_error>

namespace va {

namespace {

// ---------------------------------------------------------------------------
// Shared state
// ---------------------------------------------------------------------------

struct LogState {
    std::mutex                               mu;
    std::unique_ptr<kcenon::logger::logger>  logger;
    std::atomic<bool>                        initialized{false};
    std::atomic<LogLevel>                    min_level{LogLevel::info};
};

LogState& state() {
    static LogState s;
    return s;
}

kcenon::logger::log_level convert(LogLevel level) {
    switch (level) {
        case LogLevel::trace: return kcenon::logger::log_level::trace;
        case LogLevel::debug: return kcenon::logger::log_level::debug;
        case LogLevel::info:  return kcenon::logger::log_level::info;
        case LogLevel::warn:  return kcenon::logger::log_level::warn;
        case LogLevel::error: return kcenon::logger::log_level::error;
        case LogLevel::fatal: return kcenon::logger::log_level::fatal;
        case LogLevel::off:   return kcenon::logger::log_level::off;
    }
    return kcenon::logger::log_level::off;
}

} // namespace

LogLevel log_level_from_string(const std::string& s) {
    if (s == "trace") return LogLevel::trace;
    if (s == "debug") return LogLevel::debug;
    if (s == "info")  return LogLevel::info;
    if (s == "warn" || s == "warning") return LogLevel::warn;
    if (s == "error") return LogLevel::error;
    if (s == "fatal") return LogLevel::fatal;
    if (s == "off")   return LogLevel::off;
    return LogLevel::info;
}

// ---------------------------------------------------------------------------
// initialize / shutdown
// ---------------------------------------------------------------------------

void Log::initialize(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mu);

    if (s.initialized.load()) return;

    s.logger = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                        config.buffer_size);
    s.logger->set_min_level(convert(config.min_level));
    s.min_level.store(config.min_level);

    if (config.enable_console) {
        s.logger->add_writer(std::make_unique<kcenon::logger::console_writer>());
    }

    bool file_ok = true;
    if (config.enable_file) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_directory, ec);
        file_ok = !ec;
        if (file_ok) {
            auto log_path = config.log_directory / "voice-analysis.log";
            s.logger->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config.max_file_size_mb * 1024 * 1024,
                config.max_files));
        }
    }

    s.logger->start();
    s.initialized.store(true);

    if (!file_ok) {
        s.logger->log(kcenon::logger::log_level::warn,
                      "Cannot create log directory " + config.log_directory.string() +
                      "; logging to console only");
    }
}

void Log::shutdown() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mu);

    if (!s.initialized.load()) return;

    s.logger->flush();
    s.logger->stop();
    s.logger.reset();
    s.initialized.store(false);
}

bool Log::is_initialized() {
    return state().initialized.load();
}

void Log::set_min_level(LogLevel level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    s.min_level.store(level);
    if (s.logger) s.logger->set_min_level(convert(level));
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void Log::trace(const std::string& message) { write(LogLevel::trace, message); }
void Log::debug(const std::string& message) { write(LogLevel::debug, message); }
void Log::info(const std::string& message)  { write(LogLevel::info, message); }
void Log::warn(const std::string& message)  { write(LogLevel::warn, message); }
void Log::error(const std::string& message) { write(LogLevel::error, message); }

void Log::flush() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    if (s.logger) s.logger->flush();
}

void Log::write(LogLevel level, const std::string& message) {
    auto& s = state();
    if (!s.initialized.load()) return;
    if (static_cast<int>(level) < static_cast<int>(s.min_level.load())) return;

    std::lock_guard<std::mutex> lock(s.mu);
    if (s.logger) s.logger->log(convert(level), message);
}

} // namespace va
