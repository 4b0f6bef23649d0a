#include "AppConfig.hpp"

#include "Errors.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace va {

namespace {

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out, const fs::path& path) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("Config key '" + std::string(key) + "' in " +
                              path.string() + ": " + e.what());
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------

fs::path AppConfig::default_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "voice-analysis";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".local" / "share" / "voice-analysis";
    }
    return fs::current_path() / "voice-analysis";
}

AppConfig::AppConfig() {
    const fs::path base = default_data_dir();
    database_path       = (base / "analysis.db").string();
    private_storage_dir = base.string();
    whisper_model_path  = (base / "models" / "ggml-base.bin").string();
    log_directory       = (base / "logs").string();
}

// ---------------------------------------------------------------------------
// load / save
// ---------------------------------------------------------------------------

AppConfig AppConfig::load(const fs::path& path) {
    AppConfig config;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return config;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw ValidationError("Cannot read config file " + path.string());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("Malformed config file " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ValidationError("Config file " + path.string() + " must hold a JSON object");
    }

    read_key(j, "database_path",         config.database_path, path);
    read_key(j, "external_storage_dir",  config.external_storage_dir, path);
    read_key(j, "private_storage_dir",   config.private_storage_dir, path);
    read_key(j, "temp_dir",              config.temp_dir, path);
    read_key(j, "max_recording_seconds", config.max_recording_seconds, path);
    read_key(j, "whisper_model_path",    config.whisper_model_path, path);
    read_key(j, "language_top_n",        config.language_top_n, path);
    read_key(j, "capture_input_format",  config.capture_input_format, path);
    read_key(j, "capture_device",        config.capture_device, path);
    read_key(j, "log_directory",         config.log_directory, path);
    read_key(j, "log_level",             config.log_level, path);
    read_key(j, "log_to_file",           config.log_to_file, path);

    if (config.max_recording_seconds <= 0) {
        throw ValidationError("max_recording_seconds must be positive in " + path.string());
    }
    if (config.language_top_n <= 0) {
        throw ValidationError("language_top_n must be positive in " + path.string());
    }
    if (config.private_storage_dir.empty()) {
        throw ValidationError("private_storage_dir must not be empty in " + path.string());
    }
    return config;
}

void AppConfig::save(const fs::path& path) const {
    nlohmann::json j;
    j["database_path"]         = database_path;
    j["external_storage_dir"]  = external_storage_dir;
    j["private_storage_dir"]   = private_storage_dir;
    j["temp_dir"]              = temp_dir;
    j["max_recording_seconds"] = max_recording_seconds;
    j["whisper_model_path"]    = whisper_model_path;
    j["language_top_n"]        = language_top_n;
    j["capture_input_format"]  = capture_input_format;
    j["capture_device"]        = capture_device;
    j["log_directory"]         = log_directory;
    j["log_level"]             = log_level;
    j["log_to_file"]           = log_to_file;

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw FileSystemError("Cannot create " + path.parent_path().string() +
                                  ": " + ec.message());
        }
    }

    std::ofstream f(path);
    if (!f.is_open()) {
        throw FileSystemError("Cannot write config file " + path.string());
    }
    f << j.dump(4) << '\n';
    if (!f) {
        throw FileSystemError("Failed writing config file " + path.string());
    }
}

// ---------------------------------------------------------------------------
// Derived settings
// ---------------------------------------------------------------------------

VaultLocations AppConfig::vault_locations() const {
    return VaultLocations{external_storage_dir, private_storage_dir};
}

SessionConfig AppConfig::session_config() const {
    SessionConfig session;
    session.max_duration = std::chrono::seconds(max_recording_seconds);
    if (!temp_dir.empty()) session.temp_dir = temp_dir;
    return session;
}

LogConfig AppConfig::log_config() const {
    LogConfig log;
    log.min_level     = log_level_from_string(log_level);
    log.enable_file   = log_to_file;
    log.log_directory = log_directory;
    return log;
}

} // namespace va
