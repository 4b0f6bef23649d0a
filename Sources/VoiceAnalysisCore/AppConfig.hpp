#pragma once

#include "FileVault.hpp"
#include "Logging.hpp"
#include "RecordingSession.hpp"

#include <filesystem>
#include <string>

namespace va {

/// Settings read from a JSON file, e.g.
///
///   {
///     "database_path": "/var/lib/voice-analysis/analysis.db",
///     "external_storage_dir": "/mnt/shared",
///     "max_recording_seconds": 30,
///     "whisper_model_path": "models/ggml-base.bin",
///     "log_level": "debug"
///   }
///
/// Every key is optional; unknown keys are ignored.
struct AppConfig {
    std::string database_path;
    std::string external_storage_dir;     // empty: private storage only
    std::string private_storage_dir;
    std::string temp_dir;                 // empty: system temp directory

    int max_recording_seconds = 30;

    std::string whisper_model_path;
    int         language_top_n = 5;

    std::string capture_input_format = "pulse";
    std::string capture_device       = "default";

    std::string log_directory;
    std::string log_level   = "info";
    bool        log_to_file = false;

    /// Defaults rooted at $XDG_DATA_HOME/voice-analysis (or
    /// ~/.local/share/voice-analysis).
    AppConfig();

    /// A missing file yields the defaults.  Throws ValidationError if the
    /// file is not a JSON object or a key has the wrong type or range.
    static AppConfig load(const std::filesystem::path& path);

    /// Throws FileSystemError if the file cannot be written.
    void save(const std::filesystem::path& path) const;

    VaultLocations vault_locations() const;
    SessionConfig  session_config() const;
    LogConfig      log_config() const;

    static std::filesystem::path default_data_dir();
};

} // namespace va
