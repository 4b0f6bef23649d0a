#include "FileVault.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#include <cctype>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace va {

namespace {

constexpr const char* kVaultDirName   = "audio_analysis";
constexpr const char* kDirPrefix      = "recording_";
constexpr const char* kFileStem       = "recording";
constexpr const char* kPartialSuffix  = ".partial";

std::string describe(const std::error_code& ec) {
    return ec.message();
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

FileVault::FileVault(const VaultLocations& locations) {
    if (!locations.external_root.empty() &&
        prepare_root(locations.external_root, base_)) {
        external_ = true;
    } else if (!locations.private_root.empty() &&
               prepare_root(locations.private_root, base_)) {
        external_ = false;
    } else {
        throw FileSystemError("No usable vault directory (external='" +
                              locations.external_root + "', private='" +
                              locations.private_root + "')");
    }

    Log::info("File vault at " + base_.string() +
              (external_ ? " (external storage)" : " (private storage)"));
}

bool FileVault::prepare_root(const fs::path& root, fs::path& out) {
    std::error_code ec;
    fs::path dir = root / kVaultDirName;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec)) {
        return false;
    }

    // Check write access; a directory can exist on a read-only mount.
    fs::path marker = dir / ".write_check";
    {
        std::ofstream f(marker);
        if (!f.is_open()) return false;
    }
    fs::remove(marker, ec);

    out = dir;
    return true;
}

// ---------------------------------------------------------------------------
// Layout
// ---------------------------------------------------------------------------

fs::path FileVault::directory_for(int64_t id) const {
    return base_ / (kDirPrefix + std::to_string(id));
}

bool FileVault::is_recording_file(const fs::path& p) {
    const std::string name = p.filename().string();
    if (name == kFileStem) return true;
    const std::string prefix = std::string(kFileStem) + ".";
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    return p.extension() != kPartialSuffix;
}

// ---------------------------------------------------------------------------
// store
// ---------------------------------------------------------------------------

std::string FileVault::store(const std::string& source_path, int64_t id) {
    std::error_code ec;
    const fs::path source(source_path);

    if (!fs::is_regular_file(source, ec)) {
        throw FileSystemError("Source audio file not found: " + source_path);
    }

    const fs::path dir = directory_for(id);
    fs::create_directories(dir, ec);
    if (ec) {
        throw FileSystemError("Cannot create " + dir.string() + ": " + describe(ec));
    }

    // "clip.m4a" -> "recording.m4a", "clip" or "clip." -> "recording".
    std::string ext = source.extension().string();
    if (ext == ".") ext.clear();
    const fs::path target  = dir / (kFileStem + ext);
    const fs::path partial = dir / (kFileStem + ext + kPartialSuffix);

    // Copy under a temporary name, then rename, so a crash never leaves a
    // truncated recording.* file behind.
    fs::copy_file(source, partial, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(partial, ec);
        throw FileSystemError("Cannot copy " + source_path + " to " +
                              partial.string() + ": " + describe(ec));
    }

    fs::rename(partial, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        throw FileSystemError("Cannot rename " + partial.string() + ": " + describe(ec));
    }

    // Keep exactly one artifact per directory.
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path() == target) continue;
        std::error_code rm_ec;
        fs::remove_all(entry.path(), rm_ec);
        if (rm_ec) {
            Log::warn("Could not remove stale vault entry " +
                      entry.path().string() + ": " + describe(rm_ec));
        }
    }

    return target.string();
}

// ---------------------------------------------------------------------------
// remove
// ---------------------------------------------------------------------------

bool FileVault::remove(int64_t id) {
    std::error_code ec;
    const fs::path dir = directory_for(id);

    if (!fs::exists(dir, ec)) {
        if (ec) {
            throw FileSystemError("Cannot stat " + dir.string() + ": " + describe(ec));
        }
        return false;
    }

    fs::remove_all(dir, ec);
    if (ec) {
        throw FileSystemError("Cannot delete " + dir.string() + ": " + describe(ec));
    }
    return true;
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

std::optional<std::string> FileVault::recording_path(int64_t id) const {
    std::error_code ec;
    const fs::path dir = directory_for(id);
    if (!fs::is_directory(dir, ec)) return std::nullopt;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && is_recording_file(entry.path())) {
            return entry.path().string();
        }
    }
    return std::nullopt;
}

std::vector<int64_t> FileVault::stored_ids() const {
    std::vector<int64_t> ids;
    std::error_code ec;
    const std::string prefix = kDirPrefix;

    for (const auto& entry : fs::directory_iterator(base_, ec)) {
        if (!entry.is_directory(ec)) continue;
        const std::string name = entry.path().filename().string();
        if (name.size() <= prefix.size() ||
            name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        const std::string digits = name.substr(prefix.size());
        bool numeric = true;
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                numeric = false;
                break;
            }
        }
        if (!numeric || digits.size() > 18) continue;
        ids.push_back(std::stoll(digits));
    }
    return ids;
}

bool FileVault::owns(const std::string& path, int64_t id) const {
    std::error_code ec;
    const fs::path file = fs::weakly_canonical(path, ec);
    if (ec) return false;
    const fs::path dir = fs::weakly_canonical(directory_for(id), ec);
    if (ec) return false;
    return file.parent_path() == dir && is_recording_file(file);
}

} // namespace va
