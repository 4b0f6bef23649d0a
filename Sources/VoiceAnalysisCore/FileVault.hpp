#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace va {

/// Candidate roots for the vault.  The external (shared) root wins when it
/// is configured and writable; otherwise the app-private root is used.
struct VaultLocations {
    std::string external_root;   // may be empty
    std::string private_root;
};

/// Owns the on-disk layout of audio artifacts:
///
///   <base>/recording_<id>/recording.<ext>
///
/// One directory per analysis id, exactly one audio file per directory.
/// The base directory is resolved once in the constructor and never
/// changes afterwards, so every lookup in the process agrees on it.
class FileVault {
public:
    /// Throws FileSystemError if neither root is usable.
    explicit FileVault(const VaultLocations& locations);

    // Non-copyable.
    FileVault(const FileVault&) = delete;
    FileVault& operator=(const FileVault&) = delete;

    const std::filesystem::path& base_directory() const { return base_; }
    bool uses_external_storage() const { return external_; }

    std::filesystem::path directory_for(int64_t id) const;

    /// Copy `source_path` into the directory for `id` and return the
    /// permanent path.  The source is left in place.  Any other file already
    /// in the directory is removed once the copy succeeded.
    /// Throws FileSystemError.
    std::string store(const std::string& source_path, int64_t id);

    /// Recursively delete the directory for `id`.  Returns false if there
    /// was nothing to delete.  Throws FileSystemError if deletion failed.
    bool remove(int64_t id);

    /// Path of the stored recording for `id`, if there is one.
    std::optional<std::string> recording_path(int64_t id) const;

    /// Ids of every recording_<id> directory under the base.
    std::vector<int64_t> stored_ids() const;

    /// Whether `path` names a file directly inside the directory for `id`.
    bool owns(const std::string& path, int64_t id) const;

private:
    static bool prepare_root(const std::filesystem::path& root,
                             std::filesystem::path& out);

    static bool is_recording_file(const std::filesystem::path& p);

    std::filesystem::path base_;
    bool                  external_ = false;
};

} // namespace va
