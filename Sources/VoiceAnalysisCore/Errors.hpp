#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace va {

/// Base class for every error the core reports to its callers.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Input rejected before any write happened (empty title, missing source
/// file, feedback on an empty channel, illegal status transition).
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error(what) {}
};

/// The structured store failed.
class StorageError : public Error {
public:
    explicit StorageError(const std::string& what) : Error(what) {}
};

/// The row for `id` was inserted and its audio relocated, but the final
/// path could not be committed.  PersistenceCoordinator::reconcile(id)
/// finishes the job.
class UnresolvedAnalysisError : public StorageError {
public:
    UnresolvedAnalysisError(int64_t id, const std::string& what)
        : StorageError(what), id_(id) {}

    int64_t id() const { return id_; }

private:
    int64_t id_;
};

/// Copying or deleting vault files failed.
class FileSystemError : public Error {
public:
    explicit FileSystemError(const std::string& what) : Error(what) {}
};

/// FFmpeg / whisper failures while decoding or analysing audio.
class MediaError : public Error {
public:
    explicit MediaError(const std::string& what) : Error(what) {}
};

} // namespace va
